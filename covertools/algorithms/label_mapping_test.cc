// Copyright 2010-2025 Google LLC
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
#include "covertools/algorithms/label_mapping.h"

#include <cstdint>
#include <optional>
#include <string>

#include "covertools/base/gmock.h"

namespace covertools {
namespace {

using ::testing::ElementsAre;
using ::testing::Optional;

TEST(LabelMappingTest, IdsInFirstSeenOrder) {
  LabelMapping<std::string> mapping;
  EXPECT_EQ(mapping.Intern("banana"), 0);
  EXPECT_EQ(mapping.Intern("apple"), 1);
  EXPECT_EQ(mapping.Intern("banana"), 0);
  EXPECT_EQ(mapping.Intern("cherry"), 2);
  EXPECT_EQ(mapping.size(), 3);
  EXPECT_THAT(mapping.labels(), ElementsAre("banana", "apple", "cherry"));
}

TEST(LabelMappingTest, RoundTrip) {
  LabelMapping<std::string> mapping;
  for (const std::string label : {"x", "y", "z", "y", "x"}) {
    const BaseInt id = mapping.Intern(label);
    EXPECT_EQ(mapping.label(id), label);
    EXPECT_THAT(mapping.Find(label), Optional(id));
  }
  EXPECT_FALSE(mapping.Find("w").has_value());
}

TEST(LabelMappingTest, IntegerLabels) {
  LabelMapping<int64_t> mapping;
  EXPECT_EQ(mapping.Intern(int64_t{1} << 40), 0);
  EXPECT_EQ(mapping.Intern(-7), 1);
  EXPECT_EQ(mapping.label(0), int64_t{1} << 40);
  EXPECT_THAT(mapping.Find(-7), Optional(1));
}

}  // namespace
}  // namespace covertools
