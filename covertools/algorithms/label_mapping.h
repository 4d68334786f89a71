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
#ifndef COVERTOOLS_ALGORITHMS_LABEL_MAPPING_H_
#define COVERTOOLS_ALGORITHMS_LABEL_MAPPING_H_

#include <optional>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/log/check.h"
#include "covertools/algorithms/membership_index.h"

namespace covertools {

// Bidirectional mapping between arbitrary hashable labels and the dense
// integer ids used by MembershipIndex. Ids are given in first-seen order,
// starting at 0.
//
// A mapping is filled once, before the index is built, and only read
// afterwards.
template <typename Label>
class LabelMapping {
 public:
  LabelMapping() = default;

  // Returns the id of `label`, giving it the next free id if it was never
  // seen before.
  BaseInt Intern(const Label& label) {
    const auto [it, inserted] =
        ids_.try_emplace(label, static_cast<BaseInt>(labels_.size()));
    if (inserted) labels_.push_back(label);
    return it->second;
  }

  // Returns the id of `label`, or std::nullopt if it was never interned.
  std::optional<BaseInt> Find(const Label& label) const {
    const auto it = ids_.find(label);
    if (it == ids_.end()) return std::nullopt;
    return it->second;
  }

  const Label& label(BaseInt id) const {
    DCHECK_GE(id, 0);
    DCHECK_LT(id, size());
    return labels_[id];
  }

  BaseInt size() const { return static_cast<BaseInt>(labels_.size()); }

  // Labels indexed by id.
  const std::vector<Label>& labels() const { return labels_; }

 private:
  absl::flat_hash_map<Label, BaseInt> ids_;
  std::vector<Label> labels_;
};

}  // namespace covertools

#endif  // COVERTOOLS_ALGORITHMS_LABEL_MAPPING_H_
