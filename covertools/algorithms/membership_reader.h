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
#ifndef COVERTOOLS_ALGORITHMS_MEMBERSHIP_READER_H_
#define COVERTOOLS_ALGORITHMS_MEMBERSHIP_READER_H_

#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "covertools/algorithms/label_mapping.h"
#include "covertools/algorithms/membership_index.h"

namespace covertools {

struct MembershipReaderOptions {
  // Separates the subset label from the element label on each line.
  std::string delimiter = ",";

  // If true, the first non-blank line is a header and is ignored.
  bool skip_header = false;
};

// Membership relation read from a file, with the labels used in the file.
// Labels are given dense ids in order of first appearance.
struct LabeledMemberships {
  LabelMapping<std::string> subset_labels;
  LabelMapping<std::string> element_labels;
  std::vector<Membership> memberships;

  BaseInt num_subsets() const { return subset_labels.size(); }
  BaseInt num_elements() const { return element_labels.size(); }
};

// Parses `contents`, which has one membership per line in the form
//   subset_label<delimiter>element_label
// Blank lines are skipped, as well as the '\r' of a "\r\n" line ending.
// Whitespace around each label is removed. Returns InvalidArgumentError
// naming the line for any line that does not have exactly two non-empty
// fields.
absl::StatusOr<LabeledMemberships> ParseMemberships(
    absl::string_view contents, const MembershipReaderOptions& options);

// Same as above, reading the file `filename`. Returns NotFoundError if the
// file cannot be opened.
absl::StatusOr<LabeledMemberships> ReadMembershipFile(
    absl::string_view filename, const MembershipReaderOptions& options);

}  // namespace covertools

#endif  // COVERTOOLS_ALGORITHMS_MEMBERSHIP_READER_H_
