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
#include "covertools/algorithms/membership_reader.h"

#include <string>
#include <vector>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "absl/strings/string_view.h"
#include "absl/strings/strip.h"
#include "covertools/algorithms/membership_index.h"
#include "covertools/base/file.h"
#include "covertools/base/status_macros.h"

namespace covertools {

absl::StatusOr<LabeledMemberships> ParseMemberships(
    absl::string_view contents, const MembershipReaderOptions& options) {
  if (options.delimiter.empty()) {
    return absl::InvalidArgumentError("The delimiter must not be empty");
  }
  LabeledMemberships result;
  bool header_pending = options.skip_header;
  int line_number = 0;
  for (absl::string_view line : absl::StrSplit(contents, '\n')) {
    ++line_number;
    absl::ConsumeSuffix(&line, "\r");
    if (absl::StripAsciiWhitespace(line).empty()) continue;
    if (header_pending) {
      header_pending = false;
      continue;
    }
    const std::vector<absl::string_view> fields =
        absl::StrSplit(line, absl::ByString(options.delimiter));
    if (fields.size() != 2) {
      return absl::InvalidArgumentError(absl::StrCat(
          "Line ", line_number, ": expected 2 fields separated by '",
          options.delimiter, "', got ", fields.size(), ": '", line, "'"));
    }
    const absl::string_view subset_label =
        absl::StripAsciiWhitespace(fields[0]);
    const absl::string_view element_label =
        absl::StripAsciiWhitespace(fields[1]);
    if (subset_label.empty() || element_label.empty()) {
      return absl::InvalidArgumentError(
          absl::StrCat("Line ", line_number, ": empty label in '", line, "'"));
    }
    const BaseInt subset =
        result.subset_labels.Intern(std::string(subset_label));
    const BaseInt element =
        result.element_labels.Intern(std::string(element_label));
    result.memberships.push_back({subset, element});
  }
  VLOG(1) << "Read " << result.memberships.size() << " memberships, "
          << result.num_subsets() << " subsets, " << result.num_elements()
          << " elements";
  return result;
}

absl::StatusOr<LabeledMemberships> ReadMembershipFile(
    absl::string_view filename, const MembershipReaderOptions& options) {
  ASSIGN_OR_RETURN(const std::string contents,
                   file::GetContents(filename, file::Defaults()));
  return ParseMemberships(contents, options);
}

}  // namespace covertools
