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
#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/flags/usage.h"
#include "absl/log/check.h"
#include "absl/log/initialize.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/time/time.h"
#include "covertools/algorithms/cover_result.h"
#include "covertools/algorithms/greedy_cover.h"
#include "covertools/algorithms/greedy_cover.pb.h"
#include "covertools/algorithms/membership_index.h"
#include "covertools/algorithms/membership_reader.h"
#include "covertools/base/file.h"
#include "covertools/base/status_macros.h"
#include "covertools/base/timer.h"

ABSL_FLAG(std::string, input, "",
          "REQUIRED: Input file name. One subset_label<delimiter>"
          "element_label pair per line.");
ABSL_FLAG(std::string, delimiter, ",",
          "Field delimiter of the input file. Use \\t or tab for tabs.");
ABSL_FLAG(bool, skip_header, false,
          "If true, the first non-blank line of the input is ignored.");

ABSL_FLAG(std::string, algorithm, "standard",
          "Greedy variant: standard, bitset or textbook.");
ABSL_FLAG(int64_t, max_iterations, -1,
          "If non-negative, maximum number of subsets to select.");
ABSL_FLAG(int, num_threads, 1,
          "Number of threads used to build the membership index.");
ABSL_FLAG(bool, record_steps, false,
          "If true, the elements covered by each step are kept in the proto "
          "output.");

ABSL_FLAG(bool, sort_output, false,
          "If true, the selected subset labels are sorted instead of being "
          "listed in selection order.");
ABSL_FLAG(std::string, output, "",
          "If non-empty, write the returned solution to the given file. "
          "Otherwise the solution is printed on the standard output.");
ABSL_FLAG(std::string, output_fmt, "txt",
          "Output format: txt (one subset label per line), proto or "
          "proto_bin (GreedyCoverResponse).");

namespace covertools {

void LogStats(const std::string& name, const MembershipIndex& index) {
  LOG(INFO) << ", " << name << ", num_elements, " << index.num_elements()
            << ", num_subsets, " << index.num_subsets();
  LOG(INFO) << ", " << name << ", num_memberships, "
            << index.num_memberships() << ", num_duplicates, "
            << index.num_duplicate_memberships() << ", fill rate, "
            << index.FillRate();
  LOG(INFO) << ", " << name << ", rows sizes, "
            << index.ComputeRowStats().DebugString();
  LOG(INFO) << ", " << name << ", columns sizes, "
            << index.ComputeColumnStats().DebugString();
  LOG(INFO) << ", " << name << ", num_uncoverable_elements, "
            << index.ComputeNumUncoverableElements();
}

void LogCostAndTiming(const std::string& name, const std::string& algo,
                      const CoverResult& result, const WallTimer& timer) {
  LOG(INFO) << ", " << name << ", " << algo << ", cost, " << result.cost
            << ", solution_cardinality, " << result.steps_taken
            << ", uncovered, " << result.uncovered_count << ", "
            << CoverTerminationReason_Name(result.termination_reason) << ", "
            << absl::ToInt64Microseconds(timer.GetDuration()) << "e-6, s";
}

enum class FileFormat {
  PROTO,
  PROTO_BIN,
  TXT,
};

absl::StatusOr<FileFormat> ParseFileFormat(const std::string& format_name) {
  if (format_name.empty() || absl::EqualsIgnoreCase(format_name, "txt")) {
    return FileFormat::TXT;
  } else if (absl::EqualsIgnoreCase(format_name, "proto")) {
    return FileFormat::PROTO;
  } else if (absl::EqualsIgnoreCase(format_name, "proto_bin")) {
    return FileFormat::PROTO_BIN;
  }
  return absl::InvalidArgumentError(
      absl::StrCat("Unsupported output format: ", format_name));
}

absl::StatusOr<GreedyCoverParameters::Algorithm> ParseAlgorithm(
    const std::string& name) {
  if (absl::EqualsIgnoreCase(name, "standard")) {
    return GreedyCoverParameters::GREEDY_STANDARD;
  } else if (absl::EqualsIgnoreCase(name, "bitset")) {
    return GreedyCoverParameters::GREEDY_BITSET;
  } else if (absl::EqualsIgnoreCase(name, "textbook")) {
    return GreedyCoverParameters::GREEDY_TEXTBOOK;
  }
  return absl::InvalidArgumentError(
      absl::StrCat("Unsupported algorithm: ", name));
}

std::string ParseDelimiter(const std::string& flag_value) {
  if (flag_value == "\\t" || absl::EqualsIgnoreCase(flag_value, "tab")) {
    return "\t";
  }
  return flag_value;
}

absl::Status WriteSolution(const std::string& output, FileFormat format,
                           const std::vector<std::string>& labels,
                           const CoverResult& result) {
  switch (format) {
    case FileFormat::TXT: {
      const std::string contents =
          labels.empty() ? "" : absl::StrCat(absl::StrJoin(labels, "\n"), "\n");
      if (output.empty()) {
        return file::WriteToStream(stdout, contents, "stdout");
      }
      return file::SetContents(output, contents, file::Defaults());
    }
    case FileFormat::PROTO:
      if (output.empty()) {
        return file::WriteToStream(
            stdout, result.ExportAsProto().DebugString(), "stdout");
      }
      return file::SetTextProto(output, result.ExportAsProto(),
                                file::Defaults());
    case FileFormat::PROTO_BIN:
      if (output.empty()) {
        return absl::InvalidArgumentError(
            "--output is required with --output_fmt=proto_bin");
      }
      return file::SetBinaryProto(output, result.ExportAsProto(),
                                  file::Defaults());
  }
  return absl::InternalError("Unreachable");
}

absl::Status Run() {
  const std::string input = absl::GetFlag(FLAGS_input);
  if (input.empty()) {
    return absl::InvalidArgumentError("--input is required");
  }
  ASSIGN_OR_RETURN(const FileFormat output_format,
                   ParseFileFormat(absl::GetFlag(FLAGS_output_fmt)));

  GreedyCoverParameters params;
  ASSIGN_OR_RETURN(const GreedyCoverParameters::Algorithm algorithm,
                   ParseAlgorithm(absl::GetFlag(FLAGS_algorithm)));
  params.set_algorithm(algorithm);
  params.set_tie_break(GreedyCoverParameters::LOWEST_ID);
  if (absl::GetFlag(FLAGS_max_iterations) >= 0) {
    params.set_max_iterations(absl::GetFlag(FLAGS_max_iterations));
  }
  params.set_num_threads(absl::GetFlag(FLAGS_num_threads));
  params.set_record_newly_covered_elements(absl::GetFlag(FLAGS_record_steps));
  RETURN_IF_ERROR(ValidateGreedyCoverParameters(params));

  MembershipReaderOptions reader_options;
  reader_options.delimiter = ParseDelimiter(absl::GetFlag(FLAGS_delimiter));
  reader_options.skip_header = absl::GetFlag(FLAGS_skip_header);

  WallTimer timer;
  timer.Start();
  ASSIGN_OR_RETURN(const LabeledMemberships labeled,
                   ReadMembershipFile(input, reader_options));
  timer.Stop();
  LOG(INFO) << "Read " << labeled.memberships.size() << " memberships in "
            << absl::FormatDuration(timer.GetDuration());

  timer.Restart();
  ASSIGN_OR_RETURN(
      const MembershipIndex index,
      MembershipIndex::Build(labeled.memberships, labeled.num_subsets(),
                             labeled.num_elements(),
                             std::max(1, params.num_threads())));
  timer.Stop();
  LOG(INFO) << "Index built in " << absl::FormatDuration(timer.GetDuration());
  LogStats(input, index);

  timer.Restart();
  ASSIGN_OR_RETURN(const CoverResult result, SolveGreedyCover(index, params));
  timer.Stop();
  LogCostAndTiming(input, GreedyCoverParameters::Algorithm_Name(algorithm),
                   result, timer);

  std::vector<std::string> labels =
      result.LabeledSolution(labeled.subset_labels);
  if (absl::GetFlag(FLAGS_sort_output)) {
    std::sort(labels.begin(), labels.end());
  }
  return WriteSolution(absl::GetFlag(FLAGS_output), output_format, labels,
                       result);
}

}  // namespace covertools

int main(int argc, char** argv) {
  absl::InitializeLog();
  absl::SetProgramUsageMessage(
      "Computes a small set cover of a membership file with the greedy "
      "heuristic.");
  absl::ParseCommandLine(argc, argv);
  const absl::Status status = covertools::Run();
  if (!status.ok()) {
    LOG(ERROR) << status;
    return 1;
  }
  return 0;
}
