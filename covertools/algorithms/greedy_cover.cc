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
#include "covertools/algorithms/greedy_cover.h"

#include <cmath>
#include <memory>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/time/time.h"
#include "absl/types/span.h"
#include "covertools/algorithms/cover_result.h"
#include "covertools/algorithms/coverage_tracker.h"
#include "covertools/algorithms/greedy_cover.pb.h"
#include "covertools/algorithms/greedy_selector.h"
#include "covertools/algorithms/membership_index.h"
#include "covertools/base/status_macros.h"
#include "covertools/base/timer.h"

namespace covertools {

using ::absl::InvalidArgumentError;

absl::Status ValidateGreedyCoverParameters(
    const GreedyCoverParameters& params) {
  if (!GreedyCoverParameters::Algorithm_IsValid(params.algorithm())) {
    return InvalidArgumentError(
        absl::StrCat("invalid value for algorithm: ", params.algorithm()));
  }
  if (!GreedyCoverParameters::TieBreak_IsValid(params.tie_break())) {
    return InvalidArgumentError(
        absl::StrCat("invalid value for tie_break: ", params.tie_break()));
  }
  if (params.has_max_iterations() && params.max_iterations() < 0) {
    return InvalidArgumentError(absl::StrCat(
        "max_iterations must be non-negative, got ", params.max_iterations()));
  }
  if (params.num_threads() < 0) {
    return InvalidArgumentError(absl::StrCat(
        "num_threads must be non-negative, got ", params.num_threads()));
  }
  for (int i = 0; i < params.subset_costs_size(); ++i) {
    const double cost = params.subset_costs(i);
    if (std::isnan(cost)) {
      return InvalidArgumentError(absl::StrCat("subset_costs[", i, "] is NAN"));
    }
    if (!std::isfinite(cost) || cost <= 0.0) {
      return InvalidArgumentError(absl::StrCat(
          "subset_costs[", i, "] must be positive and finite, got ", cost));
    }
  }
  return absl::OkStatus();
}

absl::Status ValidateGreedyCoverParameters(const GreedyCoverParameters& params,
                                           BaseInt num_subsets) {
  RETURN_IF_ERROR(ValidateGreedyCoverParameters(params));
  if (params.subset_costs_size() != 0 &&
      params.subset_costs_size() != num_subsets) {
    return InvalidArgumentError(
        absl::StrCat("subset_costs has ", params.subset_costs_size(),
                     " entries, expected 0 or ", num_subsets));
  }
  return absl::OkStatus();
}

absl::StatusOr<CoverResult> SolveGreedyCover(
    const MembershipIndex& index, const GreedyCoverParameters& params) {
  RETURN_IF_ERROR(ValidateGreedyCoverParameters(params, index.num_subsets()));
  WallTimer timer;
  timer.Start();
  const SubsetCostVector costs(params.subset_costs().begin(),
                               params.subset_costs().end());
  CoverageTracker tracker(&index, costs);
  tracker.set_record_newly_covered_elements(
      params.record_newly_covered_elements());
  std::unique_ptr<GreedySelector> selector =
      MakeGreedySelector(params.algorithm(), &tracker);
  const CoverTerminationReason termination_reason =
      params.has_max_iterations()
          ? selector->NextSolution(params.max_iterations())
          : selector->NextSolution();
  CoverResult result = AssembleCoverResult(tracker, termination_reason);
  timer.Stop();
  VLOG(1) << GreedyCoverParameters::Algorithm_Name(params.algorithm())
          << ": " << result.DebugString() << ", time = "
          << absl::FormatDuration(timer.GetDuration());
  return result;
}

absl::StatusOr<CoverResult> SolveGreedyCover(
    absl::Span<const Membership> memberships, BaseInt num_subsets,
    BaseInt num_elements, const GreedyCoverParameters& params) {
  RETURN_IF_ERROR(ValidateGreedyCoverParameters(params));
  const int num_threads = params.num_threads() == 0 ? 1 : params.num_threads();
  WallTimer timer;
  timer.Start();
  ASSIGN_OR_RETURN(const MembershipIndex index,
                   MembershipIndex::Build(memberships, num_subsets,
                                          num_elements, num_threads));
  timer.Stop();
  VLOG(1) << "Index built in " << absl::FormatDuration(timer.GetDuration())
          << ", num_memberships = " << index.num_memberships()
          << ", fill rate = " << index.FillRate();
  return SolveGreedyCover(index, params);
}

}  // namespace covertools
