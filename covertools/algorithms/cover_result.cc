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
#include "covertools/algorithms/cover_result.h"

#include <string>

#include "absl/log/check.h"
#include "absl/strings/str_cat.h"
#include "covertools/algorithms/coverage_tracker.h"
#include "covertools/algorithms/greedy_cover.pb.h"
#include "covertools/algorithms/membership_index.h"

namespace covertools {

CoverResult AssembleCoverResult(const CoverageTracker& tracker,
                                CoverTerminationReason termination_reason) {
  const MembershipIndex& index = *tracker.index();
  CoverResult result;
  result.solution = tracker.solution();
  result.steps = tracker.steps();
  result.uncovered_elements = tracker.ComputeUncoveredElements();
  result.num_subsets = index.num_subsets();
  result.num_elements = index.num_elements();
  result.covered_count = tracker.num_covered_elements();
  result.uncovered_count = tracker.num_uncovered_elements();
  result.steps_taken = static_cast<BaseInt>(tracker.solution().size());
  result.cost = tracker.cost();
  result.termination_reason = termination_reason;
  DCHECK_EQ(result.covered_count + result.uncovered_count,
            result.num_elements);
  DCHECK_EQ(static_cast<BaseInt>(result.uncovered_elements.size()),
            result.uncovered_count);
  return result;
}

GreedyCoverResponse CoverResult::ExportAsProto() const {
  GreedyCoverResponse response;
  response.mutable_subset()->Reserve(solution.size());
  for (const SubsetIndex subset : solution) {
    response.add_subset(subset.value());
  }
  for (const CoverStep& step : steps) {
    GreedyCoverResponse::Step* step_proto = response.add_step();
    step_proto->set_subset(step.subset.value());
    step_proto->set_num_newly_covered(step.num_newly_covered);
    for (const ElementIndex element : step.newly_covered_elements) {
      step_proto->add_newly_covered_element(element.value());
    }
  }
  for (const ElementIndex element : uncovered_elements) {
    response.add_uncovered_element(element.value());
  }
  response.set_num_subsets(num_subsets);
  response.set_num_elements(num_elements);
  response.set_covered_count(covered_count);
  response.set_uncovered_count(uncovered_count);
  response.set_steps_taken(steps_taken);
  response.set_cost(cost);
  response.set_termination_reason(termination_reason);
  return response;
}

std::string CoverResult::DebugString() const {
  return absl::StrCat(
      "termination_reason = ", CoverTerminationReason_Name(termination_reason),
      ", steps_taken = ", steps_taken, ", cost = ", cost,
      ", covered_count = ", covered_count,
      ", uncovered_count = ", uncovered_count);
}

}  // namespace covertools
