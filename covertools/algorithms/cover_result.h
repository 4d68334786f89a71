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
#ifndef COVERTOOLS_ALGORITHMS_COVER_RESULT_H_
#define COVERTOOLS_ALGORITHMS_COVER_RESULT_H_

#include <string>
#include <vector>

#include "covertools/algorithms/coverage_tracker.h"
#include "covertools/algorithms/greedy_cover.pb.h"
#include "covertools/algorithms/label_mapping.h"
#include "covertools/algorithms/membership_index.h"

namespace covertools {

// Outcome of a greedy run, detached from the tracker that produced it.
struct CoverResult {
  // Selected subsets, in selection order.
  std::vector<SubsetIndex> solution;

  // One entry per selected subset, in the same order.
  std::vector<CoverStep> steps;

  // Elements left uncovered, in increasing order.
  std::vector<ElementIndex> uncovered_elements;

  BaseInt num_subsets = 0;
  BaseInt num_elements = 0;
  BaseInt covered_count = 0;
  BaseInt uncovered_count = 0;
  BaseInt steps_taken = 0;
  Cost cost = 0.0;
  CoverTerminationReason termination_reason =
      COVER_TERMINATION_REASON_UNSPECIFIED;

  GreedyCoverResponse ExportAsProto() const;

  // Returns the labels of the selected subsets, in selection order.
  template <typename Label>
  std::vector<Label> LabeledSolution(
      const LabelMapping<Label>& subset_labels) const {
    std::vector<Label> labels;
    labels.reserve(solution.size());
    for (const SubsetIndex subset : solution) {
      labels.push_back(subset_labels.label(subset.value()));
    }
    return labels;
  }

  std::string DebugString() const;
};

// Copies the solution and the diagnostics out of `tracker`.
CoverResult AssembleCoverResult(const CoverageTracker& tracker,
                                CoverTerminationReason termination_reason);

}  // namespace covertools

#endif  // COVERTOOLS_ALGORITHMS_COVER_RESULT_H_
