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
#ifndef COVERTOOLS_ALGORITHMS_COVERAGE_TRACKER_H_
#define COVERTOOLS_ALGORITHMS_COVERAGE_TRACKER_H_

#include <cstdint>
#include <vector>

#include "absl/log/check.h"
#include "absl/types/span.h"
#include "covertools/algorithms/membership_index.h"
#include "covertools/base/bitmap.h"

namespace covertools {

// One iteration of the greedy loop: the subset that was selected and the
// elements it covered for the first time.
struct CoverStep {
  SubsetIndex subset;
  BaseInt num_newly_covered = 0;

  // Sorted. Only filled when the tracker records newly covered elements.
  std::vector<ElementIndex> newly_covered_elements;
};

// CoverageTracker does the bookkeeping of a greedy run on the MembershipIndex
// passed as argument.
//
// Its state is made of:
//   covered_: the packed set of covered elements;
//   remaining_score_: for each subset, the number of its elements that are
//   not covered yet;
//   solution_, steps_: the selected subsets and what each of them brought.
//
// The following invariants hold after every public call:
//   remaining_score_[s] == |columns[s] \ covered_| for every subset s,
//   num_uncovered_elements() == num_elements - |covered_|.
//
// A tracker has a single owner, which is the selector running the loop. It is
// neither copyable nor thread-safe.
class CoverageTracker {
 public:
  // Constructs a tracker where every subset costs 1.
  // The index must outlive the tracker.
  explicit CoverageTracker(const MembershipIndex* index);

  // Constructs a tracker with the given per-subset costs. `costs` must either
  // be empty, in which case every subset costs 1, or have one entry per
  // subset.
  CoverageTracker(const MembershipIndex* index, const SubsetCostVector& costs);

  CoverageTracker(const CoverageTracker&) = delete;
  CoverageTracker& operator=(const CoverageTracker&) = delete;

  // Goes back to the initial state: nothing covered, nothing selected.
  void Clear();

  // Returns the index to which the tracker applies.
  const MembershipIndex* index() const { return index_; }

  // Moves `element` to the covered set and decrements the remaining score of
  // every subset containing it. Returns false and does nothing if the element
  // was already covered.
  bool MarkCovered(ElementIndex element);

  // Returns the subsets containing `element`, in increasing order.
  const SparseRow& AffectedSubsets(ElementIndex element) const {
    return index_->rows()[element];
  }

  // Returns the number of not-yet-covered elements of `subset`.
  BaseInt CurrentScore(SubsetIndex subset) const {
    return remaining_score_[subset];
  }

  // Adds `subset` to the solution and covers all its elements. The subset must
  // not have been selected before. Returns the number of elements that were
  // covered by this call.
  BaseInt Select(SubsetIndex subset);

  bool IsCovered(ElementIndex element) const {
    return covered_.Get(element.value());
  }

  BaseInt num_uncovered_elements() const { return num_uncovered_elements_; }

  BaseInt num_covered_elements() const {
    return index_->num_elements() - num_uncovered_elements_;
  }

  bool is_selected(SubsetIndex subset) const { return is_selected_[subset]; }

  // The selected subsets, in selection order.
  const std::vector<SubsetIndex>& solution() const { return solution_; }

  const std::vector<CoverStep>& steps() const { return steps_; }

  // Returns the sum of the costs of the selected subsets.
  Cost cost() const { return cost_; }

  Cost subset_cost(SubsetIndex subset) const {
    return costs_.empty() ? 1.0 : costs_[subset];
  }

  bool has_unit_costs() const { return costs_.empty(); }

  // The packed covered set, one bit per element.
  const Bitmap& covered() const { return covered_; }
  absl::Span<const uint64_t> covered_words() const { return covered_.words(); }

  // Returns the elements which are not covered, in increasing order.
  std::vector<ElementIndex> ComputeUncoveredElements() const;

  void set_record_newly_covered_elements(bool value) {
    record_newly_covered_elements_ = value;
  }
  bool record_newly_covered_elements() const {
    return record_newly_covered_elements_;
  }

  // Recomputes the whole state from the covered set and the selection, and
  // CHECK-fails if it differs from the maintained one. Returns true
  // otherwise, so that it can be used in DCHECK(CheckConsistency()).
  bool CheckConsistency() const;

 private:
  // The index on which the tracker is defined.
  const MembershipIndex* index_;

  // Empty when all costs are 1.
  SubsetCostVector costs_;

  Bitmap covered_;
  SubsetToIntVector remaining_score_;
  BaseInt num_uncovered_elements_;

  SubsetBoolVector is_selected_;
  std::vector<SubsetIndex> solution_;
  std::vector<CoverStep> steps_;
  Cost cost_;

  bool record_newly_covered_elements_ = false;
};

}  // namespace covertools

#endif  // COVERTOOLS_ALGORITHMS_COVERAGE_TRACKER_H_
