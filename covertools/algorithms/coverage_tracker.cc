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
#include "covertools/algorithms/coverage_tracker.h"

#include <algorithm>
#include <cmath>
#include <utility>
#include <vector>

#include "absl/log/check.h"
#include "absl/log/log.h"
#include "covertools/algorithms/membership_index.h"

namespace covertools {

CoverageTracker::CoverageTracker(const MembershipIndex* index)
    : index_(index) {
  CHECK(index_ != nullptr);
  Clear();
}

CoverageTracker::CoverageTracker(const MembershipIndex* index,
                                 const SubsetCostVector& costs)
    : index_(index), costs_(costs) {
  CHECK(index_ != nullptr);
  if (!costs_.empty()) {
    CHECK_EQ(static_cast<BaseInt>(costs_.size()), index_->num_subsets());
  }
  Clear();
}

void CoverageTracker::Clear() {
  const BaseInt num_subsets = index_->num_subsets();
  const BaseInt num_elements = index_->num_elements();
  covered_ = Bitmap(num_elements, false);
  remaining_score_.assign(num_subsets, 0);
  const SparseColumnView& columns = index_->columns();
  for (const SubsetIndex subset : index_->SubsetRange()) {
    remaining_score_[subset] = columns[subset].size();
  }
  num_uncovered_elements_ = num_elements;
  is_selected_.assign(num_subsets, false);
  solution_.clear();
  steps_.clear();
  cost_ = 0.0;
}

bool CoverageTracker::MarkCovered(ElementIndex element) {
  DCHECK_GE(element.value(), 0);
  DCHECK_LT(element.value(), index_->num_elements());
  if (covered_.Get(element.value())) return false;
  covered_.Set(element.value(), true);
  --num_uncovered_elements_;
  for (const SubsetIndex subset : AffectedSubsets(element)) {
    --remaining_score_[subset];
    DCHECK_GE(remaining_score_[subset], 0);
  }
  return true;
}

BaseInt CoverageTracker::Select(SubsetIndex subset) {
  CHECK(!is_selected_[subset]) << "Subset " << subset << " selected twice";
  is_selected_[subset] = true;
  solution_.push_back(subset);
  cost_ += subset_cost(subset);
  CoverStep step;
  step.subset = subset;
  for (const ElementIndex element : index_->columns()[subset]) {
    if (!MarkCovered(element)) continue;
    ++step.num_newly_covered;
    if (record_newly_covered_elements_) {
      step.newly_covered_elements.push_back(element);
    }
  }
  DVLOG(1) << "Selected subset " << subset << " covering "
           << step.num_newly_covered << " new elements, "
           << num_uncovered_elements_ << " left uncovered";
  const BaseInt num_newly_covered = step.num_newly_covered;
  steps_.push_back(std::move(step));
  return num_newly_covered;
}

std::vector<ElementIndex> CoverageTracker::ComputeUncoveredElements() const {
  std::vector<ElementIndex> uncovered;
  uncovered.reserve(num_uncovered_elements_);
  for (const ElementIndex element : index_->ElementRange()) {
    if (!IsCovered(element)) uncovered.push_back(element);
  }
  return uncovered;
}

bool CoverageTracker::CheckConsistency() const {
  CHECK_EQ(static_cast<BaseInt>(covered_.size()), index_->num_elements());
  CHECK_EQ(num_uncovered_elements_,
           index_->num_elements() - covered_.PopCount());
  const SparseColumnView& columns = index_->columns();
  for (const SubsetIndex subset : index_->SubsetRange()) {
    BaseInt num_free = 0;
    for (const ElementIndex element : columns[subset]) {
      if (!IsCovered(element)) ++num_free;
    }
    CHECK_EQ(num_free, remaining_score_[subset]) << "subset = " << subset;
    if (is_selected_[subset]) {
      CHECK_EQ(remaining_score_[subset], 0) << "subset = " << subset;
    }
  }
  CHECK_EQ(solution_.size(), steps_.size());
  Cost cost = 0.0;
  BaseInt num_selected = 0;
  for (const SubsetIndex subset : solution_) {
    CHECK(is_selected_[subset]) << "subset = " << subset;
    cost += subset_cost(subset);
    ++num_selected;
  }
  CHECK_EQ(num_selected,
           std::count(is_selected_.begin(), is_selected_.end(), true));
  CHECK_LE(std::abs(cost - cost_), 1e-9 * std::max(1.0, std::abs(cost)));
  return true;
}

}  // namespace covertools
