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
#include "covertools/algorithms/greedy_selector.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include "absl/log/check.h"
#include "absl/log/log.h"
#include "covertools/algorithms/coverage_tracker.h"
#include "covertools/algorithms/greedy_cover.pb.h"
#include "covertools/algorithms/membership_index.h"
#include "covertools/base/bitmap.h"

namespace covertools {

void LazySubsetPriorityQueue::Reset(BaseInt num_subsets) {
  heap_.Load({}, num_subsets);
}

void LazySubsetPriorityQueue::InsertOrUpdate(SubsetIndex subset,
                                             double priority) {
  heap_.Insert({priority, subset.value()});
}

SubsetPriority LazySubsetPriorityQueue::PopMax() {
  const SubsetPriority top{heap_.TopPriority(), SubsetIndex(heap_.TopIndex())};
  heap_.Pop();
  return top;
}

GreedySelector::GreedySelector(CoverageTracker* tracker)
    : tracker_(tracker), num_iterations_(0) {
  CHECK(tracker_ != nullptr);
}

CoverTerminationReason GreedySelector::NextSolution(int64_t max_iterations) {
  CHECK_GE(max_iterations, 0);
  DCHECK(tracker_->CheckConsistency());
  num_iterations_ = 0;
  Initialize();
  while (true) {
    if (tracker_->num_uncovered_elements() == 0) {
      DVLOG(1) << "All elements covered after " << num_iterations_
               << " iterations";
      return FULLY_COVERED;
    }
    const std::optional<SubsetIndex> best_subset = FindBestSubset();
    if (!best_subset.has_value()) {
      DVLOG(1) << tracker_->num_uncovered_elements()
               << " elements cannot be covered";
      return RESIDUAL_UNCOVERABLE;
    }
    if (num_iterations_ >= max_iterations) {
      DVLOG(1) << "Iteration limit " << max_iterations << " reached";
      return ITERATION_LIMIT_REACHED;
    }
    DCHECK(!tracker_->is_selected(*best_subset));
    DCHECK_GT(tracker_->CurrentScore(*best_subset), 0);
    tracker_->Select(*best_subset);
    ++num_iterations_;
    DCHECK_LE(num_iterations_, tracker_->index()->num_elements());
    DVLOG(1) << "Cost = " << tracker_->cost()
             << " num_uncovered_elements = "
             << tracker_->num_uncovered_elements();
  }
}

LazyGreedySelector::LazyGreedySelector(CoverageTracker* tracker)
    : LazyGreedySelector(tracker,
                         std::make_unique<LazySubsetPriorityQueue>()) {}

LazyGreedySelector::LazyGreedySelector(
    CoverageTracker* tracker, std::unique_ptr<SubsetPriorityQueue> queue)
    : GreedySelector(tracker),
      queue_(std::move(queue)),
      num_stale_entries_(0) {
  CHECK(queue_ != nullptr);
}

void LazyGreedySelector::Initialize() {
  const MembershipIndex& index = *tracker()->index();
  queue_->Reset(index.num_subsets());
  for (const SubsetIndex subset : index.SubsetRange()) {
    if (tracker()->CurrentScore(subset) > 0) {
      queue_->InsertOrUpdate(subset, Priority(subset));
    }
  }
  DVLOG(1) << queue_->size() << " subsets in the queue";
}

std::optional<SubsetIndex> LazyGreedySelector::FindBestSubset() {
  while (!queue_->IsEmpty()) {
    const SubsetPriority top = queue_->PopMax();
    if (tracker()->CurrentScore(top.subset) == 0) continue;
    const double priority = Priority(top.subset);
    if (priority == top.priority) return top.subset;
    // Priorities never increase.
    DCHECK_LT(priority, top.priority);
    ++num_stale_entries_;
    queue_->InsertOrUpdate(top.subset, priority);
  }
  return std::nullopt;
}

BitsetGreedySelector::BitsetGreedySelector(CoverageTracker* tracker)
    : GreedySelector(tracker) {
  const MembershipIndex& index = *tracker->index();
  subset_bitmaps_.reserve(index.num_subsets());
  for (const SubsetIndex subset : index.SubsetRange()) {
    Bitmap bitmap(index.num_elements(), false);
    for (const ElementIndex element : index.columns()[subset]) {
      bitmap.Set(element.value(), true);
    }
    subset_bitmaps_.push_back(std::move(bitmap));
  }
}

void BitsetGreedySelector::Initialize() {
  candidates_.clear();
  for (const SubsetIndex subset : tracker()->index()->SubsetRange()) {
    if (tracker()->CurrentScore(subset) > 0) candidates_.push_back(subset);
  }
}

std::optional<SubsetIndex> BitsetGreedySelector::FindBestSubset() {
  const Bitmap& covered = tracker()->covered();
  std::optional<SubsetIndex> best_subset;
  double best_priority = 0.0;
  // Candidates with nothing left to cover are removed on the fly.
  size_t num_kept = 0;
  for (const SubsetIndex subset : candidates_) {
    const int64_t gain = subset_bitmaps_[subset].PopCountAndNot(covered);
    DCHECK_EQ(gain, tracker()->CurrentScore(subset));
    if (gain == 0) continue;
    candidates_[num_kept++] = subset;
    const double priority = gain / tracker()->subset_cost(subset);
    if (!best_subset.has_value() || priority > best_priority) {
      best_subset = subset;
      best_priority = priority;
    }
  }
  candidates_.resize(num_kept);
  return best_subset;
}

std::optional<SubsetIndex> TextbookGreedySelector::FindBestSubset() {
  std::optional<SubsetIndex> best_subset;
  double best_priority = 0.0;
  for (const SubsetIndex subset : tracker()->index()->SubsetRange()) {
    if (tracker()->CurrentScore(subset) == 0) continue;
    const double priority = Priority(subset);
    if (!best_subset.has_value() || priority > best_priority) {
      best_subset = subset;
      best_priority = priority;
    }
  }
  return best_subset;
}

std::unique_ptr<GreedySelector> MakeGreedySelector(
    GreedyCoverParameters::Algorithm algorithm, CoverageTracker* tracker) {
  switch (algorithm) {
    case GreedyCoverParameters::ALGORITHM_UNSPECIFIED:
    case GreedyCoverParameters::GREEDY_STANDARD:
      return std::make_unique<LazyGreedySelector>(tracker);
    case GreedyCoverParameters::GREEDY_BITSET:
      return std::make_unique<BitsetGreedySelector>(tracker);
    case GreedyCoverParameters::GREEDY_TEXTBOOK:
      return std::make_unique<TextbookGreedySelector>(tracker);
    default:
      LOG(FATAL) << "Unsupported algorithm: " << static_cast<int>(algorithm);
  }
  return nullptr;
}

}  // namespace covertools
