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
#ifndef COVERTOOLS_ALGORITHMS_GREEDY_SELECTOR_H_
#define COVERTOOLS_ALGORITHMS_GREEDY_SELECTOR_H_

#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <vector>

#include "covertools/algorithms/adjustable_k_ary_heap.h"
#include "covertools/algorithms/coverage_tracker.h"
#include "covertools/algorithms/greedy_cover.pb.h"
#include "covertools/algorithms/membership_index.h"
#include "covertools/base/bitmap.h"

// The greedy heuristic for set covering, due to Chvatal, works as follows:
// choose the subset that covers as many remaining uncovered elements as
// possible for the least possible cost per element, and iterate.
// It guarantees that the solution is at most H(d) times the optimal value,
// where d is the size of the largest subset.
//
// Vasek Chvatal, 1979. A greedy heuristic for the set-covering problem.
// Mathematics of Operations Research, 4(3):233-235, 1979.
// http://www.jstor.org/stable/3689577
//
// All the selectors below produce exactly the same sequence of subsets: the
// priority of a subset is its number of uncovered elements divided by its cost,
// and among subsets with the same priority the one with the smallest index is
// chosen. They differ only in how the subset with the highest priority is
// found.

namespace covertools {

struct SubsetPriority {
  double priority;
  SubsetIndex subset;
};

// Max-priority queue of subsets. The priorities it holds are those given at
// insertion time, which the caller may know to be out of date.
class SubsetPriorityQueue {
 public:
  virtual ~SubsetPriorityQueue() = default;

  // Removes everything and prepares the queue for subsets in
  // [0, num_subsets).
  virtual void Reset(BaseInt num_subsets) = 0;

  // Inserts `subset` with `priority`, or replaces its priority if it is
  // already in the queue.
  virtual void InsertOrUpdate(SubsetIndex subset, double priority) = 0;

  // Removes and returns the entry with the highest priority. Among entries
  // with the same priority, the one with the smallest subset index is
  // returned. The queue must not be empty.
  virtual SubsetPriority PopMax() = 0;

  virtual bool IsEmpty() const = 0;
  virtual BaseInt size() const = 0;
};

// SubsetPriorityQueue backed by an adjustable k-ary max-heap. The arity of 16
// favors the frequent reinsertions over PopMax().
class LazySubsetPriorityQueue : public SubsetPriorityQueue {
 public:
  LazySubsetPriorityQueue() = default;

  void Reset(BaseInt num_subsets) override;
  void InsertOrUpdate(SubsetIndex subset, double priority) override;
  SubsetPriority PopMax() override;
  bool IsEmpty() const override { return heap_.IsEmpty(); }
  BaseInt size() const override { return heap_.heap_size(); }

 private:
  AdjustableKAryHeap<double, SubsetIndex::ValueType, 16, true> heap_;
};

// Base class of the greedy selectors. It runs the selection loop on the
// CoverageTracker passed as argument, which it does not own, and leaves the
// search for the best subset to the derived classes.
class GreedySelector {
 public:
  static constexpr int64_t kNoIterationLimit =
      std::numeric_limits<int64_t>::max();

  explicit GreedySelector(CoverageTracker* tracker);
  virtual ~GreedySelector() = default;

  GreedySelector(const GreedySelector&) = delete;
  GreedySelector& operator=(const GreedySelector&) = delete;

  // Selects subsets until no remaining subset covers an uncovered element, or
  // until max_iterations subsets have been selected by this call while some
  // productive subset remains. Starts from the current state of the tracker,
  // so that a run stopped by the iteration limit can be resumed.
  CoverTerminationReason NextSolution(int64_t max_iterations);
  CoverTerminationReason NextSolution() {
    return NextSolution(kNoIterationLimit);
  }

  // Number of subsets selected by the last call to NextSolution().
  int64_t num_iterations() const { return num_iterations_; }

 protected:
  // Called at the beginning of NextSolution().
  virtual void Initialize() = 0;

  // Returns the unselected subset with the highest priority among those with
  // uncovered elements, or std::nullopt if there are none.
  virtual std::optional<SubsetIndex> FindBestSubset() = 0;

  // Returns the current priority of `subset`.
  double Priority(SubsetIndex subset) const {
    return tracker_->CurrentScore(subset) / tracker_->subset_cost(subset);
  }

  CoverageTracker* tracker() const { return tracker_; }

 private:
  // The data structure that maintains the coverage state.
  CoverageTracker* tracker_;

  int64_t num_iterations_;
};

// Greedy selector keeping the subsets in a priority queue with lazy
// invalidation. Selecting a subset decreases the score of the subsets that
// intersect it, but their entries are not updated at that time. Instead, a
// popped entry is compared to the authoritative score held by the tracker: if
// they differ, the entry is reinserted with its corrected priority, or dropped
// if the subset has nothing left to cover. Because priorities never increase,
// an entry that is up to date when popped is the true maximum.
class LazyGreedySelector : public GreedySelector {
 public:
  explicit LazyGreedySelector(CoverageTracker* tracker);
  LazyGreedySelector(CoverageTracker* tracker,
                     std::unique_ptr<SubsetPriorityQueue> queue);

  // Number of popped entries found to be out of date since construction.
  int64_t num_stale_entries() const { return num_stale_entries_; }

 protected:
  void Initialize() override;
  std::optional<SubsetIndex> FindBestSubset() override;

 private:
  std::unique_ptr<SubsetPriorityQueue> queue_;
  int64_t num_stale_entries_;
};

// Greedy selector working on packed bitsets. Each subset is stored as a bitmap
// over the elements, and its score is recomputed as
// popcount(subset & ~covered) for all the remaining candidates at each step.
// Uses O(num_subsets * num_elements / 64) words of memory.
class BitsetGreedySelector : public GreedySelector {
 public:
  explicit BitsetGreedySelector(CoverageTracker* tracker);

 protected:
  void Initialize() override;
  std::optional<SubsetIndex> FindBestSubset() override;

 private:
  util_intops::StrongVector<SubsetIndex, Bitmap> subset_bitmaps_;

  // Subsets which may still cover something, in increasing order.
  std::vector<SubsetIndex> candidates_;
};

// Textbook version of the greedy heuristic, scanning the scores of all the
// subsets at each step. Slow, used as a reference.
class TextbookGreedySelector : public GreedySelector {
 public:
  explicit TextbookGreedySelector(CoverageTracker* tracker)
      : GreedySelector(tracker) {}

 protected:
  void Initialize() override {}
  std::optional<SubsetIndex> FindBestSubset() override;
};

// Returns a selector implementing `algorithm` on `tracker`.
// ALGORITHM_UNSPECIFIED is the same as GREEDY_STANDARD.
std::unique_ptr<GreedySelector> MakeGreedySelector(
    GreedyCoverParameters::Algorithm algorithm, CoverageTracker* tracker);

}  // namespace covertools

#endif  // COVERTOOLS_ALGORITHMS_GREEDY_SELECTOR_H_
