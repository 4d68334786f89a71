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
#ifndef COVERTOOLS_ALGORITHMS_ADJUSTABLE_K_ARY_HEAP_H_
#define COVERTOOLS_ALGORITHMS_ADJUSTABLE_K_ARY_HEAP_H_

#include <algorithm>
#include <limits>
#include <utility>
#include <vector>

#include "absl/log/check.h"

namespace covertools {

// Adjustable k-ary heap for std::pair<Priority, Index> classes containing a
// priority and an index referring to an array where the relevant data is
// stored.
//
// Among elements with equal priorities, the one with the smallest index comes
// first, for min-heaps as well as for max-heaps. This makes the order in which
// elements are popped fully determined by their (priority, index) pairs.
//
// Because the class uses indices and vectors, it is much faster than a
// node-based priority queue, even in the binary heap case.
//
// Pop() has a complexity in O(k * log_k (n)), while SiftUp() is in
// O(log_k(n)). k is denoted as Arity below.
template <typename Priority, typename Index, int Arity, bool IsMaxHeap>
class AdjustableKAryHeap {
 public:
  using Aggregate = std::pair<Priority, Index>;
  using HeapIndex = Index;
  static_assert(Arity >= 2, "arity must be at least 2");
  static_assert(std::numeric_limits<Index>::is_integer,
                "Index must be an integer");
  static_assert(std::numeric_limits<Priority>::is_specialized,
                "Priority must be an integer or floating-point type");
  AdjustableKAryHeap() { Clear(); }

  // Construct a k-heap from an existing vector, tracking original indices.
  // `universe_size` is one more than the maximum possible index in `elements`.
  explicit AdjustableKAryHeap(const std::vector<Aggregate>& elements,
                              HeapIndex universe_size) {
    Load(elements, universe_size);
  }

  void Clear() {
    data_.clear();
    heap_positions_.clear();
    heap_size_ = 0;
  }

  // Replaces the contents of the heap with `elements`, whose indices must be
  // distinct and in [0, universe_size).
  void Load(const std::vector<Aggregate>& elements, HeapIndex universe_size) {
    data_.assign(elements.begin(), elements.end());
    heap_size_ = elements.size();
    heap_positions_.assign(universe_size, kNonExistent);
    for (HeapIndex i = 0; i < heap_size_; ++i) {
      DCHECK_EQ(heap_positions_[index(i)], kNonExistent)
          << "Duplicate index " << index(i);
      heap_positions_[index(i)] = i;
    }
    BuildHeap();
  }

  // Removes the top element from the heap (smallest for min-heap, largest for
  // max-heap), and rearranges the heap.
  void Pop() {
    CHECK(!IsEmpty());
    CHECK(RemoveAtHeapPosition(0));
  }

  // Returns the index of the top element, without modifying the heap.
  Index TopIndex() const {
    CHECK(!IsEmpty());
    return data_[0].second;
  }

  // Returns the priority of the top element, without modifying the heap.
  Priority TopPriority() const {
    CHECK(!IsEmpty());
    return data_[0].first;
  }

  // Returns the number of elements in the heap.
  HeapIndex heap_size() const { return heap_size_; }

  // True iff the heap is empty.
  bool IsEmpty() const { return heap_size() == 0; }

  // Inserts an element into the heap, or updates its priority if its index is
  // already present.
  void Insert(Aggregate element) {
    const Index index = element.second;
    DCHECK_GE(index, 0);
    if (index >= heap_positions_.size()) {
      heap_positions_.resize(index + 1, kNonExistent);
    }
    if (GetHeapPosition(index) == kNonExistent) {
      heap_positions_[index] = heap_size_;
      if (heap_size_ < data_.size()) {
        data_[heap_size_] = element;
      } else {
        data_.push_back(element);
      }
      ++heap_size_;
    }
    Update(element);
  }

  // Removes the element at index. Returns false if the element does not appear
  // in the heap.
  bool Remove(Index index) {
    if (IsEmpty()) return false;
    if (index < 0 || index >= heap_positions_.size()) return false;
    const HeapIndex heap_position = GetHeapPosition(index);
    return heap_position != kNonExistent ? RemoveAtHeapPosition(heap_position)
                                         : false;
  }

  // Changes the priority of an element which is already in the heap.
  void Update(Aggregate element) {
    DCHECK(!IsEmpty());
    const HeapIndex heap_position = GetHeapPosition(element.second);
    DCHECK_GE(heap_position, 0);
    DCHECK_LT(heap_position, heap_size_);
    data_[heap_position] = element;
    if (HasPriority(heap_position, Parent(heap_position))) {
      SiftUp(heap_position);
    } else {
      SiftDown(heap_position);
    }
  }

  // Checks if the element with index is in the heap.
  bool Contains(Index index) const {
    if (index < 0 || index >= heap_positions_.size()) return false;
    return GetHeapPosition(index) != kNonExistent;
  }

  // Checks that the heap is well-formed.
  bool CheckHeapProperty() const {
    for (HeapIndex i = heap_size() - 1; i >= 1; --i) {
      CHECK(!HasPriority(i, Parent(i)))
          << "Parent " << Parent(i) << " with priority " << priority(Parent(i))
          << " does not have priority over " << i << " with priority "
          << priority(i) << " , heap_size = " << heap_size();
    }
    for (HeapIndex i = 0; i < heap_size(); ++i) {
      CHECK_EQ(heap_positions_[index(i)], i);
    }
    CHECK_LE(heap_size(), heap_positions_.size());
    CHECK_LE(heap_size(), data_.size());
    return true;
  }

 private:
  // Gets the current position of element with index i in the heap.
  HeapIndex GetHeapPosition(Index i) const {
    DCHECK_GE(i, 0);
    DCHECK_LT(i, heap_positions_.size());
    return heap_positions_[i];
  }

  // Removes an element at a given heap position.
  bool RemoveAtHeapPosition(HeapIndex heap_index) {
    DCHECK(!IsEmpty());
    DCHECK_GE(heap_index, 0);
    if (heap_index >= heap_size()) return false;
    const HeapIndex last = heap_size() - 1;
    PerformSwap(heap_index, last);
    --heap_size_;
    heap_positions_[index(last)] = kNonExistent;
    if (heap_index == last) return true;
    if (HasPriority(heap_index, Parent(heap_index))) {
      SiftUp(heap_index);
    } else {
      SiftDown(heap_index);
    }
    return true;
  }

  // Maintains heap property by sifting down starting from the end,
  void BuildHeap() {
    if (heap_size() <= 1) return;
    for (HeapIndex i = Parent(heap_size() - 1); i >= 0; --i) {
      SiftDown(i);
    }
    DCHECK(CheckHeapProperty());
  }

  // Maintains heap property by sifting up an element.
  void SiftUp(HeapIndex index) {
    while (index > 0 && HasPriority(index, Parent(index))) {
      PerformSwap(index, Parent(index));
      index = Parent(index);
    }
  }

  // Maintains heap property by sifting down an element.
  void SiftDown(HeapIndex index) {
    while (true) {
      const HeapIndex highest_priority_child = GetHighestPriorityChild(index);
      if (highest_priority_child == index) return;
      PerformSwap(index, highest_priority_child);
      index = highest_priority_child;
    }
  }

  // Finds the element with the highest priority among index and its children.
  // Returns index if none of the children has priority over it.
  HeapIndex GetHighestPriorityChild(HeapIndex index) const {
    const HeapIndex right_bound = std::min(RightChild(index) + 1, heap_size());
    HeapIndex highest_priority_child = index;
    for (HeapIndex i = LeftChild(index); i < right_bound; ++i) {
      if (HasPriority(i, highest_priority_child)) {
        highest_priority_child = i;
      }
    }
    return highest_priority_child;
  }

  // Swaps two elements of data_, while also making sure heap_positions_ is
  // properly maintained.
  void PerformSwap(HeapIndex i, HeapIndex j) {
    std::swap(data_[i], data_[j]);
    std::swap(heap_positions_[index(i)], heap_positions_[index(j)]);
  }

  // Returns true if (data indexed by) i has more priority than j. The index is
  // compared in increasing order for both kinds of heaps.
  bool HasPriority(HeapIndex i, HeapIndex j) const {
    const Aggregate& a = data_[i];
    const Aggregate& b = data_[j];
    if (a.first != b.first) {
      return IsMaxHeap ? b.first < a.first : a.first < b.first;
    }
    return a.second < b.second;
  }

  // Powers of 2 are guaranteed to be quick thanks to simple shifts.

  // Gets the leftmost child index of a given node
  HeapIndex LeftChild(HeapIndex index) const { return Arity * index + 1; }

  // Gets the rightmost child index of a given node
  HeapIndex RightChild(HeapIndex index) const { return Arity * (index + 1); }

  // Gets the parent index of a given index.
  HeapIndex Parent(HeapIndex index) const { return (index - 1) / Arity; }

  // Returns the index of the element at position i in the heap.
  Index index(HeapIndex i) const { return data_[i].second; }

  // Returns the priority of the element at position i in the heap.
  Priority priority(HeapIndex i) const { return data_[i].first; }

  // The heap is stored as a vector. Positions at or beyond heap_size_ are
  // left-overs from removed elements.
  std::vector<Aggregate> data_;

  // Maps original index to current heap position, or kNonExistent.
  std::vector<Index> heap_positions_;

  // The number of elements currently in the heap.
  HeapIndex heap_size_ = 0;

  // The index for Aggregates not in the heap.
  static constexpr Index kNonExistent = -1;
};

}  // namespace covertools

#endif  // COVERTOOLS_ALGORITHMS_ADJUSTABLE_K_ARY_HEAP_H_
