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

#include "covertools/algorithms/adjustable_k_ary_heap.h"

#include <algorithm>
#include <cstdint>
#include <random>
#include <utility>
#include <vector>

#include "gtest/gtest.h"

namespace covertools {
namespace {

// Pops everything and returns the (priority, index) pairs in pop order.
template <typename Heap>
std::vector<typename Heap::Aggregate> Drain(Heap* heap) {
  std::vector<typename Heap::Aggregate> popped;
  while (!heap->IsEmpty()) {
    popped.push_back({heap->TopPriority(), heap->TopIndex()});
    heap->Pop();
  }
  return popped;
}

// Priorities are drawn from a small range so that many of them are equal.
std::vector<std::pair<int, int>> RandomElements(int size, int num_levels,
                                                uint32_t seed) {
  std::mt19937 generator(seed);
  std::uniform_int_distribution<int> priority_dist(0, num_levels - 1);
  std::vector<std::pair<int, int>> elements;
  for (int i = 0; i < size; ++i) {
    elements.push_back({priority_dist(generator), i});
  }
  std::shuffle(elements.begin(), elements.end(), generator);
  return elements;
}

// Max-heap order: decreasing priority, then increasing index.
std::vector<std::pair<int, int>> MaxHeapOrder(
    std::vector<std::pair<int, int>> elements) {
  std::sort(elements.begin(), elements.end(),
            [](const std::pair<int, int>& a, const std::pair<int, int>& b) {
              if (a.first != b.first) return a.first > b.first;
              return a.second < b.second;
            });
  return elements;
}

template <int Arity>
void CheckLoadThenDrain() {
  const std::vector<std::pair<int, int>> elements =
      RandomElements(5'000, 20, 17 + Arity);
  AdjustableKAryHeap<int, int, Arity, true> heap(elements, 5'000);
  EXPECT_TRUE(heap.CheckHeapProperty());
  EXPECT_EQ(Drain(&heap), MaxHeapOrder(elements));
  EXPECT_TRUE(heap.CheckHeapProperty());
}

TEST(AdjustableKAryHeapTest, LoadThenDrainGivesTotalOrder) {
  CheckLoadThenDrain<2>();
  CheckLoadThenDrain<3>();
  CheckLoadThenDrain<16>();
}

TEST(AdjustableKAryHeapTest, InsertOneByOneGivesSameOrderAsLoad) {
  const std::vector<std::pair<int, int>> elements =
      RandomElements(3'000, 7, 5);
  AdjustableKAryHeap<int, int, 16, true> heap;
  for (const std::pair<int, int>& element : elements) heap.Insert(element);
  EXPECT_TRUE(heap.CheckHeapProperty());
  EXPECT_EQ(heap.heap_size(), 3'000);
  EXPECT_EQ(Drain(&heap), MaxHeapOrder(elements));
}

TEST(AdjustableKAryHeapTest, MinHeapBreaksTiesTowardsSmallestIndex) {
  AdjustableKAryHeap<double, int, 2, false> heap;
  heap.Insert({2.0, 7});
  heap.Insert({1.0, 5});
  heap.Insert({1.0, 3});
  heap.Insert({2.0, 0});
  const std::vector<std::pair<double, int>> expected = {
      {1.0, 3}, {1.0, 5}, {2.0, 0}, {2.0, 7}};
  EXPECT_EQ(Drain(&heap), expected);
}

// Mimics the use by the lazy greedy selector: priorities only decrease, and
// a decreased entry is pushed back with Insert().
TEST(AdjustableKAryHeapTest, DecreasingUpdatesKeepTotalOrder) {
  std::vector<std::pair<int, int>> elements = RandomElements(2'000, 50, 11);
  AdjustableKAryHeap<int, int, 16, true> heap(elements, 2'000);
  std::mt19937 generator(3);
  std::uniform_int_distribution<int> position_dist(0, 1'999);
  for (int iter = 0; iter < 500; ++iter) {
    std::pair<int, int>& element = elements[position_dist(generator)];
    element.first = std::max(0, element.first - 3);
    heap.Insert(element);
  }
  EXPECT_TRUE(heap.CheckHeapProperty());
  EXPECT_EQ(Drain(&heap), MaxHeapOrder(elements));
}

TEST(AdjustableKAryHeapTest, IncreasingUpdateMovesToTop) {
  AdjustableKAryHeap<int, int, 4, true> heap(RandomElements(100, 10, 1), 100);
  heap.Update({1'000, 42});
  EXPECT_EQ(heap.TopIndex(), 42);
  EXPECT_EQ(heap.TopPriority(), 1'000);
  EXPECT_TRUE(heap.CheckHeapProperty());
}

TEST(AdjustableKAryHeapTest, Remove) {
  std::vector<std::pair<int, int>> elements = RandomElements(1'000, 30, 23);
  AdjustableKAryHeap<int, int, 4, true> heap(elements, 1'000);
  for (int index = 0; index < 1'000; index += 3) {
    EXPECT_TRUE(heap.Remove(index));
    EXPECT_FALSE(heap.Contains(index));
    EXPECT_FALSE(heap.Remove(index));
  }
  EXPECT_FALSE(heap.Remove(-1));
  EXPECT_FALSE(heap.Remove(1'000));
  EXPECT_TRUE(heap.CheckHeapProperty());
  elements.erase(std::remove_if(elements.begin(), elements.end(),
                                [](const std::pair<int, int>& e) {
                                  return e.second % 3 == 0;
                                }),
                 elements.end());
  EXPECT_EQ(heap.heap_size(), static_cast<int>(elements.size()));
  EXPECT_EQ(Drain(&heap), MaxHeapOrder(elements));
}

TEST(AdjustableKAryHeapTest, ReinsertAfterRemoval) {
  AdjustableKAryHeap<int, int, 4, true> heap;
  for (int i = 0; i < 1'000; ++i) {
    heap.Insert({i, i});
    heap.Insert({i + 1, i});
    EXPECT_TRUE(heap.Remove(i));
    EXPECT_FALSE(heap.Contains(i));
  }
  EXPECT_TRUE(heap.IsEmpty());
  heap.Insert({5, 9});
  EXPECT_TRUE(heap.Contains(9));
  EXPECT_EQ(heap.TopPriority(), 5);
}

}  // namespace
}  // namespace covertools
