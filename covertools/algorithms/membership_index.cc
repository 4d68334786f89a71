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
#include "covertools/algorithms/membership_index.h"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <numeric>
#include <utility>
#include <vector>

#include "absl/log/check.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/types/span.h"
#include "covertools/base/threadpool.h"

namespace covertools {
namespace {
// Below this many items per shard, the scheduling overhead dominates.
constexpr int64_t kMinShardSize = 1024;

int ComputeNumShards(int64_t num_items, int num_threads) {
  if (num_threads <= 1) return 1;
  const int64_t max_useful = (num_items + kMinShardSize - 1) / kMinShardSize;
  return static_cast<int>(
      std::max<int64_t>(1, std::min<int64_t>(4 * num_threads, max_useful)));
}

// Returns the half-open range [begin, end) of items handled by `shard`.
std::pair<int64_t, int64_t> ShardBounds(int shard, int num_shards,
                                        int64_t num_items) {
  return {num_items * shard / num_shards,
          num_items * (shard + 1) / num_shards};
}

absl::Status ValidateSizes(BaseInt num_subsets, BaseInt num_elements,
                           bool has_memberships, int num_threads) {
  if (num_subsets < 0) {
    return absl::InvalidArgumentError(
        absl::StrCat("num_subsets must be non-negative, got ", num_subsets));
  }
  if (num_elements < 0) {
    return absl::InvalidArgumentError(
        absl::StrCat("num_elements must be non-negative, got ", num_elements));
  }
  if (has_memberships && (num_subsets == 0 || num_elements == 0)) {
    return absl::InvalidArgumentError(absl::StrCat(
        "memberships are given but num_subsets = ", num_subsets,
        " and num_elements = ", num_elements));
  }
  if (num_threads < 1) {
    return absl::InvalidArgumentError(
        absl::StrCat("num_threads must be at least 1, got ", num_threads));
  }
  return absl::OkStatus();
}
}  // namespace

MembershipIndex::MembershipIndex()
    : num_elements_(0),
      num_subsets_(0),
      num_memberships_(0),
      num_duplicate_memberships_(0),
      columns_(),
      rows_() {}

absl::StatusOr<MembershipIndex> MembershipIndex::Build(
    absl::Span<const Membership> memberships, BaseInt num_subsets,
    BaseInt num_elements, int num_threads) {
  if (absl::Status status = ValidateSizes(num_subsets, num_elements,
                                          !memberships.empty(), num_threads);
      !status.ok()) {
    return status;
  }
  const int64_t num_input = memberships.size();

  // Every pair is checked before anything gets allocated. Each shard records
  // its first offending position, so that the reported one is the first in
  // input order whatever the number of threads.
  const int num_input_shards = ComputeNumShards(num_input, num_threads);
  std::vector<int64_t> first_invalid(num_input_shards, -1);
  ParallelForEachShard(num_input_shards, num_threads, [&](int shard) {
    const auto [begin, end] = ShardBounds(shard, num_input_shards, num_input);
    for (int64_t i = begin; i < end; ++i) {
      const Membership& m = memberships[i];
      if (m.subset < 0 || m.subset >= num_subsets || m.element < 0 ||
          m.element >= num_elements) {
        first_invalid[shard] = i;
        return;
      }
    }
  });
  for (const int64_t i : first_invalid) {
    if (i < 0) continue;
    return absl::InvalidArgumentError(absl::StrCat(
        "membership #", i, " (subset ", memberships[i].subset, ", element ",
        memberships[i].element, ") is out of range: num_subsets = ",
        num_subsets, ", num_elements = ", num_elements));
  }

  MembershipIndex index;
  index.num_subsets_ = num_subsets;
  index.num_elements_ = num_elements;

  // Counting scatter into the columns.
  SubsetToIntVector column_sizes(num_subsets, 0);
  for (const Membership& m : memberships) {
    ++column_sizes[SubsetIndex(m.subset)];
  }
  index.columns_.resize(SubsetIndex(num_subsets));
  for (const SubsetIndex subset : index.SubsetRange()) {
    index.columns_[subset].reserve(ColumnEntryIndex(column_sizes[subset]));
  }
  for (const Membership& m : memberships) {
    index.columns_[SubsetIndex(m.subset)].push_back(ElementIndex(m.element));
  }

  // Sort and deduplicate each column. Shards own disjoint ranges of subsets.
  const int num_subset_shards = ComputeNumShards(num_subsets, num_threads);
  ParallelForEachShard(num_subset_shards, num_threads, [&](int shard) {
    const auto [begin, end] =
        ShardBounds(shard, num_subset_shards, num_subsets);
    for (SubsetIndex subset(begin); subset < SubsetIndex(end); ++subset) {
      SparseColumn& column = index.columns_[subset];
      std::sort(column.begin(), column.end());
      column.erase(std::unique(column.begin(), column.end()), column.end());
    }
  });

  int64_t num_memberships = 0;
  for (const SparseColumn& column : index.columns_) {
    num_memberships += column.size();
  }
  index.num_memberships_ = num_memberships;
  index.num_duplicate_memberships_ = num_input - num_memberships;
  index.CreateSparseRowView();
  VLOG(1) << "Built membership index with " << num_subsets << " subsets, "
          << num_elements << " elements, " << num_memberships
          << " memberships (" << index.num_duplicate_memberships_
          << " duplicates dropped)";
  return index;
}

absl::StatusOr<MembershipIndex> MembershipIndex::BuildFromColumns(
    const std::vector<std::vector<BaseInt>>& subsets, BaseInt num_elements,
    int num_threads) {
  std::vector<Membership> memberships;
  size_t total_size = 0;
  for (const std::vector<BaseInt>& subset : subsets) {
    total_size += subset.size();
  }
  memberships.reserve(total_size);
  const BaseInt num_subsets = static_cast<BaseInt>(subsets.size());
  for (BaseInt subset = 0; subset < num_subsets; ++subset) {
    for (const BaseInt element : subsets[subset]) {
      memberships.push_back({subset, element});
    }
  }
  return Build(memberships, num_subsets, num_elements, num_threads);
}

void MembershipIndex::CreateSparseRowView() {
  rows_.clear();
  rows_.resize(ElementIndex(num_elements_));
  ElementToIntVector row_sizes(num_elements_, 0);
  for (const SparseColumn& column : columns_) {
    for (const ElementIndex element : column) {
      ++row_sizes[element];
    }
  }
  for (const ElementIndex element : ElementRange()) {
    rows_[element].reserve(RowEntryIndex(row_sizes[element]));
  }
  for (const SubsetIndex subset : SubsetRange()) {
    for (const ElementIndex element : columns_[subset]) {
      rows_[element].push_back(subset);
    }
  }
}

BaseInt MembershipIndex::ComputeNumUncoverableElements() const {
  BaseInt num_uncoverable = 0;
  for (const SparseRow& row : rows_) {
    if (row.empty()) ++num_uncoverable;
  }
  return num_uncoverable;
}

namespace {
// Returns the standard deviation of the values, excluding those that are zero.
template <typename T>
double StandardDeviation(const std::vector<T>& values) {
  double n = 0.0;
  double sum_of_squares = 0.0;
  double sum = 0.0;
  for (const T value : values) {
    const double sample = static_cast<double>(value);
    if (sample == 0.0) continue;
    sum_of_squares += sample * sample;
    sum += sample;
    ++n;
  }
  return n == 0.0 ? 0.0 : std::sqrt((sum_of_squares - sum * sum / n) / n);
}

template <typename T>
MembershipIndex::Stats ComputeStats(std::vector<T> sizes) {
  MembershipIndex::Stats stats{0.0, 0.0, 0.0, 0.0, 0.0};
  if (sizes.empty()) return stats;
  stats.min = *std::min_element(sizes.begin(), sizes.end());
  stats.max = *std::max_element(sizes.begin(), sizes.end());
  stats.mean = std::accumulate(sizes.begin(), sizes.end(), 0.0) / sizes.size();
  std::nth_element(sizes.begin(), sizes.begin() + sizes.size() / 2,
                   sizes.end());
  stats.median = sizes[sizes.size() / 2];
  stats.stddev = StandardDeviation(sizes);
  return stats;
}
}  // namespace

MembershipIndex::Stats MembershipIndex::ComputeRowStats() const {
  std::vector<BaseInt> row_sizes(num_elements(), 0);
  for (const ElementIndex element : ElementRange()) {
    row_sizes[element.value()] = rows_[element].size();
  }
  return ComputeStats(std::move(row_sizes));
}

MembershipIndex::Stats MembershipIndex::ComputeColumnStats() const {
  std::vector<BaseInt> column_sizes(num_subsets(), 0);
  for (const SubsetIndex subset : SubsetRange()) {
    column_sizes[subset.value()] = columns_[subset].size();
  }
  return ComputeStats(std::move(column_sizes));
}

}  // namespace covertools
