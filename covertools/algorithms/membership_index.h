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

#ifndef COVERTOOLS_ALGORITHMS_MEMBERSHIP_INDEX_H_
#define COVERTOOLS_ALGORITHMS_MEMBERSHIP_INDEX_H_

#include <cstdint>
#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/types/span.h"
#include "covertools/base/strong_int.h"
#include "covertools/base/strong_vector.h"

// Immutable representation of a set-covering instance.
//
// Let E be a "universe" set, and let (S_j) be a family (j in J) of subsets of
// E. The input is the membership relation between J and E, given as a list of
// (subset, element) pairs of dense integers. Both axes are declared
// up-front: subsets live in [0, num_subsets) and elements in
// [0, num_elements). The universe is the whole declared element range, so an
// element that belongs to no subset is part of the universe and can never be
// covered.
//
// The index stores the relation twice:
// - the column view maps each subset to its sorted elements;
// - the row view maps each element to the sorted subsets containing it.
// Repeated pairs are merged, so feeding a pair twice is the same as feeding
// it once.
//
// We use m to denote |E|, the number of elements, n to denote |S|, the number
// of subsets, and NNZ the number of distinct memberships.

namespace covertools {
// Basic non-strict type for cost.
using Cost = double;

// Base non-strict integer type for counting elements and subsets.
// Using ints makes it possible to represent problems with more than 2 billion
// (2e9) elements and subsets.
using BaseInt = int32_t;

// Subset index.
DEFINE_STRONG_INT_TYPE(SubsetIndex, BaseInt);

// Element index.
DEFINE_STRONG_INT_TYPE(ElementIndex, BaseInt);

// Position in a column (a subset with all its elements) or in a row (the
// subsets which contain a given element).
DEFINE_STRONG_INT_TYPE(ColumnEntryIndex, BaseInt);
DEFINE_STRONG_INT_TYPE(RowEntryIndex, BaseInt);

using SubsetRange = util_intops::StrongIntRange<SubsetIndex>;
using ElementRange = util_intops::StrongIntRange<ElementIndex>;

using SubsetCostVector = util_intops::StrongVector<SubsetIndex, Cost>;

using SparseColumn = util_intops::StrongVector<ColumnEntryIndex, ElementIndex>;
using SparseRow = util_intops::StrongVector<RowEntryIndex, SubsetIndex>;

using ElementToIntVector = util_intops::StrongVector<ElementIndex, BaseInt>;
using SubsetToIntVector = util_intops::StrongVector<SubsetIndex, BaseInt>;

using SparseColumnView = util_intops::StrongVector<SubsetIndex, SparseColumn>;
using SparseRowView = util_intops::StrongVector<ElementIndex, SparseRow>;

using SubsetBoolVector = util_intops::StrongVector<SubsetIndex, bool>;
using ElementBoolVector = util_intops::StrongVector<ElementIndex, bool>;

// One row of the raw membership relation, as produced by the identifier
// mapping layer.
struct Membership {
  BaseInt subset;
  BaseInt element;
};

class MembershipIndex {
 public:
  // Constructs an empty index, with no subsets and no elements.
  MembershipIndex();

  // Builds the index from raw (subset, element) pairs.
  // Returns an InvalidArgument error, before doing any other work, when
  // - num_subsets or num_elements is negative,
  // - memberships is non-empty while num_subsets or num_elements is zero,
  // - some pair has a subset outside [0, num_subsets) or an element outside
  //   [0, num_elements).
  // The result does not depend on the order of `memberships` nor on
  // num_threads, which is the number of threads used for validating and
  // sorting.
  static absl::StatusOr<MembershipIndex> Build(
      absl::Span<const Membership> memberships, BaseInt num_subsets,
      BaseInt num_elements, int num_threads = 1);

  // Builds the index directly from a column view, i.e. from the list of
  // elements of each subset. Same error conditions as above.
  static absl::StatusOr<MembershipIndex> BuildFromColumns(
      const std::vector<std::vector<BaseInt>>& subsets, BaseInt num_elements,
      int num_threads = 1);

  // Returns true if the index has no subsets or no elements.
  bool IsEmpty() const { return num_subsets_ == 0 || num_elements_ == 0; }

  // Number of elements in the universe. In matrix terms, the number of rows.
  BaseInt num_elements() const { return num_elements_; }

  // Number of subsets. In matrix terms, the number of columns.
  BaseInt num_subsets() const { return num_subsets_; }

  // Number of distinct memberships. The value is an int64_t because there can
  // be more than 1 << 31 memberships even with BaseInt = int32_t.
  int64_t num_memberships() const { return num_memberships_; }

  // Number of input pairs that were dropped because they repeated an earlier
  // one.
  int64_t num_duplicate_memberships() const {
    return num_duplicate_memberships_;
  }

  // Fraction of the (subset, element) pairs that are memberships. Zero for an
  // empty index.
  double FillRate() const {
    if (IsEmpty()) return 0.0;
    return 1.0 * num_memberships() / (1.0 * num_elements() * num_subsets());
  }

  // Column view: the sorted elements of each subset.
  const SparseColumnView& columns() const { return columns_; }

  // Row view: the sorted subsets containing each element.
  const SparseRowView& rows() const { return rows_; }

  util_intops::StrongIntRange<SubsetIndex> SubsetRange() const {
    return util_intops::StrongIntRange<SubsetIndex>(SubsetIndex(num_subsets_));
  }

  util_intops::StrongIntRange<ElementIndex> ElementRange() const {
    return util_intops::StrongIntRange<ElementIndex>(
        ElementIndex(num_elements_));
  }

  // Returns the number of elements that belong to no subset.
  BaseInt ComputeNumUncoverableElements() const;

  // Returns true if the subsets cover all the elements.
  bool ComputeFeasibility() const {
    return ComputeNumUncoverableElements() == 0;
  }

  // A struct enabling to show basic statistics on rows and columns.
  struct Stats {
    double min;
    double max;
    double median;
    double mean;
    double stddev;

    std::string DebugString() const {
      return absl::StrCat("min = ", min, ", max = ", max, ", mean = ", mean,
                          ", median = ", median, ", stddev = ", stddev);
    }
  };

  // Computes basic statistics on the sizes of the rows.
  Stats ComputeRowStats() const;

  // Computes basic statistics on the sizes of the columns.
  Stats ComputeColumnStats() const;

 private:
  // Fills rows_ from columns_. Rows come out sorted because columns are
  // scanned by increasing subset index.
  void CreateSparseRowView();

  BaseInt num_elements_;
  BaseInt num_subsets_;
  int64_t num_memberships_;
  int64_t num_duplicate_memberships_;

  // Vector of columns. Each column corresponds to a subset and contains the
  // elements of the given subset, sorted and without repetitions.
  // This takes NNZ BaseInts.
  SparseColumnView columns_;

  // Vector of rows. Each row corresponds to an element and contains the
  // subsets containing the element, sorted.
  // The size is exactly the same as for columns_.
  SparseRowView rows_;
};

}  // namespace covertools

#endif  // COVERTOOLS_ALGORITHMS_MEMBERSHIP_INDEX_H_
