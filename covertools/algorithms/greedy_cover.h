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
#ifndef COVERTOOLS_ALGORITHMS_GREEDY_COVER_H_
#define COVERTOOLS_ALGORITHMS_GREEDY_COVER_H_

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/types/span.h"
#include "covertools/algorithms/cover_result.h"
#include "covertools/algorithms/greedy_cover.pb.h"
#include "covertools/algorithms/membership_index.h"

namespace covertools {

// Returns InvalidArgumentError if `params` is not valid, independently of any
// instance: unknown enum values, negative max_iterations or num_threads, or a
// cost that is not strictly positive and finite.
absl::Status ValidateGreedyCoverParameters(const GreedyCoverParameters& params);

// Same, also checking that subset_costs is either empty or has exactly
// num_subsets entries.
absl::Status ValidateGreedyCoverParameters(const GreedyCoverParameters& params,
                                           BaseInt num_subsets);

// Runs the greedy heuristic selected by params.algorithm() on `index`.
// The parameters are validated before anything else. Instances with no
// subsets or no elements are not errors: they produce an empty solution.
absl::StatusOr<CoverResult> SolveGreedyCover(
    const MembershipIndex& index, const GreedyCoverParameters& params);

// Builds the index from raw pairs with params.num_threads() threads, then
// solves as above. Input errors are reported before any selection happens.
absl::StatusOr<CoverResult> SolveGreedyCover(
    absl::Span<const Membership> memberships, BaseInt num_subsets,
    BaseInt num_elements, const GreedyCoverParameters& params);

}  // namespace covertools

#endif  // COVERTOOLS_ALGORITHMS_GREEDY_COVER_H_
