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
#include "covertools/algorithms/greedy_cover.h"

#include <cmath>
#include <limits>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "covertools/algorithms/cover_result.h"
#include "covertools/algorithms/greedy_cover.pb.h"
#include "covertools/algorithms/label_mapping.h"
#include "covertools/algorithms/membership_index.h"
#include "covertools/base/gmock.h"
#include "google/protobuf/text_format.h"

namespace covertools {
namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;

// A = {0, 1}, B = {1, 2}, C = {2}.
const std::vector<Membership>& OverlappingMemberships() {
  static const auto* const kMemberships = new std::vector<Membership>{
      {0, 0}, {0, 1}, {1, 1}, {1, 2}, {2, 2}};
  return *kMemberships;
}

TEST(ValidateGreedyCoverParametersTest, DefaultIsValid) {
  EXPECT_OK(ValidateGreedyCoverParameters(GreedyCoverParameters()));
}

TEST(ValidateGreedyCoverParametersTest, RejectsNegativeMaxIterations) {
  GreedyCoverParameters params;
  params.set_max_iterations(-1);
  const absl::Status status = ValidateGreedyCoverParameters(params);
  EXPECT_EQ(status.code(), absl::StatusCode::kInvalidArgument);
  EXPECT_THAT(status.message(), HasSubstr("max_iterations"));
}

TEST(ValidateGreedyCoverParametersTest, AcceptsZeroMaxIterations) {
  GreedyCoverParameters params;
  params.set_max_iterations(0);
  EXPECT_OK(ValidateGreedyCoverParameters(params));
}

TEST(ValidateGreedyCoverParametersTest, RejectsNegativeNumThreads) {
  GreedyCoverParameters params;
  params.set_num_threads(-2);
  const absl::Status status = ValidateGreedyCoverParameters(params);
  EXPECT_EQ(status.code(), absl::StatusCode::kInvalidArgument);
  EXPECT_THAT(status.message(), HasSubstr("num_threads"));
}

TEST(ValidateGreedyCoverParametersTest, RejectsUnknownAlgorithm) {
  GreedyCoverParameters params;
  params.set_algorithm(static_cast<GreedyCoverParameters::Algorithm>(42));
  const absl::Status status = ValidateGreedyCoverParameters(params);
  EXPECT_EQ(status.code(), absl::StatusCode::kInvalidArgument);
  EXPECT_THAT(status.message(), HasSubstr("algorithm"));
}

TEST(ValidateGreedyCoverParametersTest, RejectsUnknownTieBreak) {
  GreedyCoverParameters params;
  params.set_tie_break(static_cast<GreedyCoverParameters::TieBreak>(7));
  const absl::Status status = ValidateGreedyCoverParameters(params);
  EXPECT_EQ(status.code(), absl::StatusCode::kInvalidArgument);
  EXPECT_THAT(status.message(), HasSubstr("tie_break"));
}

TEST(ValidateGreedyCoverParametersTest, RejectsBadCosts) {
  for (const double cost : {0.0, -1.0, std::numeric_limits<double>::infinity(),
                            std::numeric_limits<double>::quiet_NaN()}) {
    GreedyCoverParameters params;
    params.add_subset_costs(1.0);
    params.add_subset_costs(cost);
    const absl::Status status = ValidateGreedyCoverParameters(params);
    EXPECT_EQ(status.code(), absl::StatusCode::kInvalidArgument) << cost;
    EXPECT_THAT(status.message(), HasSubstr("subset_costs[1]"));
  }
}

TEST(ValidateGreedyCoverParametersTest, RejectsCostCountMismatch) {
  GreedyCoverParameters params;
  params.add_subset_costs(1.0);
  params.add_subset_costs(2.0);
  EXPECT_OK(ValidateGreedyCoverParameters(params, 2));
  const absl::Status status = ValidateGreedyCoverParameters(params, 3);
  EXPECT_EQ(status.code(), absl::StatusCode::kInvalidArgument);
  EXPECT_THAT(status.message(), HasSubstr("expected 0 or 3"));
}

TEST(SolveGreedyCoverTest, OverlappingSubsets) {
  GreedyCoverParameters params;
  params.set_record_newly_covered_elements(true);
  ASSERT_OK_AND_ASSIGN(
      const CoverResult result,
      SolveGreedyCover(OverlappingMemberships(), 3, 3, params));
  EXPECT_THAT(result.solution, ElementsAre(SubsetIndex(0), SubsetIndex(1)));
  EXPECT_EQ(result.termination_reason, FULLY_COVERED);
  EXPECT_EQ(result.covered_count, 3);
  EXPECT_EQ(result.uncovered_count, 0);
  EXPECT_EQ(result.steps_taken, 2);
  EXPECT_EQ(result.cost, 2.0);
  EXPECT_THAT(result.uncovered_elements, IsEmpty());
  ASSERT_EQ(result.steps.size(), 2);
  EXPECT_THAT(result.steps[1].newly_covered_elements,
              ElementsAre(ElementIndex(2)));
}

TEST(SolveGreedyCoverTest, EveryAlgorithmGivesTheSameResult) {
  for (const auto algorithm : {GreedyCoverParameters::ALGORITHM_UNSPECIFIED,
                               GreedyCoverParameters::GREEDY_STANDARD,
                               GreedyCoverParameters::GREEDY_BITSET,
                               GreedyCoverParameters::GREEDY_TEXTBOOK}) {
    GreedyCoverParameters params;
    params.set_algorithm(algorithm);
    ASSERT_OK_AND_ASSIGN(
        const CoverResult result,
        SolveGreedyCover(OverlappingMemberships(), 3, 3, params));
    EXPECT_THAT(result.solution, ElementsAre(SubsetIndex(0), SubsetIndex(1)));
  }
}

TEST(SolveGreedyCoverTest, ZeroSubsets) {
  ASSERT_OK_AND_ASSIGN(const CoverResult result,
                       SolveGreedyCover({}, 0, 4, GreedyCoverParameters()));
  EXPECT_THAT(result.solution, IsEmpty());
  EXPECT_EQ(result.termination_reason, RESIDUAL_UNCOVERABLE);
  EXPECT_EQ(result.uncovered_count, 4);
  EXPECT_EQ(result.covered_count, 0);
  EXPECT_EQ(result.steps_taken, 0);
  EXPECT_THAT(result.uncovered_elements,
              ElementsAre(ElementIndex(0), ElementIndex(1), ElementIndex(2),
                          ElementIndex(3)));
}

TEST(SolveGreedyCoverTest, ZeroElements) {
  ASSERT_OK_AND_ASSIGN(const CoverResult result,
                       SolveGreedyCover({}, 3, 0, GreedyCoverParameters()));
  EXPECT_THAT(result.solution, IsEmpty());
  EXPECT_EQ(result.termination_reason, FULLY_COVERED);
  EXPECT_EQ(result.uncovered_count, 0);
}

TEST(SolveGreedyCoverTest, InvalidInputIsReportedBeforeSelection) {
  const std::vector<Membership> memberships = {{0, 0}, {0, 3}};
  const absl::StatusOr<CoverResult> result =
      SolveGreedyCover(memberships, 1, 3, GreedyCoverParameters());
  EXPECT_EQ(result.status().code(), absl::StatusCode::kInvalidArgument);
  EXPECT_THAT(result.status().message(), HasSubstr("element 3"));
}

TEST(SolveGreedyCoverTest, InvalidParameters) {
  GreedyCoverParameters params;
  params.add_subset_costs(1.0);
  const absl::StatusOr<CoverResult> result =
      SolveGreedyCover(OverlappingMemberships(), 3, 3, params);
  EXPECT_EQ(result.status().code(), absl::StatusCode::kInvalidArgument);
  EXPECT_THAT(result.status().message(), HasSubstr("subset_costs"));
}

TEST(SolveGreedyCoverTest, CostWeighting) {
  // A = {0, 1, 2} costs 3, B = {0, 1} costs 1, C = {2} costs 1.
  ASSERT_OK_AND_ASSIGN(
      const MembershipIndex index,
      MembershipIndex::BuildFromColumns({{0, 1, 2}, {0, 1}, {2}}, 3));
  GreedyCoverParameters params;
  for (const double cost : {3.0, 1.0, 1.0}) params.add_subset_costs(cost);
  ASSERT_OK_AND_ASSIGN(const CoverResult result,
                       SolveGreedyCover(index, params));
  EXPECT_THAT(result.solution, ElementsAre(SubsetIndex(1), SubsetIndex(2)));
  EXPECT_EQ(result.cost, 2.0);
}

TEST(SolveGreedyCoverTest, IterationLimit) {
  ASSERT_OK_AND_ASSIGN(
      const MembershipIndex index,
      MembershipIndex::BuildFromColumns({{0, 1, 2}, {3, 4}, {5}}, 6));
  GreedyCoverParameters params;
  params.set_max_iterations(2);
  ASSERT_OK_AND_ASSIGN(const CoverResult result,
                       SolveGreedyCover(index, params));
  EXPECT_THAT(result.solution, ElementsAre(SubsetIndex(0), SubsetIndex(1)));
  EXPECT_EQ(result.termination_reason, ITERATION_LIMIT_REACHED);
  EXPECT_EQ(result.covered_count, 5);
  EXPECT_EQ(result.uncovered_count, 1);
  EXPECT_THAT(result.uncovered_elements, ElementsAre(ElementIndex(5)));

  params.set_max_iterations(3);
  ASSERT_OK_AND_ASSIGN(const CoverResult complete,
                       SolveGreedyCover(index, params));
  EXPECT_EQ(complete.termination_reason, FULLY_COVERED);
}

TEST(SolveGreedyCoverTest, NumThreadsDoesNotChangeTheResult) {
  std::vector<Membership> memberships;
  for (BaseInt subset = 0; subset < 500; ++subset) {
    for (BaseInt i = 0; i < 7; ++i) {
      memberships.push_back({subset, (subset * 37 + i * 101) % 1'000});
    }
  }
  GreedyCoverParameters params;
  ASSERT_OK_AND_ASSIGN(const CoverResult reference,
                       SolveGreedyCover(memberships, 500, 1'000, params));
  params.set_num_threads(4);
  ASSERT_OK_AND_ASSIGN(const CoverResult result,
                       SolveGreedyCover(memberships, 500, 1'000, params));
  EXPECT_EQ(result.solution, reference.solution);
  EXPECT_EQ(result.uncovered_count, reference.uncovered_count);
}

TEST(CoverResultTest, ExportAsProto) {
  GreedyCoverParameters params;
  params.set_record_newly_covered_elements(true);
  ASSERT_OK_AND_ASSIGN(
      const MembershipIndex index,
      MembershipIndex::BuildFromColumns({{0, 1}, {1, 2}, {2}}, 4));
  ASSERT_OK_AND_ASSIGN(const CoverResult result,
                       SolveGreedyCover(index, params));
  GreedyCoverResponse expected;
  ASSERT_TRUE(google::protobuf::TextFormat::ParseFromString(
      R"pb(
        subset: [ 0, 1 ]
        step { subset: 0 num_newly_covered: 2 newly_covered_element: [ 0, 1 ] }
        step { subset: 1 num_newly_covered: 1 newly_covered_element: 2 }
        num_subsets: 3
        num_elements: 4
        covered_count: 3
        uncovered_count: 1
        steps_taken: 2
        cost: 2
        termination_reason: RESIDUAL_UNCOVERABLE
        uncovered_element: 3
      )pb",
      &expected));
  const GreedyCoverResponse response = result.ExportAsProto();
  EXPECT_EQ(response.SerializeAsString(), expected.SerializeAsString())
      << response.DebugString();
}

TEST(CoverResultTest, LabeledSolution) {
  LabelMapping<std::string> subsets;
  LabelMapping<std::string> elements;
  std::vector<Membership> memberships;
  for (const auto& [subset, element] :
       std::vector<std::pair<std::string, std::string>>{
           {"A", "x"}, {"A", "y"}, {"B", "y"}, {"B", "z"}, {"C", "z"}}) {
    memberships.push_back({subsets.Intern(subset), elements.Intern(element)});
  }
  ASSERT_OK_AND_ASSIGN(
      const CoverResult result,
      SolveGreedyCover(memberships, subsets.size(), elements.size(),
                       GreedyCoverParameters()));
  EXPECT_THAT(result.LabeledSolution(subsets), ElementsAre("A", "B"));
}

}  // namespace
}  // namespace covertools
