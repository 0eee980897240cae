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

// Test helpers for code returning absl::Status and absl::StatusOr<T>:
//
//   using ::testing::status::StatusIs;
//   EXPECT_THAT(TaskGraph::Build(problem),
//               StatusIs(absl::StatusCode::kFailedPrecondition,
//                        HasSubstr("dependency cycle")));
//   ASSERT_OK_AND_ASSIGN(const TaskGraph graph, TaskGraph::Build(problem));

#ifndef GANTT_SOLVER_BASE_GMOCK_H_
#define GANTT_SOLVER_BASE_GMOCK_H_

#include <utility>

#include "absl/status/status_matchers.h"  // IWYU pragma: export
#include "gmock/gmock.h"                  // IWYU pragma: export
#include "gtest/gtest.h"                  // IWYU pragma: export

namespace testing {
namespace status {
using ::absl_testing::IsOk;
using ::absl_testing::IsOkAndHolds;
using ::absl_testing::StatusIs;
}  // namespace status
}  // namespace testing

#define EXPECT_OK(expression) EXPECT_THAT(expression, ::testing::status::IsOk())
#define ASSERT_OK(expression) ASSERT_THAT(expression, ::testing::status::IsOk())

// Asserts that rexpr, an absl::StatusOr<T>, is OK and moves its value to lhs,
// which may be a declaration. Only usable in functions returning void.
#undef ASSERT_OK_AND_ASSIGN
#define ASSERT_OK_AND_ASSIGN(lhs, rexpr)                      \
  GANTT_SOLVER_ASSERT_OK_AND_ASSIGN_IMPL_(                    \
      GANTT_SOLVER_GMOCK_CONCAT_(_status_or_value, __LINE__), \
      lhs, rexpr)

#define GANTT_SOLVER_ASSERT_OK_AND_ASSIGN_IMPL_(statusor, lhs, rexpr) \
  auto statusor = (rexpr);                                            \
  ASSERT_THAT(statusor.status(), ::testing::status::IsOk());          \
  lhs = std::move(statusor).value()

#define GANTT_SOLVER_GMOCK_CONCAT_INNER_(x, y) x##y
#define GANTT_SOLVER_GMOCK_CONCAT_(x, y) GANTT_SOLVER_GMOCK_CONCAT_INNER_(x, y)

#endif  // GANTT_SOLVER_BASE_GMOCK_H_
