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

#ifndef GANTT_SOLVER_BASE_STATUS_MACROS_H_
#define GANTT_SOLVER_BASE_STATUS_MACROS_H_

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "gantt_solver/base/status_builder.h"

// Run a command that returns a absl::Status.  If the called code returns an
// error status, return that status up out of this method too.
//
// Example:
//   RETURN_IF_ERROR(ValidateProjectSchedulingProblem(problem));
//   RETURN_IF_ERROR(file::SetContents(path, json)) << "while writing " << path;
#define RETURN_IF_ERROR(expr)                                        \
  switch (0)                                                         \
  case 0:                                                            \
  default:                                                           \
    if (const ::absl::Status status_macro_internal_adaptor = (expr); \
        status_macro_internal_adaptor.ok()) {                        \
    } else /* NOLINT */                                              \
      return ::gantt_solver::StatusBuilder(status_macro_internal_adaptor)

// Executes an expression that returns an absl::StatusOr, extracting its value
// into the variable defined by lhs (or returning on error).
//
// Example:
//   ASSIGN_OR_RETURN(TaskGraph graph, TaskGraph::Build(problem));
//
// WARNING: ASSIGN_OR_RETURN expands into multiple statements; it cannot be used
//  in a single statement (e.g. as the body of an if statement without {})!
#define ASSIGN_OR_RETURN(lhs, rexpr)                                   \
  GANTT_SOLVER_STATUS_MACROS_IMPL_ASSIGN_OR_RETURN_(                   \
      GANTT_SOLVER_STATUS_MACROS_IMPL_CONCAT_(_status_or_value,        \
                                              __COUNTER__),            \
      lhs, rexpr);

#define GANTT_SOLVER_STATUS_MACROS_IMPL_ASSIGN_OR_RETURN_(statusor, lhs, \
                                                          rexpr)         \
  auto statusor = (rexpr);                                               \
  RETURN_IF_ERROR(statusor.status());                                    \
  lhs = std::move(statusor).value()

// Internal helper for concatenating macro values.
#define GANTT_SOLVER_STATUS_MACROS_IMPL_CONCAT_INNER_(x, y) x##y
#define GANTT_SOLVER_STATUS_MACROS_IMPL_CONCAT_(x, y) \
  GANTT_SOLVER_STATUS_MACROS_IMPL_CONCAT_INNER_(x, y)

#endif  // GANTT_SOLVER_BASE_STATUS_MACROS_H_
