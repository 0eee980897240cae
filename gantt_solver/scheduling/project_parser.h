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

// Reads and validates the JSON description of a project scheduling problem.
// See ./project_scheduling.proto for the format.

#ifndef GANTT_SOLVER_SCHEDULING_PROJECT_PARSER_H_
#define GANTT_SOLVER_SCHEDULING_PROJECT_PARSER_H_

#include <cstdint>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "gantt_solver/scheduling/project_scheduling.pb.h"

namespace gantt_solver {
namespace scheduling {

// Bound on the absolute value of every quantity of a problem, and on the sum
// of all durations and positive lags. CP-SAT domains and linear expressions
// built from such values cannot overflow.
inline constexpr int64_t kMaxScheduleValue = int64_t{1} << 40;

// Checks that all the required fields are present and in range:
//   - max_resources_in_parallel is set and positive,
//   - there is at least one project, and no project has an empty id,
//   - every project has a name, num_resources >= 0 and duration > 0,
//   - every dependency has a non-empty project_id and a lag_time,
//   - no value exceeds kMaxScheduleValue in absolute value, and neither does
//     the sum of all durations and positive lags.
// Returns an InvalidArgumentError describing the first violation otherwise.
// Whether dependencies point to existing projects is checked by TaskGraph.
absl::Status ValidateProjectSchedulingProblem(
    const ProjectSchedulingProblem& problem);

// Parses a JSON string. Unknown fields are errors. The result is validated
// with ValidateProjectSchedulingProblem().
absl::StatusOr<ProjectSchedulingProblem> ParseProjectSchedulingProblem(
    absl::string_view json);

// Same as above, reading the JSON from a file.
absl::StatusOr<ProjectSchedulingProblem> ReadProjectSchedulingProblem(
    absl::string_view file_name);

}  // namespace scheduling
}  // namespace gantt_solver

#endif  // GANTT_SOLVER_SCHEDULING_PROJECT_PARSER_H_
