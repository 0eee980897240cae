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

#ifndef GANTT_SOLVER_SCHEDULING_PROJECT_SCHEDULER_H_
#define GANTT_SOLVER_SCHEDULING_PROJECT_SCHEDULER_H_

#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "gantt_solver/scheduling/gantt_chart.h"
#include "gantt_solver/scheduling/project_scheduling.pb.h"
#include "gantt_solver/scheduling/schedule_output.h"
#include "gantt_solver/scheduling/scheduling_parameters.pb.h"

namespace gantt_solver {
namespace scheduling {

struct ProjectSchedulingResult {
  TerminalStatus status = TerminalStatus::UNKNOWN;
  // The best parameters.max_solutions() solutions found, by increasing total
  // duration.
  std::vector<ScheduleSolution> solutions;
  // Number of solutions reported during the search, including the ones not
  // kept in 'solutions'.
  int num_solutions_found = 0;
};

// Builds the dependency graph and the model of the problem, and searches for
// schedules within the time limit of the parameters. Not finding any schedule
// is not an error here: 'status' is then INFEASIBLE or UNKNOWN and
// 'solutions' is empty.
//
// Errors:
//  - InvalidArgumentError for invalid parameters, an invalid problem or a
//    dependency on an unknown project,
//  - FailedPreconditionError if the dependencies contain a cycle,
//  - InternalError if the solver rejected the model.
absl::StatusOr<ProjectSchedulingResult> SearchSchedules(
    const ProjectSchedulingProblem& problem,
    const SchedulingParameters& parameters);

// Same as SearchSchedules(), but returns a NotFoundError mentioning the
// terminal status when no schedule was found.
absl::StatusOr<ProjectSchedulingResult> SolveProjectScheduling(
    const ProjectSchedulingProblem& problem,
    const SchedulingParameters& parameters);

// For each solution i, writes the serialized solution and its Gantt chart to
// "<output_prefix>_<i>.<ext>", where <ext> is the FileExtension() of the
// serializer and of the renderer respectively. Returns the names of the
// written files, in order.
absl::StatusOr<std::vector<std::string>> ExportSchedules(
    const std::vector<ScheduleSolution>& solutions,
    absl::string_view output_prefix, const ScheduleSerializer& serializer,
    const GanttChartRenderer& renderer);

}  // namespace scheduling
}  // namespace gantt_solver

#endif  // GANTT_SOLVER_SCHEDULING_PROJECT_SCHEDULER_H_
