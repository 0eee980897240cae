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

#include "gantt_solver/scheduling/project_scheduler.h"

#include <memory>
#include <string>
#include <vector>

#include "absl/log/log.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "gantt_solver/base/file.h"
#include "gantt_solver/base/status_builder.h"
#include "gantt_solver/base/status_macros.h"
#include "gantt_solver/scheduling/gantt_chart.h"
#include "gantt_solver/scheduling/parameters.h"
#include "gantt_solver/scheduling/project_scheduling.pb.h"
#include "gantt_solver/scheduling/schedule_model.h"
#include "gantt_solver/scheduling/schedule_output.h"
#include "gantt_solver/scheduling/search_driver.h"
#include "gantt_solver/scheduling/solution_collector.h"
#include "gantt_solver/scheduling/task_graph.h"
#include "ortools/sat/cp_model.pb.h"

namespace gantt_solver {
namespace scheduling {

absl::StatusOr<ProjectSchedulingResult> SearchSchedules(
    const ProjectSchedulingProblem& problem,
    const SchedulingParameters& parameters) {
  const std::string error = FindErrorInSchedulingParameters(parameters);
  if (!error.empty()) {
    return InvalidArgumentErrorBuilder() << "invalid parameters: " << error;
  }
  ASSIGN_OR_RETURN(const TaskGraph graph, TaskGraph::Build(problem));
  ASSIGN_OR_RETURN(
      const std::unique_ptr<ScheduleModel> model,
      BuildScheduleModel(&graph, problem.max_resources_in_parallel(),
                         parameters.max_duration()));

  ScheduleSolutionCollector collector(model.get(),
                                      parameters.max_solutions());
  SearchDriver driver(parameters);
  const SolutionCallback on_solution =
      [&collector](const operations_research::sat::CpSolverResponse& r) {
        collector.OnSolution(r);
      };
  ProjectSchedulingResult result;
  ASSIGN_OR_RETURN(result.status, driver.Solve(*model, on_solution));
  result.solutions = collector.TopSolutions();
  result.num_solutions_found = collector.num_solutions();
  LOG(INFO) << "Search ended with status " << TerminalStatus_Name(result.status)
            << " after " << result.num_solutions_found << " solution(s), "
            << result.solutions.size() << " kept.";
  for (const ScheduleSolution& solution : result.solutions) {
    LogScheduleSolution(solution,
                        result.status == TerminalStatus::OPTIMAL &&
                            solution.total_duration() ==
                                result.solutions.front().total_duration());
  }
  return result;
}

absl::StatusOr<ProjectSchedulingResult> SolveProjectScheduling(
    const ProjectSchedulingProblem& problem,
    const SchedulingParameters& parameters) {
  ASSIGN_OR_RETURN(ProjectSchedulingResult result,
                   SearchSchedules(problem, parameters));
  if (result.solutions.empty()) {
    return NotFoundErrorBuilder()
           << "no feasible schedule found, search status: "
           << TerminalStatus_Name(result.status);
  }
  return result;
}

absl::StatusOr<std::vector<std::string>> ExportSchedules(
    const std::vector<ScheduleSolution>& solutions,
    absl::string_view output_prefix, const ScheduleSerializer& serializer,
    const GanttChartRenderer& renderer) {
  std::vector<std::string> file_names;
  const int num_solutions = solutions.size();
  for (int i = 0; i < num_solutions; ++i) {
    const ScheduleOutput output = BuildScheduleOutput(solutions[i]);

    ASSIGN_OR_RETURN(const std::string record,
                     serializer.Serialize(output.record));
    const std::string record_file_name =
        absl::StrCat(output_prefix, "_", i, ".", serializer.FileExtension());
    RETURN_IF_ERROR(file::SetContents(record_file_name, record));
    file_names.push_back(record_file_name);

    const std::string chart_file_name =
        absl::StrCat(output_prefix, "_", i, ".", renderer.FileExtension());
    RETURN_IF_ERROR(file::SetContents(
        chart_file_name, renderer.Render(output.bars, "Gantt Chart")));
    file_names.push_back(chart_file_name);

    LOG(INFO) << "Wrote schedule #" << i << " to '" << record_file_name
              << "' and '" << chart_file_name << "'";
  }
  return file_names;
}

}  // namespace scheduling
}  // namespace gantt_solver
