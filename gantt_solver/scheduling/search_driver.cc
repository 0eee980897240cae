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

#include "gantt_solver/scheduling/search_driver.h"

#include <atomic>
#include <string>

#include "absl/log/log.h"
#include "absl/status/statusor.h"
#include "gantt_solver/base/status_builder.h"
#include "gantt_solver/base/status_macros.h"
#include "gantt_solver/scheduling/parameters.h"
#include "gantt_solver/scheduling/project_scheduling.pb.h"
#include "gantt_solver/scheduling/schedule_model.h"
#include "google/protobuf/text_format.h"
#include "ortools/sat/cp_model.pb.h"
#include "ortools/sat/cp_model_solver.h"
#include "ortools/sat/model.h"
#include "ortools/sat/sat_parameters.pb.h"

namespace gantt_solver {
namespace scheduling {

using ::operations_research::sat::CpSolverResponse;
using ::operations_research::sat::CpSolverStatus;
using ::operations_research::sat::Model;
using ::operations_research::sat::NewFeasibleSolutionObserver;
using ::operations_research::sat::NewSatParameters;

absl::StatusOr<operations_research::sat::SatParameters>
SearchDriver::BuildSatParameters() const {
  const std::string error = FindErrorInSchedulingParameters(parameters_);
  if (!error.empty()) {
    return InvalidArgumentErrorBuilder() << error;
  }
  operations_research::sat::SatParameters sat_parameters;
  sat_parameters.set_max_time_in_seconds(parameters_.max_time_in_seconds());
  if (parameters_.num_search_workers() > 0) {
    sat_parameters.set_num_workers(parameters_.num_search_workers());
  }
  sat_parameters.set_log_search_progress(parameters_.log_search_progress());
  if (!parameters_.sat_parameters().empty()) {
    operations_research::sat::SatParameters extra_parameters;
    if (!google::protobuf::TextFormat::ParseFromString(
            parameters_.sat_parameters(), &extra_parameters)) {
      return InvalidArgumentErrorBuilder()
             << "could not parse sat_parameters: '"
             << parameters_.sat_parameters() << "'";
    }
    sat_parameters.MergeFrom(extra_parameters);
  }
  return sat_parameters;
}

absl::StatusOr<TerminalStatus> SearchDriver::Solve(
    const ScheduleModel& model, const SolutionCallback& on_solution) {
  ASSIGN_OR_RETURN(const operations_research::sat::SatParameters sat_parameters,
                   BuildSatParameters());

  Model sat_model;
  sat_model.Add(NewSatParameters(sat_parameters));
  std::atomic<int> num_solutions = 0;
  sat_model.Add(NewFeasibleSolutionObserver(
      [&num_solutions, &on_solution](const CpSolverResponse& response) {
        LOG(INFO) << "Solution #" << ++num_solutions
                << ", objective: " << response.objective_value()
                << ", time: " << response.wall_time() << "s";
        on_solution(response);
      }));

  LOG(INFO) << "Solving with a time limit of "
            << sat_parameters.max_time_in_seconds() << "s";
  const CpSolverResponse response =
      operations_research::sat::SolveCpModel(model.cp_model().Build(),
                                             &sat_model);
  last_response_stats_ = operations_research::sat::CpSolverResponseStats(
      response, /*has_objective=*/true);
  VLOG(1) << last_response_stats_;

  switch (response.status()) {
    case CpSolverStatus::OPTIMAL:
      LOG(INFO) << "Optimal schedule length: " << response.objective_value();
      return TerminalStatus::OPTIMAL;
    case CpSolverStatus::FEASIBLE:
      LOG(WARNING) << "Time limit reached before proving optimality, best "
                   << "schedule length: " << response.objective_value()
                   << ", lower bound: " << response.best_objective_bound();
      return TerminalStatus::FEASIBLE;
    case CpSolverStatus::INFEASIBLE:
      LOG(INFO) << "The problem is infeasible";
      return TerminalStatus::INFEASIBLE;
    case CpSolverStatus::UNKNOWN:
      LOG(WARNING) << "Time limit reached without finding a solution";
      return TerminalStatus::UNKNOWN;
    case CpSolverStatus::MODEL_INVALID:
      return InternalErrorBuilder()
             << "the solver rejected the model: " << response.solution_info();
    default:
      return InternalErrorBuilder()
             << "unexpected solver status: "
             << operations_research::sat::CpSolverStatus_Name(
                    response.status());
  }
}

}  // namespace scheduling
}  // namespace gantt_solver
