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

#ifndef GANTT_SOLVER_SCHEDULING_SEARCH_DRIVER_H_
#define GANTT_SOLVER_SCHEDULING_SEARCH_DRIVER_H_

#include <functional>
#include <string>

#include "absl/status/statusor.h"
#include "gantt_solver/scheduling/project_scheduling.pb.h"
#include "gantt_solver/scheduling/schedule_model.h"
#include "gantt_solver/scheduling/scheduling_parameters.pb.h"
#include "ortools/sat/cp_model.pb.h"
#include "ortools/sat/sat_parameters.pb.h"

namespace gantt_solver {
namespace scheduling {

// Called each time the search finds a feasible solution, from the solving
// thread(s). Consecutive solutions are not guaranteed to improve.
using SolutionCallback =
    std::function<void(const operations_research::sat::CpSolverResponse&)>;

// Runs the CP-SAT search on a ScheduleModel, within a time limit.
//
// Usage:
//   SearchDriver driver(parameters);
//   ASSIGN_OR_RETURN(const TerminalStatus status,
//                    driver.Solve(*model, [&collector](const auto& r) {
//                      collector.OnSolution(r);
//                    }));
class SearchDriver {
 public:
  explicit SearchDriver(const SchedulingParameters& parameters)
      : parameters_(parameters) {}

  // Blocks until the search ends, i.e. at the latest when the time limit of
  // the parameters is reached. on_solution may be called any number of times,
  // including zero.
  //
  // Errors:
  //  - InvalidArgumentError if the parameters are not valid,
  //  - InternalError if the solver rejects the model.
  absl::StatusOr<TerminalStatus> Solve(const ScheduleModel& model,
                                       const SolutionCallback& on_solution);

  // The solver parameters derived from the scheduling parameters.
  absl::StatusOr<operations_research::sat::SatParameters> BuildSatParameters()
      const;

  // Statistics about the last call to Solve(), in a human readable form.
  const std::string& last_response_stats() const {
    return last_response_stats_;
  }

 private:
  const SchedulingParameters parameters_;
  std::string last_response_stats_;
};

}  // namespace scheduling
}  // namespace gantt_solver

#endif  // GANTT_SOLVER_SCHEDULING_SEARCH_DRIVER_H_
