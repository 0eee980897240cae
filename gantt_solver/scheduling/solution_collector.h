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

#ifndef GANTT_SOLVER_SCHEDULING_SOLUTION_COLLECTOR_H_
#define GANTT_SOLVER_SCHEDULING_SOLUTION_COLLECTOR_H_

#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"
#include "gantt_solver/scheduling/project_scheduling.pb.h"
#include "gantt_solver/scheduling/schedule_model.h"
#include "ortools/sat/cp_model.pb.h"

namespace gantt_solver {
namespace scheduling {

// Stores the solutions reported during the search of a ScheduleModel and
// returns the best ones at the end of the search.
//
// All the reported solutions are kept, the selection is done by
// TopSolutions(). OnSolution() and Add() can be called concurrently.
class ScheduleSolutionCollector {
 public:
  // Does not take ownership of model, which must outlive the collector.
  // max_solutions must be positive.
  ScheduleSolutionCollector(const ScheduleModel* model, int max_solutions);

  // This type is neither copyable nor movable.
  ScheduleSolutionCollector(const ScheduleSolutionCollector&) = delete;
  ScheduleSolutionCollector& operator=(const ScheduleSolutionCollector&) =
      delete;

  // Reads the schedule of a feasible response of the solver, to be used as
  // the SolutionCallback of the SearchDriver.
  void OnSolution(const operations_research::sat::CpSolverResponse& response);

  void Add(ScheduleSolution solution);

  // Returns the max_solutions solutions with the smallest total duration, by
  // increasing total duration. Solutions with the same total duration keep
  // the order in which they were reported, duplicates included.
  std::vector<ScheduleSolution> TopSolutions() const;

  int num_solutions() const;
  int max_solutions() const { return max_solutions_; }

 private:
  const ScheduleModel* const model_;
  const int max_solutions_;

  mutable absl::Mutex mutex_;
  std::vector<ScheduleSolution> solutions_ ABSL_GUARDED_BY(mutex_);
};

}  // namespace scheduling
}  // namespace gantt_solver

#endif  // GANTT_SOLVER_SCHEDULING_SOLUTION_COLLECTOR_H_
