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

#include "gantt_solver/scheduling/solution_collector.h"

#include <algorithm>
#include <utility>
#include <vector>

#include "absl/log/check.h"
#include "absl/log/log.h"
#include "absl/synchronization/mutex.h"
#include "gantt_solver/scheduling/project_scheduling.pb.h"
#include "gantt_solver/scheduling/schedule_model.h"
#include "gantt_solver/scheduling/task_graph.h"
#include "ortools/sat/cp_model.h"
#include "ortools/sat/cp_model.pb.h"

namespace gantt_solver {
namespace scheduling {

using ::operations_research::sat::CpSolverResponse;
using ::operations_research::sat::SolutionIntegerValue;

ScheduleSolutionCollector::ScheduleSolutionCollector(
    const ScheduleModel* model, int max_solutions)
    : model_(model), max_solutions_(max_solutions) {
  CHECK(model_ != nullptr);
  CHECK_GT(max_solutions_, 0);
}

void ScheduleSolutionCollector::OnSolution(const CpSolverResponse& response) {
  const TaskGraph& graph = model_->task_graph();
  ScheduleSolution solution;
  solution.set_total_duration(
      SolutionIntegerValue(response, model_->makespan()));
  for (int t = 0; t < graph.num_tasks(); ++t) {
    const Task& task = graph.task(t);
    const TaskVariables& variables = model_->task_variables(t);
    ProjectSchedule* const schedule = solution.add_schedules();
    schedule->set_project_id(task.id);
    schedule->set_name(task.name);
    schedule->set_num_resources(task.num_resources);
    schedule->set_start(SolutionIntegerValue(response, variables.start));
    schedule->set_end(SolutionIntegerValue(response, variables.end));
  }
  VLOG(2) << "Collected solution:\n" << solution.DebugString();
  Add(std::move(solution));
}

void ScheduleSolutionCollector::Add(ScheduleSolution solution) {
  absl::MutexLock lock(&mutex_);
  solutions_.push_back(std::move(solution));
}

std::vector<ScheduleSolution> ScheduleSolutionCollector::TopSolutions() const {
  std::vector<ScheduleSolution> top;
  {
    absl::MutexLock lock(&mutex_);
    top = solutions_;
  }
  std::stable_sort(top.begin(), top.end(),
                   [](const ScheduleSolution& a, const ScheduleSolution& b) {
                     return a.total_duration() < b.total_duration();
                   });
  if (top.size() > static_cast<size_t>(max_solutions_)) {
    top.resize(max_solutions_);
  }
  return top;
}

int ScheduleSolutionCollector::num_solutions() const {
  absl::MutexLock lock(&mutex_);
  return solutions_.size();
}

}  // namespace scheduling
}  // namespace gantt_solver
