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

// Translation of a TaskGraph into a CP-SAT model:
//   - one fixed-size interval [start, end) per task, within [0, horizon],
//   - start(task) >= end(target) + lag for each dependency,
//   - one cumulative constraint with the capacity of the resource pool,
//   - makespan = max(end), minimized, and optionally capped.

#ifndef GANTT_SOLVER_SCHEDULING_SCHEDULE_MODEL_H_
#define GANTT_SOLVER_SCHEDULING_SCHEDULE_MODEL_H_

#include <cstdint>
#include <memory>
#include <vector>

#include "absl/status/statusor.h"
#include "gantt_solver/scheduling/task_graph.h"
#include "ortools/sat/cp_model.h"

namespace gantt_solver {
namespace scheduling {

// The variables attached to one task of the graph.
struct TaskVariables {
  operations_research::sat::IntVar start;
  operations_research::sat::IntVar end;
  operations_research::sat::IntervalVar interval;
};

class ScheduleModel {
 public:
  const TaskGraph& task_graph() const { return *task_graph_; }

  // Indexed like task_graph().tasks().
  const std::vector<TaskVariables>& task_variables() const {
    return task_variables_;
  }
  const TaskVariables& task_variables(int task) const {
    return task_variables_[task];
  }

  operations_research::sat::IntVar makespan() const { return makespan_; }
  int64_t horizon() const { return horizon_; }
  int64_t capacity() const { return capacity_; }
  // Zero if the makespan is not capped.
  int64_t max_duration() const { return max_duration_; }

  const operations_research::sat::CpModelBuilder& cp_model() const {
    return cp_model_;
  }

 private:
  friend absl::StatusOr<std::unique_ptr<ScheduleModel>> BuildScheduleModel(
      const TaskGraph* task_graph, int64_t max_resources_in_parallel,
      int64_t max_duration);

  explicit ScheduleModel(const TaskGraph* task_graph)
      : task_graph_(task_graph) {}

  const TaskGraph* const task_graph_;
  operations_research::sat::CpModelBuilder cp_model_;
  std::vector<TaskVariables> task_variables_;
  operations_research::sat::IntVar makespan_;
  int64_t horizon_ = 0;
  int64_t capacity_ = 0;
  int64_t max_duration_ = 0;
};

// Builds the model of the given graph. The model keeps a pointer to the graph,
// which must outlive it.
// A max_duration <= 0 means no cap on the makespan.
// Returns an InvalidArgumentError if max_resources_in_parallel is not positive
// or if the graph has no task.
absl::StatusOr<std::unique_ptr<ScheduleModel>> BuildScheduleModel(
    const TaskGraph* task_graph, int64_t max_resources_in_parallel,
    int64_t max_duration);

}  // namespace scheduling
}  // namespace gantt_solver

#endif  // GANTT_SOLVER_SCHEDULING_SCHEDULE_MODEL_H_
