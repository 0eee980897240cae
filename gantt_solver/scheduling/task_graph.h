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

#ifndef GANTT_SOLVER_SCHEDULING_TASK_GRAPH_H_
#define GANTT_SOLVER_SCHEDULING_TASK_GRAPH_H_

#include <cstdint>
#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "gantt_solver/scheduling/project_scheduling.pb.h"

namespace gantt_solver {
namespace scheduling {

// A precedence on another task of the same TaskGraph.
struct Dependency {
  // Index of the target in TaskGraph::tasks(). Always smaller than the index
  // of the task holding the dependency.
  int target;
  std::string target_id;
  // The task starts at least 'lag' after the end of the target. Negative
  // values are lead times.
  int64_t lag;
};

struct Task {
  std::string id;
  std::string name;
  int64_t duration;
  int64_t num_resources;
  std::vector<Dependency> dependencies;
};

// The validated, acyclic precedence graph of a ProjectSchedulingProblem.
//
// Tasks are stored in an arena, in topological order: every task comes after
// all the tasks it depends on. Among the tasks that are ready at the same
// time, the smallest id comes first, so the order only depends on the input.
// Dependencies refer to their target by index in the arena.
class TaskGraph {
 public:
  // Errors:
  //  - InvalidArgumentError if the problem is not valid (see
  //    ValidateProjectSchedulingProblem()) or if a dependency refers to an
  //    unknown project.
  //  - FailedPreconditionError if the dependencies contain a cycle. The message
  //    contains "cycle" and the ids of the projects on the cycle.
  static absl::StatusOr<TaskGraph> Build(
      const ProjectSchedulingProblem& problem);

  int num_tasks() const { return tasks_.size(); }
  const Task& task(int index) const { return tasks_[index]; }
  const std::vector<Task>& tasks() const { return tasks_; }

  // Returns the index of the task with the given id, or -1.
  int FindTaskIndex(absl::string_view id) const;

  // Sum of all durations and positive lags: the length of the fully serial
  // schedule with every lag waited for, an upper bound on the length of any
  // optimal schedule. At most kMaxScheduleValue.
  int64_t Horizon() const;

  // The ids of all tasks, in topological order.
  std::vector<std::string> TopologicalOrder() const;

 private:
  TaskGraph() = default;

  std::vector<Task> tasks_;
  absl::flat_hash_map<std::string, int> id_to_index_;
};

}  // namespace scheduling
}  // namespace gantt_solver

#endif  // GANTT_SOLVER_SCHEDULING_TASK_GRAPH_H_
