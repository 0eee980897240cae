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

#include "gantt_solver/scheduling/task_graph.h"

#include <algorithm>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "absl/log/check.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_join.h"
#include "absl/strings/string_view.h"
#include "gantt_solver/base/status_builder.h"
#include "gantt_solver/base/status_macros.h"
#include "gantt_solver/graph/topologicalsorter.h"
#include "gantt_solver/scheduling/project_parser.h"
#include "gantt_solver/scheduling/project_scheduling.pb.h"

namespace gantt_solver {
namespace scheduling {

absl::StatusOr<TaskGraph> TaskGraph::Build(
    const ProjectSchedulingProblem& problem) {
  RETURN_IF_ERROR(ValidateProjectSchedulingProblem(problem));

  // Number the projects by increasing id. This numbering is what makes the
  // stable topological order deterministic.
  std::vector<std::string> ids;
  ids.reserve(problem.projects_size());
  for (const auto& [project_id, unused] : problem.projects()) {
    ids.push_back(project_id);
  }
  std::sort(ids.begin(), ids.end());
  const int num_projects = ids.size();
  absl::flat_hash_map<std::string, int> id_to_node;
  for (int node = 0; node < num_projects; ++node) {
    id_to_node[ids[node]] = node;
  }

  // An arc goes from a dependency to the project that depends on it.
  std::vector<std::vector<int>> successors(num_projects);
  for (int node = 0; node < num_projects; ++node) {
    const ProjectDefinition& project = problem.projects().at(ids[node]);
    for (const DependencyDefinition& dependency : project.dependencies()) {
      const auto it = id_to_node.find(dependency.project_id());
      if (it == id_to_node.end()) {
        return InvalidArgumentErrorBuilder()
               << "unknown dependency '" << dependency.project_id()
               << "' of project '" << ids[node] << "'";
      }
      successors[it->second].push_back(node);
    }
  }

  const absl::StatusOr<std::vector<int>> topological_order =
      graph::StableTopologicalSort(successors);
  if (!topological_order.ok()) {
    ASSIGN_OR_RETURN(std::vector<int> cycle,
                     graph::FindCycleInGraph(successors));
    CHECK(!cycle.empty()) << topological_order.status();
    // The arcs of the cycle go from a dependency to its dependent; display
    // them the other way around, as "depends on" relations.
    std::reverse(cycle.begin(), cycle.end());
    std::vector<std::string> cycle_ids;
    for (const int node : cycle) cycle_ids.push_back(ids[node]);
    cycle_ids.push_back(ids[cycle.front()]);
    return FailedPreconditionErrorBuilder()
           << "dependency cycle: " << absl::StrJoin(cycle_ids, " -> ");
  }

  std::vector<int> node_to_index(num_projects);
  for (int index = 0; index < num_projects; ++index) {
    node_to_index[(*topological_order)[index]] = index;
  }

  TaskGraph task_graph;
  task_graph.tasks_.reserve(num_projects);
  for (const int node : *topological_order) {
    const ProjectDefinition& project = problem.projects().at(ids[node]);
    Task task;
    task.id = ids[node];
    task.name = project.name();
    task.duration = project.duration();
    task.num_resources = project.num_resources();
    for (const DependencyDefinition& dependency : project.dependencies()) {
      const int target = node_to_index[id_to_node[dependency.project_id()]];
      DCHECK_LT(target, task_graph.num_tasks());
      task.dependencies.push_back(
          {target, dependency.project_id(), dependency.lag_time()});
    }
    task_graph.id_to_index_[task.id] = task_graph.num_tasks();
    task_graph.tasks_.push_back(std::move(task));
  }
  VLOG(1) << "Topological order: "
          << absl::StrJoin(task_graph.TopologicalOrder(), ", ");
  return task_graph;
}

int TaskGraph::FindTaskIndex(absl::string_view id) const {
  const auto it = id_to_index_.find(id);
  return it == id_to_index_.end() ? -1 : it->second;
}

int64_t TaskGraph::Horizon() const {
  int64_t horizon = 0;
  for (const Task& task : tasks_) {
    horizon += task.duration;
    for (const Dependency& dependency : task.dependencies) {
      if (dependency.lag > 0) horizon += dependency.lag;
    }
    CHECK_LE(horizon, kMaxScheduleValue);
  }
  return horizon;
}

std::vector<std::string> TaskGraph::TopologicalOrder() const {
  std::vector<std::string> order;
  order.reserve(tasks_.size());
  for (const Task& task : tasks_) order.push_back(task.id);
  return order;
}

}  // namespace scheduling
}  // namespace gantt_solver
