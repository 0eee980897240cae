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

#include "gantt_solver/scheduling/schedule_model.h"

#include <cstdint>
#include <memory>
#include <vector>

#include "absl/log/check.h"
#include "absl/log/log.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "gantt_solver/base/status_builder.h"
#include "gantt_solver/scheduling/task_graph.h"
#include "ortools/sat/cp_model.h"
#include "ortools/util/sorted_interval_list.h"

namespace gantt_solver {
namespace scheduling {

using ::operations_research::Domain;
using ::operations_research::sat::CpModelBuilder;
using ::operations_research::sat::CumulativeConstraint;
using ::operations_research::sat::IntVar;

absl::StatusOr<std::unique_ptr<ScheduleModel>> BuildScheduleModel(
    const TaskGraph* task_graph_ptr, int64_t max_resources_in_parallel,
    int64_t max_duration) {
  CHECK(task_graph_ptr != nullptr);
  const TaskGraph& task_graph = *task_graph_ptr;
  if (max_resources_in_parallel <= 0) {
    return InvalidArgumentErrorBuilder()
           << "max_resources_in_parallel must be positive, got "
           << max_resources_in_parallel;
  }
  if (task_graph.num_tasks() == 0) {
    return InvalidArgumentErrorBuilder() << "cannot schedule an empty graph";
  }

  auto model =
      std::unique_ptr<ScheduleModel>(new ScheduleModel(task_graph_ptr));
  CpModelBuilder& cp_model = model->cp_model_;
  const int64_t horizon = task_graph.Horizon();
  model->horizon_ = horizon;
  model->capacity_ = max_resources_in_parallel;
  model->max_duration_ = max_duration > 0 ? max_duration : 0;
  LOG(INFO) << "#tasks: " << task_graph.num_tasks();
  LOG(INFO) << "horizon: " << horizon;

  // Create the task variables, in topological order.
  const Domain time_domain(0, horizon);
  model->task_variables_.reserve(task_graph.num_tasks());
  for (const Task& task : task_graph.tasks()) {
    const IntVar start = cp_model.NewIntVar(time_domain)
                             .WithName(absl::StrCat("start_", task.id));
    const IntVar end = cp_model.NewIntVar(time_domain)
                           .WithName(absl::StrCat("end_", task.id));
    const operations_research::sat::IntervalVar interval =
        cp_model.NewIntervalVar(start, task.duration, end)
            .WithName(absl::StrCat("interval_", task.id));
    model->task_variables_.push_back({start, end, interval});
  }

  // A task starts after the end of each of its dependencies, shifted by the
  // lag. A negative lag allows an overlap of up to |lag|.
  int num_precedences = 0;
  for (int t = 0; t < task_graph.num_tasks(); ++t) {
    const Task& task = task_graph.task(t);
    for (const Dependency& dependency : task.dependencies) {
      cp_model.AddGreaterOrEqual(
          model->task_variables_[t].start,
          model->task_variables_[dependency.target].end + dependency.lag);
      ++num_precedences;
    }
  }
  LOG(INFO) << "#precedences: " << num_precedences;

  // We can only use max_resources_in_parallel at a time.
  CumulativeConstraint cumulative =
      cp_model.AddCumulative(max_resources_in_parallel);
  for (int t = 0; t < task_graph.num_tasks(); ++t) {
    cumulative.AddDemand(model->task_variables_[t].interval,
                         task_graph.task(t).num_resources);
  }

  // The makespan is the end of the last task.
  std::vector<IntVar> ends;
  ends.reserve(model->task_variables_.size());
  for (const TaskVariables& variables : model->task_variables_) {
    ends.push_back(variables.end);
  }
  model->makespan_ =
      cp_model.NewIntVar(time_domain).WithName("total_duration");
  cp_model.AddMaxEquality(model->makespan_, ends);
  if (model->max_duration_ > 0) {
    LOG(INFO) << "max duration: " << model->max_duration_;
    cp_model.AddLessOrEqual(model->makespan_, model->max_duration_);
  }
  cp_model.Minimize(model->makespan_);

  VLOG(2) << cp_model.Proto().DebugString();
  return model;
}

}  // namespace scheduling
}  // namespace gantt_solver
