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

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "absl/strings/string_view.h"
#include "gantt_solver/base/gmock.h"
#include "gantt_solver/scheduling/project_scheduling.pb.h"
#include "gantt_solver/scheduling/schedule_model.h"
#include "gantt_solver/scheduling/task_graph.h"
#include "gtest/gtest.h"
#include "ortools/sat/cp_model.pb.h"

namespace gantt_solver {
namespace scheduling {
namespace {

using ::operations_research::sat::CpSolverResponse;
using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::testing::SizeIs;

ProjectSchedulingProblem TwoProjects() {
  ProjectSchedulingProblem problem;
  problem.set_max_resources_in_parallel(1);
  ProjectDefinition& a = (*problem.mutable_projects())["a"];
  a.set_name("A");
  a.set_duration(2);
  a.set_num_resources(1);
  ProjectDefinition& b = (*problem.mutable_projects())["b"];
  b.set_name("B");
  b.set_duration(3);
  b.set_num_resources(1);
  return problem;
}

ScheduleSolution SolutionWithDuration(int64_t total_duration,
                                      absl::string_view tag) {
  ScheduleSolution solution;
  solution.set_total_duration(total_duration);
  solution.add_schedules()->set_project_id(std::string(tag));
  return solution;
}

std::vector<int64_t> TotalDurations(
    const std::vector<ScheduleSolution>& solutions) {
  std::vector<int64_t> durations;
  for (const ScheduleSolution& solution : solutions) {
    durations.push_back(solution.total_duration());
  }
  return durations;
}

class ScheduleSolutionCollectorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ASSERT_OK_AND_ASSIGN(graph_, TaskGraph::Build(TwoProjects()));
    ASSERT_OK_AND_ASSIGN(model_, BuildScheduleModel(&*graph_, 1, 0));
  }

  std::optional<TaskGraph> graph_;
  std::unique_ptr<ScheduleModel> model_;
};

TEST_F(ScheduleSolutionCollectorTest, NoSolution) {
  ScheduleSolutionCollector collector(model_.get(), 3);
  EXPECT_EQ(collector.num_solutions(), 0);
  EXPECT_THAT(collector.TopSolutions(), IsEmpty());
}

TEST_F(ScheduleSolutionCollectorTest, KeepsTheBestSolutions) {
  ScheduleSolutionCollector collector(model_.get(), 3);
  for (const int64_t duration : {9, 7, 12, 5, 8}) {
    collector.Add(SolutionWithDuration(duration, "x"));
  }
  EXPECT_EQ(collector.num_solutions(), 5);
  EXPECT_THAT(TotalDurations(collector.TopSolutions()), ElementsAre(5, 7, 8));
}

TEST_F(ScheduleSolutionCollectorTest, FewerSolutionsThanRequested) {
  ScheduleSolutionCollector collector(model_.get(), 10);
  collector.Add(SolutionWithDuration(6, "x"));
  collector.Add(SolutionWithDuration(4, "y"));
  EXPECT_THAT(TotalDurations(collector.TopSolutions()), ElementsAre(4, 6));
}

TEST_F(ScheduleSolutionCollectorTest, TiesKeepTheReportingOrder) {
  ScheduleSolutionCollector collector(model_.get(), 3);
  collector.Add(SolutionWithDuration(5, "first"));
  collector.Add(SolutionWithDuration(6, "worse"));
  collector.Add(SolutionWithDuration(5, "second"));
  collector.Add(SolutionWithDuration(5, "third"));
  collector.Add(SolutionWithDuration(5, "fourth"));
  const std::vector<ScheduleSolution> top = collector.TopSolutions();
  ASSERT_THAT(top, SizeIs(3));
  EXPECT_EQ(top[0].schedules(0).project_id(), "first");
  EXPECT_EQ(top[1].schedules(0).project_id(), "second");
  EXPECT_EQ(top[2].schedules(0).project_id(), "third");
}

TEST_F(ScheduleSolutionCollectorTest, ReadsTheResponse) {
  ScheduleSolutionCollector collector(model_.get(), 1);
  CpSolverResponse response;
  response.mutable_solution()->Resize(
      model_->cp_model().Proto().variables_size(), 0);
  const int a = graph_->FindTaskIndex("a");
  const int b = graph_->FindTaskIndex("b");
  response.set_solution(model_->task_variables(b).start.index(), 0);
  response.set_solution(model_->task_variables(b).end.index(), 3);
  response.set_solution(model_->task_variables(a).start.index(), 3);
  response.set_solution(model_->task_variables(a).end.index(), 5);
  response.set_solution(model_->makespan().index(), 5);
  collector.OnSolution(response);

  const std::vector<ScheduleSolution> top = collector.TopSolutions();
  ASSERT_THAT(top, SizeIs(1));
  EXPECT_EQ(top[0].total_duration(), 5);
  ASSERT_EQ(top[0].schedules_size(), 2);
  for (const ProjectSchedule& schedule : top[0].schedules()) {
    if (schedule.project_id() == "a") {
      EXPECT_EQ(schedule.name(), "A");
      EXPECT_EQ(schedule.num_resources(), 1);
      EXPECT_EQ(schedule.start(), 3);
      EXPECT_EQ(schedule.end(), 5);
    } else {
      EXPECT_EQ(schedule.project_id(), "b");
      EXPECT_EQ(schedule.name(), "B");
      EXPECT_EQ(schedule.start(), 0);
      EXPECT_EQ(schedule.end(), 3);
    }
  }
}

TEST_F(ScheduleSolutionCollectorTest, ConcurrentReports) {
  constexpr int kNumThreads = 8;
  constexpr int kSolutionsPerThread = 100;
  ScheduleSolutionCollector collector(model_.get(), 4);
  std::vector<std::thread> threads;
  for (int t = 0; t < kNumThreads; ++t) {
    threads.emplace_back([&collector, t]() {
      for (int i = 0; i < kSolutionsPerThread; ++i) {
        collector.Add(SolutionWithDuration(10 + t + i, "x"));
      }
    });
  }
  for (std::thread& thread : threads) thread.join();
  EXPECT_EQ(collector.num_solutions(), kNumThreads * kSolutionsPerThread);
  // Durations 10, 11, 11, 12, 12, 12, ...
  EXPECT_THAT(TotalDurations(collector.TopSolutions()),
              ElementsAre(10, 11, 11, 12));
}

}  // namespace
}  // namespace scheduling
}  // namespace gantt_solver
