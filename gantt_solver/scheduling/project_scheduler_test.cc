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

#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "gantt_solver/base/file.h"
#include "gantt_solver/base/gmock.h"
#include "gantt_solver/scheduling/gantt_chart.h"
#include "gantt_solver/scheduling/parameters.h"
#include "gantt_solver/scheduling/project_parser.h"
#include "gantt_solver/scheduling/project_scheduling.pb.h"
#include "gantt_solver/scheduling/schedule_output.h"
#include "gantt_solver/scheduling/scheduling_parameters.pb.h"
#include "gtest/gtest.h"

namespace gantt_solver {
namespace scheduling {
namespace {

using ::testing::AllOf;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::Le;
using ::testing::Not;
using ::testing::SizeIs;
using ::testing::status::StatusIs;

constexpr absl::string_view kHouseholdChores =
    "gantt_solver/scheduling/testdata/household_chores.json";

ProjectDefinition* AddProject(const std::string& id, int64_t duration,
                              int64_t num_resources,
                              ProjectSchedulingProblem* problem) {
  ProjectDefinition& project = (*problem->mutable_projects())[id];
  project.set_name("Project " + id);
  project.set_duration(duration);
  project.set_num_resources(num_resources);
  return &project;
}

void AddDependency(ProjectDefinition* project, const std::string& target,
                   int64_t lag) {
  DependencyDefinition* const dependency = project->add_dependencies();
  dependency->set_project_id(target);
  dependency->set_lag_time(lag);
}

SchedulingParameters TestParameters() {
  SchedulingParameters parameters = DefaultSchedulingParameters();
  parameters.set_max_time_in_seconds(10.0);
  parameters.set_num_search_workers(1);
  return parameters;
}

const ProjectSchedule& FindSchedule(const ScheduleSolution& solution,
                                    absl::string_view id) {
  for (const ProjectSchedule& schedule : solution.schedules()) {
    if (schedule.project_id() == id) return schedule;
  }
  ADD_FAILURE() << "No schedule for project " << id;
  return ProjectSchedule::default_instance();
}

// Checks the precedences, the capacity at every start time (the usage only
// increases at start times), and the total duration.
void CheckSolution(const ProjectSchedulingProblem& problem,
                   const ScheduleSolution& solution) {
  ASSERT_EQ(solution.schedules_size(), problem.projects_size());
  absl::flat_hash_map<std::string, const ProjectSchedule*> schedules;
  int64_t max_end = 0;
  for (const ProjectSchedule& schedule : solution.schedules()) {
    schedules[schedule.project_id()] = &schedule;
    max_end = std::max(max_end, schedule.end());
    const ProjectDefinition& project =
        problem.projects().at(schedule.project_id());
    EXPECT_GE(schedule.start(), 0);
    EXPECT_EQ(schedule.end() - schedule.start(), project.duration());
    EXPECT_EQ(schedule.num_resources(), project.num_resources());
    EXPECT_EQ(schedule.name(), project.name());
  }
  EXPECT_EQ(solution.total_duration(), max_end);

  for (const auto& [id, project] : problem.projects()) {
    for (const DependencyDefinition& dependency : project.dependencies()) {
      EXPECT_GE(schedules.at(id)->start(),
                schedules.at(dependency.project_id())->end() +
                    dependency.lag_time())
          << id << " depends on " << dependency.project_id();
    }
  }

  for (const ProjectSchedule& instant : solution.schedules()) {
    const int64_t t = instant.start();
    int64_t usage = 0;
    for (const ProjectSchedule& schedule : solution.schedules()) {
      if (schedule.start() <= t && t < schedule.end()) {
        usage += schedule.num_resources();
      }
    }
    EXPECT_LE(usage, problem.max_resources_in_parallel()) << "at time " << t;
  }
}

TEST(SolveProjectSchedulingTest, IndependentTasksWithOneResource) {
  ProjectSchedulingProblem problem;
  problem.set_max_resources_in_parallel(1);
  AddProject("a", 3, 1, &problem);
  AddProject("b", 2, 1, &problem);
  ASSERT_OK_AND_ASSIGN(const ProjectSchedulingResult result,
                       SolveProjectScheduling(problem, TestParameters()));
  EXPECT_EQ(result.status, TerminalStatus::OPTIMAL);
  ASSERT_THAT(result.solutions, SizeIs(1));
  EXPECT_GE(result.num_solutions_found, 1);
  EXPECT_EQ(result.solutions[0].total_duration(), 5);
  CheckSolution(problem, result.solutions[0]);
}

TEST(SolveProjectSchedulingTest, IndependentTasksInParallel) {
  ProjectSchedulingProblem problem;
  problem.set_max_resources_in_parallel(2);
  AddProject("a", 3, 1, &problem);
  AddProject("b", 2, 1, &problem);
  ASSERT_OK_AND_ASSIGN(const ProjectSchedulingResult result,
                       SolveProjectScheduling(problem, TestParameters()));
  EXPECT_EQ(result.status, TerminalStatus::OPTIMAL);
  ASSERT_THAT(result.solutions, SizeIs(1));
  EXPECT_EQ(result.solutions[0].total_duration(), 3);
  CheckSolution(problem, result.solutions[0]);
}

TEST(SolveProjectSchedulingTest, LeadTimeAllowsAnOverlap) {
  ProjectSchedulingProblem problem;
  problem.set_max_resources_in_parallel(2);
  AddProject("a", 10, 1, &problem);
  AddDependency(AddProject("b", 2, 1, &problem), "a", -2);
  ASSERT_OK_AND_ASSIGN(const ProjectSchedulingResult result,
                       SolveProjectScheduling(problem, TestParameters()));
  EXPECT_EQ(result.status, TerminalStatus::OPTIMAL);
  ASSERT_THAT(result.solutions, SizeIs(1));
  EXPECT_EQ(result.solutions[0].total_duration(), 10);
  EXPECT_EQ(FindSchedule(result.solutions[0], "a").end(), 10);
  EXPECT_EQ(FindSchedule(result.solutions[0], "b").start(), 8);
  CheckSolution(problem, result.solutions[0]);
}

TEST(SolveProjectSchedulingTest, PositiveLag) {
  ProjectSchedulingProblem problem;
  problem.set_max_resources_in_parallel(5);
  AddProject("a", 2, 1, &problem);
  AddDependency(AddProject("b", 1, 1, &problem), "a", 3);
  ASSERT_OK_AND_ASSIGN(const ProjectSchedulingResult result,
                       SolveProjectScheduling(problem, TestParameters()));
  ASSERT_THAT(result.solutions, SizeIs(1));
  EXPECT_EQ(result.solutions[0].total_duration(), 6);
  EXPECT_EQ(FindSchedule(result.solutions[0], "b").start(), 5);
}

TEST(SolveProjectSchedulingTest, CycleIsRejected) {
  ProjectSchedulingProblem problem;
  problem.set_max_resources_in_parallel(1);
  AddDependency(AddProject("x", 1, 1, &problem), "y", 0);
  AddDependency(AddProject("y", 1, 1, &problem), "x", 0);
  EXPECT_THAT(SolveProjectScheduling(problem, TestParameters()),
              StatusIs(absl::StatusCode::kFailedPrecondition,
                       HasSubstr("dependency cycle")));
}

TEST(SolveProjectSchedulingTest, UnknownDependencyIsRejected) {
  ProjectSchedulingProblem problem;
  problem.set_max_resources_in_parallel(1);
  AddDependency(AddProject("x", 1, 1, &problem), "nowhere", 0);
  EXPECT_THAT(SolveProjectScheduling(problem, TestParameters()),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("unknown dependency 'nowhere'")));
}

TEST(SolveProjectSchedulingTest, InvalidParameters) {
  ProjectSchedulingProblem problem;
  problem.set_max_resources_in_parallel(1);
  AddProject("a", 1, 1, &problem);
  SchedulingParameters parameters = TestParameters();
  parameters.set_max_solutions(0);
  EXPECT_THAT(SolveProjectScheduling(problem, parameters),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("max_solutions")));
}

TEST(SolveProjectSchedulingTest, DurationCapIsRespected) {
  ProjectSchedulingProblem problem;
  problem.set_max_resources_in_parallel(2);
  AddProject("a", 3, 1, &problem);
  AddProject("b", 2, 1, &problem);
  SchedulingParameters parameters = TestParameters();
  parameters.set_max_duration(3);
  parameters.set_max_solutions(10);
  ASSERT_OK_AND_ASSIGN(const ProjectSchedulingResult result,
                       SolveProjectScheduling(problem, parameters));
  ASSERT_THAT(result.solutions, Not(IsEmpty()));
  for (const ScheduleSolution& solution : result.solutions) {
    EXPECT_LE(solution.total_duration(), 3);
  }
}

TEST(SolveProjectSchedulingTest, UnreachableDurationCap) {
  ProjectSchedulingProblem problem;
  problem.set_max_resources_in_parallel(1);
  AddProject("a", 3, 1, &problem);
  AddProject("b", 2, 1, &problem);
  SchedulingParameters parameters = TestParameters();
  parameters.set_max_duration(4);
  EXPECT_THAT(SolveProjectScheduling(problem, parameters),
              StatusIs(absl::StatusCode::kNotFound,
                       AllOf(HasSubstr("no feasible schedule"),
                             HasSubstr("INFEASIBLE"))));
}

TEST(SearchSchedulesTest, NoScheduleIsNotAnError) {
  ProjectSchedulingProblem problem;
  problem.set_max_resources_in_parallel(1);
  AddProject("a", 3, 2, &problem);
  ASSERT_OK_AND_ASSIGN(const ProjectSchedulingResult result,
                       SearchSchedules(problem, TestParameters()));
  EXPECT_EQ(result.status, TerminalStatus::INFEASIBLE);
  EXPECT_THAT(result.solutions, IsEmpty());
  EXPECT_EQ(result.num_solutions_found, 0);
}

TEST(SolveProjectSchedulingTest, HouseholdChores) {
  ASSERT_OK_AND_ASSIGN(const ProjectSchedulingProblem problem,
                       ReadProjectSchedulingProblem(kHouseholdChores));
  SchedulingParameters parameters = TestParameters();
  parameters.set_max_solutions(5);
  ASSERT_OK_AND_ASSIGN(const ProjectSchedulingResult result,
                       SolveProjectScheduling(problem, parameters));
  EXPECT_EQ(result.status, TerminalStatus::OPTIMAL);
  ASSERT_THAT(result.solutions, Not(IsEmpty()));
  EXPECT_THAT(result.solutions, SizeIs(Le(5)));
  EXPECT_EQ(result.solutions[0].total_duration(), 8);
  const int num_solutions = result.solutions.size();
  for (int i = 0; i < num_solutions; ++i) {
    SCOPED_TRACE(i);
    CheckSolution(problem, result.solutions[i]);
    if (i > 0) {
      EXPECT_LE(result.solutions[i - 1].total_duration(),
                result.solutions[i].total_duration());
    }
  }
}

TEST(ExportSchedulesTest, WritesOneRecordAndOneChartPerSolution) {
  ScheduleSolution first;
  first.set_total_duration(2);
  ProjectSchedule* const schedule = first.add_schedules();
  schedule->set_project_id("a");
  schedule->set_name("Wash the car");
  schedule->set_num_resources(1);
  schedule->set_start(0);
  schedule->set_end(2);
  ScheduleSolution second = first;
  second.set_total_duration(3);
  second.mutable_schedules(0)->set_start(1);
  second.mutable_schedules(0)->set_end(3);

  const std::string prefix = ::testing::TempDir() + "/export_test";
  const JsonScheduleSerializer serializer;
  const SvgGanttChartRenderer renderer;
  ASSERT_OK_AND_ASSIGN(
      const std::vector<std::string> file_names,
      ExportSchedules({first, second}, prefix, serializer, renderer));
  EXPECT_THAT(file_names,
              ElementsAre(prefix + "_0.json", prefix + "_0.svg",
                          prefix + "_1.json", prefix + "_1.svg"));

  ASSERT_OK_AND_ASSIGN(const std::string json,
                       file::GetContents(prefix + "_1.json"));
  EXPECT_THAT(json, HasSubstr("\"total_duration\": \"3\""));
  ASSERT_OK_AND_ASSIGN(const std::string svg,
                       file::GetContents(prefix + "_0.svg"));
  EXPECT_THAT(svg, AllOf(HasSubstr(">Gantt Chart</text>"),
                         HasSubstr(">Wash the car</text>")));
}

TEST(ExportSchedulesTest, UnwritableDirectory) {
  const JsonScheduleSerializer serializer;
  const SvgGanttChartRenderer renderer;
  EXPECT_THAT(ExportSchedules({ScheduleSolution()}, "/nonexistent/dir/out",
                              serializer, renderer),
              Not(::testing::status::IsOk()));
}

}  // namespace
}  // namespace scheduling
}  // namespace gantt_solver
