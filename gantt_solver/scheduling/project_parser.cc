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

#include "gantt_solver/scheduling/project_parser.h"

#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "gantt_solver/base/file.h"
#include "gantt_solver/base/status_builder.h"
#include "gantt_solver/base/status_macros.h"
#include "gantt_solver/scheduling/project_scheduling.pb.h"
#include "google/protobuf/util/json_util.h"

namespace gantt_solver {
namespace scheduling {

namespace {

absl::Status ValidateProject(const std::string& project_id,
                             const ProjectDefinition& project) {
  if (project_id.empty()) {
    return InvalidInputErrorBuilder() << "empty project id";
  }
  if (!project.has_name()) {
    return InvalidInputErrorBuilder()
           << "project '" << project_id
           << "' is missing required field 'name'";
  }
  if (!project.has_num_resources()) {
    return InvalidInputErrorBuilder()
           << "project '" << project_id
           << "' is missing required field 'num_resources'";
  }
  if (project.num_resources() < 0) {
    return InvalidInputErrorBuilder()
           << "project '" << project_id
           << "' has a negative num_resources: " << project.num_resources();
  }
  if (project.num_resources() > kMaxScheduleValue) {
    return InvalidInputErrorBuilder()
           << "project '" << project_id << "' has num_resources "
           << project.num_resources() << " above " << kMaxScheduleValue;
  }
  if (!project.has_duration()) {
    return InvalidInputErrorBuilder()
           << "project '" << project_id
           << "' is missing required field 'duration'";
  }
  if (project.duration() <= 0) {
    return InvalidInputErrorBuilder()
           << "project '" << project_id
           << "' must have a positive duration, got " << project.duration();
  }
  if (project.duration() > kMaxScheduleValue) {
    return InvalidInputErrorBuilder()
           << "project '" << project_id << "' has duration "
           << project.duration() << " above " << kMaxScheduleValue;
  }
  for (int d = 0; d < project.dependencies_size(); ++d) {
    const DependencyDefinition& dependency = project.dependencies(d);
    if (!dependency.has_project_id() || dependency.project_id().empty()) {
      return InvalidInputErrorBuilder()
             << "dependency #" << d << " of project '"
             << project_id << "' is missing required field 'project_id'";
    }
    if (!dependency.has_lag_time()) {
      return InvalidInputErrorBuilder()
             << "dependency #" << d << " of project '"
             << project_id << "' is missing required field 'lag_time'";
    }
    if (dependency.lag_time() < -kMaxScheduleValue ||
        dependency.lag_time() > kMaxScheduleValue) {
      return InvalidInputErrorBuilder()
             << "dependency #" << d << " of project '" << project_id
             << "' has lag_time " << dependency.lag_time()
             << " above " << kMaxScheduleValue << " in absolute value";
    }
  }
  return absl::OkStatus();
}

}  // namespace

absl::Status ValidateProjectSchedulingProblem(
    const ProjectSchedulingProblem& problem) {
  if (!problem.has_max_resources_in_parallel()) {
    return InvalidInputErrorBuilder()
           << "missing required field 'max_resources_in_parallel'";
  }
  if (problem.max_resources_in_parallel() <= 0) {
    return InvalidInputErrorBuilder()
           << "max_resources_in_parallel must be positive, got "
           << problem.max_resources_in_parallel();
  }
  if (problem.max_resources_in_parallel() > kMaxScheduleValue) {
    return InvalidInputErrorBuilder()
           << "max_resources_in_parallel "
           << problem.max_resources_in_parallel() << " is above "
           << kMaxScheduleValue;
  }
  if (problem.projects().empty()) {
    return InvalidInputErrorBuilder() << "no projects";
  }

  // Iterate in a fixed order so that the first reported error does not depend
  // on the map layout.
  std::vector<std::string> project_ids;
  project_ids.reserve(problem.projects_size());
  for (const auto& [project_id, unused] : problem.projects()) {
    project_ids.push_back(project_id);
  }
  std::sort(project_ids.begin(), project_ids.end());
  // Each term is at most kMaxScheduleValue, so the sum cannot overflow before
  // it is checked.
  int64_t horizon = 0;
  for (const std::string& project_id : project_ids) {
    const ProjectDefinition& project = problem.projects().at(project_id);
    RETURN_IF_ERROR(ValidateProject(project_id, project));
    horizon += project.duration();
    for (const DependencyDefinition& dependency : project.dependencies()) {
      if (dependency.lag_time() > 0) horizon += dependency.lag_time();
      if (horizon > kMaxScheduleValue) break;
    }
    if (horizon > kMaxScheduleValue) {
      return InvalidInputErrorBuilder()
             << "the sum of all durations and positive lags is above "
             << kMaxScheduleValue;
    }
  }
  return absl::OkStatus();
}

absl::StatusOr<ProjectSchedulingProblem> ParseProjectSchedulingProblem(
    absl::string_view json) {
  ProjectSchedulingProblem problem;
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;
  const auto parse_status = google::protobuf::util::JsonStringToMessage(
      std::string(json), &problem, options);
  if (!parse_status.ok()) {
    return InvalidInputErrorBuilder() << parse_status.ToString();
  }
  RETURN_IF_ERROR(ValidateProjectSchedulingProblem(problem));
  return problem;
}

absl::StatusOr<ProjectSchedulingProblem> ReadProjectSchedulingProblem(
    absl::string_view file_name) {
  RETURN_IF_ERROR(file::Exists(file_name));
  ASSIGN_OR_RETURN(const std::string json, file::GetContents(file_name));
  VLOG(1) << "Read " << json.size() << " bytes from '" << file_name << "'";
  ASSIGN_OR_RETURN(ProjectSchedulingProblem problem,
                   ParseProjectSchedulingProblem(json));
  LOG(INFO) << "Successfully read '" << file_name << "': "
            << problem.projects_size() << " projects, "
            << problem.max_resources_in_parallel()
            << " resources in parallel.";
  return problem;
}

}  // namespace scheduling
}  // namespace gantt_solver
