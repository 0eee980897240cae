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

// Computes minimum-makespan schedules of projects sharing a pool of resources,
// and writes them with their Gantt charts.
//
// Example:
//   gantt_solve --input=household_chores.json --output_prefix=/tmp/chores \
//     --max_solutions=3 --time_limit=10
// writes /tmp/chores_0.json, /tmp/chores_0.svg, ... /tmp/chores_2.svg.
// See project_scheduling.proto for the input format.

#include <cstdint>
#include <cstdlib>
#include <memory>
#include <string>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "gantt_solver/base/init_google.h"
#include "gantt_solver/base/status_macros.h"
#include "gantt_solver/scheduling/gantt_chart.h"
#include "gantt_solver/scheduling/parameters.h"
#include "gantt_solver/scheduling/project_parser.h"
#include "gantt_solver/scheduling/project_scheduler.h"
#include "gantt_solver/scheduling/project_scheduling.pb.h"
#include "gantt_solver/scheduling/schedule_output.h"
#include "gantt_solver/scheduling/scheduling_parameters.pb.h"

ABSL_FLAG(std::string, input, "", "Problem file name, in JSON.");
ABSL_FLAG(std::string, output_prefix, "schedule",
          "Prefix of the written files: <prefix>_<i>.<format> and "
          "<prefix>_<i>.svg for the i-th best schedule.");
ABSL_FLAG(double, time_limit, 30.0, "Time limit of the search, in seconds.");
ABSL_FLAG(int, max_solutions, 1, "Maximum number of schedules to write.");
ABSL_FLAG(int64_t, max_duration, 0,
          "If positive, only look for schedules not longer than this.");
ABSL_FLAG(int, num_workers, 8,
          "Number of parallel search workers, 0 lets the solver decide.");
ABSL_FLAG(std::string, output_format, "json",
          "Format of the written schedules: json or textproto.");
ABSL_FLAG(bool, log_search_progress, false, "Logs the search progress.");
ABSL_FLAG(std::string, params, "", "Sat parameters in text proto format.");

namespace gantt_solver {
namespace scheduling {

SchedulingParameters ParametersFromFlags() {
  SchedulingParameters parameters = DefaultSchedulingParameters();
  parameters.set_max_time_in_seconds(absl::GetFlag(FLAGS_time_limit));
  parameters.set_max_solutions(absl::GetFlag(FLAGS_max_solutions));
  parameters.set_max_duration(absl::GetFlag(FLAGS_max_duration));
  parameters.set_num_search_workers(absl::GetFlag(FLAGS_num_workers));
  parameters.set_log_search_progress(absl::GetFlag(FLAGS_log_search_progress));
  parameters.set_sat_parameters(absl::GetFlag(FLAGS_params));
  return parameters;
}

absl::Status Run() {
  ASSIGN_OR_RETURN(const OutputFormat format,
                   ParseOutputFormat(absl::GetFlag(FLAGS_output_format)));
  ASSIGN_OR_RETURN(const ProjectSchedulingProblem problem,
                   ReadProjectSchedulingProblem(absl::GetFlag(FLAGS_input)));
  ASSIGN_OR_RETURN(const ProjectSchedulingResult result,
                   SolveProjectScheduling(problem, ParametersFromFlags()));
  const std::unique_ptr<ScheduleSerializer> serializer =
      MakeScheduleSerializer(format);
  const SvgGanttChartRenderer renderer;
  ASSIGN_OR_RETURN(const std::vector<std::string> file_names,
                   ExportSchedules(result.solutions,
                                   absl::GetFlag(FLAGS_output_prefix),
                                   *serializer, renderer));
  LOG(INFO) << "Wrote " << file_names.size() << " files.";
  return absl::OkStatus();
}

}  // namespace scheduling
}  // namespace gantt_solver

static const char kUsage[] =
    "Usage: gantt_solve --input=<problem.json> [--output_prefix=<prefix>]\n"
    "Computes minimum-makespan schedules of projects sharing resources.";

int main(int argc, char** argv) {
  gantt_solver::InitGoogle(kUsage, argc, argv);
  if (absl::GetFlag(FLAGS_input).empty()) {
    LOG(ERROR) << "Please supply a data file with --input=";
    return EXIT_FAILURE;
  }
  const absl::Status status = gantt_solver::scheduling::Run();
  if (!status.ok()) {
    LOG(ERROR) << status;
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
