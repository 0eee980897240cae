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

#include "gantt_solver/scheduling/parameters.h"

#include <cmath>
#include <string>
#include <vector>

#include "absl/strings/str_cat.h"
#include "gantt_solver/scheduling/scheduling_parameters.pb.h"
#include "google/protobuf/text_format.h"
#include "ortools/sat/sat_parameters.pb.h"

namespace gantt_solver {
namespace scheduling {

SchedulingParameters DefaultSchedulingParameters() {
  SchedulingParameters parameters;
  parameters.set_max_time_in_seconds(30.0);
  parameters.set_max_solutions(1);
  parameters.set_max_duration(0);
  parameters.set_num_search_workers(8);
  parameters.set_log_search_progress(false);
  return parameters;
}

std::string FindErrorInSchedulingParameters(
    const SchedulingParameters& parameters) {
  const std::vector<std::string> errors =
      FindErrorsInSchedulingParameters(parameters);
  return (errors.empty()) ? "" : errors[0];
}

std::vector<std::string> FindErrorsInSchedulingParameters(
    const SchedulingParameters& parameters) {
  std::vector<std::string> errors;
  const double time_limit = parameters.max_time_in_seconds();
  if (std::isnan(time_limit) || std::isinf(time_limit) || time_limit <= 0) {
    errors.emplace_back(
        absl::StrCat("Invalid max_time_in_seconds: ", time_limit,
                     " (must be positive and finite)"));
  }
  if (parameters.max_solutions() < 1) {
    errors.emplace_back(absl::StrCat("Invalid max_solutions: ",
                                     parameters.max_solutions(),
                                     " (must be at least 1)"));
  }
  if (parameters.num_search_workers() < 0) {
    errors.emplace_back(absl::StrCat("Invalid num_search_workers: ",
                                     parameters.num_search_workers()));
  }
  if (!parameters.sat_parameters().empty()) {
    operations_research::sat::SatParameters sat_parameters;
    if (!google::protobuf::TextFormat::ParseFromString(
            parameters.sat_parameters(), &sat_parameters)) {
      errors.emplace_back(absl::StrCat("Invalid sat_parameters: '",
                                       parameters.sat_parameters(), "'"));
    }
  }
  return errors;
}

}  // namespace scheduling
}  // namespace gantt_solver
