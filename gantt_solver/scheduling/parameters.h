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

#ifndef GANTT_SOLVER_SCHEDULING_PARAMETERS_H_
#define GANTT_SOLVER_SCHEDULING_PARAMETERS_H_

#include <string>
#include <vector>

#include "gantt_solver/scheduling/scheduling_parameters.pb.h"

namespace gantt_solver {
namespace scheduling {

// 30 seconds of search, one reported schedule, no duration cap, 8 workers.
SchedulingParameters DefaultSchedulingParameters();

// Returns an empty std::string if the parameters are valid, and a non-empty,
// human readable error description if they're not.
std::string FindErrorInSchedulingParameters(
    const SchedulingParameters& parameters);

// Returns a list of std::string describing the errors in the parameters.
// Returns an empty vector if the parameters are valid.
std::vector<std::string> FindErrorsInSchedulingParameters(
    const SchedulingParameters& parameters);

}  // namespace scheduling
}  // namespace gantt_solver

#endif  // GANTT_SOLVER_SCHEDULING_PARAMETERS_H_
