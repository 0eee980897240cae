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

#ifndef GANTT_SOLVER_BASE_INIT_GOOGLE_H_
#define GANTT_SOLVER_BASE_INIT_GOOGLE_H_

#include <vector>

#include "absl/flags/flag.h"   // IWYU pragma: keep
#include "absl/flags/parse.h"
#include "absl/flags/usage.h"
#include "absl/log/globals.h"
#include "absl/log/initialize.h"
#include "absl/strings/string_view.h"

namespace gantt_solver {

// Initializes logging and parses the command line flags.
//
// Typically called early on in main() and must be called before other
// threads start logging. 'usage' is passed to absl::SetProgramUsageMessage().
// Returns the positional arguments left after flag parsing, argv[0] included.
inline std::vector<char*> InitGoogle(absl::string_view usage, int argc,
                                     char** argv) {
  if (!usage.empty()) {
    absl::SetProgramUsageMessage(usage);
  }
  std::vector<char*> positional_args = absl::ParseCommandLine(argc, argv);
  absl::InitializeLog();
  absl::SetStderrThreshold(absl::LogSeverityAtLeast::kInfo);
  return positional_args;
}

}  // namespace gantt_solver

#endif  // GANTT_SOLVER_BASE_INIT_GOOGLE_H_
