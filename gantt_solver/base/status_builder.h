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

#ifndef GANTT_SOLVER_BASE_STATUS_BUILDER_H_
#define GANTT_SOLVER_BASE_STATUS_BUILDER_H_

#include <sstream>
#include <string>

#include "absl/status/status.h"

namespace gantt_solver {

// Builds an absl::Status from a code and a streamed message:
//   return InvalidArgumentErrorBuilder() << "project '" << id << "'";
//
// When built from an error status, the streamed text is appended to the
// message of that status, after "; ". An OK status stays OK.
class StatusBuilder {
 public:
  explicit StatusBuilder(absl::StatusCode code) : code_(code) {}

  explicit StatusBuilder(const absl::Status& status)
      : code_(status.code()), prefix_(status.message()) {}

  operator absl::Status() const {  // NOLINT
    if (code_ == absl::StatusCode::kOk) return absl::OkStatus();
    const std::string annotation = message_.str();
    if (prefix_.empty()) return absl::Status(code_, annotation);
    if (annotation.empty()) return absl::Status(code_, prefix_);
    return absl::Status(code_, prefix_ + "; " + annotation);
  }

  template <class T>
  StatusBuilder& operator<<(const T& t) {
    message_ << t;
    return *this;
  }

 private:
  const absl::StatusCode code_;
  const std::string prefix_;
  std::ostringstream message_;
};

inline StatusBuilder FailedPreconditionErrorBuilder() {
  return StatusBuilder(absl::StatusCode::kFailedPrecondition);
}

inline StatusBuilder InternalErrorBuilder() {
  return StatusBuilder(absl::StatusCode::kInternal);
}

inline StatusBuilder InvalidArgumentErrorBuilder() {
  return StatusBuilder(absl::StatusCode::kInvalidArgument);
}

// An InvalidArgumentError for input documents that do not match their schema.
// The message starts with "invalid input: ".
inline StatusBuilder InvalidInputErrorBuilder() {
  StatusBuilder builder(absl::StatusCode::kInvalidArgument);
  builder << "invalid input: ";
  return builder;
}

inline StatusBuilder NotFoundErrorBuilder() {
  return StatusBuilder(absl::StatusCode::kNotFound);
}

}  // namespace gantt_solver

#endif  // GANTT_SOLVER_BASE_STATUS_BUILDER_H_
