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

#ifndef GANTT_SOLVER_BASE_FILE_H_
#define GANTT_SOLVER_BASE_FILE_H_

#include <cstdio>
#include <memory>
#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"

namespace gantt_solver {

// A file opened with fopen(). The file is closed when the object is destroyed
// if Close() was not called before; errors are then ignored.
class File {
 public:
  // "mode" is passed to fopen(): "r", "w", "a", ...
  static absl::StatusOr<std::unique_ptr<File>> Open(absl::string_view name,
                                                    absl::string_view mode);

  // This type is neither copyable nor movable.
  File(const File&) = delete;
  File& operator=(const File&) = delete;

  ~File();

  // Reads from the current position to the end of the file.
  absl::StatusOr<std::string> ReadToEnd();

  absl::Status Write(absl::string_view contents);

  // Flushes and closes the file. No other method may be called afterwards.
  absl::Status Close();

  absl::string_view filename() const { return name_; }

 private:
  File(FILE* c_file, absl::string_view name) : f_(c_file), name_(name) {}

  FILE* f_;
  const std::string name_;
};

namespace file {

// Returns OkStatus if "path" exists, NotFoundError otherwise.
absl::Status Exists(absl::string_view path);

// Reads the whole file.
absl::StatusOr<std::string> GetContents(absl::string_view path);

// Creates or truncates the file, then writes contents to it.
absl::Status SetContents(absl::string_view file_name,
                         absl::string_view contents);

}  // namespace file
}  // namespace gantt_solver

#endif  // GANTT_SOLVER_BASE_FILE_H_
