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

#include "gantt_solver/base/file.h"

#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <memory>
#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "gantt_solver/base/status_builder.h"
#include "gantt_solver/base/status_macros.h"

namespace gantt_solver {

absl::StatusOr<std::unique_ptr<File>> File::Open(absl::string_view name,
                                                 absl::string_view mode) {
  const std::string null_terminated_name(name);
  const std::string null_terminated_mode(mode);
  FILE* const c_file =
      fopen(null_terminated_name.c_str(), null_terminated_mode.c_str());
  if (c_file == nullptr) {
    const int error = errno;
    return StatusBuilder(error == ENOENT ? absl::StatusCode::kNotFound
                                         : absl::StatusCode::kInvalidArgument)
           << "could not open '" << name << "': " << strerror(error);
  }
  return std::unique_ptr<File>(new File(c_file, name));
}

File::~File() {
  if (f_ != nullptr) fclose(f_);
}

absl::StatusOr<std::string> File::ReadToEnd() {
  std::string contents;
  char buffer[1 << 16];
  size_t num_read;
  while ((num_read = fread(buffer, 1, sizeof(buffer), f_)) > 0) {
    contents.append(buffer, num_read);
  }
  if (ferror(f_)) {
    return InternalErrorBuilder() << "could not read from '" << name_ << "'";
  }
  return contents;
}

absl::Status File::Write(absl::string_view contents) {
  if (fwrite(contents.data(), 1, contents.size(), f_) != contents.size()) {
    return InternalErrorBuilder() << "could not write " << contents.size()
                                  << " bytes to '" << name_ << "'";
  }
  return absl::OkStatus();
}

absl::Status File::Close() {
  FILE* const c_file = f_;
  f_ = nullptr;
  if (c_file == nullptr || fclose(c_file) != 0) {
    return InternalErrorBuilder() << "could not close '" << name_ << "'";
  }
  return absl::OkStatus();
}

namespace file {

absl::Status Exists(absl::string_view path) {
  const std::string null_terminated_path(path);
  if (access(null_terminated_path.c_str(), F_OK) == 0) {
    return absl::OkStatus();
  }
  return NotFoundErrorBuilder() << "file '" << path << "' does not exist";
}

absl::StatusOr<std::string> GetContents(absl::string_view path) {
  ASSIGN_OR_RETURN(const std::unique_ptr<File> file, File::Open(path, "r"));
  ASSIGN_OR_RETURN(std::string contents, file->ReadToEnd());
  RETURN_IF_ERROR(file->Close());
  return contents;
}

absl::Status SetContents(absl::string_view file_name,
                         absl::string_view contents) {
  ASSIGN_OR_RETURN(const std::unique_ptr<File> file,
                   File::Open(file_name, "w"));
  // Close even if the write failed, and report the first error.
  absl::Status status = file->Write(contents);
  status.Update(file->Close());
  return status;
}

}  // namespace file
}  // namespace gantt_solver
