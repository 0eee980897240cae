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

#ifndef GANTT_SOLVER_SCHEDULING_SCHEDULE_OUTPUT_H_
#define GANTT_SOLVER_SCHEDULING_SCHEDULE_OUTPUT_H_

#include <memory>
#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "gantt_solver/scheduling/gantt_chart.h"
#include "gantt_solver/scheduling/project_scheduling.pb.h"

namespace gantt_solver {
namespace scheduling {

// A solution, ready to be written and drawn.
struct ScheduleOutput {
  ScheduleSolution record;
  // One bar per project, by decreasing start time. Projects with the same
  // start keep the order of record.schedules().
  std::vector<GanttBar> bars;
};

ScheduleOutput BuildScheduleOutput(const ScheduleSolution& solution);

// Logs the schedule length, then one "name: start -> end" line per project.
void LogScheduleSolution(const ScheduleSolution& solution, bool is_optimal);

// Converts a solution to a persistent representation.
class ScheduleSerializer {
 public:
  virtual ~ScheduleSerializer() = default;

  virtual absl::StatusOr<std::string> Serialize(
      const ScheduleSolution& solution) const = 0;

  // The extension of the files produced by Serialize(), without the dot.
  virtual absl::string_view FileExtension() const = 0;
};

// Proto3 JSON mapping, with the field names of the .proto file. As in any
// proto3 JSON, int64 fields (total_duration, num_resources, start and end) are
// written as decimal strings, e.g. "total_duration": "8". Readers that use
// JsonStringToMessage() accept them as is; other readers must convert them.
class JsonScheduleSerializer : public ScheduleSerializer {
 public:
  absl::StatusOr<std::string> Serialize(
      const ScheduleSolution& solution) const override;
  absl::string_view FileExtension() const override { return "json"; }
};

// Protocol buffer text format.
class TextProtoScheduleSerializer : public ScheduleSerializer {
 public:
  absl::StatusOr<std::string> Serialize(
      const ScheduleSolution& solution) const override;
  absl::string_view FileExtension() const override { return "textproto"; }
};

enum class OutputFormat { kJson, kTextProto };

// Accepts "json" and "textproto".
absl::StatusOr<OutputFormat> ParseOutputFormat(absl::string_view name);

std::unique_ptr<ScheduleSerializer> MakeScheduleSerializer(
    OutputFormat format);

}  // namespace scheduling
}  // namespace gantt_solver

#endif  // GANTT_SOLVER_SCHEDULING_SCHEDULE_OUTPUT_H_
