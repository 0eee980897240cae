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

#include "gantt_solver/scheduling/schedule_output.h"

#include <algorithm>
#include <memory>
#include <string>

#include "absl/log/log.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "gantt_solver/base/status_builder.h"
#include "gantt_solver/scheduling/gantt_chart.h"
#include "gantt_solver/scheduling/project_scheduling.pb.h"
#include "google/protobuf/text_format.h"
#include "google/protobuf/util/json_util.h"

namespace gantt_solver {
namespace scheduling {

ScheduleOutput BuildScheduleOutput(const ScheduleSolution& solution) {
  ScheduleOutput output;
  output.record = solution;
  output.bars.reserve(solution.schedules_size());
  for (const ProjectSchedule& schedule : solution.schedules()) {
    output.bars.push_back({schedule.name(), schedule.num_resources(),
                           schedule.start(),
                           schedule.end() - schedule.start()});
  }
  std::stable_sort(output.bars.begin(), output.bars.end(),
                   [](const GanttBar& a, const GanttBar& b) {
                     return a.start > b.start;
                   });
  return output;
}

void LogScheduleSolution(const ScheduleSolution& solution, bool is_optimal) {
  LOG(INFO) << (is_optimal ? "Optimal schedule length: " : "Schedule length: ")
            << solution.total_duration();
  LOG(INFO) << "Schedules:";
  for (const ProjectSchedule& schedule : solution.schedules()) {
    LOG(INFO) << "  " << schedule.name() << ": " << schedule.start() << " -> "
              << schedule.end();
  }
}

absl::StatusOr<std::string> JsonScheduleSerializer::Serialize(
    const ScheduleSolution& solution) const {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;
  options.preserve_proto_field_names = true;
  std::string json;
  const auto status =
      google::protobuf::util::MessageToJsonString(solution, &json, options);
  if (!status.ok()) {
    return InternalErrorBuilder()
           << "could not convert the solution to JSON: " << status.ToString();
  }
  return json;
}

absl::StatusOr<std::string> TextProtoScheduleSerializer::Serialize(
    const ScheduleSolution& solution) const {
  std::string text;
  if (!google::protobuf::TextFormat::PrintToString(solution, &text)) {
    return InternalErrorBuilder()
           << "could not convert the solution to text format";
  }
  return text;
}

absl::StatusOr<OutputFormat> ParseOutputFormat(absl::string_view name) {
  if (name == "json") return OutputFormat::kJson;
  if (name == "textproto") return OutputFormat::kTextProto;
  return InvalidArgumentErrorBuilder()
         << "unknown output format '" << name
         << "', expected 'json' or 'textproto'";
}

std::unique_ptr<ScheduleSerializer> MakeScheduleSerializer(
    OutputFormat format) {
  switch (format) {
    case OutputFormat::kJson:
      return std::make_unique<JsonScheduleSerializer>();
    case OutputFormat::kTextProto:
      return std::make_unique<TextProtoScheduleSerializer>();
  }
  LOG(FATAL) << "Unknown output format: " << static_cast<int>(format);
  return nullptr;
}

}  // namespace scheduling
}  // namespace gantt_solver
