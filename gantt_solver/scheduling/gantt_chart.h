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

#ifndef GANTT_SOLVER_SCHEDULING_GANTT_CHART_H_
#define GANTT_SOLVER_SCHEDULING_GANTT_CHART_H_

#include <cstdint>
#include <string>
#include <vector>

#include "absl/strings/string_view.h"

namespace gantt_solver {
namespace scheduling {

// One row of a Gantt chart.
struct GanttBar {
  std::string label;
  // Written inside the bar.
  int64_t num_resources;
  int64_t start;
  int64_t duration;
};

// Renders a list of bars as a chart. The first bar is drawn on the bottom row,
// the last one on the top row.
class GanttChartRenderer {
 public:
  virtual ~GanttChartRenderer() = default;

  virtual std::string Render(const std::vector<GanttBar>& bars,
                             absl::string_view title) const = 0;

  // The extension of the files produced by Render(), without the dot.
  virtual absl::string_view FileExtension() const = 0;
};

// Renders a chart as a standalone SVG document, with a time axis below the
// bars and the bar labels on the left.
class SvgGanttChartRenderer : public GanttChartRenderer {
 public:
  // Fill colors of the bars, cycling by row.
  static const char* const kPalette[];
  static const int kPaletteSize;

  SvgGanttChartRenderer() = default;
  // The width of the time axis, in pixels.
  explicit SvgGanttChartRenderer(int plot_width) : plot_width_(plot_width) {}

  std::string Render(const std::vector<GanttBar>& bars,
                     absl::string_view title) const override;
  absl::string_view FileExtension() const override { return "svg"; }

 private:
  int plot_width_ = 800;
};

}  // namespace scheduling
}  // namespace gantt_solver

#endif  // GANTT_SOLVER_SCHEDULING_GANTT_CHART_H_
