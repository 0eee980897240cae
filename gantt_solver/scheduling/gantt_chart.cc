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

#include "gantt_solver/scheduling/gantt_chart.h"

#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

#include "absl/strings/str_format.h"
#include "absl/strings/str_replace.h"
#include "absl/strings/string_view.h"

namespace gantt_solver {
namespace scheduling {

const char* const SvgGanttChartRenderer::kPalette[] = {
    "#FF7F0E",  // orange
    "#2CA02C",  // green
    "#D62728",  // red
    "#9467BD",  // purple
    "#1F77B4",  // blue
    "#E377C2",  // pink
    "#8C564B",  // brown
};
const int SvgGanttChartRenderer::kPaletteSize =
    sizeof(SvgGanttChartRenderer::kPalette) /
    sizeof(SvgGanttChartRenderer::kPalette[0]);

namespace {

constexpr int kLeftMargin = 220;
constexpr int kRightMargin = 40;
constexpr int kTopMargin = 60;
constexpr int kBottomMargin = 70;
constexpr int kRowHeight = 40;
constexpr int kBarHeight = 24;
constexpr int kMaxNumTicks = 10;

std::string XmlEscape(absl::string_view text) {
  return absl::StrReplaceAll(text, {{"&", "&amp;"},
                                    {"<", "&lt;"},
                                    {">", "&gt;"},
                                    {"\"", "&quot;"},
                                    {"'", "&apos;"}});
}

}  // namespace

std::string SvgGanttChartRenderer::Render(const std::vector<GanttBar>& bars,
                                          absl::string_view title) const {
  const int num_rows = bars.size();
  int64_t time_span = 1;
  for (const GanttBar& bar : bars) {
    time_span = std::max(time_span, bar.start + bar.duration);
  }
  const double scale = static_cast<double>(plot_width_) / time_span;
  const int width = kLeftMargin + plot_width_ + kRightMargin;
  const int axis_y = kTopMargin + num_rows * kRowHeight;
  const int height = axis_y + kBottomMargin;

  std::string svg;
  absl::StrAppendFormat(&svg,
                        "<svg xmlns=\"http://www.w3.org/2000/svg\" "
                        "width=\"%d\" height=\"%d\" viewBox=\"0 0 %d %d\" "
                        "font-family=\"sans-serif\">\n",
                        width, height, width, height);
  absl::StrAppendFormat(
      &svg, "<rect width=\"%d\" height=\"%d\" fill=\"white\"/>\n", width,
      height);
  absl::StrAppendFormat(&svg,
                        "<text x=\"%d\" y=\"%d\" font-size=\"20\" "
                        "text-anchor=\"middle\">%s</text>\n",
                        width / 2, kTopMargin / 2, XmlEscape(title));

  // Time axis, with a vertical grid line on each tick.
  const int64_t tick_step =
      std::max<int64_t>(1, (time_span + kMaxNumTicks - 1) / kMaxNumTicks);
  for (int64_t t = 0; t <= time_span; t += tick_step) {
    const double x = kLeftMargin + t * scale;
    absl::StrAppendFormat(&svg,
                          "<line x1=\"%.1f\" y1=\"%d\" x2=\"%.1f\" y2=\"%d\" "
                          "stroke=\"#DDDDDD\"/>\n",
                          x, kTopMargin, x, axis_y);
    absl::StrAppendFormat(&svg,
                          "<text x=\"%.1f\" y=\"%d\" font-size=\"12\" "
                          "text-anchor=\"middle\">%d</text>\n",
                          x, axis_y + 18, t);
  }
  absl::StrAppendFormat(&svg,
                        "<line x1=\"%d\" y1=\"%d\" x2=\"%d\" y2=\"%d\" "
                        "stroke=\"black\"/>\n",
                        kLeftMargin, axis_y, kLeftMargin + plot_width_, axis_y);
  absl::StrAppendFormat(&svg,
                        "<line x1=\"%d\" y1=\"%d\" x2=\"%d\" y2=\"%d\" "
                        "stroke=\"black\"/>\n",
                        kLeftMargin, kTopMargin, kLeftMargin, axis_y);
  absl::StrAppendFormat(&svg,
                        "<text x=\"%d\" y=\"%d\" font-size=\"14\" "
                        "text-anchor=\"middle\">Start/Duration</text>\n",
                        kLeftMargin + plot_width_ / 2, height - 20);
  absl::StrAppendFormat(
      &svg,
      "<text x=\"20\" y=\"%d\" font-size=\"14\" text-anchor=\"middle\" "
      "transform=\"rotate(-90 20 %d)\">Projects</text>\n",
      (kTopMargin + axis_y) / 2, (kTopMargin + axis_y) / 2);

  for (int row = 0; row < num_rows; ++row) {
    const GanttBar& bar = bars[row];
    const int row_top = kTopMargin + (num_rows - 1 - row) * kRowHeight;
    const int center_y = row_top + kRowHeight / 2;
    const double x = kLeftMargin + bar.start * scale;
    const double bar_width = bar.duration * scale;
    absl::StrAppendFormat(&svg,
                          "<text x=\"%d\" y=\"%d\" font-size=\"12\" "
                          "text-anchor=\"end\" dominant-baseline=\"middle\">"
                          "%s</text>\n",
                          kLeftMargin - 8, center_y, XmlEscape(bar.label));
    absl::StrAppendFormat(&svg,
                          "<rect x=\"%.1f\" y=\"%d\" width=\"%.1f\" "
                          "height=\"%d\" fill=\"%s\"/>\n",
                          x, center_y - kBarHeight / 2, bar_width, kBarHeight,
                          kPalette[row % kPaletteSize]);
    absl::StrAppendFormat(&svg,
                          "<text x=\"%.1f\" y=\"%d\" font-size=\"12\" "
                          "fill=\"white\" text-anchor=\"middle\" "
                          "dominant-baseline=\"middle\">%d</text>\n",
                          x + bar_width / 2, center_y, bar.num_resources);
  }
  svg += "</svg>\n";
  return svg;
}

}  // namespace scheduling
}  // namespace gantt_solver
