#pragma once
#include <string>
#include <vector>

namespace sysgraph::model {

enum class RenderMode { Combined, Separate };

struct ChartSeries {
  std::string name;            // e.g. "RAM Usage (%)"
  std::string style{"lines+markers"};
  std::vector<std::string> x;  // shared time axis
  std::vector<double> y;
  bool operator==(const ChartSeries&) const = default;
};

struct ChartPayload {
  std::string title;
  std::vector<ChartSeries> series;
  std::string x_axis_label{"Time"};
  std::string y_axis_label{"Percentage"};
  std::string x_tick_format{"HH:MM:SS"};
  bool operator==(const ChartPayload&) const = default;
};

} // namespace sysgraph::model
