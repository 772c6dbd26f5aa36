#include "app/JsonSerializer.hpp"

namespace sysgraph::model {

void to_json(nlohmann::ordered_json& j, const ChartSeries& s) {
  j = nlohmann::ordered_json{
    {"name", s.name},
    {"mode", s.style},
    {"x", s.x},
    {"y", s.y},
  };
}

void to_json(nlohmann::ordered_json& j, const ChartPayload& c) {
  j = nlohmann::ordered_json{
    {"title", c.title},
    {"series", c.series},
    {"x_axis_label", c.x_axis_label},
    {"y_axis_label", c.y_axis_label},
    {"x_tick_format", c.x_tick_format},
  };
}

void to_json(nlohmann::ordered_json& j, const HistorySnapshot& s) {
  j = nlohmann::ordered_json{
    {"seq", s.seq},
    {"ram", s.ram},
    {"cpu", s.cpu},
    {"disk", s.disk},
    {"time", s.time},
  };
}

} // namespace sysgraph::model

namespace sysgraph::app {

// Compact output; invalid UTF-8 is replaced rather than thrown on
static std::string dump(const nlohmann::ordered_json& j) {
  return j.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}

std::string payloads_to_json(std::string_view page_title, const std::vector<model::ChartPayload>& charts) {
  nlohmann::ordered_json out;
  out["title"] = std::string(page_title);
  out["charts"] = charts;
  return dump(out);
}

std::string snapshot_to_json(const model::HistorySnapshot& snap) {
  return dump(nlohmann::ordered_json(snap));
}

} // namespace sysgraph::app
