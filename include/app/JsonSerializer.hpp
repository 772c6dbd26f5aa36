#pragma once
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>
#include "model/Chart.hpp"
#include "model/Sample.hpp"

// Found by ADL from nlohmann::ordered_json; ordered so fields keep schema order.
namespace sysgraph::model {

void to_json(nlohmann::ordered_json& j, const ChartSeries& s);
void to_json(nlohmann::ordered_json& j, const ChartPayload& c);
void to_json(nlohmann::ordered_json& j, const HistorySnapshot& s);

} // namespace sysgraph::model

namespace sysgraph::app {

// {"title":..,"charts":[{"title":..,"series":[{"name":..,"mode":..,"x":[..],"y":[..]}],
//   "x_axis_label":"Time","y_axis_label":"Percentage","x_tick_format":"HH:MM:SS"}]}
[[nodiscard]] std::string payloads_to_json(std::string_view page_title,
                                           const std::vector<model::ChartPayload>& charts);

// {"seq":N,"ram":[..],"cpu":[..],"disk":[..],"time":[..]}
[[nodiscard]] std::string snapshot_to_json(const model::HistorySnapshot& snap);

} // namespace sysgraph::app
