#include "app/ChartLayout.hpp"

namespace sysgraph::app {

static model::ChartSeries make_series(const char* name, const std::vector<std::string>& x,
                                      const std::vector<double>& y) {
  model::ChartSeries s;
  s.name = name;
  s.x = x;
  s.y = y;
  return s;
}

std::vector<model::ChartPayload> CombinedLayout::render(const model::HistorySnapshot& snap) const {
  if (snap.empty()) return {};
  model::ChartPayload p;
  p.title = "RAM, CPU, and Disk Usage Over Time";
  p.series.push_back(make_series(kRamSeries, snap.time, snap.ram));
  p.series.push_back(make_series(kCpuSeries, snap.time, snap.cpu));
  p.series.push_back(make_series(kDiskSeries, snap.time, snap.disk));
  return {std::move(p)};
}

std::vector<model::ChartPayload> SeparateLayout::render(const model::HistorySnapshot& snap) const {
  if (snap.empty()) return {};
  struct Def { const char* title; const char* series; const std::vector<double>* y; };
  const Def defs[] = {
    {"RAM Usage Over Time",  kRamSeries,  &snap.ram},
    {"CPU Usage Over Time",  kCpuSeries,  &snap.cpu},
    {"Disk Usage Over Time", kDiskSeries, &snap.disk},
  };
  std::vector<model::ChartPayload> out;
  out.reserve(3);
  for (const auto& d : defs) {
    model::ChartPayload p;
    p.title = d.title;
    p.series.push_back(make_series(d.series, snap.time, *d.y));
    out.push_back(std::move(p));
  }
  return out;
}

std::unique_ptr<ChartLayout> make_layout(model::RenderMode mode) {
  if (mode == model::RenderMode::Combined) return std::make_unique<CombinedLayout>();
  return std::make_unique<SeparateLayout>();
}

model::RenderMode parse_mode(std::string_view s) {
  return s == "one" ? model::RenderMode::Combined : model::RenderMode::Separate;
}

const char* mode_name(model::RenderMode mode) {
  return mode == model::RenderMode::Combined ? "one" : "multiple";
}

const char* page_title(model::RenderMode mode) {
  return mode == model::RenderMode::Combined
             ? "System Monitoring Dashboard (Combined Graph)"
             : "System Monitoring Dashboard (Separate Graphs)";
}

} // namespace sysgraph::app
