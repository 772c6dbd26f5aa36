#pragma once
#include <memory>
#include <string_view>
#include <vector>
#include "model/Chart.hpp"
#include "model/Sample.hpp"

namespace sysgraph::app {

inline constexpr const char* kRamSeries  = "RAM Usage (%)";
inline constexpr const char* kCpuSeries  = "CPU Usage (%)";
inline constexpr const char* kDiskSeries = "Disk Usage (%)";

// Shapes a history snapshot into chart payloads. Chosen once at startup;
// never changes the store's representation.
class ChartLayout {
public:
  virtual ~ChartLayout() = default;

  // Empty snapshot -> no charts.
  [[nodiscard]] virtual std::vector<model::ChartPayload> render(const model::HistorySnapshot& snap) const = 0;

  [[nodiscard]] virtual model::RenderMode mode() const = 0;
};

// One chart, three series on a shared time axis
class CombinedLayout final : public ChartLayout {
public:
  [[nodiscard]] std::vector<model::ChartPayload> render(const model::HistorySnapshot& snap) const override;
  [[nodiscard]] model::RenderMode mode() const override { return model::RenderMode::Combined; }
};

// Three charts (RAM, CPU, Disk), one series each
class SeparateLayout final : public ChartLayout {
public:
  [[nodiscard]] std::vector<model::ChartPayload> render(const model::HistorySnapshot& snap) const override;
  [[nodiscard]] model::RenderMode mode() const override { return model::RenderMode::Separate; }
};

[[nodiscard]] std::unique_ptr<ChartLayout> make_layout(model::RenderMode mode);

// "one" -> Combined; anything else -> Separate.
[[nodiscard]] model::RenderMode parse_mode(std::string_view s);
[[nodiscard]] const char* mode_name(model::RenderMode mode);
[[nodiscard]] const char* page_title(model::RenderMode mode);

} // namespace sysgraph::app
