#pragma once

#include <expected>
#include <string>
#include "model/Chart.hpp"
#include "util/Log.hpp"

namespace sysgraph::app {

struct Config {
  model::RenderMode mode{model::RenderMode::Separate};
  std::string bind{"127.0.0.1"};
  int port{8050};
  std::string disk_path{"/"};
  int cpu_window_ms{1000};       // clamped to [0, 4000]
  util::LogLevel log_level{util::LogLevel::Info};
  std::string source;            // config file actually read; empty if none
};

// $XDG_CONFIG_HOME/sysgraph/config.toml, else ~/.config/sysgraph/config.toml
std::string config_file_path();

// Environment lookup accepting both SYSGRAPH_ and sysgraph_ prefixes
const char* getenv_compat(const char* name);
int getenv_int(const char* name, int defv);

// Resolve every key TOML -> env -> compiled default. An explicit path
// that cannot be read is an error; a missing default file is not.
[[nodiscard]] std::expected<Config, std::string> load_config(const std::string& explicit_path = {});

} // namespace sysgraph::app
