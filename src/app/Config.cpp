#include "app/Config.hpp"
#include "app/ChartLayout.hpp"
#include "util/TomlReader.hpp"

#include <cstdlib>
#include <filesystem>

namespace sysgraph::app {

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string alt;
  std::string n(name);
  if (n.rfind("SYSGRAPH_", 0) == 0) {
    alt = std::string("sysgraph_") + n.substr(9);
  } else if (n.rfind("sysgraph_", 0) == 0) {
    alt = std::string("SYSGRAPH_") + n.substr(9);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

int getenv_int(const char* name, int defv) {
  const char* v = getenv_compat(name);
  if (!v || !*v) return defv;
  try { return std::stoi(v); } catch (const std::exception&) { return defv; }
}

std::string config_file_path() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/sysgraph/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/sysgraph/config.toml";
  return {};
}

// Resolve an int from TOML -> env -> compiled default
static int resolve_int(const util::TomlReader& toml, bool have_toml,
                       const char* section, const char* key,
                       const char* env_name, int def) {
  if (have_toml && toml.has(section, key))
    return toml.get_int(section, key, def);
  return getenv_int(env_name, def);
}

// Resolve a string from TOML -> env -> compiled default
static std::string resolve_string(const util::TomlReader& toml, bool have_toml,
                                  const char* section, const char* key,
                                  const char* env_name, const std::string& def) {
  if (have_toml && toml.has(section, key))
    return toml.get_string(section, key, def);
  const char* v = getenv_compat(env_name);
  if (v && *v) return std::string(v);
  return def;
}

std::expected<Config, std::string> load_config(const std::string& explicit_path) {
  Config c{};
  util::TomlReader toml;
  bool have_toml = false;
  if (!explicit_path.empty()) {
    if (!toml.load(explicit_path)) return std::unexpected("cannot read config file " + explicit_path);
    have_toml = true;
    c.source = explicit_path;
  } else if (auto path = config_file_path(); !path.empty() && std::filesystem::exists(path)) {
    have_toml = toml.load(path);
    if (have_toml) c.source = path;
  }

  // --- [dashboard] ---
  c.mode = parse_mode(resolve_string(toml, have_toml, "dashboard", "mode", "SYSGRAPH_MODE", "multiple"));
  c.bind = resolve_string(toml, have_toml, "dashboard", "bind", "SYSGRAPH_BIND", c.bind);
  int port = resolve_int(toml, have_toml, "dashboard", "port", "SYSGRAPH_PORT", c.port);
  if (port >= 1 && port <= 65535) c.port = port;
  else SYSGRAPH_LOG_WARN("config", "port %d out of range; using %d", port, c.port);

  // --- [sampler] ---
  c.disk_path = resolve_string(toml, have_toml, "sampler", "disk_path", "SYSGRAPH_DISK_PATH", c.disk_path);
  int win = resolve_int(toml, have_toml, "sampler", "cpu_window_ms", "SYSGRAPH_CPU_WINDOW_MS", c.cpu_window_ms);
  // The CPU window must leave room inside a 5s tick
  if (win < 0) win = 0;
  if (win > 4000) win = 4000;
  c.cpu_window_ms = win;

  // --- [log] ---
  auto lvl = resolve_string(toml, have_toml, "log", "level", "SYSGRAPH_LOG_LEVEL", "info");
  if (!util::parse_log_level(lvl, c.log_level))
    SYSGRAPH_LOG_WARN("config", "unknown log level '%s'; using info", lvl.c_str());

  return c;
}

} // namespace sysgraph::app
