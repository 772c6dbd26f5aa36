// Helpers for reading /proc with an optional fixture root
#pragma once
#include <optional>
#include <string>

namespace sysgraph::util {

// Map an absolute /proc path under SYSGRAPH_PROC_ROOT when that is set
auto map_proc_path(const std::string& abs) -> std::string;

// Read entire file as string. Returns std::nullopt on error.
auto read_file_string(const std::string& abs) -> std::optional<std::string>;

} // namespace sysgraph::util
