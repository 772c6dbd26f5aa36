#pragma once
#include <string>
#include "model/Host.hpp"

namespace sysgraph::collectors {

class FsCollector {
public:
  // Usage of the filesystem holding `path`
  bool sample(const std::string& path, sysgraph::model::FsUsage& out) const;
};

} // namespace sysgraph::collectors
