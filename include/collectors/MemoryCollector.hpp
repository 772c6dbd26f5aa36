#pragma once
#include "model/Host.hpp"

namespace sysgraph::collectors {

class MemoryCollector {
public:
  bool sample(sysgraph::model::Memory& out) const; // returns true on success
};

} // namespace sysgraph::collectors
