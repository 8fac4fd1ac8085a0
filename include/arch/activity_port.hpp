#pragma once

#include <cstdint>

namespace fm {

// All comments are in English.
// Port to the memory holding per-position timestep-activity patterns.
class ActivityPort {
public:
  virtual ~ActivityPort() = default;

  // Read-enable pulse for this cycle at the given address.
  virtual void Request(std::uint8_t addr) = 0;

  // One clock cycle of the memory.
  virtual bool run() = 0;

  // Response pulse and its data.
  virtual bool         response_valid() const = 0;
  virtual std::uint8_t response() const = 0;

  // True while a request is outstanding.
  virtual bool busy() const = 0;
};

} // namespace fm
