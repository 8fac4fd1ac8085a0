#pragma once
// All comments are in English.

#include <cstdint>

namespace fm {

struct EngineConfig {
  std::int32_t  threshold        = 3;       // neuron fires when potential > threshold
  int           activity_latency = 1;       // cycles from read request to response
  bool          backpressure     = true;    // extractor holds while the queue pair is full
  bool          neuron_start     = true;    // neuron start input
  std::uint64_t deadlock_cycles  = 256;     // no-progress window before DeadlockError
  std::uint64_t max_cycles       = 100000;  // hard cap per operation
  bool          verbose          = false;   // per-cycle trace
};

} // namespace fm
