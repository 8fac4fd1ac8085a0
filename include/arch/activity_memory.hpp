// activity_memory.hpp
// All comments are in English.
#pragma once
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <vector>
#include "common/constants.hpp"
#include "arch/activity_port.hpp"

namespace fm {

/**
 * ActivityMemory
 *
 * Fixed-latency model of the activity-pattern store:
 *   - Request() at cycle N produces a response pulse at cycle N + latency.
 *   - SetStalled(true) withholds responses (no timeout), to exercise deadlock
 *     detection.
 *   - One outstanding request at a time.
 */
class ActivityMemory final : public ActivityPort {
public:
  explicit ActivityMemory(std::size_t depth = kActivityDepth, int latency = 1);

  // Replace the contents; missing tail entries read as 0. Throws if the image is too large.
  void LoadImage(const std::vector<std::uint8_t>& image);

  // Direct (zero-time) access for setup and inspection.
  void         Write(std::size_t addr, std::uint8_t pattern);
  std::uint8_t Read(std::size_t addr) const;

  void SetLatency(int cycles) {
    if (cycles < 0) throw std::invalid_argument("ActivityMemory: latency must be >= 0");
    latency_ = cycles;
  }
  int  latency() const { return latency_; }

  void SetStalled(bool stalled) { stalled_ = stalled; }
  bool stalled() const { return stalled_; }

  // Drop any outstanding request and pulse.
  void Reset();

  std::size_t   depth()    const { return mem_.size(); }
  std::uint64_t requests() const { return requests_; }

  // ActivityPort
  void         Request(std::uint8_t addr) override;
  bool         run() override;
  bool         response_valid() const override { return valid_; }
  std::uint8_t response() const override { return data_; }
  bool         busy() const override { return pending_; }

private:
  std::vector<std::uint8_t> mem_;
  int  latency_ = 1;
  bool stalled_ = false;

  bool          pending_   = false;
  std::uint8_t  addr_      = 0;
  int           remaining_ = 0;

  bool          valid_ = false;
  std::uint8_t  data_  = 0;

  std::uint64_t requests_ = 0;
};

} // namespace fm
