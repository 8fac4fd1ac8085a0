// activity_memory.cpp
// All comments are in English.
#include "arch/activity_memory.hpp"
#include <algorithm>
#include <string>

namespace fm {

ActivityMemory::ActivityMemory(std::size_t depth, int latency)
  : mem_(depth, 0) {
  if (depth == 0) throw std::invalid_argument("ActivityMemory: depth must be > 0");
  SetLatency(latency);
}

void ActivityMemory::LoadImage(const std::vector<std::uint8_t>& image) {
  if (image.size() > mem_.size()) {
    throw std::out_of_range("ActivityMemory: image of " + std::to_string(image.size()) +
                            " entries exceeds depth " + std::to_string(mem_.size()));
  }
  std::fill(mem_.begin(), mem_.end(), 0);
  std::copy(image.begin(), image.end(), mem_.begin());
}

void ActivityMemory::Write(std::size_t addr, std::uint8_t pattern) {
  if (addr >= mem_.size()) throw std::out_of_range("ActivityMemory: write out of range");
  mem_[addr] = pattern;
}

std::uint8_t ActivityMemory::Read(std::size_t addr) const {
  if (addr >= mem_.size()) throw std::out_of_range("ActivityMemory: read out of range");
  return mem_[addr];
}

void ActivityMemory::Request(std::uint8_t addr) {
  if (pending_) throw std::logic_error("ActivityMemory: request while a read is outstanding");
  if (addr >= mem_.size()) {
    throw std::out_of_range("ActivityMemory: address " + std::to_string(addr) + " out of range");
  }
  pending_   = true;
  addr_      = addr;
  remaining_ = latency_;
  ++requests_;
}

bool ActivityMemory::run() {
  valid_ = false;
  if (!pending_ || stalled_) return false;

  if (remaining_ > 0) {
    --remaining_;
    return true;
  }
  data_    = mem_[addr_];
  valid_   = true;
  pending_ = false;
  return true;
}

void ActivityMemory::Reset() {
  pending_   = false;
  addr_      = 0;
  remaining_ = 0;
  valid_     = false;
  data_      = 0;
}

} // namespace fm
