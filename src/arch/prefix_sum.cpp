// All comments are in English.
#include "arch/prefix_sum.hpp"
#include <stdexcept>

namespace fm {

PrefixCounts PrefixSumTree::Scan(const Mask128& mask) {
  PrefixCounts cur{};
  for (int i = 0; i < kMaskBits; ++i) {
    cur[i] = mask.Test(i) ? 1 : 0;
  }

  for (int stage = 0; stage < kPrefixScanStages; ++stage) {
    const int stride = 1 << stage;
    PrefixCounts next = cur;
    for (int i = stride; i < kMaskBits; ++i) {
      next[i] = static_cast<std::uint8_t>(cur[i] + cur[i - stride]);
    }
    cur = next;
  }
  return cur;
}

int PrefixSumTree::RankBelow(const Mask128& mask, int pos) {
  if (pos < 0 || pos >= kMaskBits) {
    throw std::out_of_range("PrefixSumTree::RankBelow: position out of range");
  }
  if (pos == 0) return 0;
  const PrefixCounts scan = Scan(mask);
  return scan[pos - 1];
}

} // namespace fm
