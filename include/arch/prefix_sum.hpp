#pragma once
// All comments are in English.

#include <array>
#include <cstdint>
#include "common/constants.hpp"
#include "common/mask128.hpp"

namespace fm {

using PrefixCounts = std::array<std::uint8_t, kMaskBits>;

/**
 * PrefixSumTree
 *
 * Hillis-Steele inclusive scan over the 128 bits of a mask:
 *   - stage s (s = 0..6) adds the value at stride 2^s below each lane;
 *   - after kPrefixScanStages stages, lane i holds popcount(mask[0..i]).
 *
 * Used by the extractor to turn a matched position into a weight-table rank.
 */
class PrefixSumTree {
public:
  // Full inclusive scan.
  static PrefixCounts Scan(const Mask128& mask);

  // Set bits strictly below pos (pos 0 has rank 0).
  static int RankBelow(const Mask128& mask, int pos);
};

} // namespace fm
