#pragma once
#include <array>
#include <cstdint>
#include "common/constants.hpp"

/* All comments are in English.
 * Records passed between pipeline stages.
 */

namespace fm {

using Weight       = std::int8_t;
using AccumValue   = std::int16_t;
using WeightTable  = std::array<Weight, kMaskBits>;
using TimestepSums = std::array<AccumValue, kTimesteps>;

// One matched position: index in the 128-wide space + weight looked up by B's rank.
struct MatchedElement {
    std::uint8_t pos    = 0;
    Weight       weight = 0;
};

// Laggy path output: RankOffset of pos within mask A, with pos/weight carried through.
struct RankResult {
    std::uint8_t rank_offset = 0;  // set bits of A in [0, pos]
    std::uint8_t pos         = 0;
    Weight       weight      = 0;
};

} // namespace fm
