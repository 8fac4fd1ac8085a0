// common/constants.hpp
#pragma once
// All comments are in English.

#include <cstddef>
#include <cstdint>

namespace fm {

// -----------------------------------------------------------------------------
// Fibre geometry
// -----------------------------------------------------------------------------
inline constexpr int kMaskBits  = 128;  // positions per fibre
inline constexpr int kTimesteps = 8;    // timesteps per correction cycle

// -----------------------------------------------------------------------------
// Decoupling queue pair
// -----------------------------------------------------------------------------
inline constexpr std::size_t kPairQueueCapacity = 8;

// -----------------------------------------------------------------------------
// Chunked rank counter (laggy path)
// -----------------------------------------------------------------------------
inline constexpr int kRankChunks        = 16;
inline constexpr int kRankChunkBits     = kMaskBits / kRankChunks;  // 8
inline constexpr int kRankReduceLevels  = 4;                        // 16->8->4->2->1
inline constexpr int kRankScheduleCycles = 8;                       // fixed schedule length

// -----------------------------------------------------------------------------
// Fast path prefix-sum tree
// -----------------------------------------------------------------------------
inline constexpr int kPrefixScanStages = 7;  // log2(kMaskBits)

// -----------------------------------------------------------------------------
// Activity memory
// -----------------------------------------------------------------------------
inline constexpr std::size_t   kActivityDepth  = kMaskBits;
inline constexpr std::uint8_t  kAllActive      = 0xFF;

// -----------------------------------------------------------------------------
// Sanity checks
// -----------------------------------------------------------------------------
static_assert(kMaskBits == 128, "Mask128 storage assumes 128 positions");
static_assert(kRankChunks * kRankChunkBits == kMaskBits, "chunks must tile the mask");
static_assert((1 << kRankReduceLevels) == kRankChunks, "reduction tree must be binary");
static_assert(kRankReduceLevels < kRankScheduleCycles, "reduction must fit the schedule");
static_assert((1 << kPrefixScanStages) == kMaskBits, "scan depth must be log2(width)");
static_assert(kTimesteps == 8, "activity pattern and spike train are 8-bit");
static_assert(kPairQueueCapacity > 0, "kPairQueueCapacity must be positive");

} // namespace fm
