#pragma once
// All comments are in English.

#include <array>
#include <cstdint>
#include "common/constants.hpp"
#include "common/mask128.hpp"
#include "common/match.hpp"

namespace fm {

class DecouplingQueuePair;

using ChunkCounts = std::array<std::uint8_t, kRankChunks>;

/**
 * RankCounter (laggy path)
 *
 * For a popped PendingMatch, counts the set bits of mask A at indices <= pos:
 *   cycle 0   : dispatch, 16 per-chunk partial counts
 *   cycle 1-4 : pairwise reduction 16 -> 8 -> 4 -> 2 -> 1
 *   cycle 5-6 : idle
 *   cycle 7   : result pulse; the counter accepts a new dispatch next cycle
 *
 * The fixed schedule caps this stage at one result per kRankScheduleCycles.
 */
class RankCounter {
public:
  RankCounter() = default;

  // Mask A for the current operation.
  void LatchMaskA(const Mask128& a) { mask_a_ = a; }
  const Mask128& mask_a() const     { return mask_a_; }

  // One clock cycle. downstream_ready gates dispatch (correction ready-for-slow).
  bool run(DecouplingQueuePair& queue, bool downstream_ready);

  // Slow reset: abandon any in-flight computation, zero registers.
  void Reset();

  bool ready_for_new() const { return !busy_; }
  bool busy()          const { return busy_; }
  int  cycle()         const { return cycle_; }
  int  live_count()    const { return live_; }
  const ChunkCounts& partials() const { return partials_; }
  const MatchedElement& inflight() const { return inflight_; }

  // One-cycle pulses.
  bool              dispatched()   const { return dispatched_; }
  bool              result_valid() const { return result_valid_; }
  const RankResult& result()       const { return result_; }

  // Chunk count for one chunk, restricted to bits <= pos.
  static std::uint8_t ChunkCount(const Mask128& a, int chunk, int pos);
  static ChunkCounts  PartialCounts(const Mask128& a, int pos);

private:
  void ReduceLevel();

private:
  Mask128        mask_a_{};
  MatchedElement inflight_{};
  ChunkCounts    partials_{};
  int            live_  = 0;
  int            cycle_ = 0;
  bool           busy_  = false;

  bool       dispatched_   = false;
  bool       result_valid_ = false;
  RankResult result_{};
};

} // namespace fm
