#pragma once
// All comments are in English.

#include <cstdint>
#include "common/constants.hpp"
#include "common/match.hpp"

namespace fm {

class ActivityPort;

enum class CorrState : std::uint8_t {
  kIdle,
  kWaitQueue,    // latched; issues the activity read
  kWaitMemory,   // waits for the activity response
  kCorrecting,
  kComplete,
};

/**
 * AccumCorrectionStage
 *
 * Two behaviours sharing one pseudo-accumulator:
 *   1) Accumulation: every match pulse from the extractor adds its weight.
 *   2) Correction FSM: for each RankResult, fetch the activity pattern and
 *      derive eight per-timestep sums from the accumulator value sampled in
 *      Correcting (not at match time):
 *          sums[t] = acc            if pattern bit t is set
 *          sums[t] = acc - weight   otherwise
 *
 * The correction reads the accumulator before this cycle's accumulation, so
 * both behaviours see registered values.
 */
class AccumCorrectionStage {
public:
  AccumCorrectionStage() = default;

  // One clock cycle.
  bool run(bool match_valid, const MatchedElement& match,
           bool rank_valid, const RankResult& rank,
           ActivityPort& memory);

  // Accum reset: accumulator, correction FSM and corrected sums to zero.
  void Reset();

  // Gate for the laggy path: a new rank may be dispatched.
  bool ready_for_slow() const {
    return state_ == CorrState::kIdle || state_ == CorrState::kComplete;
  }

  // RankOffset counts A's set bits in [0, pos] and includes pos itself, so the
  // first nonzero of A has RankOffset 1. The activity memory holds one pattern
  // per nonzero of A, 0-based, so the slot read is RankOffset - 1.
  static std::uint8_t ActivitySlot(std::uint8_t rank_offset) {
    return rank_offset == 0 ? 0 : static_cast<std::uint8_t>(rank_offset - 1);
  }

  // Result export.
  bool                result_valid() const { return result_valid_; }
  const TimestepSums& results()      const { return sums_; }

  // One-cycle pulses.
  bool read_issued()  const { return read_issued_; }
  bool rank_dropped() const { return rank_dropped_; }

  // Introspection
  CorrState    state()              const { return state_; }
  AccumValue   pseudo_accumulator() const { return accum_; }
  AccumValue   snapshot()           const { return snapshot_; }
  std::uint8_t pattern()            const { return pattern_; }
  Weight       weight()             const { return weight_; }
  std::uint8_t pos()                const { return pos_; }
  std::uint8_t rank_offset()        const { return rank_; }
  std::uint8_t activity_slot()      const { return slot_; }

private:
  void Correct();

private:
  // Accumulation
  AccumValue accum_ = 0;

  // Correction FSM
  CorrState    state_    = CorrState::kIdle;
  Weight       weight_   = 0;
  std::uint8_t pos_      = 0;
  std::uint8_t rank_     = 0;
  std::uint8_t slot_     = 0;  // activity memory address
  std::uint8_t pattern_  = 0;
  AccumValue   snapshot_ = 0;
  TimestepSums sums_{};

  // Pulses
  bool result_valid_ = false;
  bool read_issued_  = false;
  bool rank_dropped_ = false;
};

} // namespace fm
