#pragma once
// All comments are in English.

#include <cstdint>
#include "common/constants.hpp"
#include "common/mask128.hpp"
#include "common/match.hpp"

namespace fm {

class DecouplingQueuePair;

enum class ExtractorState : std::uint8_t {
  kIdle,
  kPriorityEncode,
  kPrefixSum,
  kClearBit,
};

/**
 * MatchExtractor (fast path)
 *
 * Idle -> PriorityEncode -> PrefixSum -> ClearBit -> PriorityEncode ... -> Idle
 *
 *  - Idle: an offered operation is latched (A & B, B, weight table).
 *  - PriorityEncode: lowest set bit of the latched mask, or Idle + done pulse.
 *  - PrefixSum: rank of the bit in B via PrefixSumTree, weight = table[rank];
 *    one-cycle match pulse and a write into the queue pair.
 *  - ClearBit: drop the bit from the latched mask.
 *
 * With backpressure on, PrefixSum holds while the queue pair is full.
 * With backpressure off, a refused write is reported as an overflow drop.
 */
class MatchExtractor {
public:
  MatchExtractor() = default;

  // Intake handshake. Offer() returns false when the extractor is not ready.
  bool ready() const { return state_ == ExtractorState::kIdle && !input_valid_; }
  bool Offer(const Mask128& mask_a, const Mask128& mask_b, const WeightTable& weights);

  void SetBackpressure(bool on) { backpressure_ = on; }
  bool backpressure() const     { return backpressure_; }

  // One clock cycle. Returns true if the FSM moved or emitted.
  bool run(DecouplingQueuePair& queue);

  // Fast reset: initial state, registers zeroed. Does not touch the queue.
  void Reset();

  // One-cycle output pulses (valid until the next run()).
  bool                  match_valid()   const { return match_valid_; }
  const MatchedElement& match()         const { return match_; }
  bool                  done()          const { return done_; }
  bool                  overflow_drop() const { return overflow_drop_; }
  bool                  stalled()       const { return stalled_; }

  // Introspection
  ExtractorState state()          const { return state_; }
  bool           busy()           const { return state_ != ExtractorState::kIdle || input_valid_; }
  const Mask128& pending_mask()   const { return mask_; }

private:
  // Offered operation (one-cycle valid).
  bool        input_valid_ = false;
  Mask128     in_mask_a_{};
  Mask128     in_mask_b_{};
  WeightTable in_weights_{};

  // Latched operation.
  ExtractorState state_ = ExtractorState::kIdle;
  Mask128        mask_{};       // remaining intersection bits
  Mask128        mask_b_{};
  WeightTable    weights_{};
  int            pos_ = 0;      // found by PriorityEncode

  // Output pulses.
  bool           match_valid_   = false;
  MatchedElement match_{};
  bool           done_          = false;
  bool           overflow_drop_ = false;
  bool           stalled_       = false;

  bool backpressure_ = true;
};

} // namespace fm
