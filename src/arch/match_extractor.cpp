// All comments are in English.
#include "arch/match_extractor.hpp"
#include "arch/pair_queue.hpp"
#include "arch/prefix_sum.hpp"

namespace fm {

bool MatchExtractor::Offer(const Mask128& mask_a, const Mask128& mask_b,
                           const WeightTable& weights) {
  if (!ready()) return false;
  in_mask_a_   = mask_a;
  in_mask_b_   = mask_b;
  in_weights_  = weights;
  input_valid_ = true;
  return true;
}

bool MatchExtractor::run(DecouplingQueuePair& queue) {
  // Pulses last exactly one cycle.
  match_valid_   = false;
  done_          = false;
  overflow_drop_ = false;
  stalled_       = false;

  switch (state_) {
    case ExtractorState::kIdle: {
      if (!input_valid_) return false;
      mask_        = in_mask_a_ & in_mask_b_;
      mask_b_      = in_mask_b_;
      weights_     = in_weights_;
      input_valid_ = false;
      state_       = ExtractorState::kPriorityEncode;
      return true;
    }

    case ExtractorState::kPriorityEncode: {
      if (mask_.IsZero()) {
        done_  = true;
        state_ = ExtractorState::kIdle;
        return true;
      }
      pos_   = mask_.LowestSetBit();
      state_ = ExtractorState::kPrefixSum;
      return true;
    }

    case ExtractorState::kPrefixSum: {
      if (backpressure_ && queue.full()) {
        stalled_ = true;
        return false;
      }
      const int rank = PrefixSumTree::RankBelow(mask_b_, pos_);
      match_.pos    = static_cast<std::uint8_t>(pos_);
      match_.weight = weights_[static_cast<std::size_t>(rank)];
      match_valid_  = true;
      if (!queue.Push(match_)) overflow_drop_ = true;
      state_ = ExtractorState::kClearBit;
      return true;
    }

    case ExtractorState::kClearBit: {
      mask_.Clear(pos_);
      state_ = ExtractorState::kPriorityEncode;
      return true;
    }
  }
  return false;
}

void MatchExtractor::Reset() {
  input_valid_ = false;
  in_mask_a_   = {};
  in_mask_b_   = {};
  in_weights_  = {};
  state_       = ExtractorState::kIdle;
  mask_        = {};
  mask_b_      = {};
  weights_     = {};
  pos_         = 0;
  match_valid_   = false;
  match_         = {};
  done_          = false;
  overflow_drop_ = false;
  stalled_       = false;
}

} // namespace fm
