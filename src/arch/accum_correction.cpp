// All comments are in English.
#include "arch/accum_correction.hpp"
#include "arch/activity_port.hpp"

namespace fm {

void AccumCorrectionStage::Correct() {
  snapshot_ = accum_;
  if (pattern_ == kAllActive) {
    sums_.fill(snapshot_);
    return;
  }
  const AccumValue corrected = static_cast<AccumValue>(snapshot_ - weight_);
  for (int t = 0; t < kTimesteps; ++t) {
    const bool active = ((pattern_ >> t) & 1u) != 0;
    sums_[t] = active ? snapshot_ : corrected;
  }
}

bool AccumCorrectionStage::run(bool match_valid, const MatchedElement& match,
                               bool rank_valid, const RankResult& rank,
                               ActivityPort& memory) {
  result_valid_ = false;
  read_issued_  = false;
  rank_dropped_ = false;

  bool progressed = false;

  // (2) Correction FSM, on the accumulator value registered last cycle.
  if (rank_valid && state_ != CorrState::kIdle) {
    rank_dropped_ = true;
  }

  switch (state_) {
    case CorrState::kIdle:
      if (rank_valid) {
        weight_ = rank.weight;
        pos_    = rank.pos;
        rank_   = rank.rank_offset;
        slot_   = ActivitySlot(rank.rank_offset);
        state_  = CorrState::kWaitQueue;
        progressed = true;
      }
      break;

    case CorrState::kWaitQueue:
      memory.Request(slot_);
      read_issued_ = true;
      state_ = CorrState::kWaitMemory;
      progressed = true;
      break;

    case CorrState::kWaitMemory:
      if (memory.response_valid()) {
        pattern_ = memory.response();
        state_   = CorrState::kCorrecting;
        progressed = true;
      }
      break;

    case CorrState::kCorrecting:
      Correct();
      state_ = CorrState::kComplete;
      progressed = true;
      break;

    case CorrState::kComplete:
      result_valid_ = true;
      state_ = CorrState::kIdle;
      progressed = true;
      break;
  }

  // (1) Accumulation.
  if (match_valid) {
    accum_ = static_cast<AccumValue>(accum_ + match.weight);
    progressed = true;
  }

  return progressed;
}

void AccumCorrectionStage::Reset() {
  accum_    = 0;
  state_    = CorrState::kIdle;
  weight_   = 0;
  pos_      = 0;
  rank_     = 0;
  slot_     = 0;
  pattern_  = 0;
  snapshot_ = 0;
  sums_.fill(0);
  result_valid_ = false;
  read_issued_  = false;
  rank_dropped_ = false;
}

} // namespace fm
