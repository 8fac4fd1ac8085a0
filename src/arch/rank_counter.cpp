// All comments are in English.
#include "arch/rank_counter.hpp"
#include "arch/pair_queue.hpp"
#include <stdexcept>

namespace fm {

std::uint8_t RankCounter::ChunkCount(const Mask128& a, int chunk, int pos) {
  if (chunk < 0 || chunk >= kRankChunks) {
    throw std::out_of_range("RankCounter::ChunkCount: chunk out of range");
  }
  const int begin = chunk * kRankChunkBits;
  const int end   = begin + kRankChunkBits;  // exclusive
  if (begin > pos) return 0;                 // chunk entirely after pos
  if (end - 1 <= pos) {
    return static_cast<std::uint8_t>(a.CountRange(begin, end));
  }
  return static_cast<std::uint8_t>(a.CountRange(begin, pos + 1));
}

ChunkCounts RankCounter::PartialCounts(const Mask128& a, int pos) {
  if (pos < 0 || pos >= kMaskBits) {
    throw std::out_of_range("RankCounter::PartialCounts: position out of range");
  }
  ChunkCounts out{};
  for (int c = 0; c < kRankChunks; ++c) out[c] = ChunkCount(a, c, pos);
  return out;
}

void RankCounter::ReduceLevel() {
  const int half = live_ / 2;
  for (int i = 0; i < half; ++i) {
    partials_[i] = static_cast<std::uint8_t>(partials_[2 * i] + partials_[2 * i + 1]);
  }
  for (int i = half; i < live_; ++i) partials_[i] = 0;
  live_ = half;
}

bool RankCounter::run(DecouplingQueuePair& queue, bool downstream_ready) {
  dispatched_   = false;
  result_valid_ = false;

  if (busy_) {
    ++cycle_;
    if (cycle_ <= kRankReduceLevels) ReduceLevel();
    if (cycle_ == kRankScheduleCycles - 1) {
      result_.rank_offset = partials_[0];
      result_.pos         = inflight_.pos;
      result_.weight      = inflight_.weight;
      result_valid_       = true;
      busy_               = false;
    }
    return true;
  }

  if (queue.empty() || !downstream_ready) return false;

  const auto popped = queue.Pop();
  if (!popped) return false;
  inflight_   = *popped;
  partials_   = PartialCounts(mask_a_, inflight_.pos);
  live_       = kRankChunks;
  cycle_      = 0;
  busy_       = true;
  dispatched_ = true;
  return true;
}

void RankCounter::Reset() {
  mask_a_       = {};
  inflight_     = {};
  partials_     = {};
  live_         = 0;
  cycle_        = 0;
  busy_         = false;
  dispatched_   = false;
  result_valid_ = false;
  result_       = {};
}

} // namespace fm
