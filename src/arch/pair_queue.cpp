// All comments are in English.
#include "arch/pair_queue.hpp"

namespace fm {

bool DecouplingQueuePair::Push(const MatchedElement& m) {
  if (full()) return false;
  const std::size_t tail = (head_ + size_) % kPairQueueCapacity;
  buf_[tail] = m;
  ++size_;
  return true;
}

std::optional<MatchedElement> DecouplingQueuePair::Pop() {
  if (empty()) return std::nullopt;
  const MatchedElement m = buf_[head_];
  Retire();
  return m;
}

std::optional<std::uint8_t> DecouplingQueuePair::PopPosition() {
  if (position_empty() || pos_taken_) return std::nullopt;
  const std::uint8_t pos = buf_[head_].pos;
  pos_taken_ = true;
  if (weight_taken_) Retire();
  return pos;
}

std::optional<Weight> DecouplingQueuePair::PopWeight() {
  if (weight_empty() || weight_taken_) return std::nullopt;
  const Weight w = buf_[head_].weight;
  weight_taken_ = true;
  if (pos_taken_) Retire();
  return w;
}

std::optional<MatchedElement> DecouplingQueuePair::Front() const {
  if (size_ == 0) return std::nullopt;
  return buf_[head_];
}

void DecouplingQueuePair::Retire() {
  head_ = (head_ + 1) % kPairQueueCapacity;
  --size_;
  pos_taken_    = false;
  weight_taken_ = false;
}

void DecouplingQueuePair::clear() {
  head_ = 0;
  size_ = 0;
  pos_taken_    = false;
  weight_taken_ = false;
}

} // namespace fm
