#pragma once
// All comments are in English.

#include <cstddef>
#include <cstdint>
#include <optional>
#include "common/constants.hpp"
#include "common/match.hpp"

namespace fm {

/**
 * DecouplingQueuePair
 *
 * Position lane + weight lane, kept as ONE circular buffer of paired records
 * so the lanes cannot hold different entries.
 *
 *   - Push() writes both lanes or neither (accepted iff both lanes are non-full).
 *   - Pop() is the internal reader: it takes the head record from both lanes.
 *   - PopPosition()/PopWeight() let an external consumer yield one lane at a
 *     time; the head record retires only after both lanes yielded it, and a
 *     lane that is ahead reads nothing until the other lane catches up.
 *
 * Lane-local empty()/full() count the entries a lane still owes its reader.
 */
class DecouplingQueuePair {
public:
  DecouplingQueuePair() = default;

  // Write one record; returns false (both lanes untouched) if either lane is full.
  bool Push(const MatchedElement& m);

  // Take the head record on both lanes; std::nullopt if no record is held.
  // A head already yielded on one lane is completed by this call.
  std::optional<MatchedElement> Pop();

  // Single-lane reads for flow-control consumers.
  std::optional<std::uint8_t> PopPosition();
  std::optional<Weight>       PopWeight();

  // Read-only peek at the head record.
  std::optional<MatchedElement> Front() const;

  // Lane-local status.
  std::size_t position_count() const { return size_ - (pos_taken_ ? 1 : 0); }
  std::size_t weight_count()   const { return size_ - (weight_taken_ ? 1 : 0); }
  bool position_empty() const { return position_count() == 0; }
  bool weight_empty()   const { return weight_count() == 0; }
  bool position_full()  const { return position_count() == kPairQueueCapacity; }
  bool weight_full()    const { return weight_count() == kPairQueueCapacity; }

  // Write acceptance: AND of both lanes' non-full.
  bool full()  const { return position_full() || weight_full(); }
  bool empty() const { return size_ == 0; }
  std::size_t size() const { return size_; }

  void clear();

private:
  void Retire();

private:
  MatchedElement buf_[kPairQueueCapacity]{};
  std::size_t    head_ = 0;
  std::size_t    size_ = 0;
  bool           pos_taken_    = false;  // head position already yielded
  bool           weight_taken_ = false;  // head weight already yielded
};

} // namespace fm
