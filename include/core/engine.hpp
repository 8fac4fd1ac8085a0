#pragma once
// All comments are in English.
#include <cstdint>
#include <deque>
#include <stdexcept>
#include <string>
#include <vector>
#include "common/constants.hpp"
#include "common/match.hpp"
#include "common/operation.hpp"
#include "core/engine_config.hpp"
#include "stats/sim_stats.hpp"
#include "arch/match_extractor.hpp"         // fast path
#include "arch/pair_queue.hpp"              // fast -> laggy
#include "arch/rank_counter.hpp"            // laggy path
#include "arch/activity_memory.hpp"         // external activity store
#include "arch/accum_correction.hpp"        // accumulator + correction
#include "arch/if_neuron.hpp"               // spike train

namespace fm {

// Thrown when no stage makes progress for EngineConfig::deadlock_cycles cycles.
class DeadlockError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// One corrected result as exported on the result-valid pulse.
struct CorrectionRecord {
  std::uint64_t cycle         = 0;
  std::uint8_t  pos           = 0;
  Weight        weight        = 0;
  std::uint8_t  rank_offset   = 0;  // inclusive
  std::uint8_t  activity_slot = 0;  // rank_offset - 1
  std::uint8_t  pattern       = 0;
  AccumValue    snapshot      = 0;  // accumulator sampled in Correcting
  TimestepSums  sums{};
};

struct OperationResult {
  std::string                   name;
  std::vector<MatchedElement>   matches;      // every match pulse, in order
  std::vector<CorrectionRecord> corrections;
  std::vector<std::uint8_t>     spike_trains; // one per neuron done pulse
  AccumValue                    pseudo_accumulator = 0;
  std::uint64_t                 cycles = 0;
  EngineStats                   stats{};

  // Spike train of the last neuron run (0 when none ran).
  std::uint8_t final_spike_train() const {
    return spike_trains.empty() ? 0 : spike_trains.back();
  }
};

/**
 * ClockEngine
 *
 * Owns and wires the pipeline; Tick() advances every state machine once, consumers
 * before producers:
 *
 *   neuron <- correction/accumulation <- activity memory <- rank counter <- extractor
 *
 * so a pulse raised in cycle N is observed downstream in cycle N+1, while ready
 * signals (queue full, ready_for_slow) are seen by the producer in the same cycle.
 *
 * Reset domains:
 *   fast   : extractor + queue pair
 *   slow   : rank counter
 *   accum  : accumulator + correction FSM (+ its outstanding activity read)
 *   neuron : neuron
 */
class ClockEngine {
public:
  explicit ClockEngine(const EngineConfig& cfg = EngineConfig{});

  // ---- Intake handshake ----
  bool ready() const { return extractor_.ready(); }
  // Offer one operation; the extractor latches it on the next Tick().
  // Throws std::runtime_error if not ready or the laggy path still holds matches.
  void Submit(const Operation& op);

  // One clock cycle. Returns true if any stage made progress.
  bool Tick();

  // True when no stage holds work or an undelivered pulse.
  bool Idle() const;

  // Reset, submit, tick until Idle. Throws DeadlockError or std::runtime_error.
  OperationResult RunOperation(const Operation& op);

  // Tick until Idle; returns the cycles spent.
  std::uint64_t RunUntilIdle();

  // ---- Reset lines ----
  void ResetFast();
  void ResetSlow();
  void ResetAccum();
  void ResetNeuron();
  void ResetAll();

  // ---- Config ----
  const EngineConfig& config() const { return cfg_; }
  void SetBackpressure(bool on);
  void SetThreshold(std::int32_t thr);
  void SetActivityLatency(int cycles);

  // ---- Components accessors ----
  MatchExtractor&             extractor()       { return extractor_; }
  DecouplingQueuePair&        queue()           { return queue_; }
  RankCounter&                rank_counter()    { return rank_; }
  ActivityMemory&             activity_memory() { return memory_; }
  AccumCorrectionStage&       accum()           { return accum_; }
  IFNeuron&                   neuron()          { return neuron_; }
  const MatchExtractor&       extractor()       const { return extractor_; }
  const DecouplingQueuePair&  queue()           const { return queue_; }
  const RankCounter&          rank_counter()    const { return rank_; }
  const ActivityMemory&       activity_memory() const { return memory_; }
  const AccumCorrectionStage& accum()           const { return accum_; }
  const IFNeuron&             neuron()          const { return neuron_; }

  // ---- Collected outputs since the last ClearOutputs() ----
  const std::vector<MatchedElement>&   matches()      const { return matches_; }
  const std::vector<CorrectionRecord>& corrections()  const { return corrections_; }
  const std::vector<std::uint8_t>&     spike_trains() const { return spike_trains_; }
  void ClearOutputs();

  const EngineStats& stats() const { return stats_; }
  void ClearStats() { stats_ = EngineStats{}; }
  std::uint64_t cycle() const { return cycle_; }

  // Short one-line state dump (used by traces and deadlock reports).
  std::string DescribeState() const;

private:
  void CollectPulses();
  void ReportHazard(const std::string& what);

private:
  EngineConfig cfg_;

  // Components
  MatchExtractor       extractor_;
  DecouplingQueuePair  queue_;
  RankCounter          rank_;
  ActivityMemory       memory_;
  AccumCorrectionStage accum_;
  IFNeuron             neuron_;

  // Push cycle of every record in the queue pair, for wait-latency stats.
  std::deque<std::uint64_t> push_cycles_;

  std::vector<MatchedElement>   matches_;
  std::vector<CorrectionRecord> corrections_;
  std::vector<std::uint8_t>     spike_trains_;

  EngineStats   stats_{};
  std::uint64_t cycle_ = 0;
};

const char* ExtractorStateName(ExtractorState s);
const char* CorrStateName(CorrState s);
const char* NeuronStateName(NeuronState s);

} // namespace fm
