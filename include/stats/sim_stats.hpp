// All comments are in English.
#pragma once
#include <cstdint>

namespace fm {

struct StageStats {
  uint64_t ran = 0;                // cycles the stage made progress
  uint64_t gated_off = 0;          // cycles blocked by a neighbour
  uint64_t eligible_but_noop = 0;  // cycles with nothing to do
};

struct QueueLatencyStats {
  uint64_t count = 0;  // number of completed items measured
  uint64_t total = 0;  // sum of wait cycles over all completed items
  uint64_t max   = 0;  // maximum single-item wait cycles observed
};

struct EngineStats {
  uint64_t cycles              = 0;
  uint64_t operations          = 0;
  uint64_t matches             = 0;
  uint64_t queue_pushes        = 0;
  uint64_t overflow_drops      = 0;
  uint64_t backpressure_stalls = 0;
  uint64_t rank_dispatches     = 0;
  uint64_t activity_reads      = 0;
  uint64_t corrections         = 0;
  uint64_t neuron_runs         = 0;
  uint64_t neuron_missed       = 0;
  uint64_t rank_dropped        = 0;
  uint64_t reset_hazards       = 0;
  uint64_t max_queue_occupancy = 0;

  StageStats extractor;
  StageStats rank;
  StageStats correction;
  StageStats neuron;

  QueueLatencyStats queue_wait;  // push -> rank dispatch
};

// Add one observation to a QueueLatencyStats.
inline void AccumulateQueueLatency(QueueLatencyStats& dst, uint64_t latency) {
  dst.count += 1;
  dst.total += latency;
  if (latency > dst.max) dst.max = latency;
}

inline void AccumulateStage(StageStats& dst, const StageStats& src) {
  dst.ran               += src.ran;
  dst.gated_off         += src.gated_off;
  dst.eligible_but_noop += src.eligible_but_noop;
}

inline void AccumulateEngineStats(EngineStats& dst, const EngineStats& src) {
  dst.cycles              += src.cycles;
  dst.operations          += src.operations;
  dst.matches             += src.matches;
  dst.queue_pushes        += src.queue_pushes;
  dst.overflow_drops      += src.overflow_drops;
  dst.backpressure_stalls += src.backpressure_stalls;
  dst.rank_dispatches     += src.rank_dispatches;
  dst.activity_reads      += src.activity_reads;
  dst.corrections         += src.corrections;
  dst.neuron_runs         += src.neuron_runs;
  dst.neuron_missed       += src.neuron_missed;
  dst.rank_dropped        += src.rank_dropped;
  dst.reset_hazards       += src.reset_hazards;
  if (src.max_queue_occupancy > dst.max_queue_occupancy) {
    dst.max_queue_occupancy = src.max_queue_occupancy;
  }
  AccumulateStage(dst.extractor,  src.extractor);
  AccumulateStage(dst.rank,       src.rank);
  AccumulateStage(dst.correction, src.correction);
  AccumulateStage(dst.neuron,     src.neuron);
  dst.queue_wait.count += src.queue_wait.count;
  dst.queue_wait.total += src.queue_wait.total;
  if (src.queue_wait.max > dst.queue_wait.max) dst.queue_wait.max = src.queue_wait.max;
}

} // namespace fm
