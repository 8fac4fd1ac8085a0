// core/engine.cpp
#include "core/engine.hpp"
#include <iostream>
#include <sstream>

namespace fm {

const char* ExtractorStateName(ExtractorState s) {
  switch (s) {
    case ExtractorState::kIdle:           return "Idle";
    case ExtractorState::kPriorityEncode: return "PriorityEncode";
    case ExtractorState::kPrefixSum:      return "PrefixSum";
    case ExtractorState::kClearBit:       return "ClearBit";
    default:                              return "unknown";
  }
}

const char* CorrStateName(CorrState s) {
  switch (s) {
    case CorrState::kIdle:       return "Idle";
    case CorrState::kWaitQueue:  return "WaitQueue";
    case CorrState::kWaitMemory: return "WaitMemory";
    case CorrState::kCorrecting: return "Correcting";
    case CorrState::kComplete:   return "Complete";
    default:                     return "unknown";
  }
}

const char* NeuronStateName(NeuronState s) {
  switch (s) {
    case NeuronState::kIdle:        return "Idle";
    case NeuronState::kCalculating: return "Calculating";
    case NeuronState::kDone:        return "Done";
    default:                        return "unknown";
  }
}

ClockEngine::ClockEngine(const EngineConfig& cfg)
  : cfg_(cfg)
  , memory_(kActivityDepth, cfg.activity_latency)
  , neuron_(cfg.threshold)
{
  if (cfg_.deadlock_cycles == 0) {
    throw std::invalid_argument("ClockEngine: deadlock_cycles must be > 0");
  }
  if (cfg_.max_cycles == 0) {
    throw std::invalid_argument("ClockEngine: max_cycles must be > 0");
  }
  extractor_.SetBackpressure(cfg_.backpressure);
}

void ClockEngine::SetBackpressure(bool on) {
  cfg_.backpressure = on;
  extractor_.SetBackpressure(on);
}

void ClockEngine::SetThreshold(std::int32_t thr) {
  cfg_.threshold = thr;
  neuron_.SetThreshold(thr);
}

void ClockEngine::SetActivityLatency(int cycles) {
  memory_.SetLatency(cycles);
  cfg_.activity_latency = cycles;
}

void ClockEngine::Submit(const Operation& op) {
  if (!ready()) {
    throw std::runtime_error("ClockEngine::Submit: extractor is not ready for a new operation");
  }
  if (rank_.busy() || !queue_.empty()) {
    throw std::runtime_error("ClockEngine::Submit: laggy path still holds matches of the previous operation");
  }
  if (!extractor_.Offer(op.mask_a, op.mask_b, op.weights)) {
    throw std::runtime_error("ClockEngine::Submit: extractor refused the operation");
  }
  rank_.LatchMaskA(op.mask_a);

  if (cfg_.verbose) {
    std::cout << "[Engine] cycle=" << cycle_ << " accept '" << op.name
              << "' A=" << op.mask_a.ToHex() << " B=" << op.mask_b.ToHex()
              << " matches=" << (op.mask_a & op.mask_b).Popcount() << "\n";
  }
}

bool ClockEngine::Tick() {
  // Neuron: consumes last cycle's corrected sums.
  const bool neuron_busy = neuron_.state() != NeuronState::kIdle;
  const bool p_neuron = neuron_.run(cfg_.neuron_start, accum_.result_valid(), accum_.results());

  // Correction + accumulation: last cycle's match, rank and memory pulses.
  const bool p_corr = accum_.run(extractor_.match_valid(), extractor_.match(),
                                 rank_.result_valid(), rank_.result(), memory_);

  // Activity memory.
  const bool p_mem = memory_.run();

  // Laggy path: dispatch gated by the correction stage.
  const bool rank_eligible = !rank_.busy() && !queue_.empty();
  const bool slow_ready    = accum_.ready_for_slow();
  const bool p_rank = rank_.run(queue_, slow_ready);

  // Fast path.
  const bool p_ext = extractor_.run(queue_);

  // ---- Per-stage accounting ----
  if (p_ext) ++stats_.extractor.ran;
  else if (extractor_.stalled()) ++stats_.extractor.gated_off;
  else ++stats_.extractor.eligible_but_noop;

  if (p_rank) ++stats_.rank.ran;
  else if (rank_eligible && !slow_ready) ++stats_.rank.gated_off;
  else ++stats_.rank.eligible_but_noop;

  if (p_corr) ++stats_.correction.ran;
  else if (accum_.state() == CorrState::kWaitMemory) ++stats_.correction.gated_off;
  else ++stats_.correction.eligible_but_noop;

  if (p_neuron) ++stats_.neuron.ran;
  else if (neuron_busy) ++stats_.neuron.gated_off;
  else ++stats_.neuron.eligible_but_noop;

  CollectPulses();

  if (cfg_.verbose) {
    std::cout << "[Engine] " << DescribeState() << "\n";
  }

  ++cycle_;
  ++stats_.cycles;
  return p_neuron || p_corr || p_mem || p_rank || p_ext;
}

void ClockEngine::CollectPulses() {
  if (extractor_.match_valid()) {
    const MatchedElement& m = extractor_.match();
    matches_.push_back(m);
    ++stats_.matches;
    if (extractor_.overflow_drop()) {
      ++stats_.overflow_drops;
      std::cerr << "[Engine][Warn] cycle=" << cycle_ << " queue pair full, match pos="
                << static_cast<int>(m.pos) << " weight=" << static_cast<int>(m.weight)
                << " dropped\n";
    } else {
      ++stats_.queue_pushes;
      push_cycles_.push_back(cycle_);
    }
  }
  if (extractor_.stalled()) ++stats_.backpressure_stalls;
  if (queue_.size() > stats_.max_queue_occupancy) stats_.max_queue_occupancy = queue_.size();

  if (rank_.dispatched()) {
    ++stats_.rank_dispatches;
    if (!push_cycles_.empty()) {
      AccumulateQueueLatency(stats_.queue_wait, cycle_ - push_cycles_.front());
      push_cycles_.pop_front();
    }
  }

  if (accum_.read_issued()) ++stats_.activity_reads;
  if (accum_.rank_dropped()) {
    ++stats_.rank_dropped;
    std::cerr << "[Engine][Warn] cycle=" << cycle_ << " rank result for pos="
              << static_cast<int>(rank_.result().pos)
              << " arrived while the correction stage was busy; lost\n";
  }
  if (accum_.result_valid()) {
    CorrectionRecord rec;
    rec.cycle       = cycle_;
    rec.pos         = accum_.pos();
    rec.weight      = accum_.weight();
    rec.rank_offset = accum_.rank_offset();
    rec.activity_slot = accum_.activity_slot();
    rec.pattern     = accum_.pattern();
    rec.snapshot    = accum_.snapshot();
    rec.sums        = accum_.results();
    corrections_.push_back(rec);
    ++stats_.corrections;
  }

  if (neuron_.done()) {
    spike_trains_.push_back(neuron_.spike_train());
    ++stats_.neuron_runs;
  }
  if (neuron_.missed()) {
    ++stats_.neuron_missed;
    std::cerr << "[Engine][Warn] cycle=" << cycle_
              << " corrected sums arrived while the neuron was busy; not integrated\n";
  }
}

bool ClockEngine::Idle() const {
  return !extractor_.busy() && !extractor_.match_valid()
      && queue_.empty()
      && !rank_.busy() && !rank_.result_valid()
      && !memory_.busy()
      && accum_.state() == CorrState::kIdle && !accum_.result_valid()
      && neuron_.state() == NeuronState::kIdle;
}

std::uint64_t ClockEngine::RunUntilIdle() {
  const std::uint64_t start = cycle_;
  std::uint64_t no_progress = 0;
  for (;;) {
    if (Tick()) {
      no_progress = 0;
    } else if (++no_progress >= cfg_.deadlock_cycles) {
      throw DeadlockError("ClockEngine: no progress for " + std::to_string(no_progress) +
                          " cycles (" + DescribeState() + ")");
    }
    if (Idle()) break;
    // Finishing on the max_cycles-th tick is still within the limit.
    if (cycle_ - start >= cfg_.max_cycles) {
      throw std::runtime_error("ClockEngine: operation exceeded max_cycles=" +
                               std::to_string(cfg_.max_cycles));
    }
  }
  return cycle_ - start;
}

OperationResult ClockEngine::RunOperation(const Operation& op) {
  ResetAll();
  ClearOutputs();
  memory_.LoadImage(op.activity);

  // Per-operation stats are collected separately and folded into the totals.
  const EngineStats totals = stats_;
  ClearStats();

  Submit(op);
  const std::uint64_t cycles = RunUntilIdle();
  ++stats_.operations;

  OperationResult res;
  res.name               = op.name;
  res.matches            = matches_;
  res.corrections        = corrections_;
  res.spike_trains       = spike_trains_;
  res.pseudo_accumulator = accum_.pseudo_accumulator();
  res.cycles             = cycles;
  res.stats              = stats_;

  EngineStats merged = totals;
  AccumulateEngineStats(merged, stats_);
  stats_ = merged;
  return res;
}

void ClockEngine::ClearOutputs() {
  matches_.clear();
  corrections_.clear();
  spike_trains_.clear();
}

void ClockEngine::ReportHazard(const std::string& what) {
  ++stats_.reset_hazards;
  std::cerr << "[Engine][Warn] cycle=" << cycle_ << " reset hazard: " << what << "\n";
}

void ClockEngine::ResetFast() {
  if (rank_.busy() || accum_.state() != CorrState::kIdle) {
    ReportHazard("fast reset while the laggy path still works on matches of the abandoned operation");
  }
  extractor_.Reset();
  queue_.clear();
  push_cycles_.clear();
}

void ClockEngine::ResetSlow() {
  if (rank_.busy()) {
    ReportHazard("slow reset abandoned the rank computation for pos=" +
                 std::to_string(rank_.inflight().pos));
  }
  if (!queue_.empty()) {
    ReportHazard("slow reset left " + std::to_string(queue_.size()) +
                 " queued match(es) to be ranked against a cleared mask A");
  }
  rank_.Reset();
}

void ClockEngine::ResetAccum() {
  if (accum_.state() != CorrState::kIdle) {
    ReportHazard("accum reset abandoned the correction of pos=" +
                 std::to_string(accum_.pos()));
  }
  if (extractor_.busy() || !queue_.empty() || rank_.busy()) {
    ReportHazard("accum reset while matches are still in flight; their weights are lost from the accumulator");
  }
  accum_.Reset();
  memory_.Reset();
}

void ClockEngine::ResetNeuron() {
  neuron_.Reset();
}

void ClockEngine::ResetAll() {
  extractor_.Reset();
  queue_.clear();
  push_cycles_.clear();
  rank_.Reset();
  accum_.Reset();
  memory_.Reset();
  neuron_.Reset();
}

std::string ClockEngine::DescribeState() const {
  std::ostringstream oss;
  oss << "cycle=" << cycle_
      << " ext=" << ExtractorStateName(extractor_.state())
      << " q=" << queue_.size()
      << " rank=";
  if (rank_.busy()) oss << "busy(" << rank_.cycle() << ")";
  else              oss << "idle";
  oss << " corr=" << CorrStateName(accum_.state())
      << " acc=" << accum_.pseudo_accumulator()
      << " mem=" << (memory_.busy() ? (memory_.stalled() ? "stalled" : "busy") : "idle")
      << " neuron=" << NeuronStateName(neuron_.state());
  return oss.str();
}

} // namespace fm
