#pragma once
#include <cstdint>
#include "common/constants.hpp"
#include "common/match.hpp"

namespace fm {

enum class NeuronState : std::uint8_t {
  kIdle,
  kCalculating,
  kDone,
};

// Integrate-and-fire neuron over kTimesteps inputs, one timestep per cycle.
// A spike at timestep t replaces (rather than adds to) the potential at t+1.
class IFNeuron {
public:
    explicit IFNeuron(std::int32_t threshold = 0) : threshold_(threshold) {}

    // Idle + start + result_valid latches the inputs and begins integration.
    bool run(bool start, bool result_valid, const TimestepSums& inputs);

    // Neuron reset: Idle, timestep counter and potential cleared.
    void Reset();

    void         SetThreshold(std::int32_t thr) { threshold_ = thr; }
    std::int32_t threshold() const              { return threshold_; }

    // Potential after one timestep.
    static std::int32_t NextPotential(std::int32_t v, bool fired_prev, AccumValue input) {
        return fired_prev ? static_cast<std::int32_t>(input) : v + input;
    }

    // Whole-train evaluation with the same rule, no timing.
    static std::uint8_t SpikeTrainFor(const TimestepSums& inputs, std::int32_t threshold);

    // Outputs: spike_train() is stable from the done pulse until the next done pulse.
    bool         done()        const { return done_; }
    bool         missed()      const { return missed_; }
    std::uint8_t spike_train() const { return out_spikes_; }

    // Getters for tests
    NeuronState  state()     const { return state_; }
    std::int32_t potential() const { return v_mem_; }
    int          timestep()  const { return timestep_; }
    std::uint8_t spikes_so_far() const { return spikes_; }

private:
    std::int32_t threshold_;

    NeuronState  state_    = NeuronState::kIdle;
    TimestepSums inputs_{};
    std::int32_t v_mem_    = 0;
    bool         fired_    = false;
    int          timestep_ = 0;
    std::uint8_t spikes_   = 0;

    std::uint8_t out_spikes_ = 0;
    bool         done_       = false;
    bool         missed_     = false;
};

} // namespace fm
