#include "arch/if_neuron.hpp"

namespace fm {

std::uint8_t IFNeuron::SpikeTrainFor(const TimestepSums& inputs, std::int32_t threshold) {
    std::int32_t v = 0;
    bool fired = false;
    std::uint8_t spikes = 0;
    for (int t = 0; t < kTimesteps; ++t) {
        v = NextPotential(v, fired, inputs[t]);
        fired = v > threshold;
        if (fired) spikes = static_cast<std::uint8_t>(spikes | (1u << t));
    }
    return spikes;
}

bool IFNeuron::run(bool start, bool result_valid, const TimestepSums& inputs) {
    done_   = false;
    missed_ = false;

    switch (state_) {
    case NeuronState::kIdle:
        if (start && result_valid) {
            inputs_   = inputs;
            v_mem_    = 0;
            fired_    = false;
            timestep_ = 0;
            spikes_   = 0;
            state_    = NeuronState::kCalculating;
            return true;
        }
        return false;

    case NeuronState::kCalculating: {
        if (result_valid) missed_ = true;
        const std::int32_t next = NextPotential(v_mem_, fired_, inputs_[timestep_]);
        fired_ = next > threshold_;
        if (fired_) spikes_ = static_cast<std::uint8_t>(spikes_ | (1u << timestep_));
        v_mem_ = next;
        ++timestep_;
        if (timestep_ == kTimesteps) state_ = NeuronState::kDone;
        return true;
    }

    case NeuronState::kDone:
        if (result_valid) missed_ = true;
        out_spikes_ = spikes_;
        done_       = true;
        state_      = NeuronState::kIdle;
        timestep_   = 0;
        v_mem_      = 0;
        fired_      = false;
        return true;
    }
    return false;
}

void IFNeuron::Reset() {
    state_      = NeuronState::kIdle;
    inputs_     = {};
    v_mem_      = 0;
    fired_      = false;
    timestep_   = 0;
    spikes_     = 0;
    out_spikes_ = 0;
    done_       = false;
    missed_     = false;
}

} // namespace fm
