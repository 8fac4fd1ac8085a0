#include "arch/if_neuron.hpp"
#include "runner/simulation.hpp"
#include <iostream>
#include <string>

/* All comments are in English */

using namespace fm;

namespace {
int g_failures = 0;
void CHECK(bool cond, const std::string& msg) {
    if (!cond) { ++g_failures; std::cerr << "[FAIL] " << msg << "\n"; }
}

const TimestepSums kVector = {5, 3, 9, 2, 1, 6, 1, 1};

// Drive one run from a result-valid pulse; returns the cycle index of the done pulse.
int RunToDone(IFNeuron& n, const TimestepSums& in) {
    for (int c = 0; c < 32; ++c) {
        n.run(true, c == 0, in);
        if (n.done()) return c;
    }
    return -1;
}

void TEST_ResetOnSpikeVector() {
    std::cout << "[RUN ] ResetOnSpikeVector\n";
    CHECK(IFNeuron::SpikeTrainFor(kVector, 3) == 0x25, "spikes at t0, t2, t5");
    CHECK(SpikeTrainToString(0x25) == "10100100", "t0-first rendering");

    IFNeuron n(3);
    const int done_at = RunToDone(n, kVector);
    CHECK(done_at == kTimesteps + 1, "latch, 8 timesteps, then the done pulse");
    CHECK(n.spike_train() == 0x25, "timed run matches the reference train");
    CHECK(n.state() == NeuronState::kIdle, "back to idle after done");
    CHECK(n.timestep() == 0 && n.potential() == 0, "timestep and potential cleared");
    std::cout << "[DONE] ResetOnSpikeVector\n";
}

void TEST_StrictThreshold() {
    std::cout << "[RUN ] StrictThreshold\n";
    const TimestepSums at_thr = {3, 0, 0, 0, 0, 0, 0, 0};
    CHECK(IFNeuron::SpikeTrainFor(at_thr, 3) == 0, "potential equal to threshold does not fire");
    const TimestepSums all4 = {4, 4, 4, 4, 4, 4, 4, 4};
    CHECK(IFNeuron::SpikeTrainFor(all4, 3) == 0xFF, "4 > 3 fires every timestep");
    const TimestepSums neg = {-5, 3, 3, 3, 0, 0, 0, 0};
    // -5, -2, 1, 4 -> fire at t3 only
    CHECK(IFNeuron::SpikeTrainFor(neg, 3) == 0x08, "negative input delays the spike");
    std::cout << "[DONE] StrictThreshold\n";
}

void TEST_PotentialTrace() {
    std::cout << "[RUN ] PotentialTrace\n";
    IFNeuron n(3);
    n.run(true, true, kVector);
    const int expect_v[] = {5, 3, 12, 2, 3, 9, 1, 2};
    for (int t = 0; t < kTimesteps; ++t) {
        n.run(true, false, kVector);
        CHECK(n.potential() == expect_v[t], "potential after timestep " + std::to_string(t));
    }
    CHECK(n.state() == NeuronState::kDone, "done after the last timestep");
    std::cout << "[DONE] PotentialTrace\n";
}

void TEST_StartGateAndMissed() {
    std::cout << "[RUN ] StartGateAndMissed\n";
    IFNeuron n(3);
    n.run(false, true, kVector);
    CHECK(n.state() == NeuronState::kIdle, "no start, no integration");

    n.run(true, true, kVector);
    n.run(true, true, kVector);
    CHECK(n.missed(), "result valid while calculating is reported as missed");
    n.run(true, false, kVector);
    CHECK(!n.missed(), "missed is a one-cycle pulse");
    std::cout << "[DONE] StartGateAndMissed\n";
}

void TEST_Reset() {
    std::cout << "[RUN ] Reset\n";
    IFNeuron n(3);
    n.run(true, true, kVector);
    n.run(true, false, kVector);
    n.run(true, false, kVector);
    n.Reset();
    CHECK(n.state() == NeuronState::kIdle && n.timestep() == 0 && n.potential() == 0,
          "reset returns to idle with cleared registers");
    CHECK(RunToDone(n, kVector) == kTimesteps + 1, "a fresh run after reset completes");
    CHECK(n.spike_train() == 0x25, "fresh run gives the same train");
    std::cout << "[DONE] Reset\n";
}

} // namespace

int main() {
    std::cout << "=== IFNeuron Unit Tests ===\n";
    TEST_ResetOnSpikeVector();
    TEST_StrictThreshold();
    TEST_PotentialTrace();
    TEST_StartGateAndMissed();
    TEST_Reset();
    if (g_failures == 0) {
        std::cout << "[PASS] All tests passed.\n";
        return 0;
    } else {
        std::cout << "[FAIL] " << g_failures << " test(s) failed.\n";
        return 1;
    }
}
