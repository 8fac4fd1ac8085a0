#include "common/mask128.hpp"
#include "arch/prefix_sum.hpp"
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>

/* All comments are in English.
 * Minimal test harness:
 *  - Use CHECK(cond, msg) to record failures without stopping the run.
 *  - Each test is a function; main() aggregates results.
 */

using namespace fm;

namespace {
int g_failures = 0;

void CHECK(bool cond, const std::string& msg) {
    if (!cond) {
        ++g_failures;
        std::cerr << "[FAIL] " << msg << "\n";
    }
}

// Deterministic mask generator (xorshift).
Mask128 PseudoRandomMask(std::uint64_t seed) {
    auto next = [&seed]() {
        seed ^= seed << 13;
        seed ^= seed >> 7;
        seed ^= seed << 17;
        return seed;
    };
    Mask128 m;
    m.lo = next();
    m.hi = next();
    return m;
}

void TEST_HexRoundTripAndBits() {
    std::cout << "[RUN ] HexRoundTripAndBits\n";
    Mask128 m = Mask128::FromHex("0x80000000000000000000000000000001");
    CHECK(m.Test(0), "bit 0 should be set");
    CHECK(m.Test(127), "bit 127 should be set");
    CHECK(!m.Test(64), "bit 64 should be clear");
    CHECK(m.Popcount() == 2, "popcount should be 2");
    CHECK(m.ToHex() == "80000000000000000000000000000001", "hex should round-trip");

    Mask128 s = Mask128::FromHex("1f");
    CHECK(s.lo == 0x1FULL && s.hi == 0, "short hex should fill the low bits");

    Mask128 h = Mask128::FromHex("10000000000000000");  // bit 64
    CHECK(h.lo == 0 && h.hi == 1, "17th hex digit should land in hi");
    CHECK(h.LowestSetBit() == 64, "lowest set bit should be 64");
    std::cout << "[DONE] HexRoundTripAndBits\n";
}

void TEST_BadHexThrows() {
    std::cout << "[RUN ] BadHexThrows\n";
    bool threw = false;
    try { (void)Mask128::FromHex("0xZZ"); } catch (const std::invalid_argument&) { threw = true; }
    CHECK(threw, "non-hex digit must throw");

    threw = false;
    try { (void)Mask128::FromHex(std::string(33, '1')); } catch (const std::invalid_argument&) { threw = true; }
    CHECK(threw, "more than 32 digits must throw");

    threw = false;
    try { (void)Mask128::FromHex(""); } catch (const std::invalid_argument&) { threw = true; }
    CHECK(threw, "empty string must throw");

    threw = false;
    try { Mask128 m; m.Set(128); } catch (const std::out_of_range&) { threw = true; }
    CHECK(threw, "Set(128) must throw");
    std::cout << "[DONE] BadHexThrows\n";
}

void TEST_SetClearLowest() {
    std::cout << "[RUN ] SetClearLowest\n";
    Mask128 m;
    CHECK(m.IsZero(), "default mask is zero");
    CHECK(m.LowestSetBit() == -1, "zero mask has no lowest bit");
    m.Set(63);
    m.Set(64);
    m.Set(100);
    CHECK(m.LowestSetBit() == 63, "lowest should be 63");
    m.Clear(63);
    CHECK(m.LowestSetBit() == 64, "lowest should move to 64");
    m.Clear(64);
    CHECK(m.LowestSetBit() == 100, "lowest should move to 100");
    CHECK(m.CountRange(0, 100) == 0, "no bits below 100");
    CHECK(m.CountRange(0, 101) == 1, "one bit at or below 100");
    std::cout << "[DONE] SetClearLowest\n";
}

void TEST_PrefixScanMatchesNaiveRank() {
    std::cout << "[RUN ] PrefixScanMatchesNaiveRank\n";
    for (std::uint64_t seed = 1; seed <= 20; ++seed) {
        const Mask128 b = PseudoRandomMask(seed * 0x9E3779B97F4A7C15ULL);
        const PrefixCounts scan = PrefixSumTree::Scan(b);
        int running = 0;
        for (int p = 0; p < 128; ++p) {
            CHECK(PrefixSumTree::RankBelow(b, p) == running,
                  "RankBelow must equal set bits strictly below p (seed " + std::to_string(seed) +
                  ", p " + std::to_string(p) + ")");
            if (b.Test(p)) ++running;
            CHECK(scan[p] == running, "inclusive scan must equal popcount of [0, p]");
        }
        CHECK(scan[127] == b.Popcount(), "last lane must equal popcount");
    }
    CHECK(PrefixSumTree::RankBelow(Mask128::FromHex("1"), 0) == 0, "position 0 has rank 0");
    std::cout << "[DONE] PrefixScanMatchesNaiveRank\n";
}

} // namespace

int main() {
    std::cout << "=== Mask128 / PrefixSumTree Unit Tests ===\n";
    TEST_HexRoundTripAndBits();
    TEST_BadHexThrows();
    TEST_SetClearLowest();
    TEST_PrefixScanMatchesNaiveRank();
    if (g_failures == 0) {
        std::cout << "[PASS] All tests passed.\n";
        return 0;
    } else {
        std::cout << "[FAIL] " << g_failures << " test(s) failed.\n";
        return 1;
    }
}
