#include "arch/activity_memory.hpp"
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

/* All comments are in English */

using namespace fm;

namespace {
int g_failures = 0;
void CHECK(bool cond, const std::string& msg) {
    if (!cond) { ++g_failures; std::cerr << "[FAIL] " << msg << "\n"; }
}

// Number of run() calls after Request() until the response pulse (0 = never within limit).
int CallsToResponse(ActivityMemory& mem, std::uint8_t addr, int limit = 16) {
    mem.Request(addr);
    for (int c = 1; c <= limit; ++c) {
        mem.run();
        if (mem.response_valid()) return c;
    }
    return 0;
}

void TEST_FixedLatency() {
    std::cout << "[RUN ] FixedLatency\n";
    for (int lat : {0, 1, 3}) {
        ActivityMemory mem(kActivityDepth, lat);
        mem.Write(4, 0xA5);
        const int calls = CallsToResponse(mem, 4);
        CHECK(calls == lat + 1, "response after latency " + std::to_string(lat));
        CHECK(mem.response() == 0xA5, "response carries the stored pattern");
        CHECK(!mem.busy(), "no request outstanding after the response");
        mem.run();
        CHECK(!mem.response_valid(), "response valid is a one-cycle pulse");
    }
    std::cout << "[DONE] FixedLatency\n";
}

void TEST_LoadImage() {
    std::cout << "[RUN ] LoadImage\n";
    ActivityMemory mem;
    mem.Write(100, 0x11);
    mem.LoadImage({0xFF, 0x01, 0x80});
    CHECK(mem.Read(0) == 0xFF && mem.Read(1) == 0x01 && mem.Read(2) == 0x80, "image copied");
    CHECK(mem.Read(100) == 0, "entries beyond the image are zeroed");

    bool threw = false;
    try {
        mem.LoadImage(std::vector<std::uint8_t>(kActivityDepth + 1, 0));
    } catch (const std::out_of_range&) {
        threw = true;
    }
    CHECK(threw, "oversized image must throw std::out_of_range");
    std::cout << "[DONE] LoadImage\n";
}

void TEST_StallWithholdsResponse() {
    std::cout << "[RUN ] StallWithholdsResponse\n";
    ActivityMemory mem(kActivityDepth, 1);
    mem.Write(0, 0x3C);
    mem.SetStalled(true);
    mem.Request(0);
    for (int c = 0; c < 20; ++c) {
        CHECK(!mem.run(), "stalled memory makes no progress");
        CHECK(!mem.response_valid(), "stalled memory never responds");
    }
    CHECK(mem.busy(), "request is still outstanding");
    mem.SetStalled(false);
    mem.run();
    mem.run();
    CHECK(mem.response_valid() && mem.response() == 0x3C, "response resumes after the stall");
    std::cout << "[DONE] StallWithholdsResponse\n";
}

void TEST_Errors() {
    std::cout << "[RUN ] Errors\n";
    ActivityMemory mem(16, 2);

    bool threw = false;
    try { mem.Request(16); } catch (const std::out_of_range&) { threw = true; }
    CHECK(threw, "request beyond depth throws std::out_of_range");
    CHECK(!mem.busy(), "refused request leaves the memory idle");

    threw = false;
    mem.Request(1);
    try { mem.Request(2); } catch (const std::logic_error&) { threw = true; }
    CHECK(threw, "second outstanding request throws std::logic_error");

    threw = false;
    try { mem.SetLatency(-1); } catch (const std::invalid_argument&) { threw = true; }
    CHECK(threw, "negative latency throws std::invalid_argument");

    threw = false;
    try { (void)mem.Read(16); } catch (const std::out_of_range&) { threw = true; }
    CHECK(threw, "direct read beyond depth throws");

    mem.Reset();
    CHECK(!mem.busy() && !mem.response_valid(), "reset drops the outstanding request");
    CHECK(mem.requests() == 1, "request counter survives reset");
    std::cout << "[DONE] Errors\n";
}

} // namespace

int main() {
    std::cout << "=== ActivityMemory Unit Tests ===\n";
    TEST_FixedLatency();
    TEST_LoadImage();
    TEST_StallWithholdsResponse();
    TEST_Errors();
    if (g_failures == 0) {
        std::cout << "[PASS] All tests passed.\n";
        return 0;
    } else {
        std::cout << "[FAIL] " << g_failures << " test(s) failed.\n";
        return 1;
    }
}
