#pragma once
#include <cstdint>
#include <string>

/* All comments are in English.
 * 128-bit sparsity mask shared by the extractor, rank counter and runner.
 * Bit i lives in lo (i < 64) or hi (i >= 64).
 */

namespace fm {

struct Mask128 {
    std::uint64_t lo = 0;
    std::uint64_t hi = 0;

    static Mask128 FromBit(int pos);

    // Parse 1..32 hex digits (most significant first, optional 0x prefix).
    // Throws std::invalid_argument on malformed input.
    static Mask128 FromHex(const std::string& text);

    // 32 lower-case hex digits, most significant first.
    std::string ToHex() const;

    bool Test(int pos) const;
    void Set(int pos);
    void Clear(int pos);

    bool IsZero() const { return lo == 0 && hi == 0; }
    int  Popcount() const;

    // Index of the lowest set bit, or -1 when the mask is zero.
    int  LowestSetBit() const;

    // Popcount of bits [begin, end).
    int  CountRange(int begin, int end) const;

    Mask128 operator&(const Mask128& o) const { return {lo & o.lo, hi & o.hi}; }
    Mask128 operator|(const Mask128& o) const { return {lo | o.lo, hi | o.hi}; }
    bool operator==(const Mask128& o) const { return lo == o.lo && hi == o.hi; }
    bool operator!=(const Mask128& o) const { return !(*this == o); }
};

} // namespace fm
