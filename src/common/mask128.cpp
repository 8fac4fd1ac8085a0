#include "common/mask128.hpp"
#include <cctype>
#include <stdexcept>

namespace fm {

namespace {

int Popcount64(std::uint64_t v) {
    int n = 0;
    while (v) {
        v &= v - 1;
        ++n;
    }
    return n;
}

int Ctz64(std::uint64_t v) {
    int n = 0;
    while ((v & 1ULL) == 0) {
        v >>= 1;
        ++n;
    }
    return n;
}

void CheckPos(int pos) {
    if (pos < 0 || pos >= 128) throw std::out_of_range("Mask128: bit position out of range");
}

} // namespace

Mask128 Mask128::FromBit(int pos) {
    Mask128 m;
    m.Set(pos);
    return m;
}

Mask128 Mask128::FromHex(const std::string& text) {
    std::string digits = text;
    if (digits.size() >= 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) {
        digits = digits.substr(2);
    }
    if (digits.empty() || digits.size() > 32) {
        throw std::invalid_argument("Mask128: expected 1..32 hex digits, got '" + text + "'");
    }

    Mask128 m;
    for (char ch : digits) {
        const unsigned char uch = static_cast<unsigned char>(ch);
        if (!std::isxdigit(uch)) {
            throw std::invalid_argument("Mask128: invalid hex digit in '" + text + "'");
        }
        const std::uint64_t nib = std::isdigit(uch)
            ? static_cast<std::uint64_t>(uch - '0')
            : static_cast<std::uint64_t>(std::tolower(uch) - 'a' + 10);
        // Shift the 128-bit value left by one nibble.
        m.hi = (m.hi << 4) | (m.lo >> 60);
        m.lo = (m.lo << 4) | nib;
    }
    return m;
}

std::string Mask128::ToHex() const {
    static const char kDigits[] = "0123456789abcdef";
    std::string out(32, '0');
    for (int i = 0; i < 16; ++i) {
        out[15 - i] = kDigits[(hi >> (4 * i)) & 0xF];
        out[31 - i] = kDigits[(lo >> (4 * i)) & 0xF];
    }
    return out;
}

bool Mask128::Test(int pos) const {
    CheckPos(pos);
    return pos < 64 ? ((lo >> pos) & 1ULL) != 0 : ((hi >> (pos - 64)) & 1ULL) != 0;
}

void Mask128::Set(int pos) {
    CheckPos(pos);
    if (pos < 64) lo |= (1ULL << pos);
    else          hi |= (1ULL << (pos - 64));
}

void Mask128::Clear(int pos) {
    CheckPos(pos);
    if (pos < 64) lo &= ~(1ULL << pos);
    else          hi &= ~(1ULL << (pos - 64));
}

int Mask128::Popcount() const {
    return Popcount64(lo) + Popcount64(hi);
}

int Mask128::LowestSetBit() const {
    if (lo != 0) return Ctz64(lo);
    if (hi != 0) return 64 + Ctz64(hi);
    return -1;
}

int Mask128::CountRange(int begin, int end) const {
    if (begin < 0 || end > 128 || begin > end) {
        throw std::out_of_range("Mask128::CountRange: invalid range");
    }
    int n = 0;
    for (int i = begin; i < end; ++i) {
        if (Test(i)) ++n;
    }
    return n;
}

} // namespace fm
