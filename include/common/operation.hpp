#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "common/mask128.hpp"
#include "common/match.hpp"

/* All comments are in English.
 * One operation offered on the intake handshake, plus the activity-memory
 * image that goes with it.
 */

namespace fm {

struct Operation {
    std::string               name;
    Mask128                   mask_a{};
    Mask128                   mask_b{};
    WeightTable               weights{};   // entry k belongs to the k-th set bit of B
    std::vector<std::uint8_t> activity;    // activity memory image, slot k = k-th set bit of A
};

} // namespace fm
