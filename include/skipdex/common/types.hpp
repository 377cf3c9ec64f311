#pragma once

#include <skipdex/config.hpp>
#include <cstdint>
#include <optional>

namespace skipdex {

using Level = int;
using EmployeeId = int64_t;

struct IndexOptions {
    Level max_level = kDefaultMaxLevel;
    double promotion_probability = kDefaultPromotionProbability;
    std::optional<uint32_t> seed;  // unset: seeded from std::random_device
};

} // namespace skipdex
