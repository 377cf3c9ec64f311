#pragma once

#include <string_view>

namespace skipdex {

// Version
inline constexpr std::string_view kVersion = "1.0.0";

// OrderedIndex
inline constexpr int kDefaultMaxLevel = 16;
inline constexpr double kDefaultPromotionProbability = 0.5;

} // namespace skipdex
