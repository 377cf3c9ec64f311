/**
 * @file ordered_index.cpp
 * @brief Configuration checks for OrderedIndex
 */

#include <skipdex/index/ordered_index.hpp>

#include <spdlog/spdlog.h>

namespace skipdex {

Status ValidateIndexOptions(const IndexOptions& options) {
    if (options.max_level < 0) {
        spdlog::warn("Rejected index configuration: max_level={}", options.max_level);
        return Status::InvalidArgument("max_level must be non-negative, got " +
                                       std::to_string(options.max_level));
    }
    
    // Written as a positive range check so NaN is rejected too
    const double p = options.promotion_probability;
    if (!(p > 0.0 && p < 1.0)) {
        spdlog::warn("Rejected index configuration: promotion_probability={}", p);
        return Status::InvalidArgument("promotion_probability must be in (0, 1), got " +
                                       std::to_string(p));
    }
    
    return Status::Ok();
}

} // namespace skipdex
