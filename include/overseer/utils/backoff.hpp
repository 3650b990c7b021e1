/**
 * @file backoff.hpp
 * @brief Exponential backoff policy shared by retrying components
 * 
 * Used by the pool's prewarm retries, artifact uploads and control-plane
 * completion calls.
 * 
 * @date 2025
 */

#pragma once

#include <chrono>

namespace overseer {
namespace utils {

/**
 * @struct BackoffPolicy
 * @brief Bounded exponential backoff
 * 
 * Retry n (0-based) waits `initial_delay * multiplier^n`, capped at
 * `max_delay`. At most `max_retries` retries follow the first try, so an
 * operation is tried `max_retries + 1` times in total.
 */
struct BackoffPolicy {
    std::chrono::milliseconds initial_delay{500};   ///< Delay before the first retry
    double multiplier{2.0};                         ///< Growth factor per retry
    std::chrono::milliseconds max_delay{30000};     ///< Upper bound for any single delay
    int max_retries{3};                             ///< Retries after the first try
    
    /**
     * @brief Delay to wait before retry number `retry`
     * @param retry 0-based retry index
     * @return Delay, never above max_delay
     */
    std::chrono::milliseconds DelayFor(int retry) const;
};

} // namespace utils
} // namespace overseer
