/**
 * @file backoff.cpp
 * @brief Exponential backoff delay computation
 * 
 * @date 2025
 */

#include "overseer/utils/backoff.hpp"

#include <algorithm>
#include <cmath>

namespace overseer {
namespace utils {

std::chrono::milliseconds BackoffPolicy::DelayFor(int retry) const {
    if (initial_delay.count() <= 0) {
        return std::chrono::milliseconds(0);
    }
    
    double factor = std::pow(std::max(multiplier, 1.0), std::max(retry, 0));
    double delay_ms = static_cast<double>(initial_delay.count()) * factor;
    double cap_ms = static_cast<double>(std::max(max_delay, initial_delay).count());
    
    return std::chrono::milliseconds(static_cast<long long>(std::min(delay_ms, cap_ms)));
}

} // namespace utils
} // namespace overseer
