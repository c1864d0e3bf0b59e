#include "termbar/progress/eta.hpp"
#include <cmath>

namespace termbar {
namespace progress {

EtaEstimator::EtaEstimator(double warmup_fraction)
    : warmup_fraction_(warmup_fraction) {
}

bool EtaEstimator::isWarmedUp(std::chrono::steady_clock::duration elapsed,
                              uint64_t value, uint64_t max) const {
    if (max == 0 || value == 0 || elapsed <= std::chrono::steady_clock::duration::zero()) {
        return false;
    }
    double fraction = static_cast<double>(value) / static_cast<double>(max);
    return fraction > warmup_fraction_;
}

uint64_t EtaEstimator::remainingSeconds(std::chrono::steady_clock::duration elapsed,
                                        uint64_t value, uint64_t max) const {
    using constants::time::ESTIMATING_PLACEHOLDER_SECONDS;
    using constants::time::MAX_REPRESENTABLE_SECONDS;
    
    if (value >= max) {
        return 0;
    }
    if (!isWarmedUp(elapsed, value, max)) {
        return ESTIMATING_PLACEHOLDER_SECONDS;
    }
    
    double elapsed_s = std::chrono::duration<double>(elapsed).count();
    double remaining = elapsed_s / static_cast<double>(value) * static_cast<double>(max - value);
    remaining = std::round(remaining);
    
    if (!(remaining < static_cast<double>(MAX_REPRESENTABLE_SECONDS))) {
        return MAX_REPRESENTABLE_SECONDS;
    }
    return static_cast<uint64_t>(remaining);
}

uint64_t elapsedSeconds(std::chrono::steady_clock::duration elapsed) {
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(elapsed).count();
    return seconds > 0 ? static_cast<uint64_t>(seconds) : 0;
}

}}
