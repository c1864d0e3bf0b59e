#pragma once

#include "termbar/common/constants.hpp"
#include <chrono>
#include <cstdint>

namespace termbar {
namespace progress {

class EtaEstimator {
public:
    explicit EtaEstimator(double warmup_fraction = constants::limits::DEFAULT_WARMUP_FRACTION);
    
    // Linear extrapolation of the time left: elapsed / value * (max - value).
    // Until value / max exceeds the warm-up fraction (or no time has passed)
    // this returns ESTIMATING_PLACEHOLDER_SECONDS. Results that would not fit
    // the time formatter saturate at MAX_REPRESENTABLE_SECONDS.
    uint64_t remainingSeconds(std::chrono::steady_clock::duration elapsed,
                              uint64_t value, uint64_t max) const;
    
    bool isWarmedUp(std::chrono::steady_clock::duration elapsed,
                    uint64_t value, uint64_t max) const;
    
    double warmupFraction() const { return warmup_fraction_; }

private:
    double warmup_fraction_;
};

uint64_t elapsedSeconds(std::chrono::steady_clock::duration elapsed);

}}
