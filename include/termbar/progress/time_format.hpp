#pragma once

#include "termbar/common/constants.hpp"
#include <cstdint>
#include <string>

namespace termbar {
namespace progress {

struct DurationParts {
    uint64_t days;
    uint64_t hours;
    uint64_t minutes;
    uint64_t seconds;
};

/**
 * Splits a second count into days, hours, minutes and seconds.
 *
 * Throws ProgressError(DURATION_OUT_OF_RANGE) when total_seconds is at or
 * above constants::time::MAX_REPRESENTABLE_SECONDS.
 */
DurationParts splitDuration(uint64_t total_seconds);

/**
 * Renders "<prefix>DDdHHhMMmSSs". The day field is zero padded to day_width,
 * every other field to two digits, so the result has the same length for
 * every representable input.
 */
std::string formatDuration(uint64_t total_seconds,
                           const std::string& prefix = constants::progress::ETA_PREFIX,
                           int day_width = constants::limits::DEFAULT_DAY_WIDTH);

size_t formattedDurationLength(const std::string& prefix, int day_width);

}}
