#include "termbar/progress/time_format.hpp"
#include "termbar/progress/error_codes.hpp"
#include <spdlog/fmt/fmt.h>

namespace termbar {
namespace progress {

DurationParts splitDuration(uint64_t total_seconds) {
    using namespace constants::time;
    
    if (total_seconds >= MAX_REPRESENTABLE_SECONDS) {
        throw ProgressError(ProgressErrorCode::DURATION_OUT_OF_RANGE, {
            "TimeFormat",
            {{"seconds", std::to_string(total_seconds)},
             {"limit", std::to_string(MAX_REPRESENTABLE_SECONDS)}}
        });
    }
    
    DurationParts parts;
    parts.days = total_seconds / SECONDS_PER_DAY;
    uint64_t rest = total_seconds % SECONDS_PER_DAY;
    parts.hours = rest / SECONDS_PER_HOUR;
    rest %= SECONDS_PER_HOUR;
    parts.minutes = rest / SECONDS_PER_MINUTE;
    parts.seconds = rest % SECONDS_PER_MINUTE;
    return parts;
}

std::string formatDuration(uint64_t total_seconds, const std::string& prefix, int day_width) {
    DurationParts parts = splitDuration(total_seconds);
    return fmt::format("{}{:0{}}d{:02}h{:02}m{:02}s",
                       prefix, parts.days, day_width, parts.hours, parts.minutes, parts.seconds);
}

size_t formattedDurationLength(const std::string& prefix, int day_width) {
    // day field + "d" + "HHh" + "MMm" + "SSs"
    return prefix.size() + static_cast<size_t>(day_width) + 1 + 9;
}

}}
