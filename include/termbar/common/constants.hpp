#pragma once

#include <string>
#include <cstdint>
#include <cstddef>

namespace termbar {
namespace constants {

namespace version {
    constexpr const char* CLI_VERSION = "1.0.0";
    
    inline std::string getFullVersion() {
        return std::string("termbar v") + CLI_VERSION;
    }
}

namespace system {
    constexpr const char* APPLICATION_NAME = "termbar";
    constexpr const char* LOGGER_NAME = "termbar";
    constexpr const char* CONFIG_ENV = "TERMBAR_CONFIG";
    constexpr const char* CONFIG_FILE_NAME = "termbar.toml";
}

namespace time {
    constexpr uint64_t SECONDS_PER_MINUTE = 60;
    constexpr uint64_t SECONDS_PER_HOUR = 3600;
    constexpr uint64_t SECONDS_PER_DAY = 86400;
    
    // 100 days; anything at or above this is a broken estimate
    constexpr uint64_t MAX_REPRESENTABLE_SECONDS = 100 * SECONDS_PER_DAY;
    constexpr uint64_t ESTIMATING_PLACEHOLDER_SECONDS = MAX_REPRESENTABLE_SECONDS - 1;
}

namespace progress {
    constexpr const char* DEFAULT_FORMAT = "|=|";
    constexpr const char* ETA_PREFIX = "ETA:";
    constexpr const char* ELAPSED_PREFIX = "TOT:";
    
    constexpr size_t FORMAT_GLYPHS = 3;
    constexpr int BORDER_WIDTH = 2;
    constexpr int WHITESPACE = 2;
    constexpr int MIN_MIN_BAR_WIDTH = BORDER_WIDTH + 1;
    
    constexpr int MIN_DAY_WIDTH = 2;
    constexpr int MAX_DAY_WIDTH = 9;
}

namespace limits {
    constexpr int DEFAULT_UPDATE_INTERVAL_MS = 100;
    constexpr int DEFAULT_SCREEN_WIDTH = 80;
    constexpr int DEFAULT_MIN_BAR_WIDTH = 10;
    constexpr int DEFAULT_DAY_WIDTH = 2;
    constexpr double DEFAULT_WARMUP_FRACTION = 0.001;
    
    constexpr size_t DEFAULT_LOG_ROTATION_SIZE_MB = 10;
    constexpr size_t DEFAULT_LOG_MAX_FILES = 3;
}

namespace config_defaults {
    constexpr int UPDATE_INTERVAL_MS = limits::DEFAULT_UPDATE_INTERVAL_MS;
    constexpr int DEFAULT_WIDTH = limits::DEFAULT_SCREEN_WIDTH;
    constexpr int MIN_BAR_WIDTH = limits::DEFAULT_MIN_BAR_WIDTH;
    constexpr int DAY_WIDTH = limits::DEFAULT_DAY_WIDTH;
    constexpr double WARMUP_FRACTION = limits::DEFAULT_WARMUP_FRACTION;
    constexpr const char* FORMAT = progress::DEFAULT_FORMAT;
    
    constexpr size_t LOG_ROTATION_SIZE_MB = limits::DEFAULT_LOG_ROTATION_SIZE_MB;
    constexpr size_t LOG_MAX_FILES = limits::DEFAULT_LOG_MAX_FILES;
}

}
}
