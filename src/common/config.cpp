#include "termbar/common/config.hpp"
#include "termbar/common/constants.hpp"
#include "termbar/common/logger.hpp"
#include <toml.hpp>
#include <fstream>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <unistd.h>

namespace termbar {
namespace common {

LogLevel parseLogLevel(const std::string& value) {
    if (value == "DEBUG" || value == "debug") return LogLevel::DEBUG;
    if (value == "INFO" || value == "info") return LogLevel::INFO;
    if (value == "WARN" || value == "warn") return LogLevel::WARN;
    if (value == "ERROR" || value == "error") return LogLevel::ERROR;
    throw std::invalid_argument("Unknown log level: " + value);
}

std::string logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN: return "WARN";
        case LogLevel::INFO: return "INFO";
        case LogLevel::DEBUG: return "DEBUG";
    }
    return "WARN";
}

Config& Config::instance() {
    static Config instance;
    return instance;
}

Config::Config() {
    global_ = createDefaultConfig();
}

GlobalConfig Config::createDefaultConfig() {
    using namespace constants::config_defaults;

    GlobalConfig config;

    config.log_level = LogLevel::WARN;
    config.log_file = "";

    config.progress.update_interval_ms = UPDATE_INTERVAL_MS;
    config.progress.default_width = DEFAULT_WIDTH;
    config.progress.min_bar_width = MIN_BAR_WIDTH;
    config.progress.format = FORMAT;
    config.progress.day_width = DAY_WIDTH;
    config.progress.warmup_fraction = WARMUP_FRACTION;

    config.logging.rotation_size_mb = LOG_ROTATION_SIZE_MB;
    config.logging.max_files = LOG_MAX_FILES;
    config.logging.format = LogFormat::TEXT;

    return config;
}

void Config::reset() {
    global_ = createDefaultConfig();
    current_config_path_.clear();
}

std::vector<std::string> Config::getConfigSearchPaths() const {
    std::vector<std::string> paths;

    if (const char* env_path = std::getenv(constants::system::CONFIG_ENV)) {
        if (*env_path) {
            paths.emplace_back(env_path);
        }
    }

    if (const char* xdg = std::getenv("XDG_CONFIG_HOME")) {
        if (*xdg) {
            paths.push_back(std::string(xdg) + "/termbar/" + constants::system::CONFIG_FILE_NAME);
        }
    }

    if (const char* home = std::getenv("HOME")) {
        if (*home) {
            paths.push_back(std::string(home) + "/.config/termbar/" + constants::system::CONFIG_FILE_NAME);
        }
    }

    return paths;
}

std::optional<std::string> Config::findBestConfig() const {
    for (const auto& path : getConfigSearchPaths()) {
        if (std::filesystem::exists(path) && access(path.c_str(), R_OK) == 0) {
            return path;
        }
    }

    return std::nullopt;
}

bool Config::load(const std::string& config_file) {
    try {
        global_ = createDefaultConfig();

        std::string effective_config_file = config_file;
        if (effective_config_file.empty()) {
            auto best = findBestConfig();
            if (!best) {
                Logger::instance().debug("[Config] No config file found, using defaults");
                current_config_path_.clear();
                return true;
            }
            effective_config_file = *best;
        }

        current_config_path_ = effective_config_file;

        bool loaded = tryLoadTomlFile(effective_config_file);

        Logger::instance().info("[Config] Loaded | path={} | from_file={}",
                               effective_config_file, loaded);
        return true;
    } catch (const std::exception& e) {
        Logger::instance().error("[Config] Parse failed | error={}", e.what());
        return false;
    }
}

bool Config::tryLoadTomlFile(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        Logger::instance().debug("[Config] File not found | path={}", path);
        return false;
    }

    if (access(path.c_str(), R_OK) != 0) {
        Logger::instance().debug("[Config] File not readable | path={}", path);
        return false;
    }

    auto data = toml::parse(path);

    if (data.contains("global")) {
        auto global_section = data.at("global");

        if (global_section.contains("log_level")) {
            global_.log_level = parseLogLevel(toml::find<std::string>(global_section, "log_level"));
        }
        if (global_section.contains("log_file")) {
            global_.log_file = toml::find<std::string>(global_section, "log_file");
        }
    }

    if (data.contains("progress")) {
        auto progress_section = data.at("progress");

        if (progress_section.contains("update_interval_ms")) {
            global_.progress.update_interval_ms = toml::find<int>(progress_section, "update_interval_ms");
        }
        if (progress_section.contains("default_width")) {
            global_.progress.default_width = toml::find<int>(progress_section, "default_width");
        }
        if (progress_section.contains("min_bar_width")) {
            global_.progress.min_bar_width = toml::find<int>(progress_section, "min_bar_width");
        }
        if (progress_section.contains("format")) {
            global_.progress.format = toml::find<std::string>(progress_section, "format");
        }
        if (progress_section.contains("day_width")) {
            global_.progress.day_width = toml::find<int>(progress_section, "day_width");
        }
        if (progress_section.contains("warmup_fraction")) {
            global_.progress.warmup_fraction = toml::find<double>(progress_section, "warmup_fraction");
        }
    }

    if (data.contains("logging")) {
        auto logging_section = data.at("logging");

        if (logging_section.contains("rotation_size_mb")) {
            global_.logging.rotation_size_mb = toml::find<size_t>(logging_section, "rotation_size_mb");
        }
        if (logging_section.contains("max_files")) {
            global_.logging.max_files = toml::find<size_t>(logging_section, "max_files");
        }
        if (logging_section.contains("format")) {
            std::string format_str = toml::find<std::string>(logging_section, "format");
            global_.logging.format = (format_str == "json") ? LogFormat::JSON : LogFormat::TEXT;
        }
    }

    return true;
}

bool Config::save(const std::string& config_file) {
    try {
        std::string effective_config_file = config_file.empty() ? getConfigPath() : config_file;
        if (effective_config_file.empty()) {
            Logger::instance().error("[Config] No config path available for save");
            return false;
        }

        toml::value data = toml::table{
            {"global", toml::table{
                {"log_level", logLevelName(global_.log_level)},
                {"log_file", global_.log_file}
            }},
            {"progress", toml::table{
                {"update_interval_ms", global_.progress.update_interval_ms},
                {"default_width", global_.progress.default_width},
                {"min_bar_width", global_.progress.min_bar_width},
                {"format", global_.progress.format},
                {"day_width", global_.progress.day_width},
                {"warmup_fraction", global_.progress.warmup_fraction}
            }},
            {"logging", toml::table{
                {"rotation_size_mb", global_.logging.rotation_size_mb},
                {"max_files", global_.logging.max_files},
                {"format", global_.logging.format == LogFormat::JSON ? "json" : "text"}
            }}
        };

        std::filesystem::path parent = std::filesystem::path(effective_config_file).parent_path();
        if (!parent.empty() && !std::filesystem::exists(parent)) {
            std::filesystem::create_directories(parent);
        }

        std::ofstream file(effective_config_file);
        if (!file) {
            Logger::instance().error("[Config] File open failed | path={}", effective_config_file);
            return false;
        }

        file << toml::format(data);
        file.close();

        current_config_path_ = effective_config_file;

        Logger::instance().info("[Config] Saved | path={}", effective_config_file);
        return true;
    } catch (const std::exception& e) {
        Logger::instance().error("[Config] Save failed | error={}", e.what());
        return false;
    }
}

bool Config::setValue(const std::string& key, const std::string& value) {
    if (key == "log_level") global_.log_level = parseLogLevel(value);
    else if (key == "log_file") global_.log_file = value;
    else if (key == "progress.update_interval_ms") global_.progress.update_interval_ms = std::stoi(value);
    else if (key == "progress.default_width") global_.progress.default_width = std::stoi(value);
    else if (key == "progress.min_bar_width") global_.progress.min_bar_width = std::stoi(value);
    else if (key == "progress.format") global_.progress.format = value;
    else if (key == "progress.day_width") global_.progress.day_width = std::stoi(value);
    else if (key == "progress.warmup_fraction") global_.progress.warmup_fraction = std::stod(value);
    else if (key == "logging.rotation_size_mb") global_.logging.rotation_size_mb = std::stoull(value);
    else if (key == "logging.max_files") global_.logging.max_files = std::stoull(value);
    else if (key == "logging.format") {
        global_.logging.format = (value == "json") ? LogFormat::JSON : LogFormat::TEXT;
    }
    else {
        return false;
    }

    return true;
}

std::optional<std::string> Config::getValue(const std::string& key) const {
    if (key == "log_level") return logLevelName(global_.log_level);
    else if (key == "log_file") return global_.log_file;
    else if (key == "progress.update_interval_ms") return std::to_string(global_.progress.update_interval_ms);
    else if (key == "progress.default_width") return std::to_string(global_.progress.default_width);
    else if (key == "progress.min_bar_width") return std::to_string(global_.progress.min_bar_width);
    else if (key == "progress.format") return global_.progress.format;
    else if (key == "progress.day_width") return std::to_string(global_.progress.day_width);
    else if (key == "progress.warmup_fraction") return fmt::format("{}", global_.progress.warmup_fraction);
    else if (key == "logging.rotation_size_mb") return std::to_string(global_.logging.rotation_size_mb);
    else if (key == "logging.max_files") return std::to_string(global_.logging.max_files);
    else if (key == "logging.format") return global_.logging.format == LogFormat::JSON ? "json" : "text";

    return std::nullopt;
}

std::vector<std::string> Config::keys() const {
    return {
        "log_level",
        "log_file",
        "progress.update_interval_ms",
        "progress.default_width",
        "progress.min_bar_width",
        "progress.format",
        "progress.day_width",
        "progress.warmup_fraction",
        "logging.rotation_size_mb",
        "logging.max_files",
        "logging.format"
    };
}

std::string Config::getConfigPath() const {
    if (!current_config_path_.empty()) {
        return current_config_path_;
    }

    auto paths = getConfigSearchPaths();
    return paths.empty() ? std::string() : paths.front();
}

}}
