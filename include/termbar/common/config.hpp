#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <cstddef>

namespace termbar {
namespace common {

enum class LogLevel {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3
};

enum class LogFormat {
    TEXT,
    JSON
};

struct ProgressConfig {
    int update_interval_ms;
    int default_width;
    int min_bar_width;
    std::string format;
    int day_width;
    double warmup_fraction;
};

struct LoggingConfig {
    size_t rotation_size_mb;
    size_t max_files;
    LogFormat format;
};

struct GlobalConfig {
    LogLevel log_level;
    std::string log_file;
    ProgressConfig progress;
    LoggingConfig logging;
};

LogLevel parseLogLevel(const std::string& value);
std::string logLevelName(LogLevel level);

class Config {
public:
    static Config& instance();
    
    static GlobalConfig createDefaultConfig();
    
    bool load(const std::string& config_file = "");
    bool save(const std::string& config_file = "");
    void reset();
    
    const GlobalConfig& global() const { return global_; }
    GlobalConfig& global() { return global_; }
    
    bool setValue(const std::string& key, const std::string& value);
    std::optional<std::string> getValue(const std::string& key) const;
    std::vector<std::string> keys() const;
    
    std::optional<std::string> findBestConfig() const;
    std::vector<std::string> getConfigSearchPaths() const;
    std::string getConfigPath() const;

private:
    Config();
    GlobalConfig global_;
    std::string current_config_path_;
    
    bool tryLoadTomlFile(const std::string& path);
};

}}
