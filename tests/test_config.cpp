#include <catch2/catch.hpp>
#include "termbar/common/config.hpp"
#include "termbar/progress/error_codes.hpp"
#include "termbar/progress/progress_bar.hpp"
#include <filesystem>
#include <fstream>
#include <unistd.h>

using termbar::common::Config;
using termbar::common::LogFormat;
using termbar::common::LogLevel;

namespace {

std::filesystem::path tempConfigPath(const std::string& name)
{
    return std::filesystem::temp_directory_path() /
           ("termbar_test_" + std::to_string(getpid()) + "_" + name + ".toml");
}

}

TEST_CASE("Config defaults match the documented values", "[config]")
{
    auto config = Config::createDefaultConfig();
    CHECK(config.log_level == LogLevel::WARN);
    CHECK(config.progress.update_interval_ms == 100);
    CHECK(config.progress.default_width == 80);
    CHECK(config.progress.min_bar_width == 10);
    CHECK(config.progress.format == "|=|");
    CHECK(config.progress.day_width == 2);
    CHECK(config.logging.format == LogFormat::TEXT);
}

TEST_CASE("Config loads progress and logging sections from TOML", "[config]")
{
    auto path = tempConfigPath("load");
    {
        std::ofstream file(path);
        file << "[global]\n"
             << "log_level = \"DEBUG\"\n"
             << "\n"
             << "[progress]\n"
             << "update_interval_ms = 250\n"
             << "default_width = 120\n"
             << "format = \"[#]\"\n"
             << "warmup_fraction = 0.01\n"
             << "\n"
             << "[logging]\n"
             << "format = \"json\"\n";
    }

    auto& config = Config::instance();
    config.reset();
    REQUIRE(config.load(path.string()));

    const auto& global = config.global();
    CHECK(global.log_level == LogLevel::DEBUG);
    CHECK(global.progress.update_interval_ms == 250);
    CHECK(global.progress.default_width == 120);
    CHECK(global.progress.format == "[#]");
    CHECK(global.progress.warmup_fraction == Approx(0.01));
    CHECK(global.progress.min_bar_width == 10);
    CHECK(global.logging.format == LogFormat::JSON);
    CHECK(config.getConfigPath() == path.string());

    auto options = termbar::progress::ProgressBarOptions::fromConfig(global.progress);
    CHECK(options.update_interval == std::chrono::milliseconds(250));
    CHECK(options.default_width == 120);
    CHECK(options.format == "[#]");
    CHECK_NOTHROW(termbar::progress::validateOptions(options));

    std::filesystem::remove(path);
    config.reset();
}

TEST_CASE("Config rejects malformed TOML", "[config]")
{
    auto path = tempConfigPath("broken");
    {
        std::ofstream file(path);
        file << "[progress\nupdate_interval_ms = \n";
    }

    auto& config = Config::instance();
    config.reset();
    CHECK_FALSE(config.load(path.string()));

    std::filesystem::remove(path);
    config.reset();
}

TEST_CASE("Config setValue and getValue use dotted keys", "[config]")
{
    auto& config = Config::instance();
    config.reset();

    CHECK(config.setValue("progress.format", "<->"));
    CHECK(config.getValue("progress.format") == std::optional<std::string>("<->"));

    CHECK(config.setValue("progress.update_interval_ms", "40"));
    CHECK(config.global().progress.update_interval_ms == 40);

    CHECK(config.setValue("log_level", "info"));
    CHECK(config.getValue("log_level") == std::optional<std::string>("INFO"));

    CHECK_FALSE(config.setValue("progress.colour", "red"));
    CHECK_FALSE(config.getValue("progress.colour").has_value());

    CHECK_THROWS_AS(config.setValue("progress.day_width", "wide"), std::invalid_argument);

    for (const auto& key : config.keys()) {
        INFO("key=" << key);
        CHECK(config.getValue(key).has_value());
    }

    config.reset();
}

TEST_CASE("Config save writes a file that loads back", "[config]")
{
    auto path = tempConfigPath("save");
    auto& config = Config::instance();
    config.reset();

    REQUIRE(config.setValue("progress.min_bar_width", "16"));
    REQUIRE(config.setValue("progress.format", "(*)"));
    REQUIRE(config.save(path.string()));

    config.reset();
    REQUIRE(config.load(path.string()));
    CHECK(config.global().progress.min_bar_width == 16);
    CHECK(config.global().progress.format == "(*)");

    std::filesystem::remove(path);
    config.reset();
}

TEST_CASE("Invalid bar settings from config are caught by validation", "[config]")
{
    auto progress = Config::createDefaultConfig().progress;
    progress.format = "==";
    CHECK_THROWS_AS(termbar::progress::validateOptions(
                        termbar::progress::ProgressBarOptions::fromConfig(progress)),
                    termbar::progress::ProgressError);
}
