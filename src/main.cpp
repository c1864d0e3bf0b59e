#include <CLI/CLI.hpp>
#include <iostream>
#include <memory>
#include <string>

#include "termbar/common/config.hpp"
#include "termbar/common/constants.hpp"
#include "termbar/common/logger.hpp"
#include "cli/config_command.hpp"
#include "cli/demo_command.hpp"
#include "cli/feed_command.hpp"

int main(int argc, char** argv) {
    try {
        CLI::App app{"Live terminal progress bars", termbar::constants::system::APPLICATION_NAME};
        app.set_version_flag("--version,-v", termbar::constants::version::getFullVersion());
        app.require_subcommand(0, 1);

        std::string config_file;
        std::string log_level;
        app.add_option("-c,--config", config_file, "Configuration file path");
        app.add_option("--log-level", log_level, "Override log level (ERROR, WARN, INFO, DEBUG)")
           ->check(CLI::IsMember({"ERROR", "WARN", "INFO", "DEBUG", "error", "warn", "info", "debug"}));

        auto demo_cmd = std::make_unique<termbar::cli::DemoCommand>();
        auto feed_cmd = std::make_unique<termbar::cli::FeedCommand>();
        auto config_cmd = std::make_unique<termbar::cli::ConfigCommand>();

        demo_cmd->setup(app.add_subcommand("demo", "Render a bar over a simulated workload"));
        feed_cmd->setup(app.add_subcommand("feed", "Render a bar driven by lines on stdin"));
        config_cmd->setup(app.add_subcommand("config", "Manage configuration"));

        CLI11_PARSE(app, argc, argv);

        auto& config = termbar::common::Config::instance();
        if (!config.load(config_file)) {
            std::cerr << "Error: Failed to load configuration from "
                      << (config_file.empty() ? config.getConfigPath() : config_file) << std::endl;
            return 1;
        }

        auto& global = config.global();
        if (!log_level.empty()) {
            global.log_level = termbar::common::parseLogLevel(log_level);
        }

        if (global.log_file.empty()) {
            termbar::common::Logger::instance().initialize(
                termbar::common::LogMode::CONSOLE_ONLY, "", global.log_level, global.logging);
        } else {
            termbar::common::Logger::instance().initialize(
                termbar::common::LogMode::FILE_ONLY, global.log_file, global.log_level, global.logging);
        }

        int exit_code = 0;
        if (demo_cmd->wasCalled()) {
            exit_code = demo_cmd->execute();
        } else if (feed_cmd->wasCalled()) {
            exit_code = feed_cmd->execute();
        } else if (config_cmd->wasCalled()) {
            exit_code = config_cmd->execute();
        } else {
            std::cout << app.help() << std::endl;
        }

        termbar::common::Logger::instance().shutdown();
        return exit_code;

    } catch (const std::exception& e) {
        termbar::common::Logger::instance().error("[Main] Fatal | error={}", e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
