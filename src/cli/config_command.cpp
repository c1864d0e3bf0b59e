#include "config_command.hpp"
#include "termbar/common/config.hpp"
#include "termbar/common/logger.hpp"
#include "termbar/progress/error_codes.hpp"
#include "termbar/progress/progress_bar.hpp"
#include <iostream>
#include <iomanip>
#include <stdexcept>

namespace termbar {
namespace cli {

ConfigCommand::ConfigCommand() = default;

void ConfigCommand::setup(CLI::App* subcommand) {
    subcommand_ = subcommand;
    
    set_cmd_ = subcommand->add_subcommand("set", "Set configuration value and save it");
    set_cmd_->add_option("key", set_key_, "Configuration key")->required();
    set_cmd_->add_option("value", set_value_, "Configuration value")->required();
    set_cmd_->callback([this]() { was_called_ = true; });
    
    get_cmd_ = subcommand->add_subcommand("get", "Get configuration value");
    get_cmd_->add_option("key", get_key_, "Configuration key (optional)");
    get_cmd_->callback([this]() { was_called_ = true; });
    
    show_cmd_ = subcommand->add_subcommand("show", "Show effective configuration");
    show_cmd_->callback([this]() { was_called_ = true; });
    
    subcommand->callback([this]() { was_called_ = true; });
}

int ConfigCommand::execute() {
    if (set_cmd_->parsed()) {
        return executeSet();
    } else if (get_cmd_->parsed()) {
        return executeGet();
    } else if (show_cmd_->parsed()) {
        return executeShow();
    }
    
    std::cout << subcommand_->help() << std::endl;
    return 0;
}

int ConfigCommand::executeSet() {
    auto& config = common::Config::instance();
    
    try {
        if (!config.setValue(set_key_, set_value_)) {
            std::cerr << "Error: Unknown configuration key: " << set_key_ << "\n";
            return 1;
        }
    } catch (const std::invalid_argument&) {
        std::cerr << "Error: Invalid value for " << set_key_ << ": " << set_value_ << "\n";
        return 1;
    } catch (const std::out_of_range&) {
        std::cerr << "Error: Value out of range for " << set_key_ << ": " << set_value_ << "\n";
        return 1;
    }
    
    // Reject settings a bar would refuse at construction time.
    try {
        progress::validateOptions(progress::ProgressBarOptions::fromConfig(config.global().progress));
    } catch (const progress::ProgressError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    
    if (!config.save()) {
        std::cerr << "Error: Failed to save configuration to " << config.getConfigPath() << "\n";
        return 1;
    }
    
    std::cout << set_key_ << " = " << set_value_ << "\n";
    std::cout << "Saved to " << config.getConfigPath() << "\n";
    return 0;
}

int ConfigCommand::executeGet() {
    auto& config = common::Config::instance();
    
    if (!get_key_.empty()) {
        auto value = config.getValue(get_key_);
        if (!value) {
            std::cerr << "Error: Unknown configuration key: " << get_key_ << "\n";
            return 1;
        }
        std::cout << *value << "\n";
        return 0;
    }
    
    for (const auto& key : config.keys()) {
        std::cout << std::left << std::setw(30) << key << " " << config.getValue(key).value_or("") << "\n";
    }
    return 0;
}

int ConfigCommand::executeShow() {
    auto& config = common::Config::instance();
    
    std::cout << "# " << config.getConfigPath() << "\n";
    
    std::string current_section;
    for (const auto& key : config.keys()) {
        auto dot = key.find('.');
        std::string section = dot == std::string::npos ? "global" : key.substr(0, dot);
        std::string name = dot == std::string::npos ? key : key.substr(dot + 1);
        
        if (section != current_section) {
            std::cout << "\n[" << section << "]\n";
            current_section = section;
        }
        std::cout << name << " = " << config.getValue(key).value_or("") << "\n";
    }
    return 0;
}

}}
