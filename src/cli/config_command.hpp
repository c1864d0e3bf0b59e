#pragma once

#include "main_command.hpp"
#include <CLI/CLI.hpp>
#include <string>

namespace termbar {
namespace cli {

class ConfigCommand : public MainCommand {
public:
    ConfigCommand();
    
    void setup(CLI::App* subcommand);
    int execute() override;

private:
    CLI::App* set_cmd_ = nullptr;
    CLI::App* get_cmd_ = nullptr;
    CLI::App* show_cmd_ = nullptr;
    
    std::string set_key_;
    std::string set_value_;
    std::string get_key_;
    
    int executeSet();
    int executeGet();
    int executeShow();
};

}}
