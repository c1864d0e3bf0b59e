#pragma once

#include "main_command.hpp"
#include <CLI/CLI.hpp>
#include <cstdint>

namespace termbar {
namespace cli {

class DemoCommand : public MainCommand {
public:
    DemoCommand();
    
    void setup(CLI::App* subcommand);
    int execute() override;

private:
    uint64_t max_ = 100;
    int step_ms_ = 50;
    uint64_t abort_at_ = 0;
};

}}
