#pragma once

#include "termbar/progress/progress_bar.hpp"
#include <CLI/CLI.hpp>
#include <string>

namespace termbar {
namespace cli {

// Shared base for subcommands: registration state plus the bar options every
// command that draws a bar accepts.
class MainCommand {
public:
    MainCommand();
    virtual ~MainCommand();
    
    bool wasCalled() const { return was_called_; }
    virtual int execute() = 0;

protected:
    CLI::App* subcommand_ = nullptr;
    bool was_called_ = false;
    
    std::string label_;
    std::string format_;
    int interval_ms_ = 0;
    bool synchronous_ = false;
    
    void addBarOptions(CLI::App* subcommand);
    progress::ProgressBarOptions buildBarOptions() const;
};

}}
