#pragma once

#include "main_command.hpp"
#include <CLI/CLI.hpp>
#include <cstdint>
#include <istream>
#include <ostream>
#include <string>

namespace termbar {
namespace cli {

// Drives a bar from line-oriented input:
//   <N>          set the value
//   + / +<N>     increment by one / by N
//   max <N>      resize
//   label <TEXT> relabel
//   done         finish (EOF also finishes)
class FeedCommand : public MainCommand {
public:
    FeedCommand();
    
    void setup(CLI::App* subcommand);
    int execute() override;
    
    // Reads commands until EOF or "done", drawing the bar on bar_out.
    int run(std::istream& in, std::ostream& bar_out);
    
    // Applies one trimmed input line. Returns false on "done"; throws
    // std::invalid_argument for a malformed line.
    bool applyLine(progress::ProgressBar& bar, const std::string& line);

private:
    uint64_t max_ = 0;
    bool strict_ = false;
};

}}
