#include "main_command.hpp"
#include "termbar/common/config.hpp"

namespace termbar {
namespace cli {

MainCommand::MainCommand() = default;
MainCommand::~MainCommand() = default;

void MainCommand::addBarOptions(CLI::App* subcommand) {
    subcommand->add_option("-l,--label", label_, "Label shown left of the bar (default: percentage)");
    subcommand->add_option("-f,--format", format_, "Three glyphs: begin, fill, end (default from config)");
    subcommand->add_option("-i,--interval-ms", interval_ms_, "Base redraw interval in milliseconds")
              ->check(CLI::NonNegativeNumber);
    subcommand->add_flag("-s,--sync", synchronous_, "Redraw inline instead of on a render thread");
}

progress::ProgressBarOptions MainCommand::buildBarOptions() const {
    auto options = progress::ProgressBarOptions::fromConfig(common::Config::instance().global().progress);
    
    options.label = label_;
    if (!format_.empty()) {
        options.format = format_;
    }
    if (interval_ms_ > 0) {
        options.update_interval = std::chrono::milliseconds(interval_ms_);
    }
    options.mode = synchronous_ ? progress::RenderMode::SYNCHRONOUS : progress::RenderMode::THREADED;
    
    return options;
}

}}
