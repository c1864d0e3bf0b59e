#include "demo_command.hpp"
#include "termbar/common/logger.hpp"
#include <iostream>
#include <thread>
#include <chrono>

namespace termbar {
namespace cli {

DemoCommand::DemoCommand() = default;

void DemoCommand::setup(CLI::App* subcommand) {
    subcommand_ = subcommand;
    
    subcommand->add_option("-m,--max", max_, "Total work units")
              ->capture_default_str();
    subcommand->add_option("--step-ms", step_ms_, "Simulated time per work unit")
              ->check(CLI::NonNegativeNumber)
              ->capture_default_str();
    subcommand->add_option("--abort-at", abort_at_, "Stop early after this many units (0 = never)");
    addBarOptions(subcommand);
    
    subcommand->callback([this]() { was_called_ = true; });
}

int DemoCommand::execute() {
    auto options = buildBarOptions();
    
    common::Logger::instance().info("[Demo] Starting | max={} | step_ms={} | format={}",
                                    max_, step_ms_, options.format);
    
    progress::ProgressBar bar(max_, options);
    
    for (uint64_t i = 0; i < max_; ++i) {
        if (abort_at_ > 0 && i >= abort_at_) {
            bar.close();
            std::cout << "Aborted at " << bar.value() << "/" << bar.max() << "\n";
            return 1;
        }
        
        std::this_thread::sleep_for(std::chrono::milliseconds(step_ms_));
        bar.increment();
    }
    
    bar.finish();
    
    auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(bar.elapsed()).count();
    common::Logger::instance().info("[Demo] Complete | units={} | elapsed_ms={}", bar.value(), elapsed_ms);
    std::cout << "Processed " << bar.value() << " units\n";
    return 0;
}

}}
