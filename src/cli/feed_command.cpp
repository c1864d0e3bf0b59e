#include "feed_command.hpp"
#include "termbar/common/logger.hpp"
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace termbar {
namespace cli {

static std::string trim(const std::string& text) {
    size_t begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

static uint64_t parseCount(const std::string& text) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument("not a non-negative integer: '" + text + "'");
    }
    try {
        return std::stoull(text);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument("out of range: '" + text + "'");
    }
}

FeedCommand::FeedCommand() = default;

void FeedCommand::setup(CLI::App* subcommand) {
    subcommand_ = subcommand;
    
    subcommand->add_option("-m,--max", max_, "Total work units")->required();
    subcommand->add_flag("--strict", strict_, "Fail on malformed input lines instead of skipping them");
    addBarOptions(subcommand);
    
    subcommand->callback([this]() { was_called_ = true; });
}

int FeedCommand::execute() {
    return run(std::cin, std::cerr);
}

int FeedCommand::run(std::istream& in, std::ostream& bar_out) {
    auto options = buildBarOptions();
    options.out = &bar_out;
    progress::ProgressBar bar(max_, options);
    
    std::string line;
    size_t line_number = 0;
    
    while (std::getline(in, line)) {
        ++line_number;
        
        try {
            if (!applyLine(bar, trim(line))) {
                break;
            }
        } catch (const std::invalid_argument& e) {
            common::Logger::instance().warn("[Feed] Malformed input | line={} | error={}", line_number, e.what());
            if (strict_) {
                bar.close();
                std::cerr << "Error: line " << line_number << ": " << e.what() << "\n";
                return 1;
            }
        }
    }
    
    bar.finish();
    common::Logger::instance().info("[Feed] Finished | lines={} | value={}", line_number, bar.value());
    return 0;
}

bool FeedCommand::applyLine(progress::ProgressBar& bar, const std::string& line) {
    if (line.empty()) {
        return true;
    }
    
    if (line == "done") {
        return false;
    }
    
    if (line[0] == '+') {
        uint64_t steps = line.size() == 1 ? 1 : parseCount(line.substr(1));
        for (uint64_t i = 0; i < steps && bar.value() < bar.max(); ++i) {
            bar.increment();
        }
        return true;
    }
    
    std::istringstream stream(line);
    std::string keyword;
    stream >> keyword;
    
    if (keyword == "max") {
        std::string argument;
        stream >> argument;
        bar.updateMax(parseCount(argument));
        return true;
    }
    
    if (keyword == "label") {
        bar.updateLabel(trim(line.substr(keyword.size())));
        return true;
    }
    
    bar.update(parseCount(line));
    return true;
}

}}
