#include <catch2/catch.hpp>
#include "cli/feed_command.hpp"
#include "termbar/common/config.hpp"
#include "termbar/progress/error_codes.hpp"
#include <CLI/CLI.hpp>
#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <string>

using termbar::cli::FeedCommand;
using namespace termbar::progress;

namespace {

void configure(CLI::App& app, FeedCommand& command, const std::string& args)
{
    termbar::common::Config::instance().reset();
    command.setup(app.add_subcommand("feed", "Render a bar driven by lines on stdin"));
    app.parse("feed " + args, false);
}

ProgressBarOptions barOptions(std::ostringstream& out)
{
    ProgressBarOptions options;
    options.out = &out;
    options.width_query = [](int) { return 60; };
    options.update_interval = std::chrono::milliseconds(10);
    return options;
}

size_t newlines(const std::string& output)
{
    return static_cast<size_t>(std::count(output.begin(), output.end(), '\n'));
}

std::string lastFrame(const std::string& output)
{
    size_t end = output.rfind('\r');
    REQUIRE(end != std::string::npos);
    size_t begin = output.rfind('\r', end - 1);
    begin = begin == std::string::npos ? 0 : begin + 1;
    return output.substr(begin, end - begin);
}

}

TEST_CASE("Feed lines drive the bar", "[feed]")
{
    std::ostringstream out;
    ProgressBar bar(10, barOptions(out));
    FeedCommand command;

    CHECK(command.applyLine(bar, "7"));
    CHECK(bar.value() == 7);

    CHECK(command.applyLine(bar, "+"));
    CHECK(bar.value() == 8);

    SECTION("+N stops at max") {
        CHECK(command.applyLine(bar, "+50"));
        CHECK(bar.value() == 10);
    }

    SECTION("max resizes and label relabels") {
        CHECK(command.applyLine(bar, "max 20"));
        CHECK(bar.max() == 20);
        CHECK(command.applyLine(bar, "+4"));
        CHECK(bar.value() == 12);

        CHECK(command.applyLine(bar, "label copying files"));
        CHECK(bar.renderLine(60).rfind("copying files |", 0) == 0);
    }

    SECTION("blank lines are ignored and done stops reading") {
        CHECK(command.applyLine(bar, ""));
        CHECK(bar.value() == 8);
        CHECK_FALSE(command.applyLine(bar, "done"));
    }

    bar.finish();
}

TEST_CASE("Malformed feed lines are rejected without touching the bar", "[feed]")
{
    std::ostringstream out;
    ProgressBar bar(10, barOptions(out));
    bar.update(4);
    FeedCommand command;

    for (const char* line : {"abc", "-1", "12abc", "+x", "+-2", "max", "max -3", "maximum 5",
                             "99999999999999999999999"}) {
        INFO("line=" << line);
        CHECK_THROWS_AS(command.applyLine(bar, line), std::invalid_argument);
    }
    CHECK(bar.value() == 4);
    CHECK(bar.max() == 10);

    bar.finish();
}

TEST_CASE("Feed max below the current value is fatal", "[feed]")
{
    std::ostringstream out;
    ProgressBar bar(10, barOptions(out));
    FeedCommand command;

    command.applyLine(bar, "7");
    try {
        command.applyLine(bar, "max 3");
        FAIL("expected ProgressError");
    } catch (const ProgressError& e) {
        CHECK(e.code() == ProgressErrorCode::MAX_BELOW_VALUE);
    }
    CHECK(bar.max() == 10);

    bar.finish();
}

TEST_CASE("Feed run finishes the bar at done or end of input", "[feed]")
{
    CLI::App app{"termbar"};
    FeedCommand command;
    configure(app, command, "--max 10 -i 10");
    std::ostringstream out;

    SECTION("done ends the input early") {
        std::istringstream in("3\n+\n+2\ndone\nmax 1\n");
        CHECK(command.run(in, out) == 0);
    }

    SECTION("end of input") {
        std::istringstream in("4\n");
        CHECK(command.run(in, out) == 0);
    }

    const std::string output = out.str();
    CHECK(newlines(output) == 1);
    CHECK(output.back() == '\n');
    CHECK(lastFrame(output).rfind("100% ", 0) == 0);
}

TEST_CASE("Feed skips malformed lines unless strict", "[feed]")
{
    CLI::App app{"termbar"};
    FeedCommand command;
    std::ostringstream out;
    std::istringstream in("2\nbogus\n+\n");

    SECTION("lenient") {
        configure(app, command, "--max 10 -i 10");
        CHECK(command.run(in, out) == 0);
        CHECK(lastFrame(out.str()).rfind("100% ", 0) == 0);
    }

    SECTION("strict") {
        configure(app, command, "--max 10 -i 10 --strict");
        CHECK(command.run(in, out) == 1);
        CHECK(lastFrame(out.str()).rfind(" 20% ", 0) == 0);
    }

    CHECK(newlines(out.str()) == 1);
}

TEST_CASE("Feed run propagates a fatal resize and still ends the line", "[feed]")
{
    CLI::App app{"termbar"};
    FeedCommand command;
    configure(app, command, "--max 10 -i 10");
    std::ostringstream out;
    std::istringstream in("5\nmax 2\n");

    CHECK_THROWS_AS(command.run(in, out), ProgressError);

    const std::string output = out.str();
    CHECK(newlines(output) == 1);
    CHECK(output.back() == '\n');
}
