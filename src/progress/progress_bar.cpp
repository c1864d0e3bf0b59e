#include "termbar/progress/progress_bar.hpp"
#include "termbar/progress/error_codes.hpp"
#include "termbar/progress/layout.hpp"
#include "termbar/progress/time_format.hpp"
#include "termbar/common/logger.hpp"
#include "termbar/common/terminal.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <iostream>
#include <utility>
#include <unistd.h>

namespace termbar {
namespace progress {

namespace {

constexpr int TICK_DIVISOR = 2;
constexpr std::chrono::milliseconds DONE_POLL_SLICE{10};

size_t sequenceLength(unsigned char lead) {
    if (lead < 0x80) return 1;
    if ((lead >> 5) == 0x6) return 2;
    if ((lead >> 4) == 0xE) return 3;
    if ((lead >> 3) == 0x1E) return 4;
    return 1;
}

bool isContinuation(unsigned char byte) {
    return (byte & 0xC0) == 0x80;
}

std::string takeGlyphs(const std::vector<std::string>& glyphs, size_t count) {
    std::string result;
    for (size_t i = 0; i < count && i < glyphs.size(); ++i) {
        result += glyphs[i];
    }
    return result;
}

}

std::vector<std::string> splitGlyphs(const std::string& text) {
    std::vector<std::string> glyphs;
    size_t pos = 0;

    while (pos < text.size()) {
        size_t length = sequenceLength(static_cast<unsigned char>(text[pos]));

        bool well_formed = pos + length <= text.size();
        for (size_t i = 1; well_formed && i < length; ++i) {
            well_formed = isContinuation(static_cast<unsigned char>(text[pos + i]));
        }
        if (!well_formed) {
            length = 1;
        }

        glyphs.push_back(text.substr(pos, length));
        pos += length;
    }

    return glyphs;
}

ProgressBarOptions ProgressBarOptions::fromConfig(const common::ProgressConfig& config) {
    ProgressBarOptions options;
    options.format = config.format;
    options.update_interval = std::chrono::milliseconds(config.update_interval_ms);
    options.default_width = config.default_width;
    options.min_bar_width = config.min_bar_width;
    options.day_width = config.day_width;
    options.warmup_fraction = config.warmup_fraction;
    return options;
}

ProgressBar::ProgressBar(uint64_t max, ProgressBarOptions options)
    : options_(std::move(options)),
      glyphs_(splitGlyphs(options_.format)),
      state_(max, options_.label),
      estimator_(options_.warmup_fraction),
      out_(options_.out ? *options_.out : std::cerr) {

    validateOptions(options_);

    if (!options_.width_query) {
        options_.width_query = [](int fallback_width) {
            return common::queryTerminalWidth(STDERR_FILENO, fallback_width);
        };
    }

    common::Logger::instance().debug("[Progress] Created | max={} | mode={} | interval_ms={}",
                                     max,
                                     options_.mode == RenderMode::THREADED ? "threaded" : "synchronous",
                                     options_.update_interval.count());

    if (options_.mode == RenderMode::THREADED) {
        render_thread_ = std::thread(&ProgressBar::renderLoop, this);
        return;
    }

    Snapshot snapshot = sample();
    drawInline(snapshot);
    last_draw_ = std::chrono::steady_clock::now();
    if (snapshot.value >= snapshot.max) {
        stopRendering();
    }
}

ProgressBar::ProgressBar(uint64_t max, const std::string& label)
    : ProgressBar(max, [&label]() {
          ProgressBarOptions options;
          options.label = label;
          return options;
      }()) {
}

ProgressBar::~ProgressBar() {
    if (closed_) {
        return;
    }

    try {
        close();
    } catch (const std::exception& e) {
        common::Logger::instance().error("[Progress] Render failed before close | error={}", e.what());
    }
}

void validateOptions(const ProgressBarOptions& options) {
    size_t glyphs = splitGlyphs(options.format).size();
    if (glyphs != constants::progress::FORMAT_GLYPHS) {
        throw ProgressError(ProgressErrorCode::INVALID_FORMAT, {
            "ProgressBar",
            {{"format", options.format},
             {"glyphs", std::to_string(glyphs)}}
        });
    }

    auto reject = [](const std::string& option, const std::string& value) {
        throw ProgressError(ProgressErrorCode::INVALID_OPTION, {
            "ProgressBar",
            {{"option", option}, {"value", value}}
        });
    };

    if (options.update_interval.count() <= 0) {
        reject("update_interval", std::to_string(options.update_interval.count()));
    }
    if (options.default_width <= 0) {
        reject("default_width", std::to_string(options.default_width));
    }
    if (options.min_bar_width < constants::progress::MIN_MIN_BAR_WIDTH) {
        reject("min_bar_width", std::to_string(options.min_bar_width));
    }
    if (options.day_width < constants::progress::MIN_DAY_WIDTH ||
        options.day_width > constants::progress::MAX_DAY_WIDTH) {
        reject("day_width", std::to_string(options.day_width));
    }
    if (options.warmup_fraction < 0.0 || options.warmup_fraction >= 1.0) {
        reject("warmup_fraction", std::to_string(options.warmup_fraction));
    }
}

void ProgressBar::update(uint64_t value) {
    state_.set(value);
    if (options_.mode == RenderMode::SYNCHRONOUS) {
        tickInline();
    }
}

void ProgressBar::increment() {
    state_.increment();
    if (options_.mode == RenderMode::SYNCHRONOUS) {
        tickInline();
    }
}

void ProgressBar::updateLabel(const std::string& label) {
    state_.setLabel(label);
}

void ProgressBar::updateMax(uint64_t max) {
    state_.setMax(max);
}

void ProgressBar::finish() {
    if (closed_) {
        return;
    }

    state_.complete();
    shutdown();
}

void ProgressBar::close() {
    if (closed_) {
        return;
    }

    shutdown();
}

void ProgressBar::shutdown() {
    state_.markDone();

    if (render_thread_.joinable()) {
        render_thread_.join();
    } else if (render_state_.load() == RenderState::RUNNING) {
        try {
            draw(sample());
        } catch (const std::exception& e) {
            common::Logger::instance().error("[Progress] Render failed | value={} | max={} | error={}",
                                             state_.value(), state_.max(), e.what());
            render_failed_ = true;
            render_error_ = std::current_exception();
        }
        stopRendering();
    }

    if (!render_failed_) {
        redrawIfStale();
    }

    closed_ = true;

    common::Logger::instance().debug("[Progress] Closed | value={} | max={} | elapsed_s={}",
                                     state_.value(), state_.max(), elapsedSeconds(state_.elapsed()));

    if (render_error_) {
        std::exception_ptr error = render_error_;
        render_error_ = nullptr;
        std::rethrow_exception(error);
    }
}

std::string ProgressBar::renderLine(int screen_width) const {
    return composeLine(sample(), screen_width);
}

ProgressBar::Snapshot ProgressBar::sample() const {
    Snapshot snapshot;
    snapshot.value = state_.value();
    snapshot.max = state_.max();
    snapshot.label = state_.label();
    snapshot.elapsed = state_.elapsed();
    return snapshot;
}

std::string ProgressBar::composeEtaField(const Snapshot& snapshot) const {
    if (snapshot.value >= snapshot.max) {
        return formatDuration(elapsedSeconds(snapshot.elapsed),
                              constants::progress::ELAPSED_PREFIX, options_.day_width);
    }

    uint64_t remaining = estimator_.remainingSeconds(snapshot.elapsed, snapshot.value, snapshot.max);
    return formatDuration(remaining, constants::progress::ETA_PREFIX, options_.day_width);
}

std::string ProgressBar::composeLine(const Snapshot& snapshot, int screen_width) const {
    std::string label = snapshot.label;
    if (label.empty()) {
        uint64_t percent = snapshot.value >= snapshot.max
            ? 100
            : static_cast<uint64_t>(static_cast<double>(snapshot.value) * 100.0 /
                                    static_cast<double>(snapshot.max));
        label = fmt::format("{:>3}%", percent);
    }

    std::vector<std::string> label_glyphs = splitGlyphs(label);
    std::string eta = composeEtaField(snapshot);

    Layout layout = computeLayout(screen_width, label_glyphs.size(), eta.size(), options_.min_bar_width);
    int filled = filledPieces(layout.interior_width, snapshot.value, snapshot.max);

    std::string line;
    if (layout.label_width > 0) {
        line += takeGlyphs(label_glyphs, static_cast<size_t>(layout.label_width));
        line += ' ';
    }

    line += glyphs_[0];
    for (int i = 0; i < layout.interior_width; ++i) {
        line += i < filled ? glyphs_[1] : std::string(" ");
    }
    line += glyphs_[2];

    line += ' ';
    line += eta;
    return line;
}

void ProgressBar::draw(const Snapshot& snapshot) {
    int width = options_.width_query(options_.default_width);
    if (width <= 0) {
        width = options_.default_width;
    }

    out_ << composeLine(snapshot, width) << '\r' << std::flush;
    drawn_value_ = snapshot.value;
    drawn_max_ = snapshot.max;
}

void ProgressBar::drawInline(const Snapshot& snapshot) {
    try {
        draw(snapshot);
    } catch (const std::exception& e) {
        common::Logger::instance().error("[Progress] Render failed | value={} | max={} | error={}",
                                         snapshot.value, snapshot.max, e.what());
        render_failed_ = true;
        stopRendering();
        throw;
    }
}

// The loop stops by itself once value reaches max. If the bar was grown and
// advanced after that, the last line on screen is out of date.
void ProgressBar::redrawIfStale() {
    Snapshot snapshot = sample();
    if (snapshot.value == drawn_value_ && snapshot.max == drawn_max_) {
        return;
    }

    common::Logger::instance().debug("[Progress] Redrawing after stop | value={} | max={}",
                                     snapshot.value, snapshot.max);
    try {
        draw(snapshot);
    } catch (const std::exception& e) {
        common::Logger::instance().error("[Progress] Render failed | value={} | max={} | error={}",
                                         snapshot.value, snapshot.max, e.what());
        render_error_ = std::current_exception();
    }
    out_ << '\n' << std::flush;
}

void ProgressBar::renderLoop() {
    common::Logger::instance().debug("[Progress] Render loop started | max={}", state_.max());

    try {
        while (true) {
            bool done = state_.isDone();
            Snapshot snapshot = sample();
            draw(snapshot);

            if (done || snapshot.value >= snapshot.max) {
                break;
            }

            waitForNextTick();
        }
    } catch (const std::exception& e) {
        common::Logger::instance().error("[Progress] Render failed | value={} | max={} | error={}",
                                         state_.value(), state_.max(), e.what());
        render_failed_ = true;
        render_error_ = std::current_exception();
    }

    stopRendering();
}

void ProgressBar::waitForNextTick() {
    auto tick = std::max(options_.update_interval / TICK_DIVISOR, std::chrono::milliseconds(1));
    auto deadline = std::chrono::steady_clock::now() + tick;

    while (!state_.isDone()) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            break;
        }
        std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(deadline - now, DONE_POLL_SLICE));
    }
}

void ProgressBar::tickInline() {
    if (render_state_.load() != RenderState::RUNNING) {
        return;
    }

    Snapshot snapshot = sample();
    bool complete = snapshot.value >= snapshot.max;
    auto now = std::chrono::steady_clock::now();

    if (!complete && now - last_draw_ < options_.update_interval) {
        return;
    }

    drawInline(snapshot);
    last_draw_ = now;

    if (complete) {
        stopRendering();
    }
}

void ProgressBar::stopRendering() {
    render_state_.store(RenderState::STOPPING);
    out_ << '\n' << std::flush;
    render_state_.store(RenderState::STOPPED);

    common::Logger::instance().debug("[Progress] Render stopped | value={} | max={}",
                                     state_.value(), state_.max());
}

}}
