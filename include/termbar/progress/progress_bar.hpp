#pragma once

#include "termbar/common/config.hpp"
#include "termbar/common/constants.hpp"
#include "termbar/progress/eta.hpp"
#include "termbar/progress/progress_state.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <ostream>
#include <string>
#include <thread>
#include <vector>

namespace termbar {
namespace progress {

enum class RenderMode {
    THREADED,
    SYNCHRONOUS
};

enum class RenderState {
    RUNNING,
    STOPPING,
    STOPPED
};

// Returns the current terminal column count, or the given fallback.
using WidthQuery = std::function<int(int fallback_width)>;

struct ProgressBarOptions {
    std::string label;
    std::string format = constants::progress::DEFAULT_FORMAT;
    std::chrono::milliseconds update_interval{constants::limits::DEFAULT_UPDATE_INTERVAL_MS};
    int default_width = constants::limits::DEFAULT_SCREEN_WIDTH;
    int min_bar_width = constants::limits::DEFAULT_MIN_BAR_WIDTH;
    int day_width = constants::limits::DEFAULT_DAY_WIDTH;
    double warmup_fraction = constants::limits::DEFAULT_WARMUP_FRACTION;
    RenderMode mode = RenderMode::THREADED;

    // Defaults to std::cerr.
    std::ostream* out = nullptr;
    // Defaults to an ioctl query on stderr.
    WidthQuery width_query;

    static ProgressBarOptions fromConfig(const common::ProgressConfig& config);
};

/**
 * Single-line terminal progress bar.
 *
 * In THREADED mode the constructor starts a render thread that redraws the
 * line every tick until the bar completes or is finished. The owning thread
 * only touches ProgressState through update/increment/updateLabel/updateMax,
 * so none of those calls block on output.
 *
 * In SYNCHRONOUS mode there is no thread; update() and increment() redraw
 * inline, at most once per update interval.
 *
 * finish() (or close()) must be called before the bar is discarded so the
 * terminal is left on a fresh line; the destructor calls close() as a last
 * resort.
 */
class ProgressBar {
public:
    explicit ProgressBar(uint64_t max, ProgressBarOptions options = ProgressBarOptions());
    ProgressBar(uint64_t max, const std::string& label);
    ~ProgressBar();

    ProgressBar(const ProgressBar&) = delete;
    ProgressBar& operator=(const ProgressBar&) = delete;

    void update(uint64_t value);
    void increment();
    void updateLabel(const std::string& label);
    void updateMax(uint64_t max);

    // Forces value = max, renders the completed line, emits the trailing
    // newline and joins the render thread. Rethrows a render failure.
    void finish();

    // Like finish() but keeps the current value.
    void close();

    uint64_t value() const { return state_.value(); }
    uint64_t max() const { return state_.max(); }
    bool isDone() const { return state_.isDone(); }
    RenderState renderState() const { return render_state_.load(); }
    std::chrono::steady_clock::duration elapsed() const { return state_.elapsed(); }

    // The line a tick would draw right now for the given width, without the
    // trailing carriage return.
    std::string renderLine(int screen_width) const;

private:
    struct Snapshot {
        uint64_t value;
        uint64_t max;
        std::string label;
        std::chrono::steady_clock::duration elapsed;
    };

    ProgressBarOptions options_;
    std::vector<std::string> glyphs_;
    ProgressState state_;
    EtaEstimator estimator_;
    std::ostream& out_;

    std::atomic<RenderState> render_state_{RenderState::RUNNING};
    std::thread render_thread_;
    std::exception_ptr render_error_;
    std::chrono::steady_clock::time_point last_draw_;
    uint64_t drawn_value_ = 0;
    uint64_t drawn_max_ = 0;
    bool render_failed_ = false;
    bool closed_ = false;

    Snapshot sample() const;
    std::string composeLine(const Snapshot& snapshot, int screen_width) const;
    std::string composeEtaField(const Snapshot& snapshot) const;
    void draw(const Snapshot& snapshot);
    void drawInline(const Snapshot& snapshot);
    void redrawIfStale();

    void renderLoop();
    void waitForNextTick();
    void tickInline();
    void stopRendering();
    void shutdown();
};

// Throws ProgressError(INVALID_FORMAT) unless format is exactly three glyphs,
// and ProgressError(INVALID_OPTION) for out-of-range numeric options.
void validateOptions(const ProgressBarOptions& options);

// Splits UTF-8 text into glyphs (code points). Bytes that do not start a
// well-formed sequence count as one glyph each.
std::vector<std::string> splitGlyphs(const std::string& text);

}}
