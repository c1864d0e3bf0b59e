#include "termbar/progress/progress_state.hpp"
#include "termbar/progress/error_codes.hpp"
#include <algorithm>
#include <utility>

namespace termbar {
namespace progress {

ProgressState::ProgressState(uint64_t max, std::string label)
    : max_(max),
      start_(std::chrono::steady_clock::now()),
      label_(std::move(label)) {
}

void ProgressState::set(uint64_t value) {
    value_.store(std::min(value, max_.load()));
}

void ProgressState::increment() {
    uint64_t current = value_.load();
    uint64_t desired;
    do {
        uint64_t limit = max_.load();
        desired = current < limit ? current + 1 : limit;
    } while (!value_.compare_exchange_weak(current, desired));
}

void ProgressState::setMax(uint64_t new_max) {
    uint64_t current = value_.load();
    if (new_max < current) {
        throw ProgressError(ProgressErrorCode::MAX_BELOW_VALUE, {
            "ProgressState",
            {{"new_max", std::to_string(new_max)},
             {"value", std::to_string(current)}}
        });
    }
    max_.store(new_max);
}

void ProgressState::setLabel(const std::string& label) {
    std::lock_guard<std::mutex> lock(label_mutex_);
    label_ = label;
}

std::string ProgressState::label() const {
    std::lock_guard<std::mutex> lock(label_mutex_);
    return label_;
}

void ProgressState::complete() {
    value_.store(max_.load());
}

std::chrono::steady_clock::duration ProgressState::elapsed() const {
    return std::chrono::steady_clock::now() - start_;
}

}}
