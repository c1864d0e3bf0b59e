#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>

namespace termbar {
namespace progress {

// Shared between the owning thread, which mutates it, and the render thread,
// which samples it. value, max and done are lock-free atomics; the label is
// guarded separately since a string cannot be swapped atomically.
class ProgressState {
public:
    explicit ProgressState(uint64_t max, std::string label = "");
    
    ProgressState(const ProgressState&) = delete;
    ProgressState& operator=(const ProgressState&) = delete;
    
    uint64_t value() const { return value_.load(); }
    uint64_t max() const { return max_.load(); }
    bool isDone() const { return done_.load(); }
    bool isComplete() const { return value() >= max(); }
    
    // Stores min(value, max).
    void set(uint64_t value);
    void increment();
    
    // Throws ProgressError(MAX_BELOW_VALUE) if new_max < value().
    void setMax(uint64_t new_max);
    
    void setLabel(const std::string& label);
    std::string label() const;
    
    // value = max
    void complete();
    void markDone() { done_.store(true); }
    
    std::chrono::steady_clock::time_point startTime() const { return start_; }
    std::chrono::steady_clock::duration elapsed() const;

private:
    std::atomic<uint64_t> value_{0};
    std::atomic<uint64_t> max_;
    std::atomic<bool> done_{false};
    const std::chrono::steady_clock::time_point start_;
    
    mutable std::mutex label_mutex_;
    std::string label_;
};

}}
