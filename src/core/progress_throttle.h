// progress_throttle.h
#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>

using SteadyTime = std::chrono::steady_clock::time_point;

/// Source of "now". Tests substitute a manual clock.
using TimeSource = std::function<SteadyTime()>;

/// std::chrono::steady_clock::now wrapped as a TimeSource.
TimeSource steadyClock();

/// Default spacing between two progress samples of the same transfer.
constexpr std::chrono::milliseconds kProgressInterval{1000};

/// Emission policy shared by uploads and downloads: accumulate byte counts
/// and release them at most once per interval, plus one final drain.
/// Not thread-safe; owned by a single transfer.
class ProgressThrottle {
public:
    explicit ProgressThrottle(std::chrono::milliseconds interval = kProgressInterval,
                              TimeSource now = steadyClock());

    // Add bytes. Returns the accumulated delta when the interval since the
    // last release (or construction) has elapsed; the accumulator and timer
    // are reset in that case.
    std::optional<uint64_t> record(uint64_t bytes);

    // Release whatever is still pending. nullopt when nothing is pending.
    std::optional<uint64_t> drain();

    // Start a new interval now. Pending bytes are kept.
    void restart();

    uint64_t pending() const { return pending_; }

    std::chrono::milliseconds interval() const { return interval_; }

private:
    std::chrono::milliseconds interval_;
    TimeSource now_;
    SteadyTime last_release_;
    uint64_t pending_ = 0;
};
