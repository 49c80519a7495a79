// progress_throttle.cpp
#include "progress_throttle.h"

#include <utility>

TimeSource steadyClock() {
    return [] { return std::chrono::steady_clock::now(); };
}

ProgressThrottle::ProgressThrottle(std::chrono::milliseconds interval, TimeSource now)
    : interval_(interval)
    , now_(now ? std::move(now) : steadyClock())
{
    last_release_ = now_();
}

std::optional<uint64_t> ProgressThrottle::record(uint64_t bytes) {
    pending_ += bytes;
    if (pending_ == 0) {
        return std::nullopt;
    }

    auto current = now_();
    if (current - last_release_ < interval_) {
        return std::nullopt;
    }

    uint64_t released = pending_;
    pending_ = 0;
    last_release_ = current;
    return released;
}

void ProgressThrottle::restart() {
    last_release_ = now_();
}

std::optional<uint64_t> ProgressThrottle::drain() {
    if (pending_ == 0) {
        return std::nullopt;
    }
    uint64_t released = pending_;
    pending_ = 0;
    last_release_ = now_();
    return released;
}
