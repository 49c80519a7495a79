#include "progress_stream.h"

#include <utility>

ProgressStream::ProgressStream(TransferId id,
                               uint64_t total,
                               ProgressHandler handler,
                               std::chrono::milliseconds interval,
                               TimeSource now)
    : id_(id)
    , total_(total)
    , handler_(std::move(handler))
    , throttle_(interval, std::move(now))
{
}

ChunkCallback ProgressStream::forward(ChunkCallback downstream) {
    return [this, downstream = std::move(downstream)](const char* data, size_t size) {
        if (downstream) {
            downstream(data, size);
        }
        observe(size);
    };
}

ReadCallback ProgressStream::pull(ReadCallback upstream) {
    return [this, upstream = std::move(upstream)](char* buffer, size_t capacity) -> size_t {
        size_t got = upstream ? upstream(buffer, capacity) : 0;
        if (got == 0) {
            complete();
            return 0;
        }
        observe(got);
        return got;
    };
}

void ProgressStream::complete() {
    if (completed_) {
        return;
    }
    completed_ = true;

    if (auto residual = throttle_.drain()) {
        emit(*residual);
    }
}

void ProgressStream::observe(size_t size) {
    bytes_seen_ += size;
    if (completed_) {
        return;
    }
    if (auto released = throttle_.record(size)) {
        emit(*released);
    }
}

void ProgressStream::emit(uint64_t progress) {
    ++samples_emitted_;
    if (handler_) {
        handler_(ProgressSample{id_, progress, total_});
    }
}
