#pragma once

#include <chrono>
#include <cstdint>

#include "progress_throttle.h"
#include "transfer_types.h"

/// Progress-tracking decorator for one transfer's byte stream.
///
/// Chunks pass through unchanged. Every chunk is counted, and a
/// ProgressSample carrying the bytes moved since the previous sample is
/// delivered to the handler at most once per interval. complete() flushes
/// the residual. When the wrapped stream throws, the exception propagates
/// and the residual is never reported.
///
/// The callbacks returned by forward() and pull() refer to this object and
/// must not outlive it.
class ProgressStream {
public:
    ProgressStream(TransferId id,
                   uint64_t total,
                   ProgressHandler handler,
                   std::chrono::milliseconds interval = kProgressInterval,
                   TimeSource now = steadyClock());

    ProgressStream(const ProgressStream&) = delete;
    ProgressStream& operator=(const ProgressStream&) = delete;

    /// Push form: hands each chunk to `downstream`, then counts it.
    ChunkCallback forward(ChunkCallback downstream);

    /// Pull form: reads from `upstream`, counts the bytes, returns them.
    /// End of stream (0 bytes) completes the stream.
    ReadCallback pull(ReadCallback upstream);

    /// Measure the first interval from now instead of from construction.
    void restartWindow() { throttle_.restart(); }

    /// Emit the residual if nonzero. Only the first call has an effect.
    void complete();

    /// Expected size reported in samples. 0 = unknown.
    void setTotal(uint64_t total) { total_ = total; }
    uint64_t total() const { return total_; }

    /// Bytes counted so far, reported or not.
    uint64_t bytesSeen() const { return bytes_seen_; }

    /// Samples handed to the handler so far.
    uint64_t samplesEmitted() const { return samples_emitted_; }

private:
    void observe(size_t size);
    void emit(uint64_t progress);

    TransferId id_;
    uint64_t total_;
    ProgressHandler handler_;
    ProgressThrottle throttle_;
    uint64_t bytes_seen_ = 0;
    uint64_t samples_emitted_ = 0;
    bool completed_ = false;
};
