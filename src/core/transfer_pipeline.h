#pragma once

#include <chrono>
#include <cstddef>

#include <nlohmann/json.hpp>

#include "http_client.h"
#include "progress_throttle.h"
#include "transfer_types.h"

/// Knobs shared by both pipelines.
struct PipelineOptions {
    std::chrono::milliseconds progress_interval = kProgressInterval;
    size_t read_chunk_size = 64 * 1024;
    TimeSource clock;   // empty = steady_clock
};

/// GET request.url and stream the body into request.path.
///
/// The destination is created (truncated if present) once response headers
/// arrive, so a request that never gets a response leaves no file behind.
/// Any failure after that leaves a partial file; it is not removed.
class DownloadPipeline {
public:
    DownloadPipeline(HttpClient& client, ProgressHandler on_progress, PipelineOptions options = {});

    /// Returns request.id. Throws TransferError.
    TransferId run(const TransferRequest& request);

private:
    HttpClient& client_;            // non-owning
    ProgressHandler on_progress_;
    PipelineOptions options_;
};

/// PUT the contents of request.path to request.url and return the parsed
/// JSON response body.
class UploadPipeline {
public:
    UploadPipeline(HttpClient& client, ProgressHandler on_progress, PipelineOptions options = {});

    /// Throws TransferError.
    nlohmann::json run(const TransferRequest& request);

private:
    HttpClient& client_;            // non-owning
    ProgressHandler on_progress_;
    PipelineOptions options_;
};
