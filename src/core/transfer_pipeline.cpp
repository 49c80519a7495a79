#include "transfer_pipeline.h"
#include "file_io.h"
#include "logger.h"
#include "progress_stream.h"
#include "transfer_error.h"

#include <optional>
#include <utility>

namespace {

std::string transferTag(const TransferRequest& request) {
    return "Transfer " + std::to_string(request.id);
}

} // anonymous namespace

// ── DownloadPipeline ───────────────────────────────────────────

DownloadPipeline::DownloadPipeline(HttpClient& client, ProgressHandler on_progress, PipelineOptions options)
    : client_(client)
    , on_progress_(std::move(on_progress))
    , options_(std::move(options))
{
}

TransferId DownloadPipeline::run(const TransferRequest& request) {
    const std::string tag = transferTag(request);
    Logger::instance().info(tag + " download " + request.url + " -> " + request.path.string());

    ProgressStream progress(request.id, 0, on_progress_,
                            options_.progress_interval, options_.clock);
    std::optional<FileWriter> file;

    ResponseCallback on_response = [&](const ResponseInfo& info) {
        Logger::instance().info(tag + " response: status=" + std::to_string(info.status)
            + " length=" + std::to_string(info.content_length));
        if (info.status >= 400) {
            Logger::instance().warn(tag + " server answered HTTP " + std::to_string(info.status)
                + "; the response body is saved as-is");
        }
        progress.setTotal(info.content_length > 0 ? static_cast<uint64_t>(info.content_length) : 0);
        progress.restartWindow();
        file.emplace(request.path);
    };

    ChunkCallback on_data = progress.forward([&](const char* data, size_t size) {
        if (!file) {
            file.emplace(request.path);
        }
        file->write(data, size);
    });

    client_.get(request.url, request.headers, on_response, on_data);

    progress.complete();
    if (!file) {
        file.emplace(request.path);
    }
    file->flush();

    Logger::instance().info(tag + " download finished: " + std::to_string(file->bytesWritten())
        + " bytes, " + std::to_string(progress.samplesEmitted()) + " progress events");
    return request.id;
}

// ── UploadPipeline ─────────────────────────────────────────────

UploadPipeline::UploadPipeline(HttpClient& client, ProgressHandler on_progress, PipelineOptions options)
    : client_(client)
    , on_progress_(std::move(on_progress))
    , options_(std::move(options))
{
}

nlohmann::json UploadPipeline::run(const TransferRequest& request) {
    const std::string tag = transferTag(request);

    FileReader reader(request.path, options_.read_chunk_size);
    const std::optional<uint64_t> size = reader.size();

    Logger::instance().info(tag + " upload " + request.path.string() + " -> " + request.url
        + (size ? " (" + std::to_string(*size) + " bytes)" : " (size unknown)"));

    ProgressStream progress(request.id, size.value_or(0), on_progress_,
                            options_.progress_interval, options_.clock);

    ReadCallback body = progress.pull([&reader](char* buffer, size_t capacity) {
        return reader.read(buffer, capacity);
    });

    HttpResponse response = client_.put(request.url, request.headers,
                                        size ? static_cast<int64_t>(*size) : -1, body);

    // A declared body size ends the upload without a final empty read.
    progress.complete();

    if (response.status >= 400) {
        Logger::instance().warn(tag + " server answered HTTP " + std::to_string(response.status));
    }

    nlohmann::json result;
    try {
        result = nlohmann::json::parse(response.body);
    } catch (const nlohmann::json::parse_error& e) {
        throw TransferError(TransferErrorKind::ResponseParse,
            "failed to parse response body as JSON: " + std::string(e.what()));
    }

    Logger::instance().info(tag + " upload finished: " + std::to_string(reader.bytesRead())
        + " bytes, " + std::to_string(progress.samplesEmitted()) + " progress events");
    return result;
}
