#include "transfer_service.h"
#include "logger.h"
#include "transfer_error.h"

PooledTransferService::PooledTransferService(const TransferConfig& config,
                                             EventSink& sink,
                                             HttpClientFactory client_factory)
    : config_(ConfigFile::sanitize(config))
    , sink_(sink)
    , client_factory_(std::move(client_factory))
{
    pool_ = std::make_unique<ThreadPool>(static_cast<size_t>(config_.worker_threads));
    Logger::instance().debug("Transfer service started with "
        + std::to_string(pool_->size()) + " workers");
}

PooledTransferService::~PooledTransferService() {
    // Running transfers have no cancellation; wait for them.
    pool_->shutdown();
}

std::future<TransferId> PooledTransferService::download(TransferRequest request) {
    return pool_->submit([this, request = std::move(request)]() -> TransferId {
        try {
            auto client = makeClient();
            DownloadPipeline pipeline(*client,
                                      progressToSink(sink_, kDownloadProgressEvent),
                                      pipelineOptions());
            return pipeline.run(request);
        } catch (const TransferError& e) {
            Logger::instance().error("Transfer " + std::to_string(request.id)
                + " download failed [" + errorKindName(e.kind()) + "]: " + e.what());
            throw;
        } catch (const std::exception& e) {
            Logger::instance().error("Transfer " + std::to_string(request.id)
                + " download failed: " + e.what());
            throw;
        }
    });
}

std::future<nlohmann::json> PooledTransferService::upload(TransferRequest request) {
    return pool_->submit([this, request = std::move(request)]() -> nlohmann::json {
        try {
            auto client = makeClient();
            UploadPipeline pipeline(*client,
                                    progressToSink(sink_, kUploadProgressEvent),
                                    pipelineOptions());
            return pipeline.run(request);
        } catch (const TransferError& e) {
            Logger::instance().error("Transfer " + std::to_string(request.id)
                + " upload failed [" + errorKindName(e.kind()) + "]: " + e.what());
            throw;
        } catch (const std::exception& e) {
            Logger::instance().error("Transfer " + std::to_string(request.id)
                + " upload failed: " + e.what());
            throw;
        }
    });
}

PipelineOptions PooledTransferService::pipelineOptions() const {
    PipelineOptions options;
    options.progress_interval = std::chrono::milliseconds(config_.progress_interval_ms);
    options.read_chunk_size = static_cast<size_t>(config_.read_chunk_size);
    options.clock = clock_;
    return options;
}

std::unique_ptr<HttpClient> PooledTransferService::makeClient() const {
    if (client_factory_) {
        auto client = client_factory_();
        if (!client) {
            throw TransferError(TransferErrorKind::Transport, "HTTP client factory returned no client");
        }
        return client;
    }
    return std::make_unique<CurlHttpClient>(config_.http);
}
