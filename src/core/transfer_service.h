#pragma once

#include <future>
#include <memory>
#include <utility>

#include <nlohmann/json.hpp>

#include "config_file.h"
#include "event_sink.h"
#include "http_client.h"
#include "thread_pool.h"
#include "transfer_pipeline.h"
#include "transfer_types.h"

/// The two transfer operations offered to a host.
/// Failures surface as TransferError through the returned future.
class TransferService {
public:
    virtual ~TransferService() = default;

    /// Resolves to request.id once the file is fully written.
    virtual std::future<TransferId> download(TransferRequest request) = 0;

    /// Resolves to the server's JSON response.
    virtual std::future<nlohmann::json> upload(TransferRequest request) = 0;
};

/// Runs each transfer as an independent task on a worker pool. Every
/// transfer gets its own HttpClient; progress goes to the shared sink as
/// "download://progress" / "upload://progress".
class PooledTransferService : public TransferService {
public:
    /// `sink` must outlive the service. An empty factory builds a
    /// CurlHttpClient from config.http.
    PooledTransferService(const TransferConfig& config,
                          EventSink& sink,
                          HttpClientFactory client_factory = {});
    ~PooledTransferService() override;

    PooledTransferService(const PooledTransferService&) = delete;
    PooledTransferService& operator=(const PooledTransferService&) = delete;

    std::future<TransferId> download(TransferRequest request) override;
    std::future<nlohmann::json> upload(TransferRequest request) override;

    /// Clock handed to every pipeline (tests).
    void setClock(TimeSource clock) { clock_ = std::move(clock); }

private:
    PipelineOptions pipelineOptions() const;
    std::unique_ptr<HttpClient> makeClient() const;

    TransferConfig config_;
    EventSink& sink_;               // non-owning
    HttpClientFactory client_factory_;
    TimeSource clock_;
    std::unique_ptr<ThreadPool> pool_;  // declared last: joined before the rest is torn down
};
