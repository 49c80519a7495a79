#pragma once

#include <mutex>
#include <ostream>
#include <string>

#include <nlohmann/json.hpp>

#include "transfer_types.h"

inline constexpr const char* kDownloadProgressEvent = "download://progress";
inline constexpr const char* kUploadProgressEvent = "upload://progress";
inline constexpr const char* kTransferResultEvent = "transfer://result";

/// Host-side event bus. Shared by every running transfer, so
/// implementations must accept concurrent emit() calls.
class EventSink {
public:
    virtual ~EventSink() = default;

    /// Fire-and-forget delivery of one event.
    virtual void emit(const std::string& event, const nlohmann::json& payload) = 0;
};

/// Writes {"event": ..., "payload": ...} as one JSON line per event.
class JsonLinesEventSink : public EventSink {
public:
    explicit JsonLinesEventSink(std::ostream& out);

    void emit(const std::string& event, const nlohmann::json& payload) override;

private:
    std::mutex mutex_;
    std::ostream& out_;
};

/// Handler that publishes a transfer's samples as `event` on `sink`.
/// The sink must outlive the handler.
ProgressHandler progressToSink(EventSink& sink, std::string event);
