#include "event_sink.h"

#include <utility>

JsonLinesEventSink::JsonLinesEventSink(std::ostream& out)
    : out_(out)
{
}

void JsonLinesEventSink::emit(const std::string& event, const nlohmann::json& payload) {
    nlohmann::json line{
        {"event",   event},
        {"payload", payload}
    };
    std::string text = line.dump();

    std::lock_guard<std::mutex> lock(mutex_);
    out_ << text << '\n';
    out_.flush();
}

ProgressHandler progressToSink(EventSink& sink, std::string event) {
    return [&sink, event = std::move(event)](const ProgressSample& sample) {
        sink.emit(event, nlohmann::json(sample));
    };
}
