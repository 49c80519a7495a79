#include "command_dispatcher.h"
#include "logger.h"
#include "transfer_error.h"

#include <cctype>
#include <limits>
#include <stdexcept>
#include <utility>

using json = nlohmann::json;

namespace {

json okReply(json result) {
    return json{{"ok", true}, {"result", std::move(result)}};
}

json errorReply(const TransferError& error) {
    return json{{"ok", false}, {"error", errorToJson(error)}};
}

std::future<json> readyReply(json reply) {
    std::promise<json> promise;
    promise.set_value(std::move(reply));
    return promise.get_future();
}

/// Wait for a transfer future and fold its outcome into a reply envelope.
template<typename T>
std::future<json> replyWhenDone(std::future<T> pending) {
    return std::async(std::launch::deferred, [pending = std::move(pending)]() mutable -> json {
        try {
            return okReply(json(pending.get()));
        } catch (const TransferError& e) {
            return errorReply(e);
        } catch (const std::exception& e) {
            // Anything else (filesystem, allocation) is reported as I/O.
            return errorReply(TransferError(TransferErrorKind::Io, e.what()));
        }
    });
}

const json& requireField(const json& args, const char* name) {
    auto it = args.find(name);
    if (it == args.end() || it->is_null()) {
        throw TransferError(TransferErrorKind::InvalidArgument,
            std::string("missing argument '") + name + "'");
    }
    return *it;
}

std::string requireString(const json& args, const char* name) {
    const json& value = requireField(args, name);
    if (!value.is_string()) {
        throw TransferError(TransferErrorKind::InvalidArgument,
            std::string("argument '") + name + "' must be a string");
    }
    return value.get<std::string>();
}

} // anonymous namespace

CommandDispatcher::CommandDispatcher(TransferService& service)
    : service_(service)
{
}

TransferRequest CommandDispatcher::parseRequest(const json& args) {
    if (!args.is_object()) {
        throw TransferError(TransferErrorKind::InvalidArgument, "arguments must be a JSON object");
    }

    TransferRequest request;

    const json& id = requireField(args, "id");
    if (!id.is_number_integer() || id.get<int64_t>() < 0 ||
        id.get<uint64_t>() > std::numeric_limits<TransferId>::max()) {
        throw TransferError(TransferErrorKind::InvalidArgument,
            "argument 'id' must be an integer in [0, 4294967295]");
    }
    request.id = id.get<TransferId>();

    request.url = requireString(args, "url");

    // Hosts may send either the camelCase or the snake_case spelling.
    request.path = args.contains("filePath") ? requireString(args, "filePath")
                                             : requireString(args, "file_path");

    auto headers = args.find("headers");
    if (headers != args.end() && !headers->is_null()) {
        if (!headers->is_object()) {
            throw TransferError(TransferErrorKind::InvalidArgument,
                "argument 'headers' must be an object of strings");
        }
        for (const auto& [name, value] : headers->items()) {
            if (!value.is_string()) {
                throw TransferError(TransferErrorKind::InvalidArgument,
                    "header '" + name + "' must be a string");
            }
            request.headers[name] = value.get<std::string>();
        }
    }

    return request;
}

TransferId CommandDispatcher::parseId(const std::string& text) {
    TransferError invalid(TransferErrorKind::InvalidArgument,
        "transfer id must be an integer in [0, 4294967295], got '" + text + "'");
    if (text.empty()) {
        throw invalid;
    }
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw invalid;
        }
    }

    unsigned long long value = 0;
    try {
        size_t pos = 0;
        value = std::stoull(text, &pos);
        if (pos != text.size()) {
            throw invalid;
        }
    } catch (const std::out_of_range&) {
        throw invalid;
    }
    if (value > std::numeric_limits<TransferId>::max()) {
        throw invalid;
    }
    return static_cast<TransferId>(value);
}

std::future<json> CommandDispatcher::start(const std::string& command, const json& args) {
    TransferRequest request;
    try {
        request = parseRequest(args);
    } catch (const TransferError& e) {
        Logger::instance().warn("Rejected '" + command + "' command: " + e.what());
        return readyReply(errorReply(e));
    }

    // The service may refuse to schedule (e.g. its pool is shutting down).
    try {
        if (command == "download") {
            return replyWhenDone(service_.download(std::move(request)));
        }
        if (command == "upload") {
            return replyWhenDone(service_.upload(std::move(request)));
        }
    } catch (const TransferError& e) {
        Logger::instance().error("Failed to start '" + command + "': " + e.what());
        return readyReply(errorReply(e));
    } catch (const std::exception& e) {
        Logger::instance().error("Failed to start '" + command + "': " + e.what());
        return readyReply(errorReply(TransferError(TransferErrorKind::Io, e.what())));
    }

    TransferError unknown(TransferErrorKind::InvalidArgument, "unknown command '" + command + "'");
    Logger::instance().warn(unknown.what());
    return readyReply(errorReply(unknown));
}

json CommandDispatcher::invoke(const std::string& command, const json& args) {
    return start(command, args).get();
}
