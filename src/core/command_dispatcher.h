#pragma once

#include <future>
#include <string>

#include <nlohmann/json.hpp>

#include "transfer_service.h"
#include "transfer_types.h"

/// Host-facing boundary: runs "download" / "upload" commands given JSON
/// arguments {"id", "url", "filePath", "headers"} and answers with
///   {"ok": true,  "result": ...}
///   {"ok": false, "error": {"kind": "...", "message": "..."}}
class CommandDispatcher {
public:
    explicit CommandDispatcher(TransferService& service);

    /// Start a command. The future resolves to the reply envelope and
    /// never carries an exception for transfer failures.
    std::future<nlohmann::json> start(const std::string& command, const nlohmann::json& args);

    /// start() and wait.
    nlohmann::json invoke(const std::string& command, const nlohmann::json& args);

    /// Validate and convert command arguments. Throws TransferError(InvalidArgument).
    static TransferRequest parseRequest(const nlohmann::json& args);

    /// Parse a transfer id given as text (command line). Only plain decimal
    /// digits in the TransferId range are accepted.
    static TransferId parseId(const std::string& text);

private:
    TransferService& service_;   // non-owning
};
