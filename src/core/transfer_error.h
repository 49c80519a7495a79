#pragma once

#include <stdexcept>
#include <string>

#include <nlohmann/json_fwd.hpp>

// NOTE: Avoid bare IO / ERROR style names – they collide with platform macros.
enum class TransferErrorKind {
    Io,              // open / create / read / write / flush failure
    Transport,       // DNS, connect, TLS, protocol, mid-stream disconnect
    ContentLength,   // response declared an unusable Content-Length
    ResponseParse,   // upload response body is not JSON
    InvalidArgument  // malformed command arguments
};

/// Exception thrown when a transfer fails. Every failure aborts the transfer.
class TransferError : public std::runtime_error {
public:
    TransferError(TransferErrorKind kind, const std::string& what, int curl_code = 0)
        : std::runtime_error(what),
          kind_(kind),
          curl_code_(curl_code) {}

    TransferErrorKind kind() const noexcept { return kind_; }

    /// libcurl result code for Transport errors, 0 otherwise.
    int curlCode() const noexcept { return curl_code_; }

private:
    TransferErrorKind kind_;
    int curl_code_;
};

/// Stable identifier used at the command boundary, e.g. "io", "transport".
const char* errorKindName(TransferErrorKind kind);

/// {"kind": "...", "message": "..."}
nlohmann::json errorToJson(const TransferError& error);
