#include "transfer_error.h"

#include <nlohmann/json.hpp>

const char* errorKindName(TransferErrorKind kind) {
    switch (kind) {
        case TransferErrorKind::Io:              return "io";
        case TransferErrorKind::Transport:       return "transport";
        case TransferErrorKind::ContentLength:   return "content_length";
        case TransferErrorKind::ResponseParse:   return "response_parse";
        case TransferErrorKind::InvalidArgument: return "invalid_argument";
    }
    return "unknown";
}

nlohmann::json errorToJson(const TransferError& error) {
    return nlohmann::json{
        {"kind",    errorKindName(error.kind())},
        {"message", error.what()}
    };
}
