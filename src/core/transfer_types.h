#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <string>

#include <nlohmann/json_fwd.hpp>

/// Caller-supplied transfer identifier, echoed in every progress sample.
using TransferId = uint32_t;

/// Request headers. Assigning a key twice keeps the last value.
using HeaderMap = std::map<std::string, std::string>;

/// Bytes moved since the previous sample, plus the expected size (0 = unknown).
struct ProgressSample {
    TransferId id = 0;
    uint64_t progress = 0;
    uint64_t total = 0;
};

bool operator==(const ProgressSample& a, const ProgressSample& b);

/// Receives progress samples for one transfer.
using ProgressHandler = std::function<void(const ProgressSample& sample)>;

/// Push side of a byte stream: consumes one chunk. Throws on failure.
using ChunkCallback = std::function<void(const char* data, size_t size)>;

/// Pull side of a byte stream: fills up to `capacity` bytes and returns the
/// count, 0 at end of stream. Throws on failure.
using ReadCallback = std::function<size_t(char* buffer, size_t capacity)>;

struct TransferRequest {
    TransferId id = 0;
    std::string url;
    std::filesystem::path path;
    HeaderMap headers;
};

// nlohmann ADL hooks
void to_json(nlohmann::json& j, const ProgressSample& sample);
void from_json(const nlohmann::json& j, ProgressSample& sample);
