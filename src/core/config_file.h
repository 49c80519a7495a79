#pragma once
#include <string>
#include <cstdint>
#include <optional>

#include "http_client.h"

struct TransferConfig {
    HttpConfig http;
    int progress_interval_ms = 1000;
    int64_t read_chunk_size = 64 * 1024;
    int worker_threads = 4;
    std::string log_file;          // empty = no log file
    std::string log_level = "info";
    bool log_to_stderr = false;
};

class ConfigFile {
public:
    /// Serialize TransferConfig to JSON and write to file.
    static bool save(const std::string& path, const TransferConfig& config);

    /// Read a JSON config file. Missing keys keep their defaults; returns
    /// nullopt when the file is unreadable or not valid JSON.
    static std::optional<TransferConfig> load(const std::string& path);

    /// Clamp values into their usable ranges.
    static TransferConfig sanitize(TransferConfig config);
};
