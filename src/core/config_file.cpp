#include "config_file.h"
#include "logger.h"

#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>

using json = nlohmann::json;

// ── JSON serialization helpers ─────────────────────────────────

static json httpConfigToJson(const HttpConfig& h) {
    return json{
        {"connect_timeout_sec",  h.connect_timeout_sec},
        {"transfer_timeout_sec", h.transfer_timeout_sec},
        {"low_speed_limit",      h.low_speed_limit},
        {"low_speed_time",       h.low_speed_time},
        {"max_redirects",        h.max_redirects},
        {"verify_ssl",           h.verify_ssl},
        {"user_agent",           h.user_agent}
    };
}

static HttpConfig httpConfigFromJson(const json& j) {
    HttpConfig h;
    h.connect_timeout_sec  = j.value("connect_timeout_sec",  h.connect_timeout_sec);
    h.transfer_timeout_sec = j.value("transfer_timeout_sec", h.transfer_timeout_sec);
    h.low_speed_limit      = j.value("low_speed_limit",      h.low_speed_limit);
    h.low_speed_time       = j.value("low_speed_time",       h.low_speed_time);
    h.max_redirects        = j.value("max_redirects",        h.max_redirects);
    h.verify_ssl           = j.value("verify_ssl",           h.verify_ssl);
    h.user_agent           = j.value("user_agent",           h.user_agent);
    return h;
}

static json transferConfigToJson(const TransferConfig& c) {
    return json{
        {"http",                 httpConfigToJson(c.http)},
        {"progress_interval_ms", c.progress_interval_ms},
        {"read_chunk_size",      c.read_chunk_size},
        {"worker_threads",       c.worker_threads},
        {"log_file",             c.log_file},
        {"log_level",            c.log_level},
        {"log_to_stderr",        c.log_to_stderr}
    };
}

static TransferConfig transferConfigFromJson(const json& j) {
    TransferConfig c;
    if (j.contains("http")) {
        c.http = httpConfigFromJson(j.at("http"));
    }
    c.progress_interval_ms = j.value("progress_interval_ms", c.progress_interval_ms);
    c.read_chunk_size      = j.value("read_chunk_size",      c.read_chunk_size);
    c.worker_threads       = j.value("worker_threads",       c.worker_threads);
    c.log_file             = j.value("log_file",             c.log_file);
    c.log_level            = j.value("log_level",            c.log_level);
    c.log_to_stderr        = j.value("log_to_stderr",        c.log_to_stderr);
    return c;
}

// ── ConfigFile implementation ──────────────────────────────────

bool ConfigFile::save(const std::string& path, const TransferConfig& config) {
    std::ofstream ofs(path);
    if (!ofs.is_open()) {
        return false;
    }
    ofs << transferConfigToJson(config).dump(4);
    return ofs.good();
}

std::optional<TransferConfig> ConfigFile::load(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        return std::nullopt;
    }
    try {
        json j = json::parse(ifs);
        if (!j.is_object()) {
            Logger::instance().warn("Config " + path + " is not a JSON object");
            return std::nullopt;
        }
        return sanitize(transferConfigFromJson(j));
    } catch (const json::exception& e) {
        Logger::instance().warn("Config " + path + " rejected: " + e.what());
        return std::nullopt;
    }
}

TransferConfig ConfigFile::sanitize(TransferConfig config) {
    config.http.connect_timeout_sec  = std::max(config.http.connect_timeout_sec, 1);
    config.http.transfer_timeout_sec = std::max(config.http.transfer_timeout_sec, 0);
    config.http.low_speed_limit      = std::max(config.http.low_speed_limit, 0);
    config.http.low_speed_time       = std::max(config.http.low_speed_time, 0);
    config.http.max_redirects        = std::clamp(config.http.max_redirects, 0, 50);
    config.progress_interval_ms      = std::clamp(config.progress_interval_ms, 1, 60 * 1000);
    config.read_chunk_size           = std::clamp<int64_t>(config.read_chunk_size, 512, 16 * 1024 * 1024);
    config.worker_threads            = std::clamp(config.worker_threads, 1, 64);
    return config;
}
