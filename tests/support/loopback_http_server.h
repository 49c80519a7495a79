#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

/// One request as seen by the server. Header names are lower-cased.
struct HttpRequestRecord {
    std::string method;
    std::string target;
    std::map<std::string, std::string> headers;
    std::string body;
};

/// Raw access to the client connection for one response.
class ResponseWriter {
public:
    explicit ResponseWriter(int fd) : fd_(fd) {}

    /// Status line plus headers; always adds "Connection: close".
    bool sendHead(int status, const std::vector<std::pair<std::string, std::string>>& headers);

    bool send(const std::string& bytes);

    /// Convenience: head with Content-Length plus the whole body.
    bool sendResponse(int status, const std::string& body,
                      const std::string& content_type = "application/json");

private:
    int fd_;
};

/// Minimal HTTP/1.1 server on 127.0.0.1 with an ephemeral port.
/// Connections are handled one at a time on a background thread.
class LoopbackHttpServer {
public:
    using Handler = std::function<void(const HttpRequestRecord& request, ResponseWriter& writer)>;

    explicit LoopbackHttpServer(Handler handler);
    ~LoopbackHttpServer();

    LoopbackHttpServer(const LoopbackHttpServer&) = delete;
    LoopbackHttpServer& operator=(const LoopbackHttpServer&) = delete;

    uint16_t port() const { return port_; }

    /// "http://127.0.0.1:<port><path>"
    std::string url(const std::string& path) const;

    std::vector<HttpRequestRecord> requests() const;

private:
    void serve();
    bool readRequest(int fd, HttpRequestRecord& out);

    Handler handler_;
    int listen_fd_ = -1;
    uint16_t port_ = 0;
    std::atomic<bool> stopping_{false};
    std::thread thread_;

    mutable std::mutex mutex_;
    std::vector<HttpRequestRecord> requests_;
};
