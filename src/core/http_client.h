#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "transfer_types.h"

/// Status line and declared size of a response, known before the body.
struct ResponseInfo {
    long status = 0;
    int64_t content_length = -1;   // -1 = not declared
};

/// A fully received response (used for uploads).
struct HttpResponse {
    long status = 0;
    std::string body;
};

/// Per-client HTTP configuration.
struct HttpConfig {
    int connect_timeout_sec = 30;
    int transfer_timeout_sec = 0;   // 0 = no overall limit
    int low_speed_limit = 0;        // bytes/sec; 0 = disabled
    int low_speed_time = 0;         // seconds below low_speed_limit before aborting
    int max_redirects = 10;
    bool verify_ssl = true;
    std::string user_agent = "transfer/1.0";
};

/// Called once per request, after the final response headers and before
/// the first body chunk.
using ResponseCallback = std::function<void(const ResponseInfo& info)>;

/// One in-flight request at a time. Exceptions thrown by callbacks abort the
/// request and are rethrown unchanged; network failures throw
/// TransferError(Transport), an unusable Content-Length throws
/// TransferError(ContentLength).
class HttpClient {
public:
    virtual ~HttpClient() = default;

    /// GET `url`, streaming the body into on_data.
    virtual void get(const std::string& url,
                     const HeaderMap& headers,
                     const ResponseCallback& on_response,
                     const ChunkCallback& on_data) = 0;

    /// PUT `url` with a body pulled from `body`. body_size < 0 sends the
    /// body with chunked transfer encoding.
    virtual HttpResponse put(const std::string& url,
                             const HeaderMap& headers,
                             int64_t body_size,
                             const ReadCallback& body) = 0;
};

using HttpClientFactory = std::function<std::unique_ptr<HttpClient>()>;

/// "Name: value" lines, one per entry. Empty values become "Name;", which
/// is how libcurl is told to send a header with no value.
std::vector<std::string> buildHeaderLines(const HeaderMap& headers);

/// Parse a Content-Length header value. Returns -1 when the value is not a
/// plain non-negative decimal that fits in int64_t.
int64_t parseContentLength(const std::string& value);

/// HttpClient over a libcurl easy handle (Pimpl).
/// Each instance owns one handle; not thread-safe, use one per transfer.
class CurlHttpClient : public HttpClient {
public:
    explicit CurlHttpClient(HttpConfig config = {});
    ~CurlHttpClient() override;

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    void get(const std::string& url,
             const HeaderMap& headers,
             const ResponseCallback& on_response,
             const ChunkCallback& on_data) override;

    HttpResponse put(const std::string& url,
                     const HeaderMap& headers,
                     int64_t body_size,
                     const ReadCallback& body) override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};
