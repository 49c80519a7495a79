#include "http_client.h"
#include "logger.h"
#include "transfer_error.h"

#include <cctype>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <limits>
#include <mutex>
#include <optional>
#include <utility>
#include <curl/curl.h>

// ── Static helpers ─────────────────────────────────────────────

namespace {

void ensureCurlInitialized() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw TransferError(TransferErrorKind::Transport, "failed to initialise libcurl");
        }
        std::atexit([] { curl_global_cleanup(); });
    });
}

/// Trim leading/trailing whitespace.
std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return {};
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

/// Case-insensitive header name comparison.
bool headerNameEquals(const std::string& header, const std::string& name) {
    if (header.size() != name.size()) return false;
    for (size_t i = 0; i < name.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(header[i])) !=
            std::tolower(static_cast<unsigned char>(name[i]))) {
            return false;
        }
    }
    return true;
}

struct SlistDeleter {
    void operator()(curl_slist* list) const noexcept {
        curl_slist_free_all(list);
    }
};
using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;

HeaderList makeHeaderList(const HeaderMap& headers, bool suppress_expect) {
    curl_slist* list = nullptr;
    for (const auto& line : buildHeaderLines(headers)) {
        curl_slist* next = curl_slist_append(list, line.c_str());
        if (!next) {
            curl_slist_free_all(list);
            throw TransferError(TransferErrorKind::Transport, "failed to build request headers");
        }
        list = next;
    }
    if (suppress_expect) {
        // An empty "Expect:" stops libcurl from waiting for 100-continue.
        curl_slist* next = curl_slist_append(list, "Expect:");
        if (!next) {
            curl_slist_free_all(list);
            throw TransferError(TransferErrorKind::Transport, "failed to build request headers");
        }
        list = next;
    }
    return HeaderList(list);
}

// ── Per-request callback context ───────────────────────────────

struct RequestContext {
    CURL* curl = nullptr;
    const ResponseCallback* on_response = nullptr;
    const ChunkCallback* on_data = nullptr;
    const ReadCallback* body = nullptr;
    std::string* response_body = nullptr;

    ResponseInfo info;
    bool response_delivered = false;

    // Unparseable Content-Length of the current response. Only an error
    // if this response is the one delivered (not a redirect or 1xx).
    std::optional<std::string> bad_content_length;

    // First exception raised inside a callback; rethrown after perform.
    std::exception_ptr failure;
};

void deliverResponse(RequestContext& ctx) {
    if (ctx.response_delivered) {
        return;
    }
    ctx.response_delivered = true;
    if (ctx.bad_content_length) {
        throw TransferError(TransferErrorKind::ContentLength,
            "invalid Content-Length header: '" + *ctx.bad_content_length + "'");
    }
    if (ctx.info.status == 0) {
        curl_easy_getinfo(ctx.curl, CURLINFO_RESPONSE_CODE, &ctx.info.status);
    }
    if (ctx.on_response && *ctx.on_response) {
        (*ctx.on_response)(ctx.info);
    }
}

size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
    size_t total = size * nitems;
    auto* ctx = static_cast<RequestContext*>(userdata);
    std::string line(buffer, total);

    // A new status line starts a new response (redirects, 1xx).
    if (line.compare(0, 5, "HTTP/") == 0) {
        ctx->info = ResponseInfo{};
        ctx->bad_content_length.reset();
        auto space = line.find(' ');
        if (space != std::string::npos) {
            ctx->info.status = std::strtol(line.c_str() + space + 1, nullptr, 10);
        }
        return total;
    }

    auto colon = line.find(':');
    if (colon == std::string::npos) return total;

    std::string name = trim(line.substr(0, colon));
    std::string value = trim(line.substr(colon + 1));

    if (headerNameEquals(name, "Content-Length")) {
        int64_t length = parseContentLength(value);
        if (length < 0) {
            ctx->bad_content_length = value;
        } else {
            ctx->info.content_length = length;
        }
    }
    return total;
}

size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<RequestContext*>(userdata);
    size_t total = size * nmemb;

    try {
        deliverResponse(*ctx);
        if (ctx->on_data && *ctx->on_data) {
            (*ctx->on_data)(ptr, total);
        } else if (ctx->response_body) {
            ctx->response_body->append(ptr, total);
        }
    } catch (...) {
        ctx->failure = std::current_exception();
        return 0;
    }
    return total;
}

size_t readCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* ctx = static_cast<RequestContext*>(userdata);
    try {
        if (!ctx->body || !*ctx->body) {
            return 0;
        }
        return (*ctx->body)(buffer, size * nitems);
    } catch (...) {
        ctx->failure = std::current_exception();
        return CURL_READFUNC_ABORT;
    }
}

} // anonymous namespace

// ── Free functions ─────────────────────────────────────────────

std::vector<std::string> buildHeaderLines(const HeaderMap& headers) {
    std::vector<std::string> lines;
    lines.reserve(headers.size());
    for (const auto& [name, value] : headers) {
        if (value.empty()) {
            lines.push_back(name + ";");
        } else {
            lines.push_back(name + ": " + value);
        }
    }
    return lines;
}

int64_t parseContentLength(const std::string& value) {
    std::string digits = trim(value);
    if (digits.empty()) {
        return -1;
    }

    constexpr int64_t kMax = std::numeric_limits<int64_t>::max();
    int64_t result = 0;
    for (char c : digits) {
        if (c < '0' || c > '9') {
            return -1;
        }
        int digit = c - '0';
        if (result > (kMax - digit) / 10) {
            return -1;  // overflow
        }
        result = result * 10 + digit;
    }
    return result;
}

// ── Pimpl ──────────────────────────────────────────────────────

struct CurlHttpClient::Impl {
    CURL* curl = nullptr;
    HttpConfig config;
    char error_buffer[CURL_ERROR_SIZE] = {};

    explicit Impl(HttpConfig cfg) : config(std::move(cfg)) {
        ensureCurlInitialized();
        curl = curl_easy_init();
        if (!curl) {
            throw TransferError(TransferErrorKind::Transport, "failed to initialise CURL easy handle");
        }
    }

    ~Impl() {
        if (curl) {
            curl_easy_cleanup(curl);
        }
    }

    void reset() {
        curl_easy_reset(curl);
        error_buffer[0] = '\0';
    }

    // ── Common configuration applied to every request ──────────
    void applyConfig() {
        curl_easy_setopt(curl, CURLOPT_USERAGENT, config.user_agent.c_str());
        curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buffer);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

        // Redirects
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, static_cast<long>(config.max_redirects));

        // TLS
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, config.verify_ssl ? 1L : 0L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, config.verify_ssl ? 2L : 0L);

        // Timeouts
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(config.connect_timeout_sec));
        if (config.transfer_timeout_sec > 0)
            curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(config.transfer_timeout_sec));

        // Low-speed abort: detect stalled connections
        if (config.low_speed_limit > 0 && config.low_speed_time > 0) {
            curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, static_cast<long>(config.low_speed_limit));
            curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, static_cast<long>(config.low_speed_time));
        }
    }

    void perform(RequestContext& ctx, const char* method, const std::string& url) {
        CURLcode res = curl_easy_perform(curl);

        if (ctx.failure) {
            std::rethrow_exception(ctx.failure);
        }

        // libcurl rejects a malformed Content-Length itself before the
        // header callback sees it.
        if (res == CURLE_WEIRD_SERVER_REPLY && std::strstr(error_buffer, "Content-Length")) {
            throw TransferError(TransferErrorKind::ContentLength,
                std::string(method) + " " + url + " failed: " + error_buffer);
        }

        if (res != CURLE_OK) {
            std::string msg = std::string(method) + " " + url + " failed: " + curl_easy_strerror(res);
            if (error_buffer[0] != '\0') {
                msg += " (";
                msg += error_buffer;
                msg += ")";
            }
            throw TransferError(TransferErrorKind::Transport, msg, static_cast<int>(res));
        }
    }
};

// ── CurlHttpClient public API ──────────────────────────────────

CurlHttpClient::CurlHttpClient(HttpConfig config)
    : impl_(std::make_unique<Impl>(std::move(config))) {}

CurlHttpClient::~CurlHttpClient() = default;

void CurlHttpClient::get(const std::string& url,
                         const HeaderMap& headers,
                         const ResponseCallback& on_response,
                         const ChunkCallback& on_data) {
    impl_->reset();
    CURL* curl = impl_->curl;

    HeaderList header_list = makeHeaderList(headers, false);

    RequestContext ctx;
    ctx.curl = curl;
    ctx.on_response = &on_response;
    ctx.on_data = &on_data;

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list.get());
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);
    impl_->applyConfig();

    Logger::instance().debug("GET " + url + " (" + std::to_string(headers.size()) + " headers)");
    impl_->perform(ctx, "GET", url);

    // Empty bodies never reach the write callback.
    deliverResponse(ctx);
}

HttpResponse CurlHttpClient::put(const std::string& url,
                                 const HeaderMap& headers,
                                 int64_t body_size,
                                 const ReadCallback& body) {
    impl_->reset();
    CURL* curl = impl_->curl;

    HeaderList header_list = makeHeaderList(headers, true);

    HttpResponse response;
    RequestContext ctx;
    ctx.curl = curl;
    ctx.body = &body;
    ctx.response_body = &response.body;

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);
    curl_easy_setopt(curl, CURLOPT_READFUNCTION, readCallback);
    curl_easy_setopt(curl, CURLOPT_READDATA, &ctx);
    if (body_size >= 0) {
        curl_easy_setopt(curl, CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(body_size));
    }
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list.get());
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);
    impl_->applyConfig();

    Logger::instance().debug("PUT " + url + " (" + std::to_string(headers.size())
        + " headers, body " + (body_size >= 0 ? std::to_string(body_size) + " bytes" : "chunked") + ")");
    impl_->perform(ctx, "PUT", url);

    deliverResponse(ctx);
    response.status = ctx.info.status;
    return response;
}
