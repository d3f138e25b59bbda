#pragma once

#include "ssp_errors.h"
#include "ssp_options.h"
#include "ssp_ring_buffer.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace ssp {

// Inclusive byte range. last == nullopt means "to the end".
struct ByteRange {
    int64_t first = 0;
    std::optional<int64_t> last;

    // "bytes=first-last" / "bytes=first-"
    std::string header_value() const;
};

struct HttpRequest {
    std::string url;
    std::map<std::string, std::string> headers;
    std::optional<ByteRange> range;
    std::chrono::milliseconds timeout{10000};
};

struct HttpResponse {
    long status = 0;
    std::string effective_url;                  // after redirects
    std::map<std::string, std::string> headers; // keys lowercased
    Bytes body;                                 // empty for streaming gets and HEAD

    std::optional<int64_t> content_length() const;
    std::string body_text() const { return std::string(body.begin(), body.end()); }
};

// Receives body bytes as they arrive; return false to abort the transfer
using ChunkCallback = std::function<bool(const uint8_t* data, size_t len)>;

// Minimal HTTP transport. Non-2xx statuses fail with HttpFailed.
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual Result<HttpResponse> Get(const HttpRequest& request) = 0;

    // Body is delivered to on_data instead of being collected
    virtual Result<HttpResponse> GetStreaming(const HttpRequest& request,
                                              const ChunkCallback& on_data) = 0;

    virtual Result<HttpResponse> Head(const HttpRequest& request) = 0;
};

// True when a ranged request was answered with the whole resource (200).
// Only "bytes=0-" may legitimately come back as 200.
bool is_ignored_range(const HttpRequest& request, long status);

// libcurl-backed client. Applies options.user_agent and options.http_headers
// to every request (request headers win on conflict).
std::shared_ptr<HttpClient> create_http_client(const StreamOptions& options);

// Resolve a possibly relative URI against a base URL (RFC 3986 subset)
std::string resolve_url(const std::string& base, const std::string& uri);

} // namespace ssp
