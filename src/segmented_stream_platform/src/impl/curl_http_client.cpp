#include "curl_http_client.h"

#include <QLoggingCategory>

#include <algorithm>
#include <cctype>
#include <mutex>

Q_LOGGING_CATEGORY(sspHttp, "ssp.http")

namespace ssp {
namespace impl {

namespace {

std::once_flag g_curl_init;

void ensure_curl_global_init() {
    std::call_once(g_curl_init, [] {
        CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (rc != CURLE_OK) {
            qCCritical(sspHttp, "curl_global_init failed: %s", curl_easy_strerror(rc));
        }
    });
}

std::string trim(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// State shared with the curl callbacks of one transfer
struct TransferContext {
    CURL* curl = nullptr;
    HttpResponse* response = nullptr;
    const ChunkCallback* on_data = nullptr;
    const HttpRequest* request = nullptr;
    bool aborted_by_consumer = false;
    bool rejected_status = false;
};

size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* ctx = static_cast<TransferContext*>(userdata);
    size_t total = size * nitems;
    std::string line(buffer, total);

    // New status line: a redirect hop starts a fresh header set
    if (line.compare(0, 5, "HTTP/") == 0) {
        ctx->response->headers.clear();
        return total;
    }

    size_t colon = line.find(':');
    if (colon != std::string::npos) {
        ctx->response->headers[to_lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
    }
    return total;
}

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<TransferContext*>(userdata);
    size_t total = size * nmemb;

    long status = 0;
    curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &status);
    if (status >= 400 || is_ignored_range(*ctx->request, status)) {
        // Error pages and ignored ranges must never reach the consumer
        ctx->rejected_status = true;
        return 0;
    }

    const auto* data = reinterpret_cast<const uint8_t*>(ptr);
    if (ctx->on_data) {
        if (!(*ctx->on_data)(data, total)) {
            ctx->aborted_by_consumer = true;
            return 0;
        }
    } else {
        ctx->response->body.insert(ctx->response->body.end(), data, data + total);
    }
    return total;
}

} // namespace

Error curl_error(CURLcode code, const std::string& context) {
    return Error::http_failed(context + ": " + curl_easy_strerror(code));
}

// ============================================================================
// CurlHandle / CurlHeaderList
// ============================================================================

CurlHandle::CurlHandle()
    : m_curl(curl_easy_init()) {
}

CurlHandle::~CurlHandle() {
    if (m_curl) {
        curl_easy_cleanup(m_curl);
    }
}

CurlHandle::CurlHandle(CurlHandle&& other) noexcept
    : m_curl(other.m_curl) {
    other.m_curl = nullptr;
}

CurlHandle& CurlHandle::operator=(CurlHandle&& other) noexcept {
    if (this != &other) {
        if (m_curl) {
            curl_easy_cleanup(m_curl);
        }
        m_curl = other.m_curl;
        other.m_curl = nullptr;
    }
    return *this;
}

CurlHeaderList::~CurlHeaderList() {
    if (m_list) {
        curl_slist_free_all(m_list);
    }
}

void CurlHeaderList::append(const std::string& line) {
    m_list = curl_slist_append(m_list, line.c_str());
}

// ============================================================================
// CurlHttpClient
// ============================================================================

CurlHttpClient::CurlHttpClient(const StreamOptions& options)
    : m_user_agent(options.user_agent)
    , m_default_headers(options.http_headers) {
    ensure_curl_global_init();
}

Result<HttpResponse> CurlHttpClient::Get(const HttpRequest& request) {
    return perform(Method::Get, request, nullptr);
}

Result<HttpResponse> CurlHttpClient::GetStreaming(const HttpRequest& request,
                                                  const ChunkCallback& on_data) {
    return perform(Method::Get, request, &on_data);
}

Result<HttpResponse> CurlHttpClient::Head(const HttpRequest& request) {
    return perform(Method::Head, request, nullptr);
}

Result<HttpResponse> CurlHttpClient::perform(Method method, const HttpRequest& request,
                                             const ChunkCallback* on_data) {
    CurlHandle handle;
    if (!handle) {
        return Error::internal("curl_easy_init failed");
    }
    CURL* curl = handle.get();

    HttpResponse response;
    TransferContext ctx;
    ctx.curl = curl;
    ctx.response = &response;
    ctx.on_data = on_data;
    ctx.request = &request;

    std::map<std::string, std::string> headers = m_default_headers;
    for (const auto& h : request.headers) {
        headers[h.first] = h.second;
    }
    CurlHeaderList header_list;
    for (const auto& h : headers) {
        header_list.append(h.first + ": " + h.second);
    }

    std::string range;
    if (request.range) {
        // CURLOPT_RANGE takes the value without the "bytes=" unit
        range = request.range->header_value().substr(6);
    }

    // Transfer timeout is a stall timeout: segments can be large
    long stall_seconds = std::max<long>(1, static_cast<long>((request.timeout.count() + 999) / 1000));

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L); // Multithreading safety
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "identity");
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(request.timeout.count()));
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, stall_seconds);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    if (!m_user_agent.empty()) {
        curl_easy_setopt(curl, CURLOPT_USERAGENT, m_user_agent.c_str());
    }
    if (header_list.get()) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list.get());
    }
    if (!range.empty()) {
        curl_easy_setopt(curl, CURLOPT_RANGE, range.c_str());
    }
    if (method == Method::Head) {
        curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
    }
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);

    qCDebug(sspHttp, "%s %s%s%s", method == Method::Head ? "HEAD" : "GET", request.url.c_str(),
            range.empty() ? "" : " range=", range.c_str());

    CURLcode res = curl_easy_perform(curl);

    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    char* effective = nullptr;
    if (curl_easy_getinfo(curl, CURLINFO_EFFECTIVE_URL, &effective) == CURLE_OK && effective) {
        response.effective_url = effective;
    } else {
        response.effective_url = request.url;
    }

    if (ctx.aborted_by_consumer) {
        return Error::http_failed("Transfer of " + request.url + " aborted");
    }
    if (ctx.rejected_status || response.status >= 400) {
        return Error::http_failed("HTTP " + std::to_string(response.status) + " for " + request.url);
    }
    if (res != CURLE_OK) {
        return curl_error(res, request.url);
    }
    if (is_ignored_range(request, response.status)) {
        return Error::http_failed("Server ignored range request for " + request.url);
    }
    return response;
}

} // namespace impl
} // namespace ssp
