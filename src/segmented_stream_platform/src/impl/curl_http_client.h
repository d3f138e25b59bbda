#pragma once

// libcurl headers - ONLY allowed in impl/ directory
#include <curl/curl.h>

#include <segmented_stream_platform/ssp_http.h>

#include <string>

namespace ssp {
namespace impl {

// Convert a curl result code to an SSP Error
Error curl_error(CURLcode code, const std::string& context);

// curl easy handle wrapper
class CurlHandle {
public:
    CurlHandle();
    ~CurlHandle();

    // Non-copyable
    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;

    // Move semantics
    CurlHandle(CurlHandle&& other) noexcept;
    CurlHandle& operator=(CurlHandle&& other) noexcept;

    CURL* get() const { return m_curl; }
    explicit operator bool() const { return m_curl != nullptr; }

private:
    CURL* m_curl = nullptr;
};

// curl_slist wrapper for request headers
class CurlHeaderList {
public:
    CurlHeaderList() = default;
    ~CurlHeaderList();

    CurlHeaderList(const CurlHeaderList&) = delete;
    CurlHeaderList& operator=(const CurlHeaderList&) = delete;

    void append(const std::string& line);
    curl_slist* get() const { return m_list; }

private:
    curl_slist* m_list = nullptr;
};

class CurlHttpClient : public HttpClient {
public:
    explicit CurlHttpClient(const StreamOptions& options);
    ~CurlHttpClient() override = default;

    Result<HttpResponse> Get(const HttpRequest& request) override;
    Result<HttpResponse> GetStreaming(const HttpRequest& request,
                                      const ChunkCallback& on_data) override;
    Result<HttpResponse> Head(const HttpRequest& request) override;

private:
    enum class Method { Get, Head };

    Result<HttpResponse> perform(Method method, const HttpRequest& request,
                                 const ChunkCallback* on_data);

    std::string m_user_agent;
    std::map<std::string, std::string> m_default_headers;
};

} // namespace impl
} // namespace ssp
