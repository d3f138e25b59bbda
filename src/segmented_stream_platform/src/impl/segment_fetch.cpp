#include "segment_fetch.h"

#include <QLoggingCategory>

Q_LOGGING_CATEGORY(sspFetch, "ssp.fetch")

namespace {
template<typename F>
struct ScopeExit {
    F fn;
    ~ScopeExit() { fn(); }
};
template<typename F>
ScopeExit<F> make_scope_exit(F fn) { return {std::move(fn)}; }
} // namespace

namespace ssp {
namespace impl {

SegmentFetch::SegmentFetch(Segment segment, std::shared_ptr<HttpClient> http,
                           const GenerationalThreadPool& pool, FetchSettings settings)
    : m_segment(std::move(segment))
    , m_http(std::move(http))
    , m_pool(pool)
    , m_settings(std::move(settings))
    , m_buffer(m_settings.buffer_size) {
}

bool SegmentFetch::IsStale() const {
    return m_cancelled.load() || !m_pool.IsCurrent(m_segment.group_id);
}

HttpRequest SegmentFetch::make_request() const {
    HttpRequest request;
    request.url = m_segment.url;
    request.headers = m_settings.headers;
    request.timeout = m_settings.timeout;
    request.range = m_segment.range;

    // Resume after a partial transfer
    int64_t delivered = m_delivered.load();
    if (delivered > 0) {
        ByteRange resume = m_segment.range.value_or(ByteRange{});
        resume.first += delivered;
        request.range = resume;
    }
    return request;
}

void SegmentFetch::Run() {
    // Always end the download so the writer never waits past it
    auto done = make_scope_exit([this]() { m_buffer.Close(); });

    if (IsStale()) {
        qCDebug(sspFetch, "Skipping stale download of %s", m_segment.describe().c_str());
        return;
    }

    std::string last_error;
    for (int32_t attempt = 1; attempt <= m_settings.attempts; ++attempt) {
        if (IsStale()) {
            qCDebug(sspFetch, "Download of %s cancelled", m_segment.describe().c_str());
            return;
        }

        qCDebug(sspFetch, "Started download of %s (attempt %d/%d)", m_segment.describe().c_str(),
                attempt, m_settings.attempts);

        auto result = m_http->GetStreaming(make_request(), [this](const uint8_t* data, size_t len) {
            if (IsStale()) {
                return false;
            }
            m_buffer.Write(data, len);
            m_delivered += static_cast<int64_t>(len);
            return !m_buffer.IsClosed();
        });

        if (result.is_ok()) {
            qCDebug(sspFetch, "Download of %s complete (%lld bytes)", m_segment.describe().c_str(),
                    static_cast<long long>(m_delivered.load()));
            return;
        }
        if (IsStale()) {
            qCDebug(sspFetch, "Download of %s cancelled", m_segment.describe().c_str());
            return;
        }

        last_error = result.error().message;
        qCWarning(sspFetch, "Unable to download %s (%s)", m_segment.describe().c_str(), last_error.c_str());
        if (attempt < m_settings.attempts) {
            qCWarning(sspFetch, "Retrying %s", m_segment.describe().c_str());
        }
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_error = Error::segment_fetch_failed("Unable to download " + m_segment.url + " " +
                                          m_segment.describe() + " after " +
                                          std::to_string(m_settings.attempts) + " attempt(s): " +
                                          last_error);
}

Result<Bytes> SegmentFetch::Read(size_t max_size, Timeout timeout) {
    return m_buffer.Read(max_size, true, timeout);
}

void SegmentFetch::Cancel() {
    m_cancelled.store(true);
    m_buffer.Close();
}

std::optional<Error> SegmentFetch::failure() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_error;
}

// ============================================================================
// KeyCache
// ============================================================================

KeyCache::KeyCache(std::shared_ptr<HttpClient> http, FetchSettings settings)
    : m_http(std::move(http))
    , m_settings(std::move(settings)) {
}

Result<Bytes> KeyCache::get(const std::string& uri) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_keys.find(uri);
        if (it != m_keys.end()) {
            return it->second;
        }
    }

    HttpRequest request;
    request.url = uri;
    request.headers = m_settings.headers;
    request.timeout = m_settings.timeout;

    std::string last_error;
    for (int32_t attempt = 1; attempt <= m_settings.attempts; ++attempt) {
        auto res = m_http->Get(request);
        if (res.is_ok()) {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_keys[uri] = res.value().body;
            qCDebug(sspFetch, "Fetched decryption key %s", uri.c_str());
            return res.value().body;
        }
        last_error = res.error().message;
    }
    return Error::decryption_failed("Unable to fetch decryption key " + uri + ": " + last_error);
}

} // namespace impl
} // namespace ssp
