#include <segmented_stream_platform/ssp_http.h>

#include "impl/curl_http_client.h"

#include <stdexcept>
#include <vector>

namespace ssp {

std::string ByteRange::header_value() const {
    std::string value = "bytes=" + std::to_string(first) + "-";
    if (last) {
        value += std::to_string(*last);
    }
    return value;
}

std::optional<int64_t> HttpResponse::content_length() const {
    auto it = headers.find("content-length");
    if (it == headers.end()) {
        return std::nullopt;
    }
    try {
        return std::stoll(it->second);
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

bool is_ignored_range(const HttpRequest& request, long status) {
    if (!request.range || status != 200) {
        return false;
    }
    return request.range->first > 0 || request.range->last.has_value();
}

std::shared_ptr<HttpClient> create_http_client(const StreamOptions& options) {
    return std::make_shared<impl::CurlHttpClient>(options);
}

namespace {

// Collapse "." and ".." segments of an absolute path
std::string remove_dot_segments(const std::string& path) {
    std::vector<std::string> parts;
    size_t pos = 0;
    while (pos <= path.size()) {
        size_t next = path.find('/', pos);
        if (next == std::string::npos) next = path.size();
        std::string part = path.substr(pos, next - pos);
        if (part == "..") {
            if (!parts.empty()) parts.pop_back();
        } else if (part != "." && !(part.empty() && next != path.size())) {
            parts.push_back(part);
        }
        pos = next + 1;
    }

    std::string out;
    for (const auto& part : parts) {
        out += "/" + part;
    }
    return out.empty() ? "/" : out;
}

} // namespace

std::string resolve_url(const std::string& base, const std::string& uri) {
    if (uri.find("://") != std::string::npos) {
        return uri;
    }

    size_t scheme_end = base.find("://");
    if (scheme_end == std::string::npos) {
        return uri;
    }
    std::string scheme = base.substr(0, scheme_end);

    if (uri.compare(0, 2, "//") == 0) {
        return scheme + ":" + uri;
    }

    size_t authority_start = scheme_end + 3;
    size_t path_start = base.find('/', authority_start);
    std::string origin = path_start == std::string::npos ? base : base.substr(0, path_start);

    // Strip query/fragment off the base before taking its directory
    std::string base_path = path_start == std::string::npos ? "/" : base.substr(path_start);
    size_t query = base_path.find_first_of("?#");
    if (query != std::string::npos) {
        if (uri.empty()) {
            return base;
        }
        base_path = base_path.substr(0, query);
    }

    if (!uri.empty() && uri[0] == '/') {
        return origin + remove_dot_segments(uri);
    }
    if (!uri.empty() && uri[0] == '?') {
        return origin + base_path + uri;
    }

    std::string dir = base_path.substr(0, base_path.rfind('/') + 1);
    std::string rel = uri;
    std::string suffix;
    size_t rel_query = rel.find_first_of("?#");
    if (rel_query != std::string::npos) {
        suffix = rel.substr(rel_query);
        rel = rel.substr(0, rel_query);
    }
    return origin + remove_dot_segments(dir + rel) + suffix;
}

} // namespace ssp
