#include <segmented_stream_platform/ssp_options.h>

#include <QLoggingCategory>

#include <nlohmann/json.hpp>

#include <cctype>
#include <cmath>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

Q_LOGGING_CATEGORY(sspOptions, "ssp.options")

namespace ssp {

StreamOptions default_options() {
    StreamOptions opts;
    opts.ringbuffer_size = 16 * 1024 * 1024;
    opts.segment_size = 2 * 1024 * 1024;
    opts.segment_attempts = 3;
    opts.segment_timeout = std::chrono::milliseconds(10000);
    opts.segment_threads = 1;
    opts.writer_threads = 1;
    opts.work_queue_size = 20;
    opts.hls_live_edge = 3;
    opts.hls_timeout = std::chrono::milliseconds(60000);
    opts.http_stream_timeout = std::chrono::milliseconds(60000);
    opts.seek_meta_threads = 16;
    opts.seek_meta_timeout = std::chrono::milliseconds(10000);
    opts.seek_timeout = std::chrono::milliseconds(60000);
    opts.reorder = ReorderPolicy{3, 10, 2};
    opts.user_agent = "ssp/1.0";
    return opts;
}

Result<void> validate_options(const StreamOptions& options) {
    if (options.ringbuffer_size <= 0) {
        return Error::invalid_arg("ringbuffer-size must be positive");
    }
    if (options.segment_size <= 0) {
        return Error::invalid_arg("stream-segment-size must be positive");
    }
    if (options.segment_attempts < 1) {
        return Error::invalid_arg("stream-segment-attempts must be at least 1");
    }
    if (options.segment_threads < 1 || options.writer_threads < 1) {
        return Error::invalid_arg("thread counts must be at least 1");
    }
    if (options.work_queue_size < 1) {
        return Error::invalid_arg("work queue size must be at least 1");
    }
    if (options.seek_meta_threads < 1) {
        return Error::invalid_arg("seek meta thread count must be at least 1");
    }
    if (options.segment_timeout.count() <= 0 || options.hls_timeout.count() <= 0 ||
        options.http_stream_timeout.count() <= 0 || options.seek_timeout.count() <= 0 ||
        options.seek_meta_timeout.count() <= 0) {
        return Error::invalid_arg("timeouts must be positive");
    }
    if (options.reorder.min_segments < 1) {
        return Error::invalid_arg("reorder min_segments must be at least 1");
    }
    return Result<void>();
}

Result<int64_t> parse_file_size(const std::string& text) {
    if (text.empty()) {
        return Error::invalid_arg("empty size");
    }

    size_t digits = 0;
    while (digits < text.size() && (std::isdigit(static_cast<unsigned char>(text[digits])) || text[digits] == '.')) {
        ++digits;
    }
    if (digits == 0) {
        return Error::invalid_arg("invalid size: " + text);
    }

    double value = 0.0;
    std::istringstream in(text.substr(0, digits));
    in >> value;
    if (in.fail()) {
        return Error::invalid_arg("invalid size: " + text);
    }

    std::string suffix = text.substr(digits);
    double multiplier = 1.0;
    if (suffix.empty()) {
        multiplier = 1.0;
    } else if (suffix == "K" || suffix == "k") {
        multiplier = 1024.0;
    } else if (suffix == "M" || suffix == "m") {
        multiplier = 1024.0 * 1024.0;
    } else {
        return Error::invalid_arg("invalid size suffix: " + text);
    }

    int64_t bytes = static_cast<int64_t>(std::llround(value * multiplier));
    if (bytes <= 0) {
        return Error::invalid_arg("size must be positive: " + text);
    }
    return bytes;
}

namespace {

std::chrono::milliseconds seconds_to_ms(double seconds) {
    return std::chrono::milliseconds(static_cast<int64_t>(std::llround(seconds * 1000.0)));
}

// Sizes may be given as numbers or as "16M" style strings
Result<int64_t> size_value(const json& value) {
    if (value.is_number_integer()) {
        return value.get<int64_t>();
    }
    if (value.is_string()) {
        return parse_file_size(value.get<std::string>());
    }
    return Error::invalid_arg("size must be a number or a string");
}

} // namespace

Result<StreamOptions> parse_options_json(const std::string& json_text, const StreamOptions& base) {
    StreamOptions opts = base;

    json parsed;
    try {
        parsed = json::parse(json_text);
    } catch (const json::parse_error& e) {
        return Error::invalid_arg(std::string("options JSON parse error: ") + e.what());
    }

    if (!parsed.is_object()) {
        return Error::invalid_arg("options JSON must be an object");
    }

    try {
        for (auto it = parsed.begin(); it != parsed.end(); ++it) {
            const std::string& key = it.key();
            const json& value = it.value();

            if (key == "ringbuffer-size" || key == "stream-segment-size") {
                auto size = size_value(value);
                if (size.is_error()) {
                    return Error::invalid_arg(key + ": " + size.error().message);
                }
                (key == "ringbuffer-size" ? opts.ringbuffer_size : opts.segment_size) = size.value();
            } else if (key == "stream-segment-attempts" || key == "hls-segment-attempts") {
                opts.segment_attempts = value.get<int32_t>();
            } else if (key == "stream-segment-timeout" || key == "hls-segment-timeout") {
                opts.segment_timeout = seconds_to_ms(value.get<double>());
            } else if (key == "stream-segment-threads" || key == "hls-download-threads") {
                opts.segment_threads = value.get<int32_t>();
            } else if (key == "stream-writer-threads") {
                opts.writer_threads = value.get<int32_t>();
            } else if (key == "stream-work-queue-size") {
                opts.work_queue_size = value.get<int32_t>();
            } else if (key == "hls-live-edge") {
                opts.hls_live_edge = value.get<int32_t>();
            } else if (key == "hls-timeout") {
                opts.hls_timeout = seconds_to_ms(value.get<double>());
            } else if (key == "http-stream-timeout") {
                opts.http_stream_timeout = seconds_to_ms(value.get<double>());
            } else if (key == "seek-meta-threads") {
                opts.seek_meta_threads = value.get<int32_t>();
            } else if (key == "seek-meta-timeout") {
                opts.seek_meta_timeout = seconds_to_ms(value.get<double>());
            } else if (key == "seek-timeout") {
                opts.seek_timeout = seconds_to_ms(value.get<double>());
            } else if (key == "reorder-min-segments") {
                opts.reorder.min_segments = value.get<int32_t>();
            } else if (key == "reorder-stall-segments") {
                opts.reorder.stall_segment_threshold = value.get<int32_t>();
            } else if (key == "reorder-stall-checks") {
                opts.reorder.stall_check_threshold = value.get<int32_t>();
            } else if (key == "user-agent") {
                opts.user_agent = value.get<std::string>();
            } else if (key == "http-header") {
                if (!value.is_object()) {
                    return Error::invalid_arg("http-header must be an object of name/value pairs");
                }
                for (auto h = value.begin(); h != value.end(); ++h) {
                    opts.http_headers[h.key()] = h.value().get<std::string>();
                }
            } else {
                qCWarning(sspOptions, "Ignoring unknown option '%s'", key.c_str());
            }
        }
    } catch (const json::type_error& e) {
        return Error::invalid_arg(std::string("options JSON type error: ") + e.what());
    }

    auto valid = validate_options(opts);
    if (valid.is_error()) {
        return valid.error();
    }
    return opts;
}

Result<StreamOptions> load_options_file(const std::string& path, const StreamOptions& base) {
    std::ifstream in(path);
    if (!in) {
        return Error::invalid_arg("Failed to open options file: " + path);
    }
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    qCDebug(sspOptions, "Loading options from %s", path.c_str());
    return parse_options_json(text, base);
}

} // namespace ssp
