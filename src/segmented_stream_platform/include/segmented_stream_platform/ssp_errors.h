#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <variant>

namespace ssp {

// SSP-owned error codes (no curl/OpenSSL codes escape)
enum class ErrorCode {
    Ok,
    ReadTimeout,
    MailboxTimeout,
    MailboxClosed,
    DeliveryFailed,
    DeliveryTimeout,
    NotSubscribed,
    RegistrationFailed,
    WorkRejected,
    SegmentFetchFailed,
    DecryptionFailed,
    PlaylistInvalid,
    HttpFailed,
    Unsupported,
    InvalidArg,
    Internal
};

inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok:                 return "Ok";
        case ErrorCode::ReadTimeout:        return "ReadTimeout";
        case ErrorCode::MailboxTimeout:     return "MailboxTimeout";
        case ErrorCode::MailboxClosed:      return "MailboxClosed";
        case ErrorCode::DeliveryFailed:     return "DeliveryFailed";
        case ErrorCode::DeliveryTimeout:    return "DeliveryTimeout";
        case ErrorCode::NotSubscribed:      return "NotSubscribed";
        case ErrorCode::RegistrationFailed: return "RegistrationFailed";
        case ErrorCode::WorkRejected:       return "WorkRejected";
        case ErrorCode::SegmentFetchFailed: return "SegmentFetchFailed";
        case ErrorCode::DecryptionFailed:   return "DecryptionFailed";
        case ErrorCode::PlaylistInvalid:    return "PlaylistInvalid";
        case ErrorCode::HttpFailed:         return "HttpFailed";
        case ErrorCode::Unsupported:        return "Unsupported";
        case ErrorCode::InvalidArg:         return "InvalidArg";
        case ErrorCode::Internal:           return "Internal";
    }
    return "Unknown";
}

// Error with context message
struct Error {
    ErrorCode code;
    std::string message;

    static Error ok() { return {ErrorCode::Ok, ""}; }
    static Error read_timeout() {
        return {ErrorCode::ReadTimeout, "Read timeout"};
    }
    static Error mailbox_timeout(const std::string& kind) {
        return {ErrorCode::MailboxTimeout, "Timed out waiting for message '" + kind + "'"};
    }
    static Error mailbox_closed(const std::string& mailbox) {
        return {ErrorCode::MailboxClosed, "Mailbox '" + mailbox + "' is closed"};
    }
    static Error delivery_failed(const std::string& detail) {
        return {ErrorCode::DeliveryFailed, detail};
    }
    static Error delivery_timeout(const std::string& detail) {
        return {ErrorCode::DeliveryTimeout, detail};
    }
    static Error not_subscribed(const std::string& kind) {
        return {ErrorCode::NotSubscribed, "Not subscribed to message: " + kind};
    }
    static Error registration_failed(const std::string& name) {
        return {ErrorCode::RegistrationFailed,
                "Unable to register mailbox '" + name + "', a mailbox with that name already exists"};
    }
    static Error work_rejected(const std::string& detail) {
        return {ErrorCode::WorkRejected, detail};
    }
    static Error segment_fetch_failed(const std::string& detail) {
        return {ErrorCode::SegmentFetchFailed, detail};
    }
    static Error decryption_failed(const std::string& detail) {
        return {ErrorCode::DecryptionFailed, detail};
    }
    static Error playlist_invalid(const std::string& detail) {
        return {ErrorCode::PlaylistInvalid, detail};
    }
    static Error http_failed(const std::string& detail) {
        return {ErrorCode::HttpFailed, detail};
    }
    static Error unsupported(const std::string& detail) {
        return {ErrorCode::Unsupported, detail};
    }
    static Error invalid_arg(const std::string& detail) {
        return {ErrorCode::InvalidArg, detail};
    }
    static Error internal(const std::string& detail) {
        return {ErrorCode::Internal, detail};
    }
};

// Result type: either value T or Error
template<typename T>
class Result {
public:
    // Success constructor
    Result(T value) : m_data(std::move(value)) {}

    // Error constructor
    Result(Error error) : m_data(std::move(error)) {}

    bool is_ok() const { return std::holds_alternative<T>(m_data); }
    bool is_error() const { return std::holds_alternative<Error>(m_data); }

    T& value() { return std::get<T>(m_data); }
    const T& value() const { return std::get<T>(m_data); }

    Error& error() { return std::get<Error>(m_data); }
    const Error& error() const { return std::get<Error>(m_data); }

    // Unwrap value or throw (for convenience in tools and tests)
    T unwrap() {
        if (is_error()) {
            throw std::runtime_error(error().message);
        }
        return std::move(value());
    }

private:
    std::variant<T, Error> m_data;
};

// Specialization for void result
template<>
class Result<void> {
public:
    Result() : m_error(std::nullopt) {}
    Result(Error error) : m_error(std::move(error)) {}

    bool is_ok() const { return !m_error.has_value(); }
    bool is_error() const { return m_error.has_value(); }

    Error& error() { return *m_error; }
    const Error& error() const { return *m_error; }

private:
    std::optional<Error> m_error;
};

} // namespace ssp
