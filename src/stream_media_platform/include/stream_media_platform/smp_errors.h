#pragma once

#include <QMetaType>

#include <optional>
#include <stdexcept>
#include <string>
#include <variant>

namespace smp {

// SMP-owned error codes (no FFmpeg or Qt codes escape)
enum class ErrorCode {
    Ok,
    InvalidArg,
    Unsupported,
    DecodeFailed,
    NotAllowed,      // playback refused by policy (no user activation)
    QuotaExceeded,   // source buffer capacity exhausted
    InvalidState,
    Aborted,
    Network,
    ServiceError,    // remote service answered with an error payload
    Internal
};

inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok:            return "Ok";
        case ErrorCode::InvalidArg:    return "InvalidArg";
        case ErrorCode::Unsupported:   return "Unsupported";
        case ErrorCode::DecodeFailed:  return "DecodeFailed";
        case ErrorCode::NotAllowed:    return "NotAllowed";
        case ErrorCode::QuotaExceeded: return "QuotaExceeded";
        case ErrorCode::InvalidState:  return "InvalidState";
        case ErrorCode::Aborted:       return "Aborted";
        case ErrorCode::Network:       return "Network";
        case ErrorCode::ServiceError:  return "ServiceError";
        case ErrorCode::Internal:      return "Internal";
    }
    return "Unknown";
}

// Error with context message
struct Error {
    ErrorCode code;
    std::string message;

    static Error ok() { return {ErrorCode::Ok, ""}; }
    static Error invalid_arg(const std::string& detail) {
        return {ErrorCode::InvalidArg, detail};
    }
    static Error unsupported(const std::string& detail) {
        return {ErrorCode::Unsupported, detail};
    }
    static Error decode_failed(const std::string& detail) {
        return {ErrorCode::DecodeFailed, detail};
    }
    static Error not_allowed(const std::string& detail) {
        return {ErrorCode::NotAllowed, detail};
    }
    static Error quota_exceeded(const std::string& detail) {
        return {ErrorCode::QuotaExceeded, detail};
    }
    static Error invalid_state(const std::string& detail) {
        return {ErrorCode::InvalidState, detail};
    }
    static Error aborted() {
        return {ErrorCode::Aborted, "Operation aborted"};
    }
    static Error network(const std::string& detail) {
        return {ErrorCode::Network, detail};
    }
    static Error service(const std::string& detail) {
        return {ErrorCode::ServiceError, detail};
    }
    static Error internal(const std::string& detail) {
        return {ErrorCode::Internal, detail};
    }

    // "QuotaExceeded: buffer full (12582912 bytes)"
    std::string describe() const {
        return std::string(error_code_to_string(code)) + ": " + message;
    }
};

// Result type: either value T or Error
template<typename T>
class Result {
public:
    Result(T value) : m_data(std::move(value)) {}
    Result(Error error) : m_data(std::move(error)) {}

    bool is_ok() const { return std::holds_alternative<T>(m_data); }
    bool is_error() const { return std::holds_alternative<Error>(m_data); }

    T& value() { return std::get<T>(m_data); }
    const T& value() const { return std::get<T>(m_data); }

    Error& error() { return std::get<Error>(m_data); }
    const Error& error() const { return std::get<Error>(m_data); }

    // Unwrap value or throw (tooling only; engine code checks is_error())
    T unwrap() {
        if (is_error()) {
            throw std::runtime_error(error().describe());
        }
        return std::move(value());
    }

private:
    std::variant<T, Error> m_data;
};

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

} // namespace smp

// Carried by queued Qt signals
Q_DECLARE_METATYPE(smp::Error)
