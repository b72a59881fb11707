#pragma once

#include <string>
#include <variant>
#include <optional>
#include <stdexcept>
#include <cstdint>

namespace voicegate {

/**
 * @brief Error types for the gateway failure modes
 */
enum class ErrorType {
    None,
    ProtocolError,      ///< Malformed client message; session stays open
    ProviderError,      ///< External STT/LLM/TTS/automation call failed (see ProviderErrorKind)
    CapacityExceeded,   ///< Registry full; new connection refused
    TurnConflict,       ///< Overlapping input while a turn is in flight (backpressure)
    TransportError,     ///< Connection closed or broken
    InvalidState,       ///< Illegal state-machine transition
    Cancelled,          ///< Owning session closed while the operation was in flight
    ConfigError,        ///< Invalid or unreadable configuration
    NotFound
};

/**
 * @brief Provider failure classification; drives the adapter retry policy
 */
enum class ProviderErrorKind {
    None,
    Timeout,
    RateLimited,
    InvalidResponse,
    Unavailable
};

/**
 * @brief Error information structure
 */
struct Error {
    ErrorType type = ErrorType::None;
    ProviderErrorKind provider_kind = ProviderErrorKind::None;
    std::string message;
    /// Provider-supplied retry delay (RateLimited only; -1 when absent)
    int64_t retry_after_ms = -1;

    Error() = default;
    Error(ErrorType t, const std::string& msg) : type(t), message(msg) {}
    Error(ProviderErrorKind kind, const std::string& msg, int64_t retry_after = -1)
        : type(ErrorType::ProviderError), provider_kind(kind), message(msg), retry_after_ms(retry_after) {}

    bool is_error() const { return type != ErrorType::None; }
    operator bool() const { return is_error(); }

    bool is_provider(ProviderErrorKind kind) const {
        return type == ErrorType::ProviderError && provider_kind == kind;
    }
};

/**
 * @brief Result type for operations that can fail
 *
 * Holds either a value of type T or an Error.
 */
template<typename T>
class Result {
public:
    // Construct from value (success)
    Result(const T& value) : data_(value) {}
    Result(T&& value) : data_(std::move(value)) {}

    // Construct from error
    Result(const Error& error) : data_(error) {}
    Result(Error&& error) : data_(std::move(error)) {}

    bool is_ok() const {
        return std::holds_alternative<T>(data_);
    }

    bool is_error() const {
        return std::holds_alternative<Error>(data_);
    }

    // Get value (throws if error)
    const T& value() const {
        if (!is_ok()) {
            throw std::runtime_error("Result is error, cannot get value");
        }
        return std::get<T>(data_);
    }

    T& value() {
        if (!is_ok()) {
            throw std::runtime_error("Result is error, cannot get value");
        }
        return std::get<T>(data_);
    }

    // Get error (throws if success)
    const Error& error() const {
        if (is_ok()) {
            throw std::runtime_error("Result is success, cannot get error");
        }
        return std::get<Error>(data_);
    }

    T value_or(const T& default_value) const {
        return is_ok() ? std::get<T>(data_) : default_value;
    }

    explicit operator bool() const {
        return is_ok();
    }

private:
    std::variant<T, Error> data_;
};

// Specialization for void (success/failure only)
template<>
class Result<void> {
public:
    Result() : is_ok_(true) {}
    Result(const Error& error) : is_ok_(false), error_(error) {}
    Result(Error&& error) : is_ok_(false), error_(std::move(error)) {}

    bool is_ok() const { return is_ok_; }
    bool is_error() const { return !is_ok_; }
    const Error& error() const { return error_; }

    explicit operator bool() const { return is_ok_; }

private:
    bool is_ok_;
    Error error_;
};

// Helper functions for creating errors
inline Error make_error(ErrorType type, const std::string& message) {
    return Error(type, message);
}

inline Error make_protocol_error(const std::string& message) {
    return Error(ErrorType::ProtocolError, message);
}

inline Error make_provider_error(ProviderErrorKind kind, const std::string& message,
                                 int64_t retry_after_ms = -1) {
    return Error(kind, message, retry_after_ms);
}

inline Error make_transport_error(const std::string& message) {
    return Error(ErrorType::TransportError, message);
}

inline Error make_turn_conflict(const std::string& message = "Turn already in progress") {
    return Error(ErrorType::TurnConflict, message);
}

inline Error make_cancelled_error(const std::string& message = "Operation cancelled") {
    return Error(ErrorType::Cancelled, message);
}

inline const char* error_type_to_string(ErrorType type) {
    switch (type) {
        case ErrorType::None: return "None";
        case ErrorType::ProtocolError: return "ProtocolError";
        case ErrorType::ProviderError: return "ProviderError";
        case ErrorType::CapacityExceeded: return "CapacityExceeded";
        case ErrorType::TurnConflict: return "TurnConflict";
        case ErrorType::TransportError: return "TransportError";
        case ErrorType::InvalidState: return "InvalidState";
        case ErrorType::Cancelled: return "Cancelled";
        case ErrorType::ConfigError: return "ConfigError";
        case ErrorType::NotFound: return "NotFound";
    }
    return "Unknown";
}

inline const char* provider_error_kind_to_string(ProviderErrorKind kind) {
    switch (kind) {
        case ProviderErrorKind::None: return "None";
        case ProviderErrorKind::Timeout: return "Timeout";
        case ProviderErrorKind::RateLimited: return "RateLimited";
        case ProviderErrorKind::InvalidResponse: return "InvalidResponse";
        case ProviderErrorKind::Unavailable: return "Unavailable";
    }
    return "Unknown";
}

/// "ProviderError(Timeout): message" style description for logs
inline std::string describe(const Error& error) {
    std::string head = error_type_to_string(error.type);
    if (error.type == ErrorType::ProviderError) {
        head += std::string("(") + provider_error_kind_to_string(error.provider_kind) + ")";
    }
    return head + ": " + error.message;
}

} // namespace voicegate
