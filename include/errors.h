#pragma once

#include <stdexcept>
#include <string>
#include <variant>
#include <optional>

namespace job_diary {

/**
 * @brief Error types for the session failure modes
 */
enum class ErrorType {
    None,
    CredentialUnavailable,  ///< Token service unreachable or refused
    MalformedResponse,      ///< Token service answered with no recognisable secret
    NegotiationFailed,      ///< Peer rejected the offer or the handshake failed
    PermissionDenied,       ///< Microphone could not be acquired
    TransportFailed,        ///< Event channel broke mid-session
    PeerError,              ///< Peer reported an error event
    PersistenceFailed,      ///< Diary store call failed
    IOError,
    InvalidState,
    Timeout,
    Unknown
};

/**
 * @brief User-facing error categories
 */
enum class ErrorCategory {
    None,
    Credential,
    Negotiation,
    Transport,
    Persistence,
    Internal
};

/**
 * @brief Error information structure
 */
struct Error {
    ErrorType type = ErrorType::None;
    std::string message;

    Error() = default;
    Error(ErrorType t, const std::string& msg) : type(t), message(msg) {}

    bool is_error() const { return type != ErrorType::None; }
    operator bool() const { return is_error(); }
};

/**
 * @brief Result type for operations that can fail
 *
 * Holds either a value of type T or an Error.
 */
template<typename T>
class Result {
public:
    Result(const T& value) : data_(value) {}
    Result(T&& value) : data_(std::move(value)) {}

    Result(const Error& error) : data_(error) {}
    Result(Error&& error) : data_(std::move(error)) {}

    bool is_ok() const {
        return std::holds_alternative<T>(data_);
    }

    bool is_error() const {
        return std::holds_alternative<Error>(data_);
    }

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

inline ErrorCategory error_category(ErrorType type) {
    switch (type) {
        case ErrorType::None:
            return ErrorCategory::None;
        case ErrorType::CredentialUnavailable:
        case ErrorType::MalformedResponse:
            return ErrorCategory::Credential;
        case ErrorType::NegotiationFailed:
        case ErrorType::PermissionDenied:
            return ErrorCategory::Negotiation;
        case ErrorType::TransportFailed:
        case ErrorType::PeerError:
            return ErrorCategory::Transport;
        case ErrorType::PersistenceFailed:
            return ErrorCategory::Persistence;
        default:
            return ErrorCategory::Internal;
    }
}

/**
 * @brief Human readable message for the UI (one line, no secrets)
 */
inline std::string describe(const Error& error) {
    switch (error_category(error.type)) {
        case ErrorCategory::Credential:
            return "Could not get a session credential: " + error.message;
        case ErrorCategory::Negotiation:
            if (error.type == ErrorType::PermissionDenied) {
                return "Microphone unavailable: " + error.message +
                       ". Please check microphone permissions.";
            }
            return "Could not connect to the transcription service: " + error.message;
        case ErrorCategory::Transport:
            return "Transcription session ended: " + error.message;
        case ErrorCategory::Persistence:
            return "Failed to save. Your draft is kept, please try again. (" + error.message + ")";
        default:
            return error.message;
    }
}

inline Error make_error(ErrorType type, const std::string& message) {
    return Error(type, message);
}

inline Error make_io_error(const std::string& message) {
    return Error(ErrorType::IOError, message);
}

inline Error make_persistence_error(const std::string& message) {
    return Error(ErrorType::PersistenceFailed, message);
}

inline Error make_timeout_error(const std::string& message = "Operation timed out") {
    return Error(ErrorType::Timeout, message);
}

} // namespace job_diary
