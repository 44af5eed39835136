#pragma once

#include "dsync/core/result.hpp"

#include <memory>
#include <string>

namespace dsync {

enum class ErrorKind {
    PackError,
    UnpackError,
    AuthError,
    ProxyError,
    ConnectionError,
    UploadError,
    IntegrityError,
    RetryExhausted,
    DigestError,
    InvalidRemotePath,
    RemoteCommandError,
    Cancelled,
    ConfigError
};

[[nodiscard]] const char* to_string(ErrorKind kind) noexcept;

/**
 * @brief Whether a kind is worth retrying unchanged when nothing else is known
 *
 * ConnectionError and UploadError are transient. ProxyError is permanent
 * unless the proxy code flags a specific failure (timeout, reset) as transient.
 */
[[nodiscard]] bool transient_by_default(ErrorKind kind) noexcept;

/**
 * @brief Engine error value
 *
 * `cause` links the error that was wrapped, e.g. the last transient failure
 * behind a RetryExhausted.
 */
struct Error {
    ErrorKind kind = ErrorKind::ConnectionError;
    std::string message;
    bool transient = false;
    std::shared_ptr<const Error> cause;

    Error() = default;
    Error(ErrorKind k, std::string msg);
    Error(ErrorKind k, std::string msg, bool is_transient);

    [[nodiscard]] Error wrapped_by(ErrorKind outer, std::string outer_message) const;

    /// Innermost error of the cause chain (this error when there is none)
    [[nodiscard]] const Error& root_cause() const noexcept;

    /// "Kind: message (caused by Kind: message)" for logs and CLI output
    [[nodiscard]] std::string describe() const;
};

template<typename T = void>
using Outcome = Result<T, Error>;

template<typename T>
Outcome<T> succeed(T value) {
    return Outcome<T>(OkValue<T>(std::move(value)));
}

inline Outcome<void> succeed() {
    return Outcome<void>();
}

template<typename T = void>
Outcome<T> fail(Error error) {
    return Outcome<T>(ErrValue<Error>(std::move(error)));
}

template<typename T = void>
Outcome<T> fail(ErrorKind kind, std::string message) {
    return Outcome<T>(ErrValue<Error>(Error(kind, std::move(message))));
}

} // namespace dsync
