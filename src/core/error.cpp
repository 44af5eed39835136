#include "dsync/core/error.hpp"

namespace dsync {

const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::PackError: return "PackError";
        case ErrorKind::UnpackError: return "UnpackError";
        case ErrorKind::AuthError: return "AuthError";
        case ErrorKind::ProxyError: return "ProxyError";
        case ErrorKind::ConnectionError: return "ConnectionError";
        case ErrorKind::UploadError: return "UploadError";
        case ErrorKind::IntegrityError: return "IntegrityError";
        case ErrorKind::RetryExhausted: return "RetryExhausted";
        case ErrorKind::DigestError: return "DigestError";
        case ErrorKind::InvalidRemotePath: return "InvalidRemotePath";
        case ErrorKind::RemoteCommandError: return "RemoteCommandError";
        case ErrorKind::Cancelled: return "Cancelled";
        case ErrorKind::ConfigError: return "ConfigError";
    }
    return "Unknown";
}

bool transient_by_default(ErrorKind kind) noexcept {
    return kind == ErrorKind::ConnectionError || kind == ErrorKind::UploadError;
}

Error::Error(ErrorKind k, std::string msg)
    : kind(k), message(std::move(msg)), transient(transient_by_default(k)) {}

Error::Error(ErrorKind k, std::string msg, bool is_transient)
    : kind(k), message(std::move(msg)), transient(is_transient) {}

Error Error::wrapped_by(ErrorKind outer, std::string outer_message) const {
    Error wrapper(outer, std::move(outer_message), false);
    wrapper.cause = std::make_shared<const Error>(*this);
    return wrapper;
}

const Error& Error::root_cause() const noexcept {
    const Error* current = this;
    while (current->cause) {
        current = current->cause.get();
    }
    return *current;
}

std::string Error::describe() const {
    std::string text = std::string(to_string(kind)) + ": " + message;
    if (cause) {
        text += " (caused by " + cause->describe() + ")";
    }
    return text;
}

} // namespace dsync
