#pragma once

#include <stdexcept>
#include <string>

namespace motium::sync {

/// How a failed collaborator call should be treated
enum class ErrorKind {
    TRANSIENT = 0,  // network, timeout, backend unavailable: retry later
    AUTH = 1,       // credential rejected: refresh before retrying
    PERMANENT = 2   // malformed request, revoked refresh token
};

inline const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::TRANSIENT: return "TRANSIENT";
        case ErrorKind::AUTH: return "AUTH";
        case ErrorKind::PERMANENT: return "PERMANENT";
        default: return "UNKNOWN";
    }
}

/// Thrown by RemoteApi and AuthEndpoint implementations
class RemoteError : public std::runtime_error {
public:
    RemoteError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

/// A collaborator call that did not return within its time budget
class TimeoutError : public RemoteError {
public:
    explicit TimeoutError(const std::string& message)
        : RemoteError(ErrorKind::TRANSIENT, message) {}
};

}  // namespace motium::sync
