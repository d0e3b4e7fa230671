#pragma once
#include <stdexcept>
#include <string>

namespace ambassador {

class AmbassadorError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Stdin frame that is not valid JSON-RPC 2.0.
class ParseError : public AmbassadorError {
public:
    using AmbassadorError::AmbassadorError;
};

class ProtocolError : public AmbassadorError {
public:
    int code;
    ProtocolError(int code, const std::string& msg)
        : AmbassadorError(msg), code(code) {}
};

/// Network-level failure: refused, reset, DNS, TLS, timeout, cancellation.
class TransportError : public AmbassadorError {
public:
    using AmbassadorError::AmbassadorError;
};

class ResponseTooLargeError : public TransportError {
public:
    using TransportError::TransportError;
};

/// 2xx response whose body could not be parsed.
class InvalidResponseError : public AmbassadorError {
public:
    using AmbassadorError::AmbassadorError;
};

class HttpStatusError : public AmbassadorError {
public:
    int status;
    std::string backend_code;   // empty when the body carried no structured error

    HttpStatusError(int status, std::string backend_code, const std::string& msg)
        : AmbassadorError(msg), status(status), backend_code(std::move(backend_code)) {}
};

class ReauthenticationError : public AmbassadorError {
public:
    using AmbassadorError::AmbassadorError;
};

class ConfigError : public AmbassadorError {
public:
    using AmbassadorError::AmbassadorError;
};

class FrameOverflowError : public AmbassadorError {
public:
    using AmbassadorError::AmbassadorError;
};

/// Why the backend rejected a session token.
enum class AuthFailure {
    SessionExpired,
    SessionSuspended,
    Unknown
};

/// Branches on the backend error code only, never on message text.
AuthFailure classify_unauthorized(const HttpStatusError& e);

namespace error {
    constexpr int ParseError       = -32700;
    constexpr int MethodNotFound   = -32601;
    constexpr int InvalidParams    = -32602;
    constexpr int InternalError    = -32603;
} // namespace error

namespace backend_code {
    constexpr const char* SessionExpired   = "session_expired";
    constexpr const char* SessionSuspended = "session_suspended";
} // namespace backend_code

} // namespace ambassador
