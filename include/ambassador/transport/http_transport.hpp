#pragma once
#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <nlohmann/json.hpp>

// Forward declarations to avoid including heavy httplib header
namespace httplib {
    class Client;
}

namespace ambassador {

/// One backend request.
struct HttpRequest {
    std::string method;                           // "GET", "POST", "DELETE"
    std::string path;                             // e.g. "/v1/tools"
    std::optional<nlohmann::json> body;
    std::optional<std::string> session_token;     // sent as X-Session-Token
    std::optional<std::chrono::milliseconds> timeout;
};

/// Backend request/response cycle.
///
/// send() returns the parsed body of a 2xx response (null for an empty
/// body) and otherwise throws:
///  - HttpStatusError for any non-2xx status,
///  - InvalidResponseError when a 2xx body is not JSON,
///  - ResponseTooLargeError when the body exceeds the ceiling,
///  - TransportError for connection-level failures and cancellation.
class IHttpTransport {
public:
    virtual ~IHttpTransport() = default;

    [[nodiscard]] virtual nlohmann::json send(const HttpRequest& req) = 0;

    /// Abort every request currently in flight.
    virtual void cancel_all() = 0;
};

struct HttpTransportOptions {
    std::string base_url;            // scheme://host:port
    std::string base_path;           // prefix prepended to every request path
    bool allow_self_signed = false;
    size_t max_response_bytes = 10 * 1024 * 1024;
    std::chrono::milliseconds connect_timeout{10000};
    std::chrono::milliseconds request_timeout{30000};
    std::string user_agent = "mcpambassador-client";
};

/// HTTPS client for the backend REST API. Each request uses its own
/// connection, so concurrent callers never share socket state.
class HttpClientTransport : public IHttpTransport {
public:
    explicit HttpClientTransport(HttpTransportOptions opts);
    ~HttpClientTransport() override;

    HttpClientTransport(const HttpClientTransport&) = delete;
    HttpClientTransport& operator=(const HttpClientTransport&) = delete;

    nlohmann::json send(const HttpRequest& req) override;
    void cancel_all() override;

    const HttpTransportOptions& options() const { return opts_; }

private:
    class InflightGuard;

    HttpTransportOptions opts_;
    std::mutex inflight_mutex_;
    std::set<httplib::Client*> inflight_;
};

} // namespace ambassador
