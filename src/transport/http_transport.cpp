#include "ambassador/transport/http_transport.hpp"
#include "ambassador/codec.hpp"
#include "ambassador/error.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace ambassador {

namespace {

bool is_blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
}

/// Extract backend error code and message from an error body. Accepted shapes:
///   {"error": "<code>", "message": "..."}
///   {"error": {"code": "...", "message": "..."}}
///   {"code": "...", "message": "..."}
/// Falls back to the raw body text.
void parse_error_body(const std::string& body, std::string& code, std::string& message) {
    message = body;
    if (body.empty() || is_blank(body)) return;

    nlohmann::json j;
    try {
        j = Codec::parse_json(body);
    } catch (const ParseError&) {
        return;
    }
    if (!j.is_object()) return;

    const nlohmann::json* source = &j;
    if (j.contains("error") && j.at("error").is_object()) {
        source = &j.at("error");
    } else if (j.contains("error") && j.at("error").is_string()) {
        code = j.at("error").get<std::string>();
    }

    if (source->contains("code")) {
        const auto& c = source->at("code");
        code = c.is_string() ? c.get<std::string>() : c.dump();
    }
    if (source->contains("message") && source->at("message").is_string()) {
        message = source->at("message").get<std::string>();
    } else if (j.contains("message") && j.at("message").is_string()) {
        message = j.at("message").get<std::string>();
    } else if (!code.empty()) {
        message = code;
    }
}

} // anonymous namespace

/// Registers a client for cancel_all() for the duration of one request.
class HttpClientTransport::InflightGuard {
public:
    InflightGuard(HttpClientTransport& owner, httplib::Client* client)
        : owner_(owner), client_(client) {
        std::lock_guard<std::mutex> lock(owner_.inflight_mutex_);
        owner_.inflight_.insert(client_);
    }
    ~InflightGuard() {
        std::lock_guard<std::mutex> lock(owner_.inflight_mutex_);
        owner_.inflight_.erase(client_);
    }

    InflightGuard(const InflightGuard&) = delete;
    InflightGuard& operator=(const InflightGuard&) = delete;

private:
    HttpClientTransport& owner_;
    httplib::Client* client_;
};

HttpClientTransport::HttpClientTransport(HttpTransportOptions opts)
    : opts_(std::move(opts)) {
    if (opts_.allow_self_signed) {
        spdlog::warn("TLS certificate verification is disabled (allow_self_signed); "
                     "use this only for development");
    }
}

HttpClientTransport::~HttpClientTransport() {
    cancel_all();
}

nlohmann::json HttpClientTransport::send(const HttpRequest& req) {
    httplib::Client client(opts_.base_url);
    if (!client.is_valid()) {
        throw TransportError("Invalid backend URL: " + opts_.base_url);
    }

    auto timeout = req.timeout.value_or(opts_.request_timeout);
    client.set_connection_timeout(std::min(opts_.connect_timeout, timeout));
    client.set_read_timeout(timeout);
    client.set_write_timeout(timeout);
    client.set_keep_alive(false);
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
    client.enable_server_certificate_verification(!opts_.allow_self_signed);
#endif

    httplib::Request request;
    request.method = req.method;
    request.path = opts_.base_path + req.path;
    request.headers = {
        {"Content-Type", "application/json"},
        {"Accept", "application/json"},
        {"User-Agent", opts_.user_agent}
    };
    if (req.session_token) {
        request.headers.emplace("X-Session-Token", *req.session_token);
    }
    if (req.body) {
        request.body = req.body->dump();
    }

    const size_t limit = opts_.max_response_bytes;
    int status = 0;
    bool too_large = false;
    std::string body;

    request.response_handler = [&](const httplib::Response& res) {
        status = res.status;
        if (res.has_header("Content-Length")) {
            auto declared = std::strtoull(res.get_header_value("Content-Length").c_str(), nullptr, 10);
            if (declared > limit) {
                too_large = true;
                return false;
            }
        }
        return true;
    };
    request.content_receiver = [&](const char* data, size_t len, uint64_t /*offset*/, uint64_t /*total*/) {
        if (body.size() + len > limit) {
            too_large = true;
            return false;
        }
        body.append(data, len);
        return true;
    };

    InflightGuard guard(*this, &client);
    auto result = client.send(request);

    const std::string what = req.method + " " + req.path;
    if (too_large) {
        throw ResponseTooLargeError(what + ": response exceeds maximum size of "
                                    + std::to_string(limit) + " bytes");
    }
    if (!result) {
        throw TransportError(what + " failed: " + httplib::to_string(result.error()));
    }
    if (status == 0) status = result->status;

    if (status >= 200 && status < 300) {
        if (body.empty() || is_blank(body)) return nullptr;
        try {
            return Codec::parse_json(body);
        } catch (const ParseError& e) {
            throw InvalidResponseError(what + ": invalid JSON response: " + e.what());
        }
    }

    std::string code;
    std::string message;
    parse_error_body(body, code, message);
    throw HttpStatusError(status, code, "HTTP " + std::to_string(status) + ": " + message);
}

void HttpClientTransport::cancel_all() {
    std::lock_guard<std::mutex> lock(inflight_mutex_);
    for (auto* client : inflight_) {
        client->stop();
    }
}

} // namespace ambassador
