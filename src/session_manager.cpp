#include "ambassador/session_manager.hpp"
#include "ambassador/error.hpp"
#include "ambassador/secret_mask.hpp"

#include <spdlog/spdlog.h>
#include <sys/utsname.h>
#include <unistd.h>

#include <cctype>
#include <cstdio>

namespace ambassador {

namespace {

constexpr const char* kRegisterPath = "/v1/sessions/register";
constexpr const char* kHeartbeatPath = "/v1/sessions/heartbeat";
constexpr const char* kConnectionsPath = "/v1/sessions/connections/";

std::string percent_encode(const std::string& s) {
    std::string out;
    for (unsigned char c : s) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            out.append(buf);
        }
    }
    return out;
}

void log_unauthorized(const HttpStatusError& e) {
    switch (classify_unauthorized(e)) {
        case AuthFailure::SessionExpired:
            spdlog::info("Session expired, re-registering");
            break;
        case AuthFailure::SessionSuspended:
            spdlog::warn("Session suspended by the backend, re-registering");
            break;
        case AuthFailure::Unknown:
            spdlog::warn("Request rejected as unauthenticated ({}), re-registering", e.what());
            break;
    }
}

} // anonymous namespace

std::string machine_fingerprint() {
    char host[256] = {0};
    if (gethostname(host, sizeof(host) - 1) != 0) {
        std::snprintf(host, sizeof(host), "unknown");
    }
    struct utsname info{};
    if (uname(&info) != 0) {
        return std::string(host) + "-unknown-unknown";
    }
    std::string os = info.sysname;
    for (auto& c : os) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return std::string(host) + "-" + os + "-" + info.machine;
}

SessionManager::SessionManager(Options opts, IHttpTransport& http)
    : opts_(std::move(opts)), http_(http) {
    SecretRegistry::instance().add(opts_.preshared_key);
}

SessionManager::~SessionManager() {
    stop_heartbeat();
}

RegistrationResponse SessionManager::register_session() {
    spdlog::info("Registering with backend as '{}' ({})", opts_.friendly_name, opts_.host_tool);

    RegistrationRequest request;
    request.preshared_key = opts_.preshared_key;
    request.friendly_name = opts_.friendly_name;
    request.host_tool = opts_.host_tool;
    request.machine_fingerprint = machine_fingerprint();

    RegistrationResponse response;
    try {
        nlohmann::json body = request;
        auto reply = http_.send(HttpRequest{"POST", kRegisterPath, std::move(body), std::nullopt, std::nullopt});
        response = reply.get<RegistrationResponse>();
    } catch (const std::exception& e) {
        spdlog::error("Registration failed: {}", e.what());
        throw;
    }

    SecretRegistry::instance().add(response.session_token);

    Session next{response.session_id, response.session_token,
                 response.connection_id, response.expires_at};
    std::vector<RegistrationListener> listeners;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session_ = next;
        ++generation_;
        listeners = listeners_;
    }

    spdlog::info("Registration successful: session {} on connection {} (profile {}, expires {})",
                 response.session_id, response.connection_id,
                 response.profile_id.empty() ? "unknown" : response.profile_id,
                 response.expires_at);

    for (const auto& listener : listeners) {
        listener(next);
    }
    restart_heartbeat();
    return response;
}

nlohmann::json SessionManager::invoke(const std::string& method,
                                      const std::string& path,
                                      std::optional<nlohmann::json> body,
                                      bool authenticated,
                                      bool allow_retry_on_401) {
    return request(method, path, std::move(body), authenticated, allow_retry_on_401).body;
}

SessionManager::Reply SessionManager::request(const std::string& method,
                                              const std::string& path,
                                              std::optional<nlohmann::json> body,
                                              bool authenticated,
                                              bool allow_retry_on_401) {
    HttpRequest outgoing{method, path, body, std::nullopt, std::nullopt};
    uint64_t generation = 0;
    if (authenticated) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (session_) outgoing.session_token = session_->session_token;
        generation = generation_;
    }

    std::optional<HttpStatusError> unauthorized;
    try {
        return Reply{http_.send(outgoing), generation};
    } catch (const HttpStatusError& e) {
        if (e.status != 401 || !authenticated || !allow_retry_on_401) throw;
        unauthorized = e;
    }

    log_unauthorized(*unauthorized);
    reauthenticate(generation);
    return request(method, path, std::move(body), authenticated, false);
}

void SessionManager::reauthenticate(uint64_t observed_generation) {
    std::promise<void> promise;
    std::shared_future<void> pending;
    bool leader = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation_ != observed_generation) {
            // Someone registered after our request was sent; just retry.
            spdlog::debug("Session already refreshed, retrying with the new session");
            return;
        }
        if (!reauth_) {
            reauth_ = promise.get_future().share();
            leader = true;
        }
        pending = *reauth_;
    }

    if (leader) {
        try {
            register_session();
            promise.set_value();
        } catch (...) {
            promise.set_exception(std::current_exception());
        }
        std::lock_guard<std::mutex> lock(mutex_);
        reauth_.reset();
    } else {
        spdlog::debug("Waiting for in-flight re-registration");
    }

    try {
        pending.get();
    } catch (const std::exception& e) {
        throw ReauthenticationError(std::string("Re-authentication failed: ") + e.what());
    }
}

HeartbeatOutcome SessionManager::heartbeat() {
    if (!has_session()) {
        spdlog::debug("Heartbeat skipped: no session");
        return HeartbeatOutcome::Skipped;
    }
    try {
        (void)invoke("POST", kHeartbeatPath, nlohmann::json::object(), true, false);
        spdlog::debug("Heartbeat acknowledged");
        return HeartbeatOutcome::Ok;
    } catch (const HttpStatusError& e) {
        if (e.status == 429) {
            spdlog::debug("Heartbeat rate-limited");
            return HeartbeatOutcome::RateLimited;
        }
        if (e.status == 401) {
            spdlog::warn("Heartbeat rejected, session will be refreshed on the next request");
            return HeartbeatOutcome::Unauthorized;
        }
        spdlog::warn("Heartbeat failed: {}", e.what());
    } catch (const std::exception& e) {
        spdlog::warn("Heartbeat failed: {}", e.what());
    }
    return HeartbeatOutcome::Failed;
}

void SessionManager::start_heartbeat() {
    std::lock_guard<std::mutex> lock(heartbeat_mutex_);
    if (heartbeat_running_ || heartbeat_stopped_) return;
    heartbeat_running_ = true;
    heartbeat_reset_ = false;
    spdlog::debug("Heartbeat every {} ms", opts_.heartbeat_interval.count());
    heartbeat_thread_ = std::thread([this] { heartbeat_loop(); });
}

void SessionManager::restart_heartbeat() {
    {
        std::lock_guard<std::mutex> lock(heartbeat_mutex_);
        if (heartbeat_stopped_) return;
        if (heartbeat_running_) {
            heartbeat_reset_ = true;
        }
    }
    heartbeat_cv_.notify_all();
    start_heartbeat();
}

void SessionManager::stop_heartbeat() {
    {
        std::lock_guard<std::mutex> lock(heartbeat_mutex_);
        heartbeat_stopped_ = true;
        heartbeat_running_ = false;
    }
    heartbeat_cv_.notify_all();
    if (heartbeat_thread_.joinable() && heartbeat_thread_.get_id() != std::this_thread::get_id()) {
        heartbeat_thread_.join();
    }
}

void SessionManager::heartbeat_loop() {
    std::unique_lock<std::mutex> lock(heartbeat_mutex_);
    while (heartbeat_running_) {
        heartbeat_cv_.wait_for(lock, opts_.heartbeat_interval, [this] {
            return !heartbeat_running_ || heartbeat_reset_;
        });
        if (!heartbeat_running_) break;
        if (heartbeat_reset_) {
            // New session: start a fresh interval
            heartbeat_reset_ = false;
            continue;
        }
        lock.unlock();
        heartbeat();
        lock.lock();
    }
}

void SessionManager::disconnect() {
    std::optional<Session> current = session();
    if (!current) return;

    spdlog::info("Disconnecting connection {}", current->connection_id);
    HttpRequest request{"DELETE", kConnectionsPath + percent_encode(current->connection_id),
                        std::nullopt, current->session_token, opts_.disconnect_timeout};

    auto pending = std::async(std::launch::async, [this, request] {
        return http_.send(request);
    });

    bool timed_out = false;
    if (pending.wait_for(opts_.disconnect_timeout) == std::future_status::timeout) {
        timed_out = true;
        spdlog::info("Disconnect did not complete within {} ms, continuing shutdown",
                     opts_.disconnect_timeout.count());
        http_.cancel_all();
    }

    try {
        (void)pending.get();
        spdlog::info("Disconnected");
    } catch (const std::exception& e) {
        if (timed_out) {
            spdlog::debug("Disconnect cancelled: {}", e.what());
        } else {
            spdlog::warn("Disconnect notification failed: {}", e.what());
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    session_.reset();
}

void SessionManager::on_registered(RegistrationListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.push_back(std::move(listener));
}

std::optional<Session> SessionManager::session() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_;
}

bool SessionManager::has_session() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_.has_value();
}

uint64_t SessionManager::generation() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return generation_;
}

} // namespace ambassador
