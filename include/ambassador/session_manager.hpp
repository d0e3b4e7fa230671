#pragma once
#include "backend_types.hpp"
#include "transport/http_transport.hpp"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace ambassador {

/// One authenticated relationship with the backend. Held only in memory and
/// always complete: a SessionManager has either a full Session or none.
struct Session {
    std::string session_id;
    std::string session_token;
    std::string connection_id;
    std::string expires_at;
};

enum class HeartbeatOutcome {
    Ok,
    RateLimited,
    Unauthorized,
    Failed,
    Skipped      // no session yet
};

/// Owns the authentication lifecycle: register, heartbeat, transparent
/// re-registration on 401 and best-effort disconnect.
class SessionManager {
public:
    struct Options {
        std::string preshared_key;
        std::string friendly_name;
        std::string host_tool;
        std::chrono::milliseconds heartbeat_interval{60000};
        std::chrono::milliseconds disconnect_timeout{2000};
    };

    /// Called after every successful registration, outside internal locks.
    using RegistrationListener = std::function<void(const Session&)>;

    /// A response body and the session generation of the request that got it.
    struct Reply {
        nlohmann::json body;
        uint64_t generation = 0;
    };

    SessionManager(Options opts, IHttpTransport& http);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    /// Register with the backend, replacing any current session wholesale,
    /// notifying listeners and restarting the heartbeat schedule.
    /// Errors propagate unchanged and leave the previous state untouched.
    RegistrationResponse register_session();

    /// General request primitive. On a 401 with allow_retry_on_401, the
    /// session is refreshed (sharing a single in-flight registration with
    /// concurrent callers) and the request is retried exactly once.
    nlohmann::json invoke(const std::string& method,
                          const std::string& path,
                          std::optional<nlohmann::json> body = std::nullopt,
                          bool authenticated = true,
                          bool allow_retry_on_401 = true);

    /// Same as invoke(), also reporting which session generation the
    /// successful attempt was sent under.
    Reply request(const std::string& method,
                  const std::string& path,
                  std::optional<nlohmann::json> body = std::nullopt,
                  bool authenticated = true,
                  bool allow_retry_on_401 = true);

    /// Send one heartbeat. Never re-registers.
    HeartbeatOutcome heartbeat();

    /// Start the periodic heartbeat (no-op if already running).
    void start_heartbeat();

    /// Stop the heartbeat for good; later registrations do not restart it.
    void stop_heartbeat();

    /// Notify the backend that this connection is closing, bounded by
    /// disconnect_timeout, then clear the session. Never throws.
    void disconnect();

    void on_registered(RegistrationListener listener);

    [[nodiscard]] std::optional<Session> session() const;
    [[nodiscard]] bool has_session() const;
    /// Bumped by every successful registration.
    [[nodiscard]] uint64_t generation() const;
    [[nodiscard]] const Options& options() const { return opts_; }

private:
    void reauthenticate(uint64_t observed_generation);
    void heartbeat_loop();
    void restart_heartbeat();

    Options opts_;
    IHttpTransport& http_;

    mutable std::mutex mutex_;
    std::optional<Session> session_;
    uint64_t generation_{0};
    std::vector<RegistrationListener> listeners_;
    // Single re-registration slot shared by every caller that sees a 401.
    std::optional<std::shared_future<void>> reauth_;

    std::mutex heartbeat_mutex_;
    std::condition_variable heartbeat_cv_;
    std::thread heartbeat_thread_;
    bool heartbeat_running_{false};
    bool heartbeat_stopped_{false};
    bool heartbeat_reset_{false};
};

/// "<hostname>-<os>-<arch>", sent at registration.
[[nodiscard]] std::string machine_fingerprint();

} // namespace ambassador
