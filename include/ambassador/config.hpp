#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace ambassador {

constexpr int MIN_HEARTBEAT_INTERVAL_SECONDS = 5;
constexpr int MAX_HEARTBEAT_INTERVAL_SECONDS = 300;
constexpr uint16_t DEFAULT_SERVER_PORT = 8443;

/// Backend location split into its parts.
struct ServerUrl {
    std::string scheme;       // "https" or "http"
    std::string host;         // without IPv6 brackets
    uint16_t port = DEFAULT_SERVER_PORT;
    std::string base_path;    // "" or "/prefix", never a trailing '/'

    /// scheme://host:port, as cpp-httplib expects it.
    [[nodiscard]] std::string origin() const;
    [[nodiscard]] bool is_loopback() const;
};

/// Throws ConfigError ("Invalid server_url", "Invalid URL scheme").
[[nodiscard]] ServerUrl parse_server_url(const std::string& url);

struct Config {
    std::string server_url;
    std::string preshared_key;
    std::string friendly_name;
    std::string host_tool = "custom";
    int heartbeat_interval_seconds = 60;
    int cache_ttl_seconds = 300;
    bool disable_cache = false;
    bool allow_self_signed = false;
    int disconnect_timeout_ms = 2000;
    int request_timeout_ms = 30000;
    size_t max_response_bytes = 10 * 1024 * 1024;
    size_t max_buffer_bytes = 10 * 1024 * 1024;
    size_t max_message_bytes = 1024 * 1024;
    std::string log_level = "info";
    std::optional<std::string> log_file;
    int worker_threads = 4;
};

/// Unknown keys are ignored; present keys must have the right type.
void from_json(const nlohmann::json& j, Config& c);

/// Overlay a JSON config file onto cfg. Throws ConfigError.
void load_config_file(const std::string& path, Config& cfg);

using EnvLookup = std::function<std::optional<std::string>(const char* name)>;

/// Reads the process environment.
[[nodiscard]] std::optional<std::string> getenv_lookup(const char* name);

/// Overlay AMBASSADOR_SERVER_URL, AMBASSADOR_PRESHARED_KEY,
/// AMBASSADOR_FRIENDLY_NAME and AMBASSADOR_HOST_TOOL onto cfg.
void apply_environment(Config& cfg, const EnvLookup& lookup = getenv_lookup);

/// Clamp into [5, 300], logging a warning when the value changes.
[[nodiscard]] int clamp_heartbeat_interval(int seconds);

[[nodiscard]] bool is_known_host_tool(const std::string& tool);

/// The machine's hostname, or "ambassador-client".
[[nodiscard]] std::string default_friendly_name();

/// Check and normalize cfg in place. Returns the parsed server URL.
/// Throws ConfigError.
ServerUrl validate_config(Config& cfg);

} // namespace ambassador
