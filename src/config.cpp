#include "ambassador/config.hpp"
#include "ambassador/error.hpp"
#include "ambassador/codec.hpp"
#include "ambassador/logging.hpp"

#include <spdlog/spdlog.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace ambassador {

namespace {

constexpr std::array<const char*, 7> kHostTools = {
    "vscode", "claude-desktop", "claude-code", "opencode", "gemini-cli", "chatgpt", "custom"
};

std::string lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

[[noreturn]] void invalid_url(const std::string& url) {
    throw ConfigError("Invalid server_url: " + url);
}

template<typename T>
void read_field(const nlohmann::json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return;
    try {
        out = it->get<T>();
    } catch (const nlohmann::json::exception&) {
        throw ConfigError(std::string("Invalid type for config key '") + key + "'");
    }
}

} // anonymous namespace

std::string ServerUrl::origin() const {
    std::string h = host.find(':') != std::string::npos ? "[" + host + "]" : host;
    return scheme + "://" + h + ":" + std::to_string(port);
}

bool ServerUrl::is_loopback() const {
    return host == "localhost" || host == "127.0.0.1" || host == "::1";
}

ServerUrl parse_server_url(const std::string& url) {
    auto sep = url.find("://");
    if (sep == std::string::npos || sep == 0) invalid_url(url);

    ServerUrl out;
    out.scheme = lower(url.substr(0, sep));
    if (!std::all_of(out.scheme.begin(), out.scheme.end(), [](unsigned char c) {
            return std::isalnum(c) || c == '+' || c == '-' || c == '.';
        })) {
        invalid_url(url);
    }

    std::string rest = url.substr(sep + 3);
    auto slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    if (slash != std::string::npos) {
        out.base_path = rest.substr(slash);
        while (!out.base_path.empty() && out.base_path.back() == '/') out.base_path.pop_back();
    }
    if (authority.empty() || authority.find('@') != std::string::npos) invalid_url(url);

    std::string port_text;
    if (authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string::npos || close == 1) invalid_url(url);
        out.host = authority.substr(1, close - 1);
        std::string tail = authority.substr(close + 1);
        if (!tail.empty()) {
            if (tail.front() != ':') invalid_url(url);
            port_text = tail.substr(1);
            if (port_text.empty()) invalid_url(url);
        }
    } else {
        auto colon = authority.rfind(':');
        if (colon != std::string::npos) {
            out.host = authority.substr(0, colon);
            port_text = authority.substr(colon + 1);
            if (port_text.empty()) invalid_url(url);
        } else {
            out.host = authority;
        }
        if (out.host.find(':') != std::string::npos) invalid_url(url);
    }
    if (out.host.empty() || out.host.find_first_of(" \t") != std::string::npos) invalid_url(url);
    out.host = lower(out.host);

    if (!port_text.empty()) {
        if (!std::all_of(port_text.begin(), port_text.end(), [](unsigned char c) { return std::isdigit(c); })
            || port_text.size() > 5) {
            invalid_url(url);
        }
        int port = std::stoi(port_text);
        if (port <= 0 || port > 65535) invalid_url(url);
        out.port = static_cast<uint16_t>(port);
    }

    if (out.scheme == "https") return out;
    if (out.scheme == "http") {
        if (!out.is_loopback()) {
            spdlog::warn("Using insecure HTTP connection to {}. HTTPS is strongly recommended "
                         "for non-localhost servers.", out.host);
        }
        return out;
    }
    throw ConfigError("Invalid URL scheme: " + out.scheme + " (must be https, or http for localhost)");
}

void from_json(const nlohmann::json& j, Config& c) {
    if (!j.is_object()) throw ConfigError("Config file must contain a JSON object");
    read_field(j, "server_url", c.server_url);
    read_field(j, "preshared_key", c.preshared_key);
    read_field(j, "friendly_name", c.friendly_name);
    read_field(j, "host_tool", c.host_tool);
    read_field(j, "heartbeat_interval_seconds", c.heartbeat_interval_seconds);
    read_field(j, "cache_ttl_seconds", c.cache_ttl_seconds);
    read_field(j, "disable_cache", c.disable_cache);
    read_field(j, "allow_self_signed", c.allow_self_signed);
    read_field(j, "disconnect_timeout_ms", c.disconnect_timeout_ms);
    read_field(j, "request_timeout_ms", c.request_timeout_ms);
    read_field(j, "max_response_bytes", c.max_response_bytes);
    read_field(j, "max_buffer_bytes", c.max_buffer_bytes);
    read_field(j, "max_message_bytes", c.max_message_bytes);
    read_field(j, "log_level", c.log_level);
    read_field(j, "worker_threads", c.worker_threads);
    auto file = j.find("log_file");
    if (file != j.end() && file->is_string()) c.log_file = file->get<std::string>();
}

void load_config_file(const std::string& path, Config& cfg) {
    std::ifstream in(path);
    if (!in) throw ConfigError("Cannot read config file: " + path);
    std::stringstream buffer;
    buffer << in.rdbuf();

    nlohmann::json j;
    try {
        j = Codec::parse_json(buffer.str());
    } catch (const ParseError& e) {
        throw ConfigError("Config file " + path + " is not valid JSON: " + e.what());
    }
    from_json(j, cfg);
}

std::optional<std::string> getenv_lookup(const char* name) {
    const char* value = std::getenv(name);
    if (!value || !*value) return std::nullopt;
    return std::string(value);
}

void apply_environment(Config& cfg, const EnvLookup& lookup) {
    if (auto v = lookup("AMBASSADOR_SERVER_URL")) cfg.server_url = *v;
    if (auto v = lookup("AMBASSADOR_PRESHARED_KEY")) cfg.preshared_key = *v;
    if (auto v = lookup("AMBASSADOR_FRIENDLY_NAME")) cfg.friendly_name = *v;
    if (auto v = lookup("AMBASSADOR_HOST_TOOL")) cfg.host_tool = *v;
}

int clamp_heartbeat_interval(int seconds) {
    if (seconds < MIN_HEARTBEAT_INTERVAL_SECONDS) {
        spdlog::warn("heartbeat_interval_seconds ({}s) is below minimum of {}s. Clamping to {}s.",
                     seconds, MIN_HEARTBEAT_INTERVAL_SECONDS, MIN_HEARTBEAT_INTERVAL_SECONDS);
        return MIN_HEARTBEAT_INTERVAL_SECONDS;
    }
    if (seconds > MAX_HEARTBEAT_INTERVAL_SECONDS) {
        spdlog::warn("heartbeat_interval_seconds ({}s) exceeds maximum of {}s. Clamping to {}s.",
                     seconds, MAX_HEARTBEAT_INTERVAL_SECONDS, MAX_HEARTBEAT_INTERVAL_SECONDS);
        return MAX_HEARTBEAT_INTERVAL_SECONDS;
    }
    return seconds;
}

bool is_known_host_tool(const std::string& tool) {
    return std::find_if(kHostTools.begin(), kHostTools.end(),
                        [&](const char* t) { return tool == t; }) != kHostTools.end();
}

std::string default_friendly_name() {
    char host[256] = {0};
    if (gethostname(host, sizeof(host) - 1) == 0 && host[0] != '\0') {
        return host;
    }
    return "ambassador-client";
}

ServerUrl validate_config(Config& cfg) {
    if (cfg.server_url.empty()) throw ConfigError("server_url is required");
    ServerUrl url = parse_server_url(cfg.server_url);

    if (cfg.preshared_key.empty()) {
        throw ConfigError("preshared_key is required (config file or AMBASSADOR_PRESHARED_KEY)");
    }
    if (!is_known_host_tool(cfg.host_tool)) {
        throw ConfigError("Unknown host_tool: " + cfg.host_tool);
    }
    if (cfg.friendly_name.empty()) cfg.friendly_name = default_friendly_name();

    cfg.heartbeat_interval_seconds = clamp_heartbeat_interval(cfg.heartbeat_interval_seconds);

    if (cfg.cache_ttl_seconds < 0) throw ConfigError("cache_ttl_seconds must not be negative");
    if (cfg.disconnect_timeout_ms <= 0) throw ConfigError("disconnect_timeout_ms must be positive");
    if (cfg.request_timeout_ms <= 0) throw ConfigError("request_timeout_ms must be positive");
    if (cfg.worker_threads <= 0) throw ConfigError("worker_threads must be positive");
    if (cfg.max_message_bytes == 0 || cfg.max_buffer_bytes < cfg.max_message_bytes) {
        throw ConfigError("max_buffer_bytes must be at least max_message_bytes");
    }
    (void)parse_log_level(cfg.log_level);
    return url;
}

} // namespace ambassador
