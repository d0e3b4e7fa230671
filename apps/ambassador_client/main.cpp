#include <ambassador/ambassador.hpp>

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include <pthread.h>
#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <thread>

namespace {

// SIGINT/SIGTERM are blocked in every thread and collected here, so the
// shutdown runs on a normal thread rather than inside a signal handler.
// SIGUSR1 only releases the watcher once the relay has stopped on its own.
std::thread start_signal_watcher(const sigset_t& set, ambassador::RelayServer& server) {
    return std::thread([set, &server] {
        int sig = 0;
        while (sigwait(&set, &sig) == 0) {
            if (sig == SIGUSR1) return;
            spdlog::info("Received signal {}, shutting down gracefully", sig);
            server.shutdown();
            return;
        }
    });
}

} // anonymous namespace

int main(int argc, char** argv) {
    using namespace ambassador;

    CLI::App app{"MCP Ambassador client - stdio relay to an MCP Ambassador server"};

    std::string server_url;
    app.add_option("-s,--server", server_url, "Ambassador server URL (https://host:8443)");

    std::string config_path;
    app.add_option("-c,--config", config_path, "JSON configuration file")
        ->check(CLI::ExistingFile);

    std::string friendly_name;
    app.add_option("--friendly-name", friendly_name, "Name shown for this client on the server");

    std::string host_tool;
    app.add_option("--host-tool", host_tool,
                   "Host application (vscode, claude-desktop, claude-code, opencode, "
                   "gemini-cli, chatgpt, custom)");

    std::optional<int> heartbeat;
    app.add_option("--heartbeat-interval", heartbeat, "Heartbeat interval in seconds [5, 300]");

    std::optional<int> cache_ttl;
    app.add_option("--cache-ttl", cache_ttl, "Tool catalog cache TTL in seconds");

    bool no_cache = false;
    app.add_flag("--no-cache", no_cache, "Fetch the tool catalog on every tools/list");

    bool allow_self_signed = false;
    app.add_flag("--allow-self-signed", allow_self_signed,
                 "Skip TLS certificate verification (development only)");

    std::string log_level;
    app.add_option("-l,--log-level", log_level,
                   "Log level (trace, debug, info, warn, error, critical, off)");

    std::string log_file;
    app.add_option("--log-file", log_file, "Also write logs to this file");

    bool version = false;
    app.add_flag("-v,--version", version, "Print version information");

    CLI11_PARSE(app, argc, argv);

    if (version) {
        std::cout << PROGRAM_NAME << " version " << LIBRARY_VERSION << std::endl;
        return 0;
    }

    Config cfg;
    ServerUrl url;
    try {
        if (!config_path.empty()) load_config_file(config_path, cfg);
        apply_environment(cfg);

        if (!server_url.empty()) cfg.server_url = server_url;
        if (!friendly_name.empty()) cfg.friendly_name = friendly_name;
        if (!host_tool.empty()) cfg.host_tool = host_tool;
        if (heartbeat) cfg.heartbeat_interval_seconds = *heartbeat;
        if (cache_ttl) cfg.cache_ttl_seconds = *cache_ttl;
        if (no_cache) cfg.disable_cache = true;
        if (allow_self_signed) cfg.allow_self_signed = true;
        if (!log_level.empty()) cfg.log_level = log_level;
        if (!log_file.empty()) cfg.log_file = log_file;

        // Register the key before anything can log it.
        SecretRegistry::instance().add(cfg.preshared_key);

        LoggingOptions log_opts;
        log_opts.level = cfg.log_level;
        log_opts.file = cfg.log_file;
        init_logging(log_opts);

        url = validate_config(cfg);
    } catch (const std::exception& e) {
        std::cerr << "Configuration error: " << SecretRegistry::instance().redact(e.what()) << std::endl;
        return 1;
    }

    spdlog::info("Starting {} {}", PROGRAM_NAME, LIBRARY_VERSION);
    spdlog::info("Server: {}{}", url.origin(), url.base_path);
    spdlog::info("Friendly name: {}", cfg.friendly_name);

    // Writes to a closed stdout must fail with EPIPE, not kill the process.
    std::signal(SIGPIPE, SIG_IGN);

    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    sigaddset(&signals, SIGUSR1);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    try {
        HttpTransportOptions http_opts;
        http_opts.base_url = url.origin();
        http_opts.base_path = url.base_path;
        http_opts.allow_self_signed = cfg.allow_self_signed;
        http_opts.max_response_bytes = cfg.max_response_bytes;
        http_opts.request_timeout = std::chrono::milliseconds(cfg.request_timeout_ms);
        http_opts.user_agent = std::string(PROGRAM_NAME) + "/" + std::string(LIBRARY_VERSION);
        auto http = std::make_shared<HttpClientTransport>(http_opts);

        RelayServer::Options opts;
        opts.session.preshared_key = cfg.preshared_key;
        opts.session.friendly_name = cfg.friendly_name;
        opts.session.host_tool = cfg.host_tool;
        opts.session.heartbeat_interval = std::chrono::seconds(cfg.heartbeat_interval_seconds);
        opts.session.disconnect_timeout = std::chrono::milliseconds(cfg.disconnect_timeout_ms);
        opts.cache.ttl = std::chrono::seconds(cfg.cache_ttl_seconds);
        opts.cache.disabled = cfg.disable_cache;
        opts.thread_pool_size = cfg.worker_threads;

        RelayServer server(opts, http);
        try {
            server.start();
        } catch (const std::exception& e) {
            spdlog::critical("Failed to register with the server: {}", e.what());
            return 1;
        }

        std::thread watcher = start_signal_watcher(signals, server);

        StdioOptions stdio_opts;
        stdio_opts.limits.max_buffer_bytes = cfg.max_buffer_bytes;
        stdio_opts.limits.max_message_bytes = cfg.max_message_bytes;
        server.serve_stdio(stdio_opts);

        pthread_kill(watcher.native_handle(), SIGUSR1);
        watcher.join();
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }

    spdlog::info("Stopped");
    return 0;
}
