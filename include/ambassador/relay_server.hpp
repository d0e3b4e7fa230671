#pragma once
#include "catalog_cache.hpp"
#include "session_manager.hpp"
#include "transport/http_transport.hpp"
#include "transport/stdio_transport.hpp"
#include "transport/transport.hpp"
#include <memory>

namespace ambassador {

/// Wires the host transport, the dispatcher, the session and the catalog
/// cache together and owns the process lifecycle.
class RelayServer {
public:
    struct Options {
        SessionManager::Options session;
        CatalogCache::Options cache;
        int thread_pool_size = 4;
    };

    RelayServer(Options opts, std::shared_ptr<IHttpTransport> http);
    ~RelayServer();

    RelayServer(const RelayServer&) = delete;
    RelayServer& operator=(const RelayServer&) = delete;

    /// Register, start the heartbeat and warm the catalog cache.
    /// Registration failures propagate; a failed prefetch is only logged.
    void start();

    /// Serve the host until end of input or shutdown(). On return the
    /// in-flight requests have completed, the heartbeat is stopped and the
    /// backend connection has been released.
    void serve(std::unique_ptr<ITransport> transport);
    void serve_stdio(StdioOptions opts = StdioOptions{});

    /// Stop reading from the host and drop requests not yet picked up by a
    /// worker. Safe to call from any thread, including before serve(), in
    /// which case serve() returns without reading.
    void shutdown();

    [[nodiscard]] bool is_running() const;

    SessionManager& session();
    CatalogCache& cache();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace ambassador
