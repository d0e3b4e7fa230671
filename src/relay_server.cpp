#include "ambassador/relay_server.hpp"
#include "ambassador/dispatcher.hpp"
#include "ambassador/error.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace ambassador {

struct RelayServer::Impl {
    Options opts;
    std::shared_ptr<IHttpTransport> http;
    SessionManager session;
    CatalogCache cache;
    Dispatcher dispatcher;

    ITransport* transport{nullptr};
    std::mutex transport_mutex;

    std::atomic<bool> running{false};
    // Set by shutdown(), possibly before serve() has a transport. Never reset.
    std::atomic<bool> shutdown_requested{false};

    // Thread pool
    std::vector<std::thread> thread_pool;
    std::queue<std::function<void()>> task_queue;
    std::mutex pool_mutex;
    std::condition_variable pool_cv;
    std::atomic<bool> pool_running{false};

    Impl(Options o, std::shared_ptr<IHttpTransport> h)
        : opts(std::move(o))
        , http(std::move(h))
        , session(opts.session, *http)
        , cache(opts.cache, [this] { return fetch_tool_catalog(session); })
        , dispatcher(session, cache) {
        // A new session may see a different tool set.
        session.on_registered([this](const Session&) { cache.invalidate(session.generation()); });
    }

    void start_thread_pool() {
        pool_running = true;
        int size = opts.thread_pool_size > 0 ? opts.thread_pool_size : 1;
        for (int i = 0; i < size; ++i) {
            thread_pool.emplace_back([this] {
                while (true) {
                    std::function<void()> task;
                    {
                        std::unique_lock<std::mutex> lock(pool_mutex);
                        pool_cv.wait(lock, [this] {
                            return !task_queue.empty() || !pool_running;
                        });
                        // Drain queued requests before exiting
                        if (!pool_running && task_queue.empty()) return;
                        task = std::move(task_queue.front());
                        task_queue.pop();
                    }
                    task();
                }
            });
        }
    }

    void stop_thread_pool() {
        {
            std::lock_guard<std::mutex> lock(pool_mutex);
            pool_running = false;
        }
        pool_cv.notify_all();
        for (auto& t : thread_pool) {
            if (t.joinable()) t.join();
        }
        thread_pool.clear();
    }

    // Requests still waiting for a worker are dropped rather than sent to
    // the backend; their answers could no longer be delivered.
    void discard_queued_tasks() {
        size_t dropped = 0;
        {
            std::lock_guard<std::mutex> lock(pool_mutex);
            dropped = task_queue.size();
            std::queue<std::function<void()>>().swap(task_queue);
        }
        if (dropped > 0) spdlog::info("Discarded {} queued request(s) on shutdown", dropped);
    }

    void dispatch_to_pool(std::function<void()> fn) {
        {
            std::lock_guard<std::mutex> lock(pool_mutex);
            task_queue.push(std::move(fn));
        }
        pool_cv.notify_one();
    }

    void send_message(const JsonRpcResponse& msg) {
        std::lock_guard<std::mutex> lock(transport_mutex);
        if (!transport) return;
        try {
            transport->send(msg);
        } catch (const TransportError& e) {
            spdlog::debug("Dropping response: {}", e.what());
        }
    }

    void on_line(std::string line) {
        dispatch_to_pool([this, line = std::move(line)] {
            if (shutdown_requested) {
                spdlog::debug("Dropping request received during shutdown");
                return;
            }
            std::optional<JsonRpcResponse> response;
            try {
                response = dispatcher.handle_line(line);
            } catch (const std::exception& e) {
                spdlog::error("Unhandled error while dispatching: {}", e.what());
                return;
            }
            if (response) send_message(*response);
        });
    }
};

RelayServer::RelayServer(Options opts, std::shared_ptr<IHttpTransport> http)
    : impl_(std::make_unique<Impl>(std::move(opts), std::move(http))) {}

RelayServer::~RelayServer() {
    impl_->stop_thread_pool();
    impl_->session.stop_heartbeat();
}

void RelayServer::start() {
    impl_->session.register_session();
    impl_->session.start_heartbeat();
    try {
        auto result = impl_->cache.get();
        spdlog::info("Tool catalog loaded ({} tools)", result.catalog.tools.size());
    } catch (const std::exception& e) {
        spdlog::warn("Initial tool catalog fetch failed: {}", e.what());
    }
}

void RelayServer::serve(std::unique_ptr<ITransport> transport) {
    impl_->start_thread_pool();

    auto* t = transport.get();
    bool stop_now = false;
    {
        std::lock_guard<std::mutex> lock(impl_->transport_mutex);
        impl_->transport = t;
        stop_now = impl_->shutdown_requested;
        impl_->running = !stop_now;
    }
    if (stop_now) {
        spdlog::info("Shutdown requested before serving started");
        t->shutdown();
    }

    spdlog::info("Relay ready on stdio");
    t->start(
        [this](std::string line) { impl_->on_line(std::move(line)); },
        [](std::exception_ptr ep) {
            try {
                std::rethrow_exception(ep);
            } catch (const std::exception& e) {
                spdlog::error("Host transport error: {}", e.what());
            }
        });

    spdlog::info("Shutting down");
    impl_->running = false;
    impl_->stop_thread_pool();
    impl_->session.stop_heartbeat();
    impl_->session.disconnect();

    {
        std::lock_guard<std::mutex> lock(impl_->transport_mutex);
        impl_->transport = nullptr;
    }
    t->shutdown();
}

void RelayServer::serve_stdio(StdioOptions opts) {
    serve(std::make_unique<StdioTransport>(std::move(opts)));
}

void RelayServer::shutdown() {
    {
        std::lock_guard<std::mutex> lock(impl_->transport_mutex);
        impl_->shutdown_requested = true;
        impl_->running = false;
        if (impl_->transport) {
            impl_->transport->shutdown();
        }
    }
    impl_->discard_queued_tasks();
}

bool RelayServer::is_running() const {
    return impl_->running;
}

SessionManager& RelayServer::session() {
    return impl_->session;
}

CatalogCache& RelayServer::cache() {
    return impl_->cache;
}

} // namespace ambassador
