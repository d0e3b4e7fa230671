#pragma once
#include "backend_types.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <utility>

namespace ambassador {

/// Serves the backend tool catalog under a TTL, falling back to the last
/// snapshot (however old) when a refresh fails.
class CatalogCache {
public:
    using Clock = std::chrono::steady_clock;

    /// A fetched catalog tagged with the session generation it came from.
    struct Fetched {
        Fetched(ToolCatalog c, uint64_t g = 0) : catalog(std::move(c)), generation(g) {}

        ToolCatalog catalog;
        uint64_t generation;
    };

    using Fetcher = std::function<Fetched()>;
    using TimeSource = std::function<Clock::time_point()>;

    struct Options {
        std::chrono::seconds ttl{300};
        bool disabled = false;
    };

    enum class Source {
        Fresh,     // fetched by this call
        Cached,    // snapshot within TTL
        Stale      // fetch failed, expired snapshot returned
    };

    struct Result {
        ToolCatalog catalog;
        Source source;
    };

    CatalogCache(Options opts, Fetcher fetcher);
    CatalogCache(Options opts, Fetcher fetcher, TimeSource now);

    /// Throws whatever the fetcher throws when no snapshot is available.
    Result get();

    /// Drop the snapshot regardless of its age. Fetches tagged with a
    /// generation older than `generation` are no longer stored.
    void invalidate(uint64_t generation = 0);

    [[nodiscard]] bool has_snapshot() const;
    [[nodiscard]] const Options& options() const { return opts_; }

private:
    struct Snapshot {
        ToolCatalog catalog;
        Clock::time_point fetched_at;
    };

    Options opts_;
    Fetcher fetcher_;
    TimeSource now_;

    mutable std::mutex mutex_;
    std::optional<Snapshot> snapshot_;
    uint64_t min_generation_{0};  // raised by invalidate()
};

} // namespace ambassador
