#include "ambassador/catalog_cache.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <exception>

namespace ambassador {

CatalogCache::CatalogCache(Options opts, Fetcher fetcher)
    : CatalogCache(opts, std::move(fetcher), [] { return Clock::now(); }) {}

CatalogCache::CatalogCache(Options opts, Fetcher fetcher, TimeSource now)
    : opts_(opts), fetcher_(std::move(fetcher)), now_(std::move(now)) {}

CatalogCache::Result CatalogCache::get() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!opts_.disabled && snapshot_ && now_() - snapshot_->fetched_at < opts_.ttl) {
            spdlog::debug("Tool catalog served from cache ({} tools)", snapshot_->catalog.tools.size());
            return {snapshot_->catalog, Source::Cached};
        }
    }

    // Fetch outside the lock: it may block on the network or re-register.
    try {
        Fetched fresh = fetcher_();
        spdlog::debug("Fetched tool catalog ({} tools)", fresh.catalog.tools.size());
        if (!opts_.disabled) {
            std::lock_guard<std::mutex> lock(mutex_);
            // A list answered under a session that has since been replaced
            // is not kept.
            if (fresh.generation >= min_generation_) {
                snapshot_ = Snapshot{fresh.catalog, now_()};
            } else {
                spdlog::debug("Discarding tool catalog fetched under an older session");
            }
        }
        return {std::move(fresh.catalog), Source::Fresh};
    } catch (const std::exception& e) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!snapshot_) throw;
        spdlog::warn("Tool catalog refresh failed, serving stale snapshot: {}", e.what());
        return {snapshot_->catalog, Source::Stale};
    }
}

void CatalogCache::invalidate(uint64_t generation) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (snapshot_) spdlog::debug("Tool catalog cache invalidated");
    snapshot_.reset();
    min_generation_ = std::max(min_generation_, generation);
}

bool CatalogCache::has_snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshot_.has_value();
}

} // namespace ambassador
