#include <gtest/gtest.h>
#include "ambassador/catalog_cache.hpp"
#include "ambassador/error.hpp"

using namespace ambassador;

namespace {

ToolCatalog make_catalog(std::initializer_list<const char*> names) {
    ToolCatalog c;
    for (const char* n : names) {
        c.tools.push_back(ToolDescriptor{n, std::string("Tool ") + n, {{"type", "object"}}, std::nullopt});
    }
    c.api_version = "v1";
    return c;
}

// Fetcher and clock under test control.
struct Harness {
    int fetches = 0;
    bool fail = false;
    ToolCatalog next = make_catalog({"alpha"});
    CatalogCache::Clock::time_point now{};

    CatalogCache make(CatalogCache::Options opts) {
        return CatalogCache(opts,
            [this] {
                ++fetches;
                if (fail) throw TransportError("backend unreachable");
                return next;
            },
            [this] { return now; });
    }
};

} // anonymous namespace

TEST(CatalogCache, SecondGetWithinTtlIsCached) {
    Harness h;
    auto cache = h.make({std::chrono::seconds(300), false});

    auto first = cache.get();
    EXPECT_EQ(first.source, CatalogCache::Source::Fresh);
    h.now += std::chrono::seconds(299);
    auto second = cache.get();
    EXPECT_EQ(second.source, CatalogCache::Source::Cached);
    EXPECT_EQ(h.fetches, 1);
    EXPECT_EQ(second.catalog.tools, first.catalog.tools);
}

TEST(CatalogCache, ExpiredSnapshotRefetched) {
    Harness h;
    auto cache = h.make({std::chrono::seconds(300), false});

    (void)cache.get();
    h.now += std::chrono::seconds(300);
    h.next = make_catalog({"alpha", "beta"});
    auto result = cache.get();
    EXPECT_EQ(result.source, CatalogCache::Source::Fresh);
    EXPECT_EQ(result.catalog.tools.size(), 2u);
    EXPECT_EQ(h.fetches, 2);
}

TEST(CatalogCache, StaleSnapshotServedOnFailure) {
    Harness h;
    auto cache = h.make({std::chrono::seconds(10), false});

    (void)cache.get();
    h.now += std::chrono::hours(24);
    h.fail = true;
    auto result = cache.get();
    EXPECT_EQ(result.source, CatalogCache::Source::Stale);
    ASSERT_EQ(result.catalog.tools.size(), 1u);
    EXPECT_EQ(result.catalog.tools[0].name, "alpha");
    EXPECT_EQ(h.fetches, 2);
}

TEST(CatalogCache, FailureWithoutSnapshotPropagates) {
    Harness h;
    h.fail = true;
    auto cache = h.make({std::chrono::seconds(300), false});
    EXPECT_THROW((void)cache.get(), TransportError);
    EXPECT_FALSE(cache.has_snapshot());
}

TEST(CatalogCache, InvalidateForcesFetch) {
    Harness h;
    auto cache = h.make({std::chrono::seconds(300), false});

    (void)cache.get();
    cache.invalidate();
    EXPECT_FALSE(cache.has_snapshot());
    (void)cache.get();
    EXPECT_EQ(h.fetches, 2);
}

TEST(CatalogCache, InvalidatedCacheHasNoStaleFallback) {
    Harness h;
    auto cache = h.make({std::chrono::seconds(300), false});

    (void)cache.get();
    cache.invalidate();
    h.fail = true;
    EXPECT_THROW((void)cache.get(), TransportError);
}

TEST(CatalogCache, ZeroTtlFetchesEveryTimeButKeepsFallback) {
    Harness h;
    auto cache = h.make({std::chrono::seconds(0), false});

    (void)cache.get();
    (void)cache.get();
    EXPECT_EQ(h.fetches, 2);
    EXPECT_TRUE(cache.has_snapshot());

    h.fail = true;
    EXPECT_EQ(cache.get().source, CatalogCache::Source::Stale);
}

TEST(CatalogCache, DisabledFetchesEveryTimeAndStoresNothing) {
    Harness h;
    auto cache = h.make({std::chrono::seconds(300), true});

    (void)cache.get();
    (void)cache.get();
    EXPECT_EQ(h.fetches, 2);
    EXPECT_FALSE(cache.has_snapshot());

    h.fail = true;
    EXPECT_THROW((void)cache.get(), TransportError);
}

TEST(CatalogCache, ListFromReplacedSessionIsNotStored) {
    Harness h;
    CatalogCache* self = nullptr;
    CatalogCache cache({std::chrono::seconds(300), false},
        [&]() -> CatalogCache::Fetched {
            ++h.fetches;
            self->invalidate(2);  // a registration lands after the request went out
            return {h.next, 1};
        },
        [&] { return h.now; });
    self = &cache;

    auto result = cache.get();
    EXPECT_EQ(result.source, CatalogCache::Source::Fresh);
    EXPECT_FALSE(cache.has_snapshot());
}

TEST(CatalogCache, ListFetchedAfterReRegistrationIsStored) {
    Harness h;
    CatalogCache* self = nullptr;
    CatalogCache cache({std::chrono::seconds(300), false},
        [&]() -> CatalogCache::Fetched {
            ++h.fetches;
            if (h.fail) throw TransportError("backend unreachable");
            // First attempt hit a 401; the retry ran under the new session
            self->invalidate(2);
            return {h.next, 2};
        },
        [&] { return h.now; });
    self = &cache;

    EXPECT_EQ(cache.get().source, CatalogCache::Source::Fresh);
    EXPECT_TRUE(cache.has_snapshot());
    EXPECT_EQ(cache.get().source, CatalogCache::Source::Cached);
    EXPECT_EQ(h.fetches, 1);

    h.now += std::chrono::seconds(301);
    h.fail = true;
    auto stale = cache.get();
    EXPECT_EQ(stale.source, CatalogCache::Source::Stale);
    ASSERT_EQ(stale.catalog.tools.size(), 1u);
    EXPECT_EQ(stale.catalog.tools[0].name, "alpha");
}
