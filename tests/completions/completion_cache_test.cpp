#include <gtest/gtest.h>

#include <chrono>
#include <string>

#include "completion_cache.h"
#include "completion_paths.h"
#include "test_support.h"

using completion_cache::TtlCache;
using tabsh_filesystem::EntryKind;
using tabsh_filesystem::Result;
using namespace std::chrono_literals;

namespace {

Result<std::string> counted_load(int& loads, const std::string& value) {
    ++loads;
    return Result<std::string>::ok(value);
}

}  // namespace

TEST(TtlCache, SecondLookupWithinTtlDoesNotReload) {
    test_support::FakeClock clock;
    TtlCache<std::string> cache(2000ms, clock.function());
    int loads = 0;

    auto first = cache.get_or_load("k", [&]() { return counted_load(loads, "v1"); });
    auto second = cache.get_or_load("k", [&]() { return counted_load(loads, "v2"); });

    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(second.is_ok());
    EXPECT_EQ(second.value(), "v1");
    EXPECT_EQ(loads, 1);
    EXPECT_EQ(cache.stats().hits, 1u);
    EXPECT_EQ(cache.stats().misses, 1u);
}

TEST(TtlCache, ExpiredEntryIsReloaded) {
    test_support::FakeClock clock;
    TtlCache<std::string> cache(2000ms, clock.function());
    int loads = 0;

    cache.get_or_load("k", [&]() { return counted_load(loads, "old"); });
    clock.advance(2001ms);
    auto reloaded = cache.get_or_load("k", [&]() { return counted_load(loads, "new"); });

    ASSERT_TRUE(reloaded.is_ok());
    EXPECT_EQ(reloaded.value(), "new");
    EXPECT_EQ(loads, 2);
}

// a hit pushes the expiry out by another full TTL
TEST(TtlCache, HitExtendsExpiry) {
    test_support::FakeClock clock;
    TtlCache<std::string> cache(2000ms, clock.function());
    int loads = 0;

    cache.get_or_load("k", [&]() { return counted_load(loads, "v"); });
    clock.advance(1500ms);
    cache.get_or_load("k", [&]() { return counted_load(loads, "v"); });
    clock.advance(1500ms);
    cache.get_or_load("k", [&]() { return counted_load(loads, "v"); });

    EXPECT_EQ(loads, 1);
}

TEST(TtlCache, FailedLoadIsNotCached) {
    test_support::FakeClock clock;
    TtlCache<std::string> cache(2000ms, clock.function());
    int loads = 0;
    auto failing = [&]() {
        ++loads;
        return Result<std::string>::error("boom");
    };

    EXPECT_TRUE(cache.get_or_load("k", failing).is_error());
    EXPECT_TRUE(cache.get_or_load("k", failing).is_error());
    EXPECT_EQ(loads, 2);
    EXPECT_EQ(cache.size(), 0u);
}

TEST(TtlCache, GetAndExtendRespectExpiry) {
    test_support::FakeClock clock;
    TtlCache<int> cache(1000ms, clock.function());

    EXPECT_FALSE(cache.get("missing").has_value());
    EXPECT_FALSE(cache.extend_ttl("missing"));

    cache.set("k", 7);
    ASSERT_TRUE(cache.get("k").has_value());
    EXPECT_EQ(*cache.get("k"), 7);

    clock.advance(900ms);
    EXPECT_TRUE(cache.extend_ttl("k"));
    clock.advance(900ms);
    EXPECT_TRUE(cache.get("k").has_value());

    clock.advance(1000ms);
    EXPECT_FALSE(cache.get("k").has_value());
    EXPECT_FALSE(cache.extend_ttl("k"));
}

TEST(TtlCache, SetPurgesExpiredEntries) {
    test_support::FakeClock clock;
    TtlCache<int> cache(1000ms, clock.function());

    cache.set("a", 1);
    cache.set("b", 2);
    clock.advance(1500ms);
    cache.set("c", 3);

    EXPECT_EQ(cache.size(), 1u);
    cache.clear();
    EXPECT_EQ(cache.size(), 0u);
}

TEST(DirectoryListingCache, EquivalentSpellingsShareOneRead) {
    test_support::FakeDirectories dirs;
    dirs.add("/work", "main.cpp", EntryKind::File);
    test_support::FakeClock clock;
    completion_paths::DirectoryListingCache listing(dirs.reader(), clock.function());

    auto first = listing.list("/work");
    auto second = listing.list("/work/./");
    auto third = listing.list("/work/sub/..");

    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(second.is_ok());
    ASSERT_TRUE(third.is_ok());
    EXPECT_EQ(second.value().size(), 1u);
    EXPECT_EQ(dirs.reads(), 1);
    EXPECT_EQ(listing.stats().hits, 2u);
}

TEST(DirectoryListingCache, RereadsAfterTtl) {
    test_support::FakeDirectories dirs;
    dirs.add("/work", "main.cpp", EntryKind::File);
    test_support::FakeClock clock;
    completion_paths::DirectoryListingCache listing(dirs.reader(), clock.function());

    listing.list("/work");
    clock.advance(completion_cache::kPathListingTtl + 1ms);
    listing.list("/work");

    EXPECT_EQ(dirs.reads(), 2);
}

TEST(DirectoryListingCache, MissingDirectoryIsAnError) {
    test_support::FakeDirectories dirs;
    completion_paths::DirectoryListingCache listing(dirs.reader());

    auto result = listing.list("/nowhere");
    ASSERT_TRUE(result.is_error());
    EXPECT_NE(result.error().find("/nowhere"), std::string::npos);
}
