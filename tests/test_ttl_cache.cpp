#include <gtest/gtest.h>
#include "../src/core/TtlCache.h"
#include <stdexcept>
#include <vector>

namespace port_census {

using std::chrono::milliseconds;

class TtlCacheTest : public ::testing::Test {
protected:
    TtlCache::NowFn clock() { return [this]{ return now; }; }
    void advance(milliseconds d) { now += d; }

    TtlCache::Clock::time_point now = TtlCache::Clock::time_point() + std::chrono::hours(1);
    int fetches = 0;
};

TEST_F(TtlCacheTest, ServesCachedValueWithinTtl) {
    TtlCache cache(milliseconds(1000), false, clock());
    auto fetch = [this]{ return ++fetches; };
    EXPECT_EQ(cache.get_or_fresh("k", fetch), 1);
    advance(milliseconds(999));
    EXPECT_EQ(cache.get_or_fresh("k", fetch), 1);
    EXPECT_EQ(fetches, 1);
}

TEST_F(TtlCacheTest, RefetchesOnceExpired) {
    TtlCache cache(milliseconds(1000), false, clock());
    auto fetch = [this]{ return ++fetches; };
    cache.get_or_fresh("k", fetch);
    advance(milliseconds(1000));
    EXPECT_EQ(cache.get_or_fresh("k", fetch), 2);
}

TEST_F(TtlCacheTest, PerCallTtlOverridesDefault) {
    TtlCache cache(milliseconds(60000), false, clock());
    auto fetch = [this]{ return ++fetches; };
    cache.get_or_fresh("systemPorts", fetch, milliseconds(30000));
    advance(milliseconds(30001));
    EXPECT_EQ(cache.get_or_fresh("systemPorts", fetch, milliseconds(30000)), 2);
    advance(milliseconds(30001));
    EXPECT_EQ(cache.get_or_fresh("systemPorts", fetch), 2);
}

TEST_F(TtlCacheTest, DisabledCacheAlwaysFetches) {
    TtlCache cache(milliseconds(60000), true, clock());
    auto fetch = [this]{ return ++fetches; };
    cache.get_or_fresh("k", fetch);
    cache.get_or_fresh("k", fetch);
    EXPECT_EQ(fetches, 2);
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_TRUE(cache.disabled());
}

TEST_F(TtlCacheTest, FetchErrorPropagatesAndKeepsOldEntry) {
    TtlCache cache(milliseconds(1000), false, clock());
    cache.get_or_fresh("k", []{ return std::string("old"); });
    advance(milliseconds(2000));
    EXPECT_THROW(cache.get_or_fresh("k", []() -> std::string { throw std::runtime_error("ss failed"); }), std::runtime_error);
    EXPECT_TRUE(cache.contains("k"));
    EXPECT_EQ(cache.ages().at("k"), milliseconds(2000));
}

TEST_F(TtlCacheTest, ClearAndClearAll) {
    TtlCache cache(milliseconds(1000), false, clock());
    cache.get_or_fresh("a", []{ return 1; });
    cache.get_or_fresh("b", []{ return std::vector<int>{1, 2}; });
    EXPECT_EQ(cache.size(), 2u);
    cache.clear("a");
    EXPECT_FALSE(cache.contains("a"));
    EXPECT_TRUE(cache.contains("b"));
    cache.clear_all();
    EXPECT_EQ(cache.size(), 0u);
}

TEST_F(TtlCacheTest, TypeMismatchRefetches) {
    TtlCache cache(milliseconds(1000), false, clock());
    cache.get_or_fresh("k", []{ return 7; });
    EXPECT_EQ(cache.get_or_fresh("k", []{ return std::string("seven"); }), "seven");
}

}
