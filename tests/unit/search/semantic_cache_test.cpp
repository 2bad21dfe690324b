#include <cmath>
#include <stdexcept>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include <sieve/search/semantic_cache.h>

#include "common/test_backends.h"

using namespace sieve;
using namespace sieve::search;
using namespace std::chrono_literals;

namespace {

const std::string kFingerprint = "l:10,r:20,d:-";

std::vector<SearchCandidate> resultsFor(const std::string& id) {
    SearchCandidate c;
    c.docId = id;
    c.fusedScore = 0.5;
    c.finalScore = 0.5;
    c.rank = 1;
    return {c};
}

// Unit vector at @p degrees from the x axis in the xy plane.
std::vector<float> atAngle(double degrees) {
    double rad = degrees * 3.14159265358979323846 / 180.0;
    return {static_cast<float>(std::cos(rad)), static_cast<float>(std::sin(rad)), 0.0f};
}

} // namespace

class SemanticCacheTest : public ::testing::Test {
protected:
    SemanticCacheConfig config() const {
        SemanticCacheConfig c;
        c.capacity = 10;
        c.similarityThreshold = 0.85;
        c.ttl = 60s;
        return c;
    }

    test::FakeClock clock_;
};

TEST_F(SemanticCacheTest, RejectsInvalidConfig) {
    SemanticCacheConfig c;
    c.capacity = 0;
    EXPECT_THROW({ SemanticCache cache(c); }, std::invalid_argument);
    c.capacity = 10;
    c.similarityThreshold = 1.5;
    EXPECT_THROW({ SemanticCache cache(c); }, std::invalid_argument);
}

TEST_F(SemanticCacheTest, CosineSimilarity) {
    EXPECT_NEAR(SemanticCache::cosineSimilarity({1, 0}, {1, 0}), 1.0, 1e-9);
    EXPECT_NEAR(SemanticCache::cosineSimilarity({1, 0}, {0, 1}), 0.0, 1e-9);
    EXPECT_NEAR(SemanticCache::cosineSimilarity({1, 1}, {2, 2}), 1.0, 1e-9);
    EXPECT_DOUBLE_EQ(SemanticCache::cosineSimilarity({1, 0}, {1, 0, 0}), 0.0);
    EXPECT_DOUBLE_EQ(SemanticCache::cosineSimilarity({0, 0}, {1, 0}), 0.0);
}

TEST_F(SemanticCacheTest, HitAboveThresholdOnly) {
    SemanticCache cache(config(), clock_.fn());
    cache.put(atAngle(0), kFingerprint, "machine learning basics", resultsFor("doc1"));

    // cos(20 deg) ~ 0.94
    auto hit = cache.get(atAngle(20), kFingerprint);
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->matchedQuery, "machine learning basics");
    EXPECT_NEAR(hit->similarity, std::cos(20 * 3.14159265358979323846 / 180.0), 1e-5);
    EXPECT_EQ(hit->results.front().docId, "doc1");

    // cos(40 deg) ~ 0.77
    EXPECT_FALSE(cache.get(atAngle(40), kFingerprint).has_value());

    auto stats = cache.stats();
    EXPECT_EQ(stats.hits, 1u);
    EXPECT_EQ(stats.misses, 1u);
}

TEST_F(SemanticCacheTest, ReturnsClosestEntry) {
    SemanticCache cache(config(), clock_.fn());
    cache.put(atAngle(0), kFingerprint, "far", resultsFor("far"));
    cache.put(atAngle(28), kFingerprint, "near", resultsFor("near"));

    auto hit = cache.get(atAngle(25), kFingerprint);
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->matchedQuery, "near");
}

TEST_F(SemanticCacheTest, FingerprintMustMatch) {
    SemanticCache cache(config(), clock_.fn());
    cache.put(atAngle(0), kFingerprint, "q", resultsFor("doc1"));
    EXPECT_FALSE(cache.get(atAngle(0), "l:5,r:20,d:-").has_value());
    EXPECT_TRUE(cache.get(atAngle(0), kFingerprint).has_value());
}

TEST_F(SemanticCacheTest, DimensionMismatchIsSkipped) {
    SemanticCache cache(config(), clock_.fn());
    cache.put({1.0f, 0.0f}, kFingerprint, "two dims", resultsFor("doc1"));
    EXPECT_FALSE(cache.get(atAngle(0), kFingerprint).has_value());
}

TEST_F(SemanticCacheTest, ZeroEmbeddingNeverMatches) {
    SemanticCache cache(config(), clock_.fn());
    cache.put({0.0f, 0.0f, 0.0f}, kFingerprint, "zero", resultsFor("doc1"));
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_FALSE(cache.get({0.0f, 0.0f, 0.0f}, kFingerprint).has_value());
}

TEST_F(SemanticCacheTest, SameQueryReplacesEntry) {
    SemanticCache cache(config(), clock_.fn());
    cache.put(atAngle(0), kFingerprint, "q", resultsFor("old"));
    cache.put(atAngle(0), kFingerprint, "q", resultsFor("new"));
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_EQ(cache.get(atAngle(0), kFingerprint)->results.front().docId, "new");
}

TEST_F(SemanticCacheTest, EvictsLeastRecentlyUsed) {
    auto c = config();
    c.capacity = 2;
    SemanticCache cache(c, clock_.fn());
    cache.put(atAngle(0), kFingerprint, "a", resultsFor("a"));
    cache.put(atAngle(90), kFingerprint, "b", resultsFor("b"));
    ASSERT_TRUE(cache.get(atAngle(0), kFingerprint).has_value());

    cache.put(atAngle(180), kFingerprint, "c", resultsFor("c"));
    EXPECT_EQ(cache.size(), 2u);
    EXPECT_EQ(cache.stats().evictions, 1u);
    EXPECT_FALSE(cache.get(atAngle(90), kFingerprint).has_value());
    EXPECT_TRUE(cache.get(atAngle(0), kFingerprint).has_value());
}

TEST_F(SemanticCacheTest, TtlExpiresForGetButNotForFindClosest) {
    SemanticCache cache(config(), clock_.fn());
    cache.put(atAngle(0), kFingerprint, "q", resultsFor("doc1"));
    clock_.advance(61s);

    EXPECT_FALSE(cache.get(atAngle(0), kFingerprint).has_value());

    // cos(50 deg) ~ 0.64: below the hit threshold, above the stale floor
    auto stale = cache.findClosest(atAngle(50), kFingerprint, 0.5);
    ASSERT_TRUE(stale.has_value());
    EXPECT_EQ(stale->matchedQuery, "q");
    EXPECT_FALSE(cache.findClosest(atAngle(70), kFingerprint, 0.5).has_value());

    EXPECT_EQ(cache.removeExpired(), 1u);
    EXPECT_EQ(cache.size(), 0u);
}

TEST_F(SemanticCacheTest, TopQueriesOrderedByHits) {
    SemanticCache cache(config(), clock_.fn());
    cache.put(atAngle(0), kFingerprint, "popular", resultsFor("p"));
    cache.put(atAngle(90), kFingerprint, "rare", resultsFor("r"));
    for (int i = 0; i < 3; ++i)
        ASSERT_TRUE(cache.get(atAngle(0), kFingerprint).has_value());
    ASSERT_TRUE(cache.get(atAngle(90), kFingerprint).has_value());

    auto top = cache.topQueries(5);
    ASSERT_EQ(top.size(), 2u);
    EXPECT_EQ(top[0].first, "popular");
    EXPECT_EQ(top[0].second, 3u);
    EXPECT_EQ(top[1].first, "rare");
    EXPECT_EQ(cache.topQueries(1).size(), 1u);
}

TEST_F(SemanticCacheTest, ConcurrentPutAndGet) {
    SemanticCache cache(config());
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&cache, t] {
            for (int i = 0; i < 50; ++i) {
                auto v = atAngle(static_cast<double>((t * 50 + i) % 360));
                cache.put(v, kFingerprint, "q" + std::to_string(t) + "-" + std::to_string(i),
                          resultsFor("d"));
                (void)cache.get(v, kFingerprint);
            }
        });
    }
    for (auto& th : threads)
        th.join();
    EXPECT_EQ(cache.size(), 10u);
}
