// EN: Unit tests for the LintCache - memoization, single-flight, invalidation, TTL and LRU
// FR: Tests unitaires du LintCache - mémoïsation, vol unique, invalidation, TTL et LRU

#include <gtest/gtest.h>
#include "lint/lint_cache.hpp"
#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/logging/logger.hpp"

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

using namespace ARL;
using namespace ARL::Lint;

namespace {

// EN: Shared knobs of the counting rule, owned by the test
// FR: Réglages partagés de la règle de comptage, détenus par le test
struct Probe {
    std::atomic<int> evaluations{0};
    std::atomic<bool> fail{false};
    std::chrono::milliseconds delay{0};
};

// EN: Counts evaluations and reports one issue per record
// FR: Compte les évaluations et rapporte un problème par enregistrement
class CountingRule : public LintRule {
public:
    explicit CountingRule(std::shared_ptr<Probe> probe) : probe_(std::move(probe)) {
        info_.id = "counting";
        info_.name = "Counting";
        info_.severity = Severity::INFO;
    }

    const RuleInfo& info() const override { return info_; }

    std::optional<LintIssue> evaluate(const NormalizedRecord& record) const override {
        probe_->evaluations++;
        if (probe_->delay.count() > 0) {
            std::this_thread::sleep_for(probe_->delay);
        }
        if (probe_->fail) {
            throw std::runtime_error("probe failure");
        }
        return makeIssue(record, "seen " + record.tagString("name").value_or("?"));
    }

private:
    RuleInfo info_;
    std::shared_ptr<Probe> probe_;
};

} // namespace

class LintCacheTest : public ::testing::Test {
protected:
    void SetUp() override {
        probe_ = std::make_shared<Probe>();
        rules_ = std::make_unique<LintRuleSet>("1");
        rules_->addRule(std::make_unique<CountingRule>(probe_));
        now_ = *parseTimestamp("2025-01-01T00:00:00Z");
    }

    std::unique_ptr<LintCache> makeCache(LintCacheConfig config = LintCacheConfig{}) {
        return std::make_unique<LintCache>(*rules_, config, [this] { return now_; });
    }

    NormalizedRecord record(const std::string& id, const std::string& name) {
        NormalizedRecord rec;
        rec.id = id;
        rec.fields["name"] = name;
        return rec;
    }

    std::shared_ptr<Probe> probe_;
    std::unique_ptr<LintRuleSet> rules_;
    TimePoint now_;
};

TEST_F(LintCacheTest, SecondLookupIsServedFromCache) {
    auto cache = makeCache();
    NormalizedRecord area = record("a1", "Alpha");

    auto first = cache->getOrCompute(area);
    auto second = cache->getOrCompute(area);

    EXPECT_EQ(probe_->evaluations.load(), 1);
    ASSERT_EQ(first.size(), 1u);
    EXPECT_EQ(first, second);
    EXPECT_EQ(first[0].message, "seen Alpha");

    LintCacheStats stats = cache->getStats();
    EXPECT_EQ(stats.total_requests, 2u);
    EXPECT_EQ(stats.cache_hits, 1u);
    EXPECT_EQ(stats.cache_misses, 1u);
    EXPECT_EQ(stats.entries_count, 1u);
    EXPECT_DOUBLE_EQ(stats.hit_ratio, 0.5);
}

TEST_F(LintCacheTest, ConcurrentCallersShareOneEvaluation) {
    probe_->delay = std::chrono::milliseconds(100);
    auto cache = makeCache();
    NormalizedRecord area = record("a1", "Alpha");

    const int thread_count = 8;
    std::vector<std::vector<LintIssue>> results(thread_count);
    std::vector<std::thread> threads;
    for (int i = 0; i < thread_count; ++i) {
        threads.emplace_back([&, i] { results[i] = cache->getOrCompute(area); });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(probe_->evaluations.load(), 1);
    for (const auto& result : results) {
        EXPECT_EQ(result, results[0]);
    }
    EXPECT_EQ(cache->getStats().computations, 1u);
}

TEST_F(LintCacheTest, DistinctAreasAreEvaluatedSeparately) {
    auto cache = makeCache();
    cache->getOrCompute(record("a1", "Alpha"));
    cache->getOrCompute(record("a2", "Beta"));
    EXPECT_EQ(probe_->evaluations.load(), 2);
    EXPECT_EQ(cache->size(), 2u);
}

TEST_F(LintCacheTest, ChangedRecordIsRecomputed) {
    auto cache = makeCache();
    cache->getOrCompute(record("a1", "Alpha"));
    auto updated = cache->getOrCompute(record("a1", "Alpha Prime"));

    EXPECT_EQ(probe_->evaluations.load(), 2);
    ASSERT_EQ(updated.size(), 1u);
    EXPECT_EQ(updated[0].message, "seen Alpha Prime");
    EXPECT_EQ(cache->size(), 1u);
}

TEST_F(LintCacheTest, InvalidateForcesRecompute) {
    auto cache = makeCache();
    NormalizedRecord area = record("a1", "Alpha");
    cache->getOrCompute(area);

    cache->invalidate("a1");
    EXPECT_FALSE(cache->has("a1"));
    cache->getOrCompute(area);

    EXPECT_EQ(probe_->evaluations.load(), 2);
    EXPECT_EQ(cache->getStats().invalidations, 1u);

    // EN: Unknown ids are a no-op
    // FR: Les ids inconnus sont sans effet
    cache->invalidate("missing");
    EXPECT_EQ(cache->getStats().invalidations, 1u);
}

TEST_F(LintCacheTest, ClearDetachesRunningEvaluation) {
    probe_->delay = std::chrono::milliseconds(200);
    auto cache = makeCache();
    NormalizedRecord area = record("a1", "Alpha");

    std::vector<LintIssue> result;
    std::thread leader([&] { result = cache->getOrCompute(area); });
    while (probe_->evaluations.load() == 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    cache->clear();
    leader.join();

    ASSERT_EQ(result.size(), 1u);
    EXPECT_FALSE(cache->has("a1"));
    EXPECT_EQ(cache->size(), 0u);

    probe_->delay = std::chrono::milliseconds(0);
    cache->getOrCompute(area);
    EXPECT_EQ(probe_->evaluations.load(), 2);
    EXPECT_TRUE(cache->has("a1"));
}

TEST_F(LintCacheTest, AutoCleanupCanBeToggledFromSeveralThreads) {
    auto cache = makeCache();
    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&cache, i] {
            for (int j = 0; j < 50; ++j) {
                cache->enableAutoCleanup((i + j) % 2 == 0, std::chrono::seconds{1});
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    cache->enableAutoCleanup(false);
    cache->getOrCompute(record("a1", "Alpha"));
    EXPECT_TRUE(cache->has("a1"));
}

TEST_F(LintCacheTest, FaultPropagatesAndIsNotCached) {
    auto cache = makeCache();
    NormalizedRecord area = record("a1", "Alpha");

    probe_->fail = true;
    EXPECT_THROW(cache->getOrCompute(area), LintRuleFault);
    EXPECT_FALSE(cache->has("a1"));
    EXPECT_EQ(cache->getStats().faults, 1u);

    probe_->fail = false;
    auto issues = cache->getOrCompute(area);
    EXPECT_EQ(issues.size(), 1u);
    EXPECT_EQ(probe_->evaluations.load(), 2);
}

TEST_F(LintCacheTest, ExpiredEntryIsRecomputed) {
    LintCacheConfig config;
    config.ttl = std::chrono::seconds(60);
    auto cache = makeCache(config);
    NormalizedRecord area = record("a1", "Alpha");

    cache->getOrCompute(area);
    now_ += std::chrono::seconds(30);
    cache->getOrCompute(area);
    EXPECT_EQ(probe_->evaluations.load(), 1);

    now_ += std::chrono::seconds(31);
    cache->getOrCompute(area);
    EXPECT_EQ(probe_->evaluations.load(), 2);
}

TEST_F(LintCacheTest, CleanupRemovesExpiredEntries) {
    LintCacheConfig config;
    config.ttl = std::chrono::seconds(10);
    auto cache = makeCache(config);

    cache->getOrCompute(record("a1", "Alpha"));
    now_ += std::chrono::seconds(5);
    cache->getOrCompute(record("a2", "Beta"));
    now_ += std::chrono::seconds(6);

    EXPECT_EQ(cache->cleanup(), 1u);
    EXPECT_FALSE(cache->has("a1"));
    EXPECT_TRUE(cache->has("a2"));
}

TEST_F(LintCacheTest, LeastRecentlyUsedEntryIsEvicted) {
    LintCacheConfig config;
    config.max_entries = 2;
    auto cache = makeCache(config);
    NormalizedRecord first = record("a1", "Alpha");

    cache->getOrCompute(first);
    now_ += std::chrono::seconds(1);
    cache->getOrCompute(record("a2", "Beta"));
    now_ += std::chrono::seconds(1);
    cache->getOrCompute(first);
    now_ += std::chrono::seconds(1);
    cache->getOrCompute(record("a3", "Gamma"));

    EXPECT_EQ(cache->size(), 2u);
    EXPECT_TRUE(cache->has("a1"));
    EXPECT_FALSE(cache->has("a2"));
    EXPECT_TRUE(cache->has("a3"));
}

TEST_F(LintCacheTest, PeekExposesEntryMetadata) {
    auto cache = makeCache();
    NormalizedRecord area = record("a1", "Alpha");
    cache->getOrCompute(area);

    auto entry = cache->peek("a1");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->fingerprint, LintCache::fingerprint(area));
    EXPECT_EQ(entry->ruleset_version, "1");
    EXPECT_EQ(entry->computed_at, now_);
    EXPECT_FALSE(cache->peek("a2").has_value());
}

TEST(LintCacheFingerprintTest, DependsOnContentOnly) {
    NormalizedRecord a;
    a.id = "x";
    a.fields["name"] = "X";
    a.custom_tags["note"] = "hello";

    NormalizedRecord b = a;
    EXPECT_EQ(LintCache::fingerprint(a), LintCache::fingerprint(b));
    EXPECT_EQ(LintCache::fingerprint(a).size(), 16u);

    b.custom_tags["note"] = "bye";
    EXPECT_NE(LintCache::fingerprint(a), LintCache::fingerprint(b));

    NormalizedRecord c = a;
    c.updated_at = parseTimestamp("2024-01-01");
    EXPECT_NE(LintCache::fingerprint(a), LintCache::fingerprint(c));
}

TEST(LintCacheConfigTest, ReadFromConfiguration) {
    auto& config = ConfigManager::getInstance();
    config.reset();
    ASSERT_TRUE(config.loadFromString(
        "lint_cache:\n"
        "  ttl_seconds: 120\n"
        "  max_entries: 50\n"
        "  auto_cleanup: true\n"
        "  cleanup_interval_seconds: 15\n"));

    LintCacheConfig cache_config = LintCacheConfig::fromConfig(config);
    EXPECT_EQ(cache_config.ttl, std::chrono::seconds(120));
    EXPECT_EQ(cache_config.max_entries, 50u);
    EXPECT_TRUE(cache_config.auto_cleanup);
    EXPECT_EQ(cache_config.cleanup_interval, std::chrono::seconds(15));
    config.reset();
}

// EN: Main test runner
// FR: Lanceur de test principal
int main(int argc, char** argv) {
    ARL::Logger::getInstance().setLogLevel(ARL::LogLevel::ERROR);
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
