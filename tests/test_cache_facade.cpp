#include <QtTest/QtTest>

#include <chrono>
#include <memory>

#include "daemon/cache_facade.hpp"
#include "support/fake_collaborators.hpp"

using namespace std::chrono_literals;

using triage::CacheFacade;
using triage::CacheKind;
using triage::CacheTtls;
using triage::LocalCacheBackend;
using triage::testing::StallingCacheBackend;
using triage::testing::SwitchableCacheBackend;

namespace {

struct ManualClock {
    std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now();

    LocalCacheBackend::Clock fn()
    {
        return [this]() { return now; };
    }
};

} // namespace

class CacheFacadeTests : public QObject
{
    Q_OBJECT
private slots:
    void testKeysAndTtls();
    void testLocalRoundTripAndExpiry();
    void testRemotePreferredWhenHealthy();
    void testRemoteFailureFallsBackToLocal();
    void testInvalidateExactKeyOnly();
    void testInvalidatePrefix();
    void testSweepDropsExpiredEntries();
    void testCorruptPayloadIsMiss();
    void testStalledRemoteIsCutOffAtTimeout();
    void testInvalidUtf8PayloadIsStored();
};

void CacheFacadeTests::testKeysAndTtls()
{
    QCOMPARE(triage::cacheKey(CacheKind::CustomerHistory, 42), std::string("customer_history:42"));
    QCOMPARE(triage::cacheKey(CacheKind::SimilarIssues, 7), std::string("similar_issues:7"));
    QCOMPARE(triage::cacheKindPrefix(CacheKind::IssueAnalysis), std::string("issue_analysis"));

    CacheFacade cache(nullptr, CacheTtls{}, 100ms);
    QCOMPARE(cache.ttlFor(CacheKind::CustomerHistory), std::chrono::seconds(300));
    QCOMPARE(cache.ttlFor(CacheKind::Customer), std::chrono::seconds(300));
    QCOMPARE(cache.ttlFor(CacheKind::IssueAnalysis), std::chrono::seconds(1800));
    QCOMPARE(cache.ttlFor(CacheKind::SimilarIssues), std::chrono::seconds(3600));
    QCOMPARE(cache.ttlFor(CacheKind::Other), std::chrono::seconds(3600));
    QVERIFY(!cache.hasRemote());
}

void CacheFacadeTests::testLocalRoundTripAndExpiry()
{
    ManualClock clock;
    CacheFacade cache(nullptr, CacheTtls{}, 100ms, clock.fn());

    cache.set("customer:1", nlohmann::json{{"name", "acme"}}, CacheKind::Customer);
    auto hit = cache.get("customer:1");
    QVERIFY(hit.has_value());
    QCOMPARE((*hit)["name"].get<std::string>(), std::string("acme"));

    clock.now += 299s;
    QVERIFY(cache.get("customer:1").has_value());
    clock.now += 1s;
    QVERIFY(!cache.get("customer:1").has_value());

    const auto stats = cache.stats();
    QCOMPARE(stats.hits, std::uint64_t(2));
    QCOMPARE(stats.misses, std::uint64_t(1));
}

void CacheFacadeTests::testRemotePreferredWhenHealthy()
{
    auto remote = std::make_shared<SwitchableCacheBackend>();
    CacheFacade cache(remote, CacheTtls{}, 100ms);

    cache.set("issue_analysis:3", nlohmann::json{{"priority", 7}}, CacheKind::IssueAnalysis);
    QCOMPARE(remote->entries.size(), std::size_t(1));
    QCOMPARE(cache.get("issue_analysis:3")->at("priority").get<int>(), 7);
    QCOMPARE(cache.stats().remoteFailures, std::uint64_t(0));
}

void CacheFacadeTests::testRemoteFailureFallsBackToLocal()
{
    auto remote = std::make_shared<SwitchableCacheBackend>();
    remote->down = true;
    CacheFacade cache(remote, CacheTtls{}, 100ms);

    cache.set("customer_history:5", nlohmann::json{{"totalIssues", 2}}, CacheKind::CustomerHistory);
    const auto hit = cache.get("customer_history:5");
    QVERIFY(hit.has_value());
    QCOMPARE(hit->at("totalIssues").get<int>(), 2);
    QCOMPARE(cache.stats().remoteFailures, std::uint64_t(2));

    // Invalidation still reaches the local copy.
    cache.invalidate("customer_history:5");
    QVERIFY(!cache.get("customer_history:5").has_value());
}

void CacheFacadeTests::testInvalidateExactKeyOnly()
{
    CacheFacade cache(nullptr, CacheTtls{}, 100ms);
    cache.set("customer_history:5", nlohmann::json(1), CacheKind::CustomerHistory);
    cache.set("customer_history:50", nlohmann::json(2), CacheKind::CustomerHistory);

    cache.invalidate("customer_history:5");
    QVERIFY(!cache.get("customer_history:5").has_value());
    QVERIFY(cache.get("customer_history:50").has_value());
}

void CacheFacadeTests::testInvalidatePrefix()
{
    auto remote = std::make_shared<SwitchableCacheBackend>();
    CacheFacade cache(remote, CacheTtls{}, 100ms);
    cache.set("similar_issues:1", nlohmann::json::array(), CacheKind::SimilarIssues);
    cache.set("similar_issues:2", nlohmann::json::array(), CacheKind::SimilarIssues);
    cache.set("customer:1", nlohmann::json::object(), CacheKind::Customer);

    cache.invalidatePrefix("similar_issues:");
    QVERIFY(!cache.get("similar_issues:1").has_value());
    QVERIFY(!cache.get("similar_issues:2").has_value());
    QVERIFY(cache.get("customer:1").has_value());
}

void CacheFacadeTests::testSweepDropsExpiredEntries()
{
    ManualClock clock;
    LocalCacheBackend local(clock.fn());
    QVERIFY(local.set("a", "1", 10s, 100ms).ok());
    QVERIFY(local.set("b", "2", 60s, 100ms).ok());

    clock.now += 30s;
    QCOMPARE(local.sweepExpired(), 1);
    QCOMPARE(local.size(), std::size_t(1));
}

void CacheFacadeTests::testCorruptPayloadIsMiss()
{
    auto remote = std::make_shared<SwitchableCacheBackend>();
    remote->entries["customer:9"] = "{not json";
    CacheFacade cache(remote, CacheTtls{}, 100ms);
    QVERIFY(!cache.get("customer:9").has_value());
    QCOMPARE(cache.stats().misses, std::uint64_t(1));
}

void CacheFacadeTests::testStalledRemoteIsCutOffAtTimeout()
{
    auto remote = std::make_shared<StallingCacheBackend>(5s);
    CacheFacade cache(remote, CacheTtls{}, 50ms);

    QElapsedTimer timer;
    timer.start();
    cache.set("customer:4", nlohmann::json{{"name", "globex"}}, CacheKind::Customer);
    const auto hit = cache.get("customer:4");
    cache.invalidatePrefix("similar_issues:");
    QVERIFY(timer.elapsed() < 2000);

    // Every remote call gave up and the local copy served the read.
    QVERIFY(hit.has_value());
    QCOMPARE(hit->at("name").get<std::string>(), std::string("globex"));
    QCOMPARE(cache.stats().remoteFailures, std::uint64_t(3));

    remote->release();
}

void CacheFacadeTests::testInvalidUtf8PayloadIsStored()
{
    CacheFacade cache(nullptr, CacheTtls{}, 100ms);
    const std::string broken = std::string("caf") + "\xC3";

    cache.set("issue_analysis:8", nlohmann::json{{"note", broken}}, CacheKind::IssueAnalysis);
    const auto hit = cache.get("issue_analysis:8");
    QVERIFY(hit.has_value());
    QCOMPARE(hit->at("note").get<std::string>(), std::string("caf\xEF\xBF\xBD"));
}

QTEST_MAIN(CacheFacadeTests)
#include "test_cache_facade.moc"
