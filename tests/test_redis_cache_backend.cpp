#include <QtTest/QtTest>

#include <chrono>
#include <memory>

#include "daemon/cache_facade.hpp"
#include "daemon/redis_cache_backend.hpp"

using namespace std::chrono_literals;

using triage::CacheFacade;
using triage::CacheKind;
using triage::CacheTtls;
using triage::ErrorKind;
using triage::RedisCacheBackend;

namespace {

// Nothing listens on port 1, so every command fails fast.
RedisCacheBackend::Options unreachable()
{
    RedisCacheBackend::Options options;
    options.host = "127.0.0.1";
    options.port = 1;
    options.timeout = 200ms;
    return options;
}

} // namespace

class RedisCacheBackendTests : public QObject
{
    Q_OBJECT
private slots:
    void testOptionsFromConfig();
    void testUnreachableServerIsCollaboratorUnavailable();
    void testFacadeFallsBackWhenRedisIsDown();
};

void RedisCacheBackendTests::testOptionsFromConfig()
{
    triage::TriageConfig config;
    config.redisHost = "cache.internal";
    config.redisPort = 6380;
    config.redisPassword = "pw";
    config.redisDb = 3;
    config.cacheTimeout = 750ms;

    const auto options = RedisCacheBackend::optionsFromConfig(config);
    QCOMPARE(options.host, std::string("cache.internal"));
    QCOMPARE(options.port, 6380);
    QCOMPARE(options.password, std::string("pw"));
    QCOMPARE(options.db, 3);
    QCOMPARE(options.timeout, std::chrono::milliseconds(750));
}

void RedisCacheBackendTests::testUnreachableServerIsCollaboratorUnavailable()
{
    RedisCacheBackend redis(unreachable());

    const auto pong = redis.ping();
    QVERIFY(!pong.ok());
    QCOMPARE(pong.error().kind, ErrorKind::CollaboratorUnavailable);

    const auto value = redis.get("customer:1", 200ms);
    QVERIFY(!value.ok());
    QCOMPARE(value.error().kind, ErrorKind::CollaboratorUnavailable);

    const auto removed = redis.removePrefix("similar_issues:", 200ms);
    QVERIFY(!removed.ok());
}

void RedisCacheBackendTests::testFacadeFallsBackWhenRedisIsDown()
{
    CacheFacade cache(std::make_shared<RedisCacheBackend>(unreachable()), CacheTtls{}, 1s);
    QVERIFY(cache.hasRemote());

    cache.set("customer:2", nlohmann::json{{"name", "initech"}}, CacheKind::Customer);
    const auto hit = cache.get("customer:2");
    QVERIFY(hit.has_value());
    QCOMPARE(hit->at("name").get<std::string>(), std::string("initech"));
    QCOMPARE(cache.stats().remoteFailures, std::uint64_t(2));
}

QTEST_MAIN(RedisCacheBackendTests)
#include "test_redis_cache_backend.moc"
