#include "daemon/triage_daemon.hpp"

#include <chrono>
#include <memory>

#include <QDebug>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"
#include "daemon/cache_facade.hpp"
#include "daemon/http_completion_client.hpp"
#ifdef TRIAGE_HAVE_REDIS
#include "daemon/redis_cache_backend.hpp"
#endif
#include "daemon/sqlite_issue_store.hpp"
#include "daemon/triage_api_server.hpp"
#include "daemon/triage_engine.hpp"

namespace triage {

namespace {

std::shared_ptr<CacheBackend> makeRemoteCache(const TriageConfig &config)
{
    if (config.redisHost.empty()) {
        return nullptr;
    }
#ifdef TRIAGE_HAVE_REDIS
    auto redis = std::make_shared<RedisCacheBackend>(RedisCacheBackend::optionsFromConfig(config));
    const auto reachable = redis->ping();
    if (!reachable) {
        // The facade serves locally until Redis answers again.
        TLOG_WARN(QStringLiteral("TriageDaemon"),
                  QStringLiteral("makeRemoteCache"),
                  QStringLiteral("redis_unreachable"),
                  QString::fromStdString(reachable.error().message),
                  QStringLiteral("local_fallback"),
                  logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"host", config.redisHost}, {"port", config.redisPort}}));
    }
    return redis;
#else
    TLOG_WARN(QStringLiteral("TriageDaemon"),
              QStringLiteral("makeRemoteCache"),
              QStringLiteral("redis_support_missing"),
              QStringLiteral("built_without_redis"),
              QStringLiteral("local_cache_only"),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"host", config.redisHost}}));
    return nullptr;
#endif
}

} // namespace

TriageDaemon::TriageDaemon(const TriageConfig &config, QObject *parent)
    : QObject(parent)
    , m_config(config)
    , m_store(std::make_unique<SqliteIssueStore>(config.databasePath))
    , m_cache(std::make_unique<CacheFacade>(makeRemoteCache(config),
                                            config.cacheTtls,
                                            config.cacheTimeout))
{
    std::string integrityMessage;
    if (!m_store->integrityCheck(&integrityMessage)) {
        qWarning() << "Triage: SQLite integrity check failed, database may be corrupt:"
                   << QString::fromStdString(integrityMessage);
    }

    CompletionClient *model = nullptr;
    if (m_config.aiAnalysisEnabled) {
        m_model = std::make_unique<HttpCompletionClient>(m_config.completionUrl,
                                                         m_config.completionPath,
                                                         m_config.completionModel,
                                                         m_config.completionApiKey);
        if (m_model->hasCredentials()) {
            model = m_model.get();
        } else {
            TLOG_WARN(QStringLiteral("TriageDaemon"),
                      QStringLiteral("TriageDaemon"),
                      QStringLiteral("completion_disabled"),
                      QStringLiteral("missing_api_key"),
                      QStringLiteral("keyword_only"),
                      logging::defaultWho(),
                      QString(),
                      (nlohmann::json{{"url", m_config.completionUrl}}));
        }
    }

    m_engine = std::make_unique<TriageEngine>(*m_store, *m_cache, model, m_config);

    m_housekeepingTimer.setInterval(
        std::chrono::duration_cast<std::chrono::milliseconds>(m_config.housekeepingInterval)
            .count());
    connect(&m_housekeepingTimer, &QTimer::timeout, this, &TriageDaemon::runHousekeeping);
}

TriageDaemon::~TriageDaemon()
{
    stop();
}

bool TriageDaemon::start()
{
    qInfo() << "Triage: daemon starting, database" << QString::fromStdString(m_config.databasePath);

    if (!m_apiServer) {
        m_apiServer = std::make_unique<TriageApiServer>(*m_engine);
        if (!m_apiServer->start()) {
            m_apiServer.reset();
            return false;
        }
    }

    if (m_config.housekeepingInterval.count() > 0) {
        m_housekeepingTimer.start();
    }
    runHousekeeping();
    return true;
}

void TriageDaemon::stop()
{
    m_housekeepingTimer.stop();
    if (m_apiServer) {
        m_apiServer->shutdown();
    }
}

void TriageDaemon::runHousekeeping()
{
    const auto purged = m_engine->purgeResolvedAlerts();
    const int swept = m_engine->sweepCache();
    if (!purged) {
        TLOG_WARN(QStringLiteral("TriageDaemon"),
                  QStringLiteral("runHousekeeping"),
                  QStringLiteral("alert_purge_failed"),
                  QString::fromStdString(errorKindName(purged.error().kind)),
                  QStringLiteral("sqlite"),
                  logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"error", purged.error().message}}));
    }

    const CacheStats stats = m_cache->stats();
    TLOG_INFO(QStringLiteral("TriageDaemon"),
              QStringLiteral("runHousekeeping"),
              QStringLiteral("housekeeping_done"),
              QStringLiteral("timer"),
              QStringLiteral("scheduled"),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"alertsPurged", purged.valueOr(0)},
                              {"cacheEntriesSwept", swept},
                              {"cacheHits", stats.hits},
                              {"cacheMisses", stats.misses},
                              {"cacheRemoteFailures", stats.remoteFailures}}));
}

} // namespace triage
