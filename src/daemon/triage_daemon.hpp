#pragma once

#include <memory>

#include <QObject>
#include <QTimer>

#include "common/config.hpp"

namespace triage {

class CacheFacade;
class HttpCompletionClient;
class SqliteIssueStore;
class TriageApiServer;
class TriageEngine;

/**
 * TriageDaemon coordinates:
 * - the SQLite issue store, the cache facade and the completion client
 * - the triage engine and its local-socket API
 * - periodic housekeeping (resolved alert purge, local cache sweep)
 *
 * It is designed to be owned from main() and driven by Qt's event loop.
 */
class TriageDaemon : public QObject
{
    Q_OBJECT
public:
    // Opens the store; throws std::runtime_error when the database is unusable.
    explicit TriageDaemon(const TriageConfig &config, QObject *parent = nullptr);
    ~TriageDaemon() override;

    // Starts the API server and the housekeeping timer.
    bool start();
    void stop();

private slots:
    void runHousekeeping();

private:
    TriageConfig m_config;
    std::unique_ptr<SqliteIssueStore> m_store;
    std::unique_ptr<CacheFacade> m_cache;
    std::unique_ptr<HttpCompletionClient> m_model;
    std::unique_ptr<TriageEngine> m_engine;
    std::unique_ptr<TriageApiServer> m_apiServer;
    QTimer m_housekeepingTimer;
};

} // namespace triage
