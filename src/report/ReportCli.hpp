#pragma once

#include <memory>
#include <optional>

#include <QString>
#include <QStringList>

#include "common/config.hpp"

namespace triage {

class CacheFacade;
class SqliteIssueStore;
class TriageEngine;

class ReportCli
{
public:
    ReportCli();
    explicit ReportCli(const TriageConfig &config);
    ~ReportCli();

    // CLI dispatcher for offline triage reports.
    // returns exit code
    int run(int argc, char *argv[]);

private:
    // Each subcommand reads from SQLite and renders output in the chosen format.
    int runAlertsReport(const QStringList &args);
    int runRiskReport(const QStringList &args);
    int runHistoryReport(const QStringList &args);
    int runSimilarReport(const QStringList &args);
    int runClassifyReport(const QStringList &args);
    int runPriorityReport(const QStringList &args);

    // Opens the store named by --db (or the configured path) with AI analysis off.
    bool openEngine(const QStringList &args);

    TriageConfig m_config;
    std::unique_ptr<SqliteIssueStore> m_store;
    std::unique_ptr<CacheFacade> m_cache;
    std::unique_ptr<TriageEngine> m_engine;
};

} // namespace triage
