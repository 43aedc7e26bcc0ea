#include "report/ReportCli.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>

#include <nlohmann/json.hpp>

#include "common/cancellation.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/models.hpp"
#include "daemon/cache_facade.hpp"
#include "daemon/sqlite_issue_store.hpp"
#include "daemon/triage_engine.hpp"

namespace triage {

namespace {

QString usageText()
{
    return QStringLiteral(
        "Usage:\n"
        "  triage-report alerts [--status Active|Acknowledged|Resolved] [--customer ID] [--format markdown|json] [--db PATH]\n"
        "  triage-report risk [--limit N] [--format markdown|json] [--db PATH]\n"
        "  triage-report history --customer ID [--format markdown|json] [--db PATH]\n"
        "  triage-report similar (--issue ID | --title TEXT --description TEXT) [--limit N] [--format markdown|json] [--db PATH]\n"
        "  triage-report classify --title TEXT --description TEXT [--format markdown|json]\n"
        "  triage-report priority --severity S --tier T --risk R [--similar N] [--format markdown|json]\n");
}

std::string prettyJson(const nlohmann::json &payload)
{
    return payload.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

QString getArgValue(const QStringList &args, const QString &key)
{
    const int idx = args.indexOf(key);
    if (idx < 0 || idx + 1 >= args.size()) {
        return {};
    }
    return args.at(idx + 1);
}

QString getFormat(const QStringList &args)
{
    const QString value = getArgValue(args, QStringLiteral("--format"));
    if (value.isEmpty()) {
        return QStringLiteral("markdown");
    }
    return value.toLower();
}

bool validFormat(const QString &format)
{
    if (format != QStringLiteral("markdown") && format != QStringLiteral("json")) {
        std::cerr << "Invalid format. Use markdown or json." << std::endl;
        return false;
    }
    return true;
}

std::optional<std::int64_t> parseId(const QString &value)
{
    bool ok = false;
    const qlonglong id = value.toLongLong(&ok);
    if (!ok || id <= 0) {
        return std::nullopt;
    }
    return static_cast<std::int64_t>(id);
}

int reportError(const TriageError &error)
{
    std::cerr << "Error (" << errorKindName(error.kind) << "): " << error.message << std::endl;
    return error.kind == ErrorKind::NotFound ? 2 : 1;
}

std::string formatHours(const std::optional<double> &hours)
{
    if (!hours) {
        return "n/a";
    }
    std::ostringstream out;
    out << std::fixed << std::setprecision(1) << *hours << "h";
    return out.str();
}

void logCommand(const QString &where, const QString &what, const nlohmann::json &context)
{
    TLOG_INFO(QStringLiteral("ReportCli"),
              where,
              what,
              QStringLiteral("user_invocation"),
              QStringLiteral("sqlite_query"),
              logging::defaultWho(),
              QString(),
              context);
}

void renderAlertsMarkdown(const std::vector<CriticalAlert> &alerts)
{
    std::cout << "# Critical Alerts\n\n";
    std::cout << "Total alerts: " << alerts.size() << "\n\n";
    if (alerts.empty()) {
        std::cout << "No alerts.\n";
        return;
    }

    for (const auto &alert : alerts) {
        std::cout << "- [" << toIso8601Utc(alert.createdAt) << "] #" << alert.id << " ("
                  << toAlertTypeString(alert.type) << ", "
                  << toSeverityString(alert.severity) << ", "
                  << toAlertStatusString(alert.status) << ") "
                  << alert.message << "\n";
        if (alert.issueId > 0) {
            std::cout << "  - issue: " << alert.issueId << "\n";
        }
        std::cout << "  - customer: " << alert.customerId << "\n";
        if (!alert.acknowledgedBy.empty()) {
            std::cout << "  - acknowledged by: " << alert.acknowledgedBy << "\n";
        }
    }
}

void renderHistoryMarkdown(const CustomerHistory &history)
{
    std::cout << "# Customer History: " << history.customer.name << "\n\n";
    std::cout << "Customer: " << history.customer.id << " (" << toTierString(history.customer.tier);
    if (!history.customer.company.empty()) {
        std::cout << ", " << history.customer.company;
    }
    std::cout << ")\n";
    std::cout << "Risk level: " << toRiskLevelString(history.riskLevel) << "\n\n";

    std::cout << "## Totals\n\n";
    std::cout << "- Issues: " << history.totalIssues << "\n";
    std::cout << "- Open: " << history.openIssues << "\n";
    std::cout << "- Resolved: " << history.resolvedIssues << "\n";
    std::cout << "- Critical: " << history.criticalIssues << "\n";
    std::cout << "- High: " << history.highIssues << "\n";
    std::cout << "- Last 30 days: " << history.recentIssues << "\n";
    std::cout << "- Average resolution: " << formatHours(history.averageResolutionHours) << "\n";
    if (history.averageSatisfaction) {
        std::cout << "- Average satisfaction: " << *history.averageSatisfaction << "\n";
    }

    std::cout << "\n## Recent Issues\n\n";
    if (history.recent.empty()) {
        std::cout << "No issues on record.\n";
        return;
    }
    for (const auto &issue : history.recent) {
        std::cout << "- [" << toIso8601Utc(issue.createdAt) << "] #" << issue.id << " ("
                  << toSeverityString(issue.severity) << ", "
                  << toStatusString(issue.status) << ") " << issue.title << "\n";
    }
}

void renderSimilarMarkdown(const std::vector<SimilarIssue> &similar)
{
    std::cout << "# Similar Resolved Issues\n\n";
    if (similar.empty()) {
        std::cout << "No similar issues above the threshold.\n";
        return;
    }
    for (const auto &item : similar) {
        std::cout << "- #" << item.issueId << " " << item.title << "\n";
        std::cout << "  - score: " << std::fixed << std::setprecision(3) << item.score << "\n";
        std::cout << "  - severity: " << toSeverityString(item.severity) << "\n";
        std::cout << "  - resolution time: " << formatHours(item.resolutionHours) << "\n";
    }
}

} // namespace

ReportCli::ReportCli()
    : m_config(loadConfig())
{
}

ReportCli::ReportCli(const TriageConfig &config)
    : m_config(config)
{
}

ReportCli::~ReportCli() = default;

int ReportCli::run(int argc, char *argv[])
{
    // CLI entry: parse the subcommand and delegate to the report handler.
    QStringList args;
    args.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        args.push_back(QString::fromLocal8Bit(argv[i]));
    }

    if (args.size() < 2) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    const QString command = args.at(1);
    TLOG_INFO(QStringLiteral("ReportCli"),
              QStringLiteral("run"),
              QStringLiteral("report_cli_command"),
              QStringLiteral("user_invocation"),
              QStringLiteral("cli"),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"command", command.toStdString()}}));

    if (command == QStringLiteral("alerts")) {
        return runAlertsReport(args);
    }
    if (command == QStringLiteral("risk")) {
        return runRiskReport(args);
    }
    if (command == QStringLiteral("history")) {
        return runHistoryReport(args);
    }
    if (command == QStringLiteral("similar")) {
        return runSimilarReport(args);
    }
    if (command == QStringLiteral("classify")) {
        return runClassifyReport(args);
    }
    if (command == QStringLiteral("priority")) {
        return runPriorityReport(args);
    }

    std::cerr << usageText().toStdString();
    return 1;
}

bool ReportCli::openEngine(const QStringList &args)
{
    if (m_engine) {
        return true;
    }

    const QString dbOverride = getArgValue(args, QStringLiteral("--db"));
    if (!dbOverride.isEmpty()) {
        m_config.databasePath = dbOverride.toStdString();
    }
    // Reports never call the language model.
    m_config.aiAnalysisEnabled = false;

    try {
        m_store = std::make_unique<SqliteIssueStore>(m_config.databasePath);
    } catch (const std::exception &ex) {
        TLOG_ERROR(QStringLiteral("ReportCli"),
                   QStringLiteral("openEngine"),
                   QStringLiteral("store_open_failed"),
                   QStringLiteral("exception"),
                   QStringLiteral("sqlite_open"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"path", m_config.databasePath}, {"what", ex.what()}}));
        std::cerr << "Failed to open database " << m_config.databasePath << ": "
                  << ex.what() << std::endl;
        return false;
    }
    m_cache = std::make_unique<CacheFacade>(nullptr, m_config.cacheTtls, m_config.cacheTimeout);
    m_engine = std::make_unique<TriageEngine>(*m_store, *m_cache, nullptr, m_config);
    return true;
}

int ReportCli::runAlertsReport(const QStringList &args)
{
    const QString format = getFormat(args);
    if (!validFormat(format)) {
        return 1;
    }

    std::optional<AlertStatus> status;
    const QString statusValue = getArgValue(args, QStringLiteral("--status"));
    if (!statusValue.isEmpty()) {
        status = parseAlertStatusString(statusValue.toStdString());
        if (!status) {
            std::cerr << "Invalid alert status." << std::endl;
            return 1;
        }
    }

    std::optional<std::int64_t> customerId;
    const QString customerValue = getArgValue(args, QStringLiteral("--customer"));
    if (!customerValue.isEmpty()) {
        customerId = parseId(customerValue);
        if (!customerId) {
            std::cerr << "Invalid customer id." << std::endl;
            return 1;
        }
    }

    if (!openEngine(args)) {
        return 1;
    }
    const auto alerts = m_engine->listAlerts(status, customerId);
    if (!alerts) {
        return reportError(alerts.error());
    }

    logCommand(QStringLiteral("runAlertsReport"),
               QStringLiteral("report_alerts"),
               nlohmann::json{{"alerts", alerts.value().size()},
                              {"format", format.toStdString()}});
    if (format == QStringLiteral("json")) {
        nlohmann::json payload;
        payload["totalAlerts"] = alerts.value().size();
        payload["alerts"] = alerts.value();
        std::cout << prettyJson(payload) << std::endl;
    } else {
        renderAlertsMarkdown(alerts.value());
    }
    return 0;
}

int ReportCli::runRiskReport(const QStringList &args)
{
    const QString format = getFormat(args);
    if (!validFormat(format)) {
        return 1;
    }

    int limit = 50;
    const QString limitValue = getArgValue(args, QStringLiteral("--limit"));
    if (!limitValue.isEmpty()) {
        bool ok = false;
        limit = limitValue.toInt(&ok);
        if (!ok || limit <= 0) {
            std::cerr << "Invalid limit." << std::endl;
            return 1;
        }
    }

    if (!openEngine(args)) {
        return 1;
    }
    const auto profiles = m_engine->customerRiskAnalysis(limit);
    if (!profiles) {
        return reportError(profiles.error());
    }

    logCommand(QStringLiteral("runRiskReport"),
               QStringLiteral("report_risk"),
               nlohmann::json{{"customers", profiles.value().size()},
                              {"format", format.toStdString()}});
    if (format == QStringLiteral("json")) {
        nlohmann::json payload;
        payload["customers"] = profiles.value();
        std::cout << prettyJson(payload) << std::endl;
        return 0;
    }

    std::cout << "# Customer Risk Dashboard\n\n";
    if (profiles.value().empty()) {
        std::cout << "No customers with issues.\n";
        return 0;
    }
    int rank = 1;
    for (const auto &profile : profiles.value()) {
        const CustomerHistory &history = profile.history;
        std::cout << rank++ << ". " << history.customer.name << " (#" << history.customer.id
                  << ", " << toTierString(history.customer.tier) << ") risk "
                  << std::fixed << std::setprecision(2) << profile.risk.score << " "
                  << toRiskLevelString(profile.risk.level) << "\n";
        std::cout << "   - critical: " << history.criticalIssues
                  << ", high: " << history.highIssues
                  << ", last 30 days: " << history.recentIssues
                  << ", open: " << history.openIssues << "\n";
    }
    return 0;
}

int ReportCli::runHistoryReport(const QStringList &args)
{
    const auto customerId = parseId(getArgValue(args, QStringLiteral("--customer")));
    if (!customerId) {
        std::cerr << usageText().toStdString();
        return 1;
    }
    const QString format = getFormat(args);
    if (!validFormat(format)) {
        return 1;
    }

    if (!openEngine(args)) {
        return 1;
    }
    const auto history = m_engine->customerHistory(*customerId);
    if (!history) {
        return reportError(history.error());
    }

    logCommand(QStringLiteral("runHistoryReport"),
               QStringLiteral("report_history"),
               nlohmann::json{{"customerId", *customerId},
                              {"format", format.toStdString()}});
    if (format == QStringLiteral("json")) {
        std::cout << prettyJson(nlohmann::json(history.value())) << std::endl;
    } else {
        renderHistoryMarkdown(history.value());
    }
    return 0;
}

int ReportCli::runSimilarReport(const QStringList &args)
{
    const QString format = getFormat(args);
    if (!validFormat(format)) {
        return 1;
    }

    int limit = m_config.similarLimit;
    const QString limitValue = getArgValue(args, QStringLiteral("--limit"));
    if (!limitValue.isEmpty()) {
        bool ok = false;
        limit = limitValue.toInt(&ok);
        if (!ok) {
            std::cerr << "Invalid limit." << std::endl;
            return 1;
        }
    }

    const QString issueValue = getArgValue(args, QStringLiteral("--issue"));
    const QString title = getArgValue(args, QStringLiteral("--title"));
    const QString description = getArgValue(args, QStringLiteral("--description"));
    if (issueValue.isEmpty() && title.isEmpty() && description.isEmpty()) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    if (!openEngine(args)) {
        return 1;
    }

    CancellationToken cancel;
    Outcome<std::vector<SimilarIssue>> similar = std::vector<SimilarIssue>{};
    if (!issueValue.isEmpty()) {
        const auto issueId = parseId(issueValue);
        if (!issueId) {
            std::cerr << "Invalid issue id." << std::endl;
            return 1;
        }
        similar = m_engine->rankSimilarIssue(*issueId, limit, cancel);
    } else {
        similar = m_engine->rankSimilarText(title.toStdString(),
                                            description.toStdString(),
                                            limit,
                                            cancel);
    }
    if (!similar) {
        return reportError(similar.error());
    }

    logCommand(QStringLiteral("runSimilarReport"),
               QStringLiteral("report_similar"),
               nlohmann::json{{"matches", similar.value().size()},
                              {"format", format.toStdString()}});
    if (format == QStringLiteral("json")) {
        nlohmann::json payload;
        payload["similarIssues"] = similar.value();
        std::cout << prettyJson(payload) << std::endl;
    } else {
        renderSimilarMarkdown(similar.value());
    }
    return 0;
}

int ReportCli::runClassifyReport(const QStringList &args)
{
    const QString title = getArgValue(args, QStringLiteral("--title"));
    const QString description = getArgValue(args, QStringLiteral("--description"));
    if (title.isEmpty() && description.isEmpty()) {
        std::cerr << usageText().toStdString();
        return 1;
    }
    const QString format = getFormat(args);
    if (!validFormat(format)) {
        return 1;
    }

    if (!openEngine(args)) {
        return 1;
    }
    CancellationToken cancel;
    const auto decision = m_engine->classify(title.toStdString(), description.toStdString(), cancel);
    if (!decision) {
        return reportError(decision.error());
    }

    logCommand(QStringLiteral("runClassifyReport"),
               QStringLiteral("report_classify"),
               nlohmann::json{{"severity", toSeverityString(decision.value().severity)},
                              {"format", format.toStdString()}});
    if (format == QStringLiteral("json")) {
        std::cout << prettyJson(nlohmann::json(decision.value())) << std::endl;
        return 0;
    }

    const SeverityDecision &result = decision.value();
    std::cout << "# Severity Classification\n\n";
    std::cout << "Severity: " << toSeverityString(result.severity) << "\n";
    std::cout << "Source: " << toSeveritySourceString(result.source) << "\n\n";
    std::cout << "## Keyword Scores\n\n";
    for (int i = 0; i < 4; ++i) {
        std::cout << "- " << toSeverityString(static_cast<Severity>(i)) << ": "
                  << std::fixed << std::setprecision(3) << result.scores[i] << "\n";
    }
    return 0;
}

int ReportCli::runPriorityReport(const QStringList &args)
{
    const auto severity = parseSeverityString(getArgValue(args, QStringLiteral("--severity")).toStdString());
    const auto tier = parseTierString(getArgValue(args, QStringLiteral("--tier")).toStdString());
    const auto risk = parseRiskLevelString(getArgValue(args, QStringLiteral("--risk")).toStdString());
    if (!severity || !tier || !risk) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    int similarCount = 0;
    const QString similarValue = getArgValue(args, QStringLiteral("--similar"));
    if (!similarValue.isEmpty()) {
        bool ok = false;
        similarCount = similarValue.toInt(&ok);
        if (!ok || similarCount < 0) {
            std::cerr << "Invalid similar count." << std::endl;
            return 1;
        }
    }
    const QString format = getFormat(args);
    if (!validFormat(format)) {
        return 1;
    }

    const int priority = TriageEngine::scorePriority(*severity, *tier, *risk,
                                                     static_cast<std::size_t>(similarCount));
    if (format == QStringLiteral("json")) {
        nlohmann::json payload;
        payload["severity"] = *severity;
        payload["tier"] = *tier;
        payload["riskLevel"] = *risk;
        payload["similarCount"] = similarCount;
        payload["priority"] = priority;
        std::cout << prettyJson(payload) << std::endl;
    } else {
        std::cout << "# Priority\n\n";
        std::cout << "Priority: " << priority << " (10 is most urgent)\n";
    }
    return 0;
}

} // namespace triage
