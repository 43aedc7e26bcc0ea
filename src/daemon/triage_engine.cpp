#include "daemon/triage_engine.hpp"

#include <algorithm>
#include <chrono>
#include <utility>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "daemon/priority_scorer.hpp"
#include "daemon/recommendation_builder.hpp"
#include "daemon/risk_scorer.hpp"

namespace triage {

namespace {

bool isBlank(const std::string &value)
{
    return value.find_first_not_of(" \t\r\n") == std::string::npos;
}

TriageError cancelled(const char *stage)
{
    return makeError(ErrorKind::Cancelled, std::string("triage cancelled before ") + stage);
}

SimilarityOptions similarityOptions(const TriageConfig &config)
{
    SimilarityOptions options;
    options.corpusLimit = config.corpusLimit;
    options.maxFeatures = config.maxFeatures;
    options.threshold = config.similarityThreshold;
    options.storeTimeout = config.storeTimeout;
    return options;
}

void logStageFallback(const char *stage, const TriageError &error)
{
    TLOG_WARN(QStringLiteral("TriageEngine"),
              QStringLiteral("analyzeNewIssue"),
              QStringLiteral("stage_degraded"),
              QString::fromStdString(errorKindName(error.kind)),
              QString::fromUtf8(stage),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"error", error.message}}));
}

int dashboardRank(const CustomerHistory &history)
{
    return history.criticalIssues * 3 + history.highIssues * 2 + history.recentIssues;
}

} // namespace

TriageEngine::TriageEngine(IssueStore &store,
                           CacheFacade &cache,
                           CompletionClient *model,
                           const TriageConfig &config,
                           NowFn now)
    : m_store(store)
    , m_cache(cache)
    , m_config(config)
    , m_now(now ? std::move(now) : NowFn([]() { return std::chrono::system_clock::now(); }))
    , m_classifier(model, config.aiAnalysisEnabled, config.llmTimeout)
    , m_ranker(store, similarityOptions(config))
    , m_detector(store)
    , m_insights(model, config.aiAnalysisEnabled, config.llmTimeout)
    , m_history(store, cache)
{
}

Outcome<TriageReport> TriageEngine::analyzeNewIssue(const NewIssueRequest &request,
                                                    const CancellationToken &cancel)
{
    const auto started = std::chrono::steady_clock::now();

    if (request.customerId <= 0) {
        return makeError(ErrorKind::InvalidInput, "customerId is required");
    }
    if (isBlank(request.title) || isBlank(request.description)) {
        return makeError(ErrorKind::InvalidInput, "title and description are required");
    }
    if (cancel.isCancelled()) {
        return cancelled("customer lookup");
    }

    const TimePoint now = m_now();
    auto history = m_history.load(request.customerId, now);
    if (!history) {
        return history.error();
    }

    if (cancel.isCancelled()) {
        return cancelled("classification");
    }
    auto severity = m_classifier.classify(request.title, request.description, cancel);
    if (!severity) {
        return severity.error();
    }

    if (cancel.isCancelled()) {
        return cancelled("issue insert");
    }
    Issue issue;
    issue.customerId = request.customerId;
    issue.title = request.title;
    issue.description = request.description;
    issue.category = request.category;
    issue.productArea = request.productArea;
    issue.severity = severity.value().severity;
    issue.status = IssueStatus::Open;
    issue.createdAt = now;
    issue.updatedAt = now;
    auto inserted = m_store.insertIssue(issue);
    if (!inserted) {
        return inserted.error();
    }
    const std::int64_t issueId = inserted.value().id;
    m_history.invalidate(request.customerId);

    TriageReport report;
    report.issueId = issueId;
    report.severity = severity.value();
    report.history = history.value();

    if (m_config.similaritySearchEnabled) {
        if (cancel.isCancelled()) {
            return cancelled("similarity ranking");
        }
        auto similar = m_ranker.rankText(request.title, request.description,
                                         m_config.similarLimit, cancel);
        if (!similar) {
            if (similar.error().kind == ErrorKind::Cancelled) {
                return similar.error();
            }
            logStageFallback("similarity", similar.error());
        } else {
            report.similarIssues = similar.value();
            for (auto &entry : report.similarIssues) {
                entry.sourceIssueId = issueId;
            }
            recordSimilarBestEffort(issueId, report.similarIssues);
            m_cache.set(cacheKey(CacheKind::SimilarIssues, issueId),
                        nlohmann::json(report.similarIssues), CacheKind::SimilarIssues);
        }
    }

    if (cancel.isCancelled()) {
        return cancelled("critical condition detection");
    }
    auto alerts = m_detector.detect(request.customerId, now, cancel);
    if (!alerts) {
        if (alerts.error().kind == ErrorKind::Cancelled) {
            return alerts.error();
        }
        logStageFallback("detection", alerts.error());
    } else {
        report.alerts = alerts.value();
    }

    auto insights = m_insights.generate(request.title, request.description,
                                        report.similarIssues, cancel);
    if (!insights) {
        return insights.error();
    }
    report.insights = insights.value();

    const CustomerTier tier = report.history.customer.tier;
    report.priority = PriorityScorer::score(report.severity.severity, tier,
                                            report.history.riskLevel,
                                            report.similarIssues.size());

    if (cancel.isCancelled()) {
        return cancelled("analysis update");
    }
    TagMap tags;
    tags["ai_analyzed"] = true;
    tags["estimated_resolution_hours"] = report.insights.estimatedHours;
    tags["priority_score"] = static_cast<std::int64_t>(report.priority);
    auto updated = m_store.updateIssueAnalysis(issueId, report.severity.severity,
                                               report.priority, tags);
    if (!updated) {
        return updated.error();
    }

    report.recommendations = buildRecommendations(report.severity.severity,
                                                  report.similarIssues,
                                                  report.history.riskLevel);
    report.analysisMs = std::chrono::duration_cast<std::chrono::milliseconds>(
                            std::chrono::steady_clock::now() - started)
                            .count();

    m_cache.set(cacheKey(CacheKind::IssueAnalysis, issueId), nlohmann::json(report),
                CacheKind::IssueAnalysis);

    TLOG_INFO(QStringLiteral("TriageEngine"),
              QStringLiteral("analyzeNewIssue"),
              QStringLiteral("issue_analyzed"),
              QStringLiteral("intake"),
              QStringLiteral("pipeline"),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"issueId", issueId},
                              {"customerId", request.customerId},
                              {"severity", toSeverityString(report.severity.severity)},
                              {"severitySource", toSeveritySourceString(report.severity.source)},
                              {"priority", report.priority},
                              {"similar", report.similarIssues.size()},
                              {"alerts", report.alerts.size()},
                              {"durationMs", report.analysisMs}}));
    return report;
}

Outcome<SeverityDecision> TriageEngine::classify(const std::string &title,
                                                 const std::string &description,
                                                 const CancellationToken &cancel) const
{
    if (isBlank(title) && isBlank(description)) {
        return makeError(ErrorKind::InvalidInput, "title or description is required");
    }
    return m_classifier.classify(title, description, cancel);
}

Outcome<std::vector<SimilarIssue>> TriageEngine::rankSimilarText(const std::string &title,
                                                                 const std::string &description,
                                                                 int limit,
                                                                 const CancellationToken &cancel) const
{
    return m_ranker.rankText(title, description, limit, cancel);
}

Outcome<std::vector<SimilarIssue>> TriageEngine::rankSimilarIssue(std::int64_t issueId,
                                                                  int limit,
                                                                  const CancellationToken &cancel)
{
    // Only the default-sized list is memoised.
    const bool cacheable = limit == m_config.similarLimit;
    const std::string key = cacheKey(CacheKind::SimilarIssues, issueId);
    if (cacheable) {
        if (auto cached = m_cache.get(key)) {
            try {
                return cached->get<std::vector<SimilarIssue>>();
            } catch (const nlohmann::json::exception &) {
                m_cache.invalidate(key);
            }
        }
    }

    auto ranked = m_ranker.rankForIssue(issueId, limit, cancel);
    if (ranked && cacheable) {
        m_cache.set(key, nlohmann::json(ranked.value()), CacheKind::SimilarIssues);
    }
    return ranked;
}

Outcome<RiskAssessment> TriageEngine::scoreRisk(std::int64_t customerId, RiskPolicy policy)
{
    auto history = m_history.load(customerId, m_now());
    if (!history) {
        return history.error();
    }
    return RiskScorer::score(history.value(), policy);
}

int TriageEngine::scorePriority(Severity severity,
                                CustomerTier tier,
                                RiskLevel historyRisk,
                                std::size_t similarCount)
{
    return PriorityScorer::score(severity, tier, historyRisk, similarCount);
}

Outcome<std::vector<CriticalAlert>> TriageEngine::detectCriticalConditions(
    std::int64_t customerId,
    const CancellationToken &cancel)
{
    auto owner = m_history.customer(customerId);
    if (!owner) {
        return owner.error();
    }
    return m_detector.detect(customerId, m_now(), cancel);
}

Outcome<CustomerHistory> TriageEngine::customerHistory(std::int64_t customerId)
{
    return m_history.load(customerId, m_now());
}

Outcome<std::vector<CustomerRiskProfile>> TriageEngine::customerRiskAnalysis(int limit)
{
    auto customers = m_store.listCustomers();
    if (!customers) {
        return customers.error();
    }

    const TimePoint now = m_now();
    std::vector<CustomerRiskProfile> profiles;
    for (const auto &customer : customers.value()) {
        auto history = m_history.load(customer.id, now);
        if (!history) {
            return history.error();
        }
        if (history.value().totalIssues == 0) {
            continue;
        }
        CustomerRiskProfile profile;
        profile.history = history.value();
        profile.risk = RiskScorer::scoreDashboard(profile.history);
        profiles.push_back(std::move(profile));
    }

    std::stable_sort(profiles.begin(), profiles.end(),
                     [](const CustomerRiskProfile &a, const CustomerRiskProfile &b) {
                         return dashboardRank(a.history) > dashboardRank(b.history);
                     });
    if (limit > 0 && profiles.size() > static_cast<std::size_t>(limit)) {
        profiles.resize(static_cast<std::size_t>(limit));
    }
    return profiles;
}

Outcome<Issue> TriageEngine::getIssue(std::int64_t issueId)
{
    if (issueId <= 0) {
        return makeError(ErrorKind::InvalidInput, "issue id must be positive");
    }
    return m_store.getIssue(issueId);
}

Outcome<std::vector<Issue>> TriageEngine::listIssues(const IssueFilter &filter)
{
    return m_store.listIssues(filter);
}

Outcome<Issue> TriageEngine::updateIssueStatus(std::int64_t issueId, IssueStatus status)
{
    if (issueId <= 0) {
        return makeError(ErrorKind::InvalidInput, "issue id must be positive");
    }
    auto updated = m_store.updateIssueStatus(issueId, status, m_now());
    if (!updated) {
        return updated.error();
    }

    m_history.invalidate(updated.value().customerId);
    m_cache.invalidate(cacheKey(CacheKind::IssueAnalysis, issueId));
    // The resolved corpus may have changed, so every memoised ranking is stale.
    m_cache.invalidatePrefix(cacheKindPrefix(CacheKind::SimilarIssues) + ":");

    TLOG_INFO(QStringLiteral("TriageEngine"),
              QStringLiteral("updateIssueStatus"),
              QStringLiteral("issue_status_changed"),
              QStringLiteral("request"),
              QStringLiteral("store_update"),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"issueId", issueId}, {"status", toStatusString(status)}}));
    return updated;
}

Outcome<IssueResolution> TriageEngine::addResolution(const IssueResolution &resolution)
{
    auto issue = getIssue(resolution.issueId);
    if (!issue) {
        return issue.error();
    }
    auto added = m_store.addResolution(resolution);
    if (added) {
        m_history.invalidate(issue.value().customerId);
    }
    return added;
}

Outcome<std::vector<CriticalAlert>> TriageEngine::listAlerts(std::optional<AlertStatus> status,
                                                             std::optional<std::int64_t> customerId)
{
    return m_store.listAlerts(status, customerId);
}

Outcome<CriticalAlert> TriageEngine::acknowledgeAlert(std::int64_t alertId, const std::string &actor)
{
    if (alertId <= 0) {
        return makeError(ErrorKind::InvalidInput, "alert id must be positive");
    }
    if (isBlank(actor)) {
        return makeError(ErrorKind::InvalidInput, "acknowledging actor is required");
    }
    return m_store.acknowledgeAlert(alertId, actor, m_now());
}

Outcome<CriticalAlert> TriageEngine::resolveAlert(std::int64_t alertId)
{
    if (alertId <= 0) {
        return makeError(ErrorKind::InvalidInput, "alert id must be positive");
    }
    return m_store.resolveAlert(alertId, m_now());
}

Outcome<int> TriageEngine::purgeResolvedAlerts()
{
    const TimePoint cutoff = m_now() - m_config.alertRetention;
    return m_store.purgeResolvedAlertsBefore(cutoff);
}

int TriageEngine::sweepCache()
{
    return m_cache.sweepLocal();
}

const TriageConfig &TriageEngine::config() const
{
    return m_config;
}

void TriageEngine::recordSimilarBestEffort(std::int64_t issueId,
                                           const std::vector<SimilarIssue> &similar)
{
    if (similar.empty()) {
        return;
    }
    auto recorded = m_store.recordSimilarIssues(issueId, similar);
    if (!recorded) {
        logStageFallback("similar_cross_reference", recorded.error());
    }
}

} // namespace triage
