#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "common/cancellation.hpp"
#include "common/config.hpp"
#include "common/models.hpp"
#include "common/triage_error.hpp"
#include "daemon/cache_facade.hpp"
#include "daemon/completion_client.hpp"
#include "daemon/critical_condition_detector.hpp"
#include "daemon/customer_history.hpp"
#include "daemon/insight_generator.hpp"
#include "daemon/issue_store.hpp"
#include "daemon/severity_classifier.hpp"
#include "daemon/similarity_ranker.hpp"

namespace triage {

// TriageEngine runs the intake pipeline for new issues and exposes each
// component as its own operation. Collaborators are injected; the engine owns
// none of them.
class TriageEngine {
public:
    using NowFn = std::function<TimePoint()>;

    TriageEngine(IssueStore &store,
                 CacheFacade &cache,
                 CompletionClient *model,
                 const TriageConfig &config,
                 NowFn now = NowFn());

    // classify -> insert -> similar -> detect -> insights -> priority -> update.
    Outcome<TriageReport> analyzeNewIssue(const NewIssueRequest &request,
                                          const CancellationToken &cancel);

    Outcome<SeverityDecision> classify(const std::string &title,
                                       const std::string &description,
                                       const CancellationToken &cancel) const;

    Outcome<std::vector<SimilarIssue>> rankSimilarText(const std::string &title,
                                                       const std::string &description,
                                                       int limit,
                                                       const CancellationToken &cancel) const;
    Outcome<std::vector<SimilarIssue>> rankSimilarIssue(std::int64_t issueId,
                                                        int limit,
                                                        const CancellationToken &cancel);

    Outcome<RiskAssessment> scoreRisk(std::int64_t customerId, RiskPolicy policy);
    static int scorePriority(Severity severity,
                             CustomerTier tier,
                             RiskLevel historyRisk,
                             std::size_t similarCount);
    Outcome<std::vector<CriticalAlert>> detectCriticalConditions(std::int64_t customerId,
                                                                 const CancellationToken &cancel);

    Outcome<CustomerHistory> customerHistory(std::int64_t customerId);
    // Dashboard policy, customers with at least one issue, most troubled first.
    Outcome<std::vector<CustomerRiskProfile>> customerRiskAnalysis(int limit = 50);

    Outcome<Issue> getIssue(std::int64_t issueId);
    Outcome<std::vector<Issue>> listIssues(const IssueFilter &filter);
    Outcome<Issue> updateIssueStatus(std::int64_t issueId, IssueStatus status);
    Outcome<IssueResolution> addResolution(const IssueResolution &resolution);

    Outcome<std::vector<CriticalAlert>> listAlerts(std::optional<AlertStatus> status,
                                                   std::optional<std::int64_t> customerId);
    Outcome<CriticalAlert> acknowledgeAlert(std::int64_t alertId, const std::string &actor);
    Outcome<CriticalAlert> resolveAlert(std::int64_t alertId);

    // Housekeeping.
    Outcome<int> purgeResolvedAlerts();
    int sweepCache();

    const TriageConfig &config() const;

private:
    IssueStore &m_store;
    CacheFacade &m_cache;
    TriageConfig m_config;
    NowFn m_now;

    SeverityClassifier m_classifier;
    SimilarityRanker m_ranker;
    CriticalConditionDetector m_detector;
    InsightGenerator m_insights;
    CustomerHistoryService m_history;

    void recordSimilarBestEffort(std::int64_t issueId, const std::vector<SimilarIssue> &similar);
};

} // namespace triage
