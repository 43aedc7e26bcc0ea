#include <QtTest/QtTest>

#include <algorithm>
#include <chrono>

#include "daemon/cache_facade.hpp"
#include "daemon/triage_engine.hpp"
#include "support/fake_collaborators.hpp"

using namespace std::chrono_literals;

using triage::AlertStatus;
using triage::AlertType;
using triage::CacheFacade;
using triage::CacheKind;
using triage::CacheTtls;
using triage::CancellationToken;
using triage::CustomerTier;
using triage::ErrorKind;
using triage::IssueStatus;
using triage::NewIssueRequest;
using triage::RiskLevel;
using triage::RiskPolicy;
using triage::Severity;
using triage::SeveritySource;
using triage::TimePoint;
using triage::TriageConfig;
using triage::TriageEngine;
using triage::testing::InMemoryIssueStore;
using triage::testing::ScriptedCompletionClient;

namespace {

const TimePoint kNow = std::chrono::system_clock::from_time_t(1760000000);

const char *kInsightsReply =
    R"({"root_cause":"Mail queue backlog","resolution_approach":"Flush the queue",)"
    R"("estimated_time_hours":3.5,"escalation_triggers":["Backlog over 1h"],)"
    R"("communication_strategy":"Hourly updates"})";

bool contains(const std::vector<std::string> &values, const std::string &value)
{
    return std::find(values.begin(), values.end(), value) != values.end();
}

// Bundles the collaborators an engine borrows so each test gets a fresh set.
struct Harness {
    InMemoryIssueStore store;
    ScriptedCompletionClient model;
    CacheFacade cache{nullptr, CacheTtls{}, 50ms};
    TriageConfig config;
    TimePoint now = kNow;

    TriageEngine engine(bool withModel = true)
    {
        return TriageEngine(store, cache, withModel ? &model : nullptr, config,
                            [this]() { return now; });
    }
};

NewIssueRequest request(std::int64_t customerId, const std::string &title, const std::string &description)
{
    NewIssueRequest req;
    req.customerId = customerId;
    req.title = title;
    req.description = description;
    return req;
}

} // namespace

class TriageEngineTests : public QObject
{
    Q_OBJECT
private slots:
    void testPipelineProducesReport();
    void testInvalidRequestWritesNothing();
    void testCancelBeforeInsertWritesNothing();
    void testCancelAfterInsertKeepsIssue();
    void testDegradedStagesStillProduceReport();
    void testAnalysisUpdateFailureIsReported();
    void testFreeTextInsightReplyIsCachedIntact();
    void testHistoryCachedUntilStatusChange();
    void testSimilarRankingCachedForDefaultLimit();
    void testCustomerRiskAnalysisOrdersByTrouble();
    void testAlertLifecycleAndPurge();
    void testResolutionRefreshesSatisfaction();
    void testScoreRiskUnknownCustomer();
};

void TriageEngineTests::testPipelineProducesReport()
{
    Harness h;
    const auto customer = h.store.addCustomer("acme", CustomerTier::Enterprise);
    const auto precedent = h.store.addIssue(customer.id, "Password reset email not arriving",
                                            "Users never receive the reset email",
                                            Severity::High, IssueStatus::Resolved, kNow - 48h, 6.0);
    h.store.addIssue(customer.id, "Invoice totals wrong", "Totals on the March invoice are wrong",
                     Severity::Normal, IssueStatus::Resolved, kNow - 72h, 2.0);
    h.model.replies.push_back(std::string("High"));
    h.model.replies.push_back(std::string(kInsightsReply));

    auto engine = h.engine();
    CancellationToken cancel;
    const auto result = engine.analyzeNewIssue(
        request(customer.id, "Password reset email delayed", "Reset email not arriving for users"),
        cancel);
    QVERIFY(result.ok());
    const auto &report = result.value();

    QCOMPARE(report.severity.severity, Severity::High);
    QCOMPARE(report.severity.source, SeveritySource::Model);
    QCOMPARE(h.model.prompts.size(), std::size_t(2));
    QVERIFY(h.model.prompts[0].find("classify its severity") != std::string::npos);
    QVERIFY(h.model.prompts[1].find("Password reset email not arriving") != std::string::npos);

    QCOMPARE(report.similarIssues.size(), std::size_t(1));
    QCOMPARE(report.similarIssues[0].issueId, precedent.id);
    QCOMPARE(report.similarIssues[0].sourceIssueId, report.issueId);
    QCOMPARE(h.store.similarBySource[report.issueId].size(), std::size_t(1));

    QVERIFY(report.alerts.empty());
    QCOMPARE(report.insights.rootCause, std::string("Mail queue backlog"));
    QCOMPARE(report.insights.estimatedHours, 3.5);

    // High (+3) and Enterprise (+2) over the base of 5.
    QCOMPARE(report.priority, 10);
    QVERIFY(contains(report.recommendations, "Assign to experienced support engineer"));
    QVERIFY(contains(report.recommendations,
                     "Based on similar issues, expected resolution time: 6.0 hours"));

    QCOMPARE(h.store.updateAnalysisCalls, 1);
    const auto *stored = h.store.find(report.issueId);
    QVERIFY(stored != nullptr);
    QCOMPARE(stored->severity, Severity::High);
    QCOMPARE(stored->priority, 10);
    QCOMPARE(std::get<bool>(stored->tags.at("ai_analyzed")), true);
    QCOMPARE(std::get<std::int64_t>(stored->tags.at("priority_score")), std::int64_t(10));
    QCOMPARE(std::get<double>(stored->tags.at("estimated_resolution_hours")), 3.5);
}

void TriageEngineTests::testInvalidRequestWritesNothing()
{
    Harness h;
    const auto customer = h.store.addCustomer("acme", CustomerTier::Basic);
    auto engine = h.engine();
    CancellationToken cancel;

    auto result = engine.analyzeNewIssue(request(0, "Outage", "Everything down"), cancel);
    QCOMPARE(result.error().kind, ErrorKind::InvalidInput);

    result = engine.analyzeNewIssue(request(customer.id, "   ", "Everything down"), cancel);
    QCOMPARE(result.error().kind, ErrorKind::InvalidInput);

    result = engine.analyzeNewIssue(request(99, "Outage", "Everything down"), cancel);
    QCOMPARE(result.error().kind, ErrorKind::NotFound);

    QCOMPARE(h.store.insertIssueCalls, 0);
    QVERIFY(h.store.issues.empty());
}

void TriageEngineTests::testCancelBeforeInsertWritesNothing()
{
    Harness h;
    const auto customer = h.store.addCustomer("acme", CustomerTier::Basic);
    auto engine = h.engine();
    CancellationToken cancel;
    cancel.cancel();

    const auto result = engine.analyzeNewIssue(request(customer.id, "Outage", "Everything down"),
                                               cancel);
    QCOMPARE(result.error().kind, ErrorKind::Cancelled);
    QCOMPARE(h.store.insertIssueCalls, 0);
}

void TriageEngineTests::testCancelAfterInsertKeepsIssue()
{
    Harness h;
    const auto customer = h.store.addCustomer("acme", CustomerTier::Basic);
    auto engine = h.engine();
    CancellationToken cancel;
    h.model.cancelDuringCall = &cancel;

    // Strong keywords skip the model, so the first model call is insight generation.
    const auto result = engine.analyzeNewIssue(
        request(customer.id, "Production down", "Complete outage for every region"), cancel);
    QCOMPARE(result.error().kind, ErrorKind::Cancelled);

    QCOMPARE(h.store.insertIssueCalls, 1);
    QCOMPARE(h.store.updateAnalysisCalls, 0);
    QCOMPARE(h.store.issues.size(), std::size_t(1));
    QCOMPARE(h.store.issues[0].severity, Severity::Critical);
    QCOMPARE(h.store.issues[0].priority, 5);
    QVERIFY(h.store.issues[0].tags.empty());
}

void TriageEngineTests::testDegradedStagesStillProduceReport()
{
    Harness h;
    const auto customer = h.store.addCustomer("acme", CustomerTier::Premium);
    h.store.corpusFailure = ErrorKind::CollaboratorUnavailable;
    auto engine = h.engine();
    CancellationToken cancel;

    const auto result = engine.analyzeNewIssue(
        request(customer.id, "Checkout broken", "Payment error for all carts"), cancel);
    QVERIFY(result.ok());
    QCOMPARE(result.value().severity.severity, Severity::High);
    QVERIFY(result.value().similarIssues.empty());
    QCOMPARE(result.value().insights.rootCause, std::string("Analysis pending"));
    QCOMPARE(result.value().insights.estimatedHours, 24.0);
    QCOMPARE(h.store.recordSimilarCalls, 0);
    QCOMPARE(h.store.updateAnalysisCalls, 1);
}

void TriageEngineTests::testAnalysisUpdateFailureIsReported()
{
    Harness h;
    const auto customer = h.store.addCustomer("acme", CustomerTier::Basic);
    h.store.updateAnalysisFailure = ErrorKind::CollaboratorUnavailable;
    auto engine = h.engine(false);
    CancellationToken cancel;

    const auto result = engine.analyzeNewIssue(request(customer.id, "Outage", "Site down"), cancel);
    QVERIFY(!result.ok());
    QCOMPARE(result.error().kind, ErrorKind::CollaboratorUnavailable);
    QCOMPARE(h.store.insertIssueCalls, 1);
}

void TriageEngineTests::testFreeTextInsightReplyIsCachedIntact()
{
    Harness h;
    const auto customer = h.store.addCustomer("acme", CustomerTier::Premium);
    // Multi-byte character right at the fallback cut-off.
    const std::string reply = std::string(199, 'a') + "\xC3\xA9" + "chou\xC3\xA9 de nouveau";
    h.model.replies.push_back(reply);
    auto engine = h.engine();
    CancellationToken cancel;

    const auto result = engine.analyzeNewIssue(
        request(customer.id, "Checkout outage", "Payment service unavailable"), cancel);
    QVERIFY(result.ok());
    QCOMPARE(result.value().severity.severity, Severity::Critical);
    QCOMPARE(h.model.prompts.size(), std::size_t(1));
    QCOMPARE(result.value().insights.rootCause, std::string("AI analysis pending"));
    QCOMPARE(result.value().insights.resolutionApproach, std::string(199, 'a') + "\xC3\xA9");
    QCOMPARE(h.store.insertIssueCalls, 1);
    QCOMPARE(h.store.updateAnalysisCalls, 1);

    const auto cached = h.cache.get(triage::cacheKey(CacheKind::IssueAnalysis, result.value().issueId));
    QVERIFY(cached.has_value());
    QCOMPARE(cached->at("aiInsights").at("resolution_approach").get<std::string>(),
             std::string(199, 'a') + "\xC3\xA9");
}

void TriageEngineTests::testHistoryCachedUntilStatusChange()
{
    Harness h;
    const auto customer = h.store.addCustomer("acme", CustomerTier::Basic);
    const auto issue = h.store.addIssue(customer.id, "Sync stuck", "Files not syncing",
                                        Severity::Normal, IssueStatus::Open, kNow - 5h);
    auto engine = h.engine(false);

    auto history = engine.customerHistory(customer.id);
    QVERIFY(history.ok());
    QCOMPARE(history.value().openIssues, 1);
    history = engine.customerHistory(customer.id);
    QCOMPARE(h.store.getCustomerCalls, 1);
    QCOMPARE(h.store.listIssuesCalls, 1);

    QVERIFY(engine.updateIssueStatus(issue.id, IssueStatus::Resolved).ok());
    history = engine.customerHistory(customer.id);
    QCOMPARE(h.store.listIssuesCalls, 2);
    QCOMPARE(history.value().openIssues, 0);
    QCOMPARE(history.value().resolvedIssues, 1);
    QCOMPARE(*history.value().averageResolutionHours, 5.0);
}

void TriageEngineTests::testSimilarRankingCachedForDefaultLimit()
{
    Harness h;
    const auto customer = h.store.addCustomer("acme", CustomerTier::Basic);
    h.store.addIssue(customer.id, "Login fails", "Login page error", Severity::High,
                     IssueStatus::Resolved, kNow - 30h);
    const auto open = h.store.addIssue(customer.id, "Login broken", "Login page error again",
                                       Severity::High, IssueStatus::Open, kNow - 1h);
    auto engine = h.engine(false);
    CancellationToken cancel;
    const int defaultLimit = h.config.similarLimit;

    auto ranked = engine.rankSimilarIssue(open.id, defaultLimit, cancel);
    QVERIFY(ranked.ok());
    QCOMPARE(ranked.value().size(), std::size_t(1));
    ranked = engine.rankSimilarIssue(open.id, defaultLimit, cancel);
    QCOMPARE(h.store.corpusCalls, 1);

    // New issues are Open and never enter the resolved corpus, so intake keeps
    // memoised rankings; only its own ranking reads the corpus.
    QVERIFY(engine.analyzeNewIssue(request(customer.id, "Export slow", "CSV export takes minutes"),
                                   cancel)
                .ok());
    QCOMPARE(h.store.corpusCalls, 2);
    ranked = engine.rankSimilarIssue(open.id, defaultLimit, cancel);
    QCOMPARE(h.store.corpusCalls, 2);

    engine.rankSimilarIssue(open.id, 2, cancel);
    engine.rankSimilarIssue(open.id, 2, cancel);
    QCOMPARE(h.store.corpusCalls, 4);

    QVERIFY(engine.updateIssueStatus(open.id, IssueStatus::Resolved).ok());
    ranked = engine.rankSimilarIssue(open.id, defaultLimit, cancel);
    QCOMPARE(h.store.corpusCalls, 5);
}

void TriageEngineTests::testCustomerRiskAnalysisOrdersByTrouble()
{
    Harness h;
    h.store.addCustomer("quiet", CustomerTier::Basic);
    const auto calm = h.store.addCustomer("calm", CustomerTier::Basic);
    const auto troubled = h.store.addCustomer("troubled", CustomerTier::Enterprise);
    h.store.addIssue(calm.id, "Typo", "Typo on pricing page", Severity::Low,
                     IssueStatus::Resolved, kNow - std::chrono::hours(24 * 100));
    h.store.addIssue(troubled.id, "Outage", "API down", Severity::Critical,
                     IssueStatus::Open, kNow - 2h);
    h.store.addIssue(troubled.id, "Data loss", "Rows missing", Severity::Critical,
                     IssueStatus::Open, kNow - 3h);
    auto engine = h.engine(false);

    auto profiles = engine.customerRiskAnalysis();
    QVERIFY(profiles.ok());
    QCOMPARE(profiles.value().size(), std::size_t(2));
    QCOMPARE(profiles.value()[0].history.customer.id, troubled.id);
    QCOMPARE(profiles.value()[0].risk.policy, RiskPolicy::Dashboard);
    // Two criticals (+4) and two open issues (+3).
    QCOMPARE(profiles.value()[0].risk.score, 7.0);
    QCOMPARE(profiles.value()[0].risk.level, RiskLevel::High);
    QCOMPARE(profiles.value()[1].risk.level, RiskLevel::Low);

    profiles = engine.customerRiskAnalysis(1);
    QCOMPARE(profiles.value().size(), std::size_t(1));
}

void TriageEngineTests::testAlertLifecycleAndPurge()
{
    Harness h;
    const auto customer = h.store.addCustomer("acme", CustomerTier::Basic);
    const auto issue = h.store.addIssue(customer.id, "Outage", "API down", Severity::Critical,
                                        IssueStatus::Open, kNow - 30h);
    auto engine = h.engine(false);
    CancellationToken cancel;

    auto alerts = engine.detectCriticalConditions(customer.id, cancel);
    QVERIFY(alerts.ok());
    QCOMPARE(alerts.value().size(), std::size_t(1));
    QCOMPARE(alerts.value()[0].type, AlertType::Unattended);
    QCOMPARE(alerts.value()[0].issueId, issue.id);
    QCOMPARE(alerts.value()[0].message,
             std::string("Critical issue #") + std::to_string(issue.id)
                 + " has been unattended for 30 hours");

    alerts = engine.detectCriticalConditions(customer.id, cancel);
    QCOMPARE(h.store.alerts.size(), std::size_t(1));

    QCOMPARE(engine.detectCriticalConditions(404, cancel).error().kind, ErrorKind::NotFound);

    const auto alertId = alerts.value()[0].id;
    QCOMPARE(engine.acknowledgeAlert(alertId, " ").error().kind, ErrorKind::InvalidInput);
    QCOMPARE(engine.resolveAlert(alertId).error().kind, ErrorKind::InvalidInput);
    QCOMPARE(engine.acknowledgeAlert(alertId, "oncall").value().status, AlertStatus::Acknowledged);
    QCOMPARE(engine.resolveAlert(alertId).value().status, AlertStatus::Resolved);

    QCOMPARE(engine.purgeResolvedAlerts().value(), 0);
    h.now = kNow + h.config.alertRetention + 1h;
    QCOMPARE(engine.purgeResolvedAlerts().value(), 1);
    QVERIFY(engine.listAlerts(std::nullopt, customer.id).value().empty());
}

void TriageEngineTests::testResolutionRefreshesSatisfaction()
{
    Harness h;
    const auto customer = h.store.addCustomer("acme", CustomerTier::Basic);
    const auto issue = h.store.addIssue(customer.id, "Sync stuck", "Files not syncing",
                                        Severity::Normal, IssueStatus::Resolved, kNow - 10h);
    auto engine = h.engine(false);

    QVERIFY(!engine.customerHistory(customer.id).value().averageSatisfaction.has_value());

    triage::IssueResolution resolution;
    resolution.issueId = 999;
    resolution.summary = "Cleared cache";
    QCOMPARE(engine.addResolution(resolution).error().kind, ErrorKind::NotFound);

    resolution.issueId = issue.id;
    resolution.customerSatisfaction = 2;
    QVERIFY(engine.addResolution(resolution).ok());
    QCOMPARE(*engine.customerHistory(customer.id).value().averageSatisfaction, 2.0);
}

void TriageEngineTests::testScoreRiskUnknownCustomer()
{
    Harness h;
    auto engine = h.engine(false);
    QCOMPARE(engine.scoreRisk(77, RiskPolicy::History).error().kind, ErrorKind::NotFound);
    QCOMPARE(engine.scoreRisk(0, RiskPolicy::Dashboard).error().kind, ErrorKind::InvalidInput);
}

QTEST_MAIN(TriageEngineTests)
#include "test_triage_engine.moc"
