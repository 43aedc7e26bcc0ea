#include <QtTest/QtTest>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"

using namespace std::chrono_literals;

class ModelsJsonTests : public QObject
{
    Q_OBJECT
private slots:
    void testEnumStringForms();
    void testUnknownEnumNamesRejected();
    void testIsoTimestamps();
    void testIssueRoundTrip();
    void testCustomerHistoryRoundTrip();
    void testAlertRoundTrip();
    void testMissingFieldsDefaults();
    void testReportShape();

private:
    static qint64 toSeconds(std::chrono::system_clock::time_point t)
    {
        return std::chrono::duration_cast<std::chrono::seconds>(
            t.time_since_epoch()).count();
    }
};

void ModelsJsonTests::testEnumStringForms()
{
    QCOMPARE(triage::toStatusString(triage::IssueStatus::InProgress), std::string("In Progress"));
    QCOMPARE(triage::toAlertTypeString(triage::AlertType::SlaBreach), std::string("SLA_Breach"));
    QCOMPARE(triage::toAlertTypeString(triage::AlertType::MultipleHighSeverity),
             std::string("Multiple High Severity Issues"));
    QCOMPARE(triage::toCategoryString(triage::IssueCategory::FeatureRequest),
             std::string("Feature Request"));
    QCOMPARE(triage::toTierString(triage::CustomerTier::Enterprise), std::string("Enterprise"));
    QCOMPARE(triage::toPolicyString(triage::RiskPolicy::Dashboard), std::string("dashboard"));

    QCOMPARE(*triage::parseStatusString("Escalated"), triage::IssueStatus::Escalated);
    QCOMPARE(*triage::parseAlertTypeString("Customer_Escalation"),
             triage::AlertType::CustomerEscalation);
    QCOMPARE(*triage::parseRiskLevelString("Medium"), triage::RiskLevel::Medium);
}

void ModelsJsonTests::testUnknownEnumNamesRejected()
{
    QVERIFY(!triage::parseSeverityString("critical").has_value());
    QVERIFY(!triage::parseStatusString("InProgress").has_value());
    QVERIFY(!triage::parseTierString("Gold").has_value());
    QVERIFY(!triage::parsePolicyString("History").has_value());
    QVERIFY(!triage::parseAlertStatusString("").has_value());
}

void ModelsJsonTests::testIsoTimestamps()
{
    const auto epoch = std::chrono::system_clock::from_time_t(1700000000);
    QCOMPARE(triage::toIso8601Utc(epoch), std::string("2023-11-14T22:13:20Z"));
    QVERIFY(triage::fromIso8601Utc("2023-11-14T22:13:20Z") == epoch);
    QVERIFY(triage::fromIso8601Utc("not a time") == std::chrono::system_clock::time_point{});
}

void ModelsJsonTests::testIssueRoundTrip()
{
    triage::Issue issue;
    issue.id = 12;
    issue.customerId = 3;
    issue.title = "Checkout broken";
    issue.description = "Payment form errors";
    issue.category = triage::IssueCategory::BugReport;
    issue.severity = triage::Severity::High;
    issue.status = triage::IssueStatus::Resolved;
    issue.priority = 8;
    issue.createdAt = std::chrono::system_clock::now() - 3h;
    issue.updatedAt = std::chrono::system_clock::now();
    issue.resolvedAt = issue.updatedAt;
    issue.resolutionHours = 3.0;
    issue.tags["ai_analyzed"] = true;
    issue.tags["priority_score"] = std::int64_t(8);

    nlohmann::json j = issue;
    QCOMPARE(j["status"].get<std::string>(), std::string("Resolved"));
    QCOMPARE(j["category"].get<std::string>(), std::string("Bug Report"));

    const auto parsed = j.get<triage::Issue>();
    QCOMPARE(parsed.id, std::int64_t(12));
    QCOMPARE(parsed.category, triage::IssueCategory::BugReport);
    QCOMPARE(parsed.severity, triage::Severity::High);
    QCOMPARE(parsed.priority, 8);
    QCOMPARE(*parsed.resolutionHours, 3.0);
    QCOMPARE(toSeconds(*parsed.resolvedAt), toSeconds(*issue.resolvedAt));
    QCOMPARE(toSeconds(parsed.createdAt), toSeconds(issue.createdAt));
    QCOMPARE(std::get<bool>(parsed.tags.at("ai_analyzed")), true);
    QCOMPARE(std::get<std::int64_t>(parsed.tags.at("priority_score")), std::int64_t(8));
}

void ModelsJsonTests::testCustomerHistoryRoundTrip()
{
    triage::CustomerHistory history;
    history.customer.id = 5;
    history.customer.name = "acme";
    history.customer.tier = triage::CustomerTier::Premium;
    history.totalIssues = 4;
    history.criticalIssues = 1;
    history.averageSatisfaction = 3.5;
    history.statusCounts["Open"] = 3;
    history.severityCounts["Critical"] = 1;
    history.riskLevel = triage::RiskLevel::Medium;
    history.recent.resize(2);

    const auto parsed = nlohmann::json(history).get<triage::CustomerHistory>();
    QCOMPARE(parsed.customer.id, std::int64_t(5));
    QCOMPARE(parsed.customer.tier, triage::CustomerTier::Premium);
    QCOMPARE(parsed.totalIssues, 4);
    QCOMPARE(parsed.criticalIssues, 1);
    QCOMPARE(*parsed.averageSatisfaction, 3.5);
    QVERIFY(!parsed.averageResolutionHours.has_value());
    QVERIFY(!parsed.lastIssueAt.has_value());
    QCOMPARE(parsed.statusCounts.at("Open"), 3);
    QCOMPARE(parsed.recent.size(), std::size_t(2));
    QCOMPARE(parsed.riskLevel, triage::RiskLevel::Medium);
}

void ModelsJsonTests::testAlertRoundTrip()
{
    triage::CriticalAlert alert;
    alert.id = 9;
    alert.customerId = 5;
    alert.type = triage::AlertType::MultipleHighSeverity;
    alert.message = "Customer has 3 high-severity issues in the last 7 days";
    alert.status = triage::AlertStatus::Acknowledged;
    alert.createdAt = std::chrono::system_clock::now();
    alert.acknowledgedAt = alert.createdAt;
    alert.acknowledgedBy = "oncall";

    nlohmann::json j = alert;
    QCOMPARE(j["type"].get<std::string>(), std::string("Multiple High Severity Issues"));
    QVERIFY(j["resolvedAt"].is_null());

    const auto parsed = j.get<triage::CriticalAlert>();
    QCOMPARE(parsed.type, triage::AlertType::MultipleHighSeverity);
    QCOMPARE(parsed.status, triage::AlertStatus::Acknowledged);
    QCOMPARE(parsed.acknowledgedBy, std::string("oncall"));
    QVERIFY(parsed.acknowledgedAt.has_value());
    QVERIFY(!parsed.resolvedAt.has_value());
}

void ModelsJsonTests::testMissingFieldsDefaults()
{
    const auto issue = nlohmann::json::object().get<triage::Issue>();
    QCOMPARE(issue.severity, triage::Severity::Normal);
    QCOMPARE(issue.status, triage::IssueStatus::Open);
    QCOMPARE(issue.category, triage::IssueCategory::General);
    QCOMPARE(issue.priority, 5);
    QVERIFY(issue.tags.empty());
    QVERIFY(!issue.resolutionHours.has_value());

    const auto similar = nlohmann::json{{"severity", "Severe"}}.get<triage::SimilarIssue>();
    QCOMPARE(similar.severity, triage::Severity::Normal);
    QCOMPARE(similar.score, 0.0);

    const auto customer = nlohmann::json::object().get<triage::Customer>();
    QCOMPARE(customer.tier, triage::CustomerTier::Basic);
}

void ModelsJsonTests::testReportShape()
{
    triage::TriageReport report;
    report.issueId = 41;
    report.priority = 9;
    report.severity.severity = triage::Severity::High;
    report.severity.source = triage::SeveritySource::Model;
    report.recommendations = {"Assign to experienced support engineer"};

    const nlohmann::json j = report;
    QCOMPARE(j["issueId"].get<std::int64_t>(), std::int64_t(41));
    QCOMPARE(j["severity"]["severity"].get<std::string>(), std::string("High"));
    QCOMPARE(j["severity"]["source"].get<std::string>(), std::string("model"));
    QVERIFY(j["aiInsights"].contains("root_cause"));
    QVERIFY(j["aiInsights"].contains("estimated_time_hours"));
    QVERIFY(j["similarIssues"].is_array());
    QVERIFY(j["alerts"].is_array());
    QVERIFY(j.contains("customerHistory"));
    QCOMPARE(j["recommendations"].size(), std::size_t(1));
}

QTEST_MAIN(ModelsJsonTests)
#include "test_models_and_json.moc"
