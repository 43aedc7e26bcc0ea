#include "daemon/critical_condition_detector.hpp"

#include <chrono>
#include <string>

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace triage {

namespace {

constexpr auto kUnattendedAfter = std::chrono::hours(24);
constexpr auto kHighSeverityWindow = std::chrono::hours(24 * 7);
constexpr int kHighSeverityClusterSize = 3;

bool isOpenStatus(IssueStatus status)
{
    return status == IssueStatus::Open || status == IssueStatus::InProgress;
}

} // namespace

CriticalConditionDetector::CriticalConditionDetector(IssueStore &store)
    : m_store(store)
{
}

std::vector<CriticalAlert> CriticalConditionDetector::evaluate(std::int64_t customerId,
                                                               const std::vector<Issue> &issues,
                                                               TimePoint now)
{
    std::vector<CriticalAlert> alerts;
    int highSeverityCount = 0;

    for (const auto &issue : issues) {
        if (issue.customerId != customerId || !isOpenStatus(issue.status)) {
            continue;
        }

        if (issue.severity == Severity::Critical && issue.createdAt < now - kUnattendedAfter) {
            const auto hoursOpen =
                std::chrono::duration_cast<std::chrono::hours>(now - issue.createdAt).count();
            CriticalAlert alert;
            alert.issueId = issue.id;
            alert.customerId = customerId;
            alert.type = AlertType::Unattended;
            alert.severity = Severity::High;
            alert.status = AlertStatus::Active;
            alert.createdAt = now;
            alert.message = "Critical issue #" + std::to_string(issue.id)
                + " has been unattended for " + std::to_string(hoursOpen) + " hours";
            alerts.push_back(std::move(alert));
        }

        if ((issue.severity == Severity::Critical || issue.severity == Severity::High)
            && issue.createdAt >= now - kHighSeverityWindow) {
            ++highSeverityCount;
        }
    }

    if (highSeverityCount >= kHighSeverityClusterSize) {
        CriticalAlert alert;
        alert.customerId = customerId;
        alert.type = AlertType::MultipleHighSeverity;
        alert.severity = Severity::High;
        alert.status = AlertStatus::Active;
        alert.createdAt = now;
        alert.message = "Customer has " + std::to_string(highSeverityCount)
            + " high-severity issues in the last 7 days";
        alerts.push_back(std::move(alert));
    }

    return alerts;
}

Outcome<std::vector<CriticalAlert>> CriticalConditionDetector::detect(std::int64_t customerId,
                                                                      TimePoint now,
                                                                      const CancellationToken &cancel)
{
    if (customerId <= 0) {
        return makeError(ErrorKind::InvalidInput, "customer id must be positive");
    }
    if (cancel.isCancelled()) {
        return makeError(ErrorKind::Cancelled, "detection cancelled");
    }

    IssueFilter filter;
    filter.customerId = customerId;
    filter.limit = 0;
    auto issues = m_store.listIssues(filter);
    if (!issues) {
        return issues.error();
    }

    std::vector<CriticalAlert> results;
    int created = 0;
    for (auto &alert : evaluate(customerId, issues.value(), now)) {
        if (alert.issueId == 0) {
            results.push_back(std::move(alert));
            continue;
        }
        // Each alert is one atomic insert, so stopping here leaves nothing half-written.
        if (cancel.isCancelled()) {
            return makeError(ErrorKind::Cancelled, "detection cancelled");
        }
        auto stored = m_store.insertAlertIfAbsent(alert);
        if (!stored) {
            return stored.error();
        }
        if (stored.value().created) {
            ++created;
        }
        results.push_back(stored.value().alert);
    }

    if (!results.empty()) {
        TLOG_INFO(QStringLiteral("CriticalConditionDetector"),
                  QStringLiteral("detect"),
                  QStringLiteral("critical_conditions_detected"),
                  QStringLiteral("intake"),
                  QStringLiteral("issue_scan"),
                  logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"customerId", customerId},
                                  {"alerts", results.size()},
                                  {"created", created}}));
    }
    return results;
}

} // namespace triage
