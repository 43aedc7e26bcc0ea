#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "common/cancellation.hpp"
#include "common/models.hpp"
#include "common/triage_error.hpp"

namespace triage {

struct AlertInsertResult {
    CriticalAlert alert;
    // False when an Active alert for the same (issue, type) already existed.
    bool created = false;
};

// IssueStore is the persistence seam for customers, issues, resolutions and alerts.
// Every record write is a single statement; callers never see half-applied updates.
class IssueStore {
public:
    virtual ~IssueStore() = default;

    virtual Outcome<Customer> getCustomer(std::int64_t id) = 0;
    virtual Outcome<Customer> insertCustomer(const Customer &customer) = 0;
    virtual Outcome<std::vector<Customer>> listCustomers() = 0;

    virtual Outcome<Issue> getIssue(std::int64_t id) = 0;
    virtual Outcome<Issue> insertIssue(const Issue &issue) = 0;
    // Severity, priority and tags land together or not at all.
    virtual Status updateIssueAnalysis(std::int64_t id,
                                       Severity severity,
                                       int priority,
                                       const TagMap &tags) = 0;
    // Moving to Resolved records resolvedAt and resolutionHours; leaving clears them.
    virtual Outcome<Issue> updateIssueStatus(std::int64_t id,
                                             IssueStatus status,
                                             TimePoint now) = 0;
    // limit <= 0 means unbounded. Newest first.
    virtual Outcome<std::vector<Issue>> listIssues(const IssueFilter &filter) = 0;

    // Resolved issues with a recorded resolution duration, newest first.
    // Fails with CollaboratorUnavailable past the timeout and Cancelled on cancellation.
    virtual Outcome<std::vector<Issue>> recentResolvedIssues(
        int limit,
        const CancellationToken &cancel,
        std::chrono::milliseconds timeout) = 0;

    virtual Outcome<std::optional<double>> averageSatisfaction(std::int64_t customerId) = 0;
    virtual Outcome<IssueResolution> addResolution(const IssueResolution &resolution) = 0;

    virtual Outcome<AlertInsertResult> insertAlertIfAbsent(const CriticalAlert &alert) = 0;
    virtual Outcome<std::vector<CriticalAlert>> listAlerts(
        std::optional<AlertStatus> status,
        std::optional<std::int64_t> customerId) = 0;
    // Active -> Acknowledged only.
    virtual Outcome<CriticalAlert> acknowledgeAlert(std::int64_t id,
                                                    const std::string &actor,
                                                    TimePoint now) = 0;
    // Acknowledged -> Resolved only.
    virtual Outcome<CriticalAlert> resolveAlert(std::int64_t id, TimePoint now) = 0;
    virtual Outcome<int> purgeResolvedAlertsBefore(TimePoint cutoff) = 0;

    // Best-effort cross reference; readers never depend on it.
    virtual Status recordSimilarIssues(std::int64_t sourceIssueId,
                                       const std::vector<SimilarIssue> &similar) = 0;
};

} // namespace triage
