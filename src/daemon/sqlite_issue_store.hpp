#pragma once

#include <memory>
#include <optional>
#include <string>

#include "daemon/issue_store.hpp"

namespace triage {

// SqliteIssueStore is the SQLite access layer for customers, issues,
// resolutions, similar-issue cross references, critical alerts and meta.
// One serialized connection is shared by all callers.
class SqliteIssueStore : public IssueStore {
public:
    // Opens (and creates if needed) the database; throws std::runtime_error on failure.
    explicit SqliteIssueStore(const std::string &path);
    ~SqliteIssueStore() override;

    static std::string defaultDatabasePath();

    Outcome<Customer> getCustomer(std::int64_t id) override;
    Outcome<Customer> insertCustomer(const Customer &customer) override;
    Outcome<std::vector<Customer>> listCustomers() override;

    Outcome<Issue> getIssue(std::int64_t id) override;
    Outcome<Issue> insertIssue(const Issue &issue) override;
    Status updateIssueAnalysis(std::int64_t id,
                               Severity severity,
                               int priority,
                               const TagMap &tags) override;
    Outcome<Issue> updateIssueStatus(std::int64_t id,
                                     IssueStatus status,
                                     TimePoint now) override;
    Outcome<std::vector<Issue>> listIssues(const IssueFilter &filter) override;

    Outcome<std::vector<Issue>> recentResolvedIssues(
        int limit,
        const CancellationToken &cancel,
        std::chrono::milliseconds timeout) override;

    Outcome<std::optional<double>> averageSatisfaction(std::int64_t customerId) override;
    Outcome<IssueResolution> addResolution(const IssueResolution &resolution) override;

    Outcome<AlertInsertResult> insertAlertIfAbsent(const CriticalAlert &alert) override;
    Outcome<std::vector<CriticalAlert>> listAlerts(
        std::optional<AlertStatus> status,
        std::optional<std::int64_t> customerId) override;
    Outcome<CriticalAlert> acknowledgeAlert(std::int64_t id,
                                            const std::string &actor,
                                            TimePoint now) override;
    Outcome<CriticalAlert> resolveAlert(std::int64_t id, TimePoint now) override;
    Outcome<int> purgeResolvedAlertsBefore(TimePoint cutoff) override;

    Status recordSimilarIssues(std::int64_t sourceIssueId,
                               const std::vector<SimilarIssue> &similar) override;

    std::optional<std::string> getMeta(const std::string &key) const;
    void setMeta(const std::string &key, const std::string &value);

    bool integrityCheck(std::string *message) const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl;
};

} // namespace triage
