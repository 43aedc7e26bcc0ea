#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "common/enums.hpp"

namespace triage {

using TimePoint = std::chrono::system_clock::time_point;

// Closed set of values an issue tag may carry.
using TagValue = std::variant<bool, std::int64_t, double, std::string>;
using TagMap = std::map<std::string, TagValue>;

struct Customer {
    std::int64_t id = 0;
    std::string name;
    std::string email;
    std::string company;
    CustomerTier tier = CustomerTier::Basic;
    TimePoint createdAt;
};

struct Issue {
    std::int64_t id = 0;
    std::int64_t customerId = 0;
    std::string title;
    std::string description;
    IssueCategory category = IssueCategory::General;
    std::string productArea;
    Severity severity = Severity::Normal;
    IssueStatus status = IssueStatus::Open;
    int priority = 5;
    TimePoint createdAt;
    TimePoint updatedAt;
    std::optional<TimePoint> resolvedAt;
    // Present exactly when status is Resolved.
    std::optional<double> resolutionHours;
    TagMap tags;
};

struct IssueResolution {
    std::int64_t id = 0;
    std::int64_t issueId = 0;
    std::string summary;
    std::optional<int> customerSatisfaction;
    TimePoint createdAt;
};

struct CustomerHistory {
    Customer customer;
    int totalIssues = 0;
    int resolvedIssues = 0;
    int openIssues = 0;
    int criticalIssues = 0;
    int highIssues = 0;
    int recentIssues = 0;
    std::optional<double> averageResolutionHours;
    std::optional<double> averageSatisfaction;
    std::optional<TimePoint> lastIssueAt;
    std::map<std::string, int> statusCounts;
    std::map<std::string, int> severityCounts;
    std::vector<Issue> recent;
    RiskLevel riskLevel = RiskLevel::Low;
};

struct SimilarIssue {
    // 0 when the query was free text rather than a stored issue.
    std::int64_t sourceIssueId = 0;
    std::int64_t issueId = 0;
    std::string title;
    std::string description;
    Severity severity = Severity::Normal;
    double score = 0.0;
    std::optional<double> resolutionHours;
};

struct CriticalAlert {
    std::int64_t id = 0;
    // 0 for customer-scoped alerts.
    std::int64_t issueId = 0;
    std::int64_t customerId = 0;
    AlertType type = AlertType::Unattended;
    Severity severity = Severity::High;
    std::string message;
    AlertStatus status = AlertStatus::Active;
    TimePoint createdAt;
    std::optional<TimePoint> acknowledgedAt;
    std::string acknowledgedBy;
    std::optional<TimePoint> resolvedAt;
};

struct AiInsights {
    std::string rootCause;
    std::string resolutionApproach;
    double estimatedHours = 24.0;
    std::vector<std::string> escalationTriggers;
    std::string communicationStrategy;
};

enum class SeveritySource {
    Keywords,
    Model,
    Default
};

struct SeverityDecision {
    Severity severity = Severity::Normal;
    SeveritySource source = SeveritySource::Default;
    // Per-level keyword score, indexed by Severity.
    double scores[4] = {0.0, 0.0, 0.0, 0.0};
};

struct RiskAssessment {
    RiskPolicy policy = RiskPolicy::History;
    double score = 0.0;
    RiskLevel level = RiskLevel::Low;
};

struct NewIssueRequest {
    std::int64_t customerId = 0;
    std::string title;
    std::string description;
    IssueCategory category = IssueCategory::General;
    std::string productArea;
};

struct TriageReport {
    std::int64_t issueId = 0;
    SeverityDecision severity;
    int priority = 5;
    CustomerHistory history;
    std::vector<SimilarIssue> similarIssues;
    std::vector<CriticalAlert> alerts;
    AiInsights insights;
    std::vector<std::string> recommendations;
    std::int64_t analysisMs = 0;
};

struct CustomerRiskProfile {
    CustomerHistory history;
    RiskAssessment risk;
};

struct IssueFilter {
    std::optional<std::int64_t> customerId;
    std::optional<IssueStatus> status;
    std::optional<Severity> severity;
    std::optional<TimePoint> createdAfter;
    int limit = 100;
    int offset = 0;
};

} // namespace triage
