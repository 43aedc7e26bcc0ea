#pragma once

namespace triage {

// Ordered least to most severe; comparisons rely on the declaration order.
enum class Severity {
    Low,
    Normal,
    High,
    Critical
};

enum class IssueStatus {
    Open,
    InProgress,
    Resolved,
    Closed,
    Escalated
};

enum class IssueCategory {
    Technical,
    Billing,
    General,
    FeatureRequest,
    BugReport
};

enum class CustomerTier {
    Basic,
    Premium,
    Enterprise
};

enum class RiskLevel {
    Low,
    Medium,
    High
};

enum class RiskPolicy {
    History,
    Dashboard
};

enum class AlertType {
    Unattended,
    Escalation,
    SlaBreach,
    CustomerEscalation,
    MultipleHighSeverity
};

enum class AlertStatus {
    Active,
    Acknowledged,
    Resolved
};

} // namespace triage
