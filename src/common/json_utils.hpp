#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace triage {

inline std::string toIso8601Utc(std::chrono::system_clock::time_point timestamp)
{
    std::time_t time = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm{};
    gmtime_r(&time, &tm);
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

inline std::chrono::system_clock::time_point fromIso8601Utc(const std::string &value)
{
    std::tm tm{};
    std::istringstream in(value);
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    if (in.fail()) {
        return std::chrono::system_clock::time_point{};
    }
    std::time_t time = timegm(&tm);
    if (time == static_cast<std::time_t>(-1)) {
        return std::chrono::system_clock::time_point{};
    }
    return std::chrono::system_clock::from_time_t(time);
}

// Leading maxCodePoints characters of a UTF-8 string. Never splits a
// multi-byte sequence, so the result stays serialisable.
inline std::string utf8Prefix(const std::string &text, std::size_t maxCodePoints)
{
    std::size_t codePoints = 0;
    std::size_t end = 0;
    while (end < text.size() && codePoints < maxCodePoints) {
        ++end;
        while (end < text.size() && (static_cast<unsigned char>(text[end]) & 0xC0) == 0x80) {
            ++end;
        }
        ++codePoints;
    }
    return text.substr(0, end);
}

inline std::string toSeverityString(Severity severity)
{
    switch (severity) {
    case Severity::Low:
        return "Low";
    case Severity::Normal:
        return "Normal";
    case Severity::High:
        return "High";
    case Severity::Critical:
        return "Critical";
    }
    return "Normal";
}

inline std::optional<Severity> parseSeverityString(const std::string &value)
{
    if (value == "Low") {
        return Severity::Low;
    }
    if (value == "Normal") {
        return Severity::Normal;
    }
    if (value == "High") {
        return Severity::High;
    }
    if (value == "Critical") {
        return Severity::Critical;
    }
    return std::nullopt;
}

inline std::string toStatusString(IssueStatus status)
{
    switch (status) {
    case IssueStatus::Open:
        return "Open";
    case IssueStatus::InProgress:
        return "In Progress";
    case IssueStatus::Resolved:
        return "Resolved";
    case IssueStatus::Closed:
        return "Closed";
    case IssueStatus::Escalated:
        return "Escalated";
    }
    return "Open";
}

inline std::optional<IssueStatus> parseStatusString(const std::string &value)
{
    if (value == "Open") {
        return IssueStatus::Open;
    }
    if (value == "In Progress") {
        return IssueStatus::InProgress;
    }
    if (value == "Resolved") {
        return IssueStatus::Resolved;
    }
    if (value == "Closed") {
        return IssueStatus::Closed;
    }
    if (value == "Escalated") {
        return IssueStatus::Escalated;
    }
    return std::nullopt;
}

inline std::string toCategoryString(IssueCategory category)
{
    switch (category) {
    case IssueCategory::Technical:
        return "Technical";
    case IssueCategory::Billing:
        return "Billing";
    case IssueCategory::General:
        return "General";
    case IssueCategory::FeatureRequest:
        return "Feature Request";
    case IssueCategory::BugReport:
        return "Bug Report";
    }
    return "General";
}

inline std::optional<IssueCategory> parseCategoryString(const std::string &value)
{
    if (value == "Technical") {
        return IssueCategory::Technical;
    }
    if (value == "Billing") {
        return IssueCategory::Billing;
    }
    if (value == "General") {
        return IssueCategory::General;
    }
    if (value == "Feature Request") {
        return IssueCategory::FeatureRequest;
    }
    if (value == "Bug Report") {
        return IssueCategory::BugReport;
    }
    return std::nullopt;
}

inline std::string toTierString(CustomerTier tier)
{
    switch (tier) {
    case CustomerTier::Basic:
        return "Basic";
    case CustomerTier::Premium:
        return "Premium";
    case CustomerTier::Enterprise:
        return "Enterprise";
    }
    return "Basic";
}

inline std::optional<CustomerTier> parseTierString(const std::string &value)
{
    if (value == "Basic") {
        return CustomerTier::Basic;
    }
    if (value == "Premium") {
        return CustomerTier::Premium;
    }
    if (value == "Enterprise") {
        return CustomerTier::Enterprise;
    }
    return std::nullopt;
}

inline std::string toRiskLevelString(RiskLevel level)
{
    switch (level) {
    case RiskLevel::Low:
        return "Low";
    case RiskLevel::Medium:
        return "Medium";
    case RiskLevel::High:
        return "High";
    }
    return "Low";
}

inline std::optional<RiskLevel> parseRiskLevelString(const std::string &value)
{
    if (value == "Low") {
        return RiskLevel::Low;
    }
    if (value == "Medium") {
        return RiskLevel::Medium;
    }
    if (value == "High") {
        return RiskLevel::High;
    }
    return std::nullopt;
}

inline std::string toPolicyString(RiskPolicy policy)
{
    return policy == RiskPolicy::Dashboard ? "dashboard" : "history";
}

inline std::optional<RiskPolicy> parsePolicyString(const std::string &value)
{
    if (value == "history") {
        return RiskPolicy::History;
    }
    if (value == "dashboard") {
        return RiskPolicy::Dashboard;
    }
    return std::nullopt;
}

inline std::string toAlertTypeString(AlertType type)
{
    switch (type) {
    case AlertType::Unattended:
        return "Unattended";
    case AlertType::Escalation:
        return "Escalation";
    case AlertType::SlaBreach:
        return "SLA_Breach";
    case AlertType::CustomerEscalation:
        return "Customer_Escalation";
    case AlertType::MultipleHighSeverity:
        return "Multiple High Severity Issues";
    }
    return "Unattended";
}

inline std::optional<AlertType> parseAlertTypeString(const std::string &value)
{
    if (value == "Unattended") {
        return AlertType::Unattended;
    }
    if (value == "Escalation") {
        return AlertType::Escalation;
    }
    if (value == "SLA_Breach") {
        return AlertType::SlaBreach;
    }
    if (value == "Customer_Escalation") {
        return AlertType::CustomerEscalation;
    }
    if (value == "Multiple High Severity Issues") {
        return AlertType::MultipleHighSeverity;
    }
    return std::nullopt;
}

inline std::string toAlertStatusString(AlertStatus status)
{
    switch (status) {
    case AlertStatus::Active:
        return "Active";
    case AlertStatus::Acknowledged:
        return "Acknowledged";
    case AlertStatus::Resolved:
        return "Resolved";
    }
    return "Active";
}

inline std::optional<AlertStatus> parseAlertStatusString(const std::string &value)
{
    if (value == "Active") {
        return AlertStatus::Active;
    }
    if (value == "Acknowledged") {
        return AlertStatus::Acknowledged;
    }
    if (value == "Resolved") {
        return AlertStatus::Resolved;
    }
    return std::nullopt;
}

inline std::string toSeveritySourceString(SeveritySource source)
{
    switch (source) {
    case SeveritySource::Keywords:
        return "keywords";
    case SeveritySource::Model:
        return "model";
    case SeveritySource::Default:
        return "default";
    }
    return "default";
}

inline void to_json(nlohmann::json &j, const Severity &severity)
{
    j = toSeverityString(severity);
}

inline void from_json(const nlohmann::json &j, Severity &severity)
{
    severity = j.is_string()
        ? parseSeverityString(j.get<std::string>()).value_or(Severity::Normal)
        : Severity::Normal;
}

inline void to_json(nlohmann::json &j, const IssueStatus &status)
{
    j = toStatusString(status);
}

inline void from_json(const nlohmann::json &j, IssueStatus &status)
{
    status = j.is_string()
        ? parseStatusString(j.get<std::string>()).value_or(IssueStatus::Open)
        : IssueStatus::Open;
}

inline void to_json(nlohmann::json &j, const IssueCategory &category)
{
    j = toCategoryString(category);
}

inline void from_json(const nlohmann::json &j, IssueCategory &category)
{
    category = j.is_string()
        ? parseCategoryString(j.get<std::string>()).value_or(IssueCategory::General)
        : IssueCategory::General;
}

inline void to_json(nlohmann::json &j, const CustomerTier &tier)
{
    j = toTierString(tier);
}

inline void from_json(const nlohmann::json &j, CustomerTier &tier)
{
    tier = j.is_string()
        ? parseTierString(j.get<std::string>()).value_or(CustomerTier::Basic)
        : CustomerTier::Basic;
}

inline void to_json(nlohmann::json &j, const RiskLevel &level)
{
    j = toRiskLevelString(level);
}

inline void from_json(const nlohmann::json &j, RiskLevel &level)
{
    level = j.is_string()
        ? parseRiskLevelString(j.get<std::string>()).value_or(RiskLevel::Low)
        : RiskLevel::Low;
}

inline void to_json(nlohmann::json &j, const AlertType &type)
{
    j = toAlertTypeString(type);
}

inline void from_json(const nlohmann::json &j, AlertType &type)
{
    type = j.is_string()
        ? parseAlertTypeString(j.get<std::string>()).value_or(AlertType::Unattended)
        : AlertType::Unattended;
}

inline void to_json(nlohmann::json &j, const AlertStatus &status)
{
    j = toAlertStatusString(status);
}

inline void from_json(const nlohmann::json &j, AlertStatus &status)
{
    status = j.is_string()
        ? parseAlertStatusString(j.get<std::string>()).value_or(AlertStatus::Active)
        : AlertStatus::Active;
}

inline nlohmann::json optionalTimeJson(const std::optional<TimePoint> &value)
{
    if (!value) {
        return nullptr;
    }
    return toIso8601Utc(*value);
}

inline std::optional<TimePoint> optionalTimeFromJson(const nlohmann::json &j,
                                                     const char *key)
{
    if (!j.contains(key) || !j.at(key).is_string()) {
        return std::nullopt;
    }
    const auto parsed = fromIso8601Utc(j.at(key).get<std::string>());
    if (parsed == TimePoint{}) {
        return std::nullopt;
    }
    return parsed;
}

inline nlohmann::json optionalDoubleJson(const std::optional<double> &value)
{
    if (!value) {
        return nullptr;
    }
    return *value;
}

inline std::optional<double> optionalDoubleFromJson(const nlohmann::json &j,
                                                    const char *key)
{
    if (!j.contains(key) || !j.at(key).is_number()) {
        return std::nullopt;
    }
    return j.at(key).get<double>();
}

inline nlohmann::json tagsToJson(const TagMap &tags)
{
    nlohmann::json out = nlohmann::json::object();
    for (const auto &entry : tags) {
        std::visit([&](const auto &value) { out[entry.first] = value; }, entry.second);
    }
    return out;
}

// Values outside the TagValue variant (null, arrays, objects) are dropped.
inline TagMap tagsFromJson(const nlohmann::json &j)
{
    TagMap tags;
    if (!j.is_object()) {
        return tags;
    }
    for (const auto &item : j.items()) {
        const auto &value = item.value();
        if (value.is_boolean()) {
            tags[item.key()] = value.get<bool>();
        } else if (value.is_number_integer()) {
            tags[item.key()] = value.get<std::int64_t>();
        } else if (value.is_number_float()) {
            tags[item.key()] = value.get<double>();
        } else if (value.is_string()) {
            tags[item.key()] = value.get<std::string>();
        }
    }
    return tags;
}

inline void to_json(nlohmann::json &j, const Customer &customer)
{
    j = nlohmann::json{
        {"id", customer.id},
        {"name", customer.name},
        {"email", customer.email},
        {"company", customer.company},
        {"tier", customer.tier},
        {"createdAt", toIso8601Utc(customer.createdAt)}
    };
}

inline void from_json(const nlohmann::json &j, Customer &customer)
{
    customer.id = j.value("id", static_cast<std::int64_t>(0));
    customer.name = j.value("name", "");
    customer.email = j.value("email", "");
    customer.company = j.value("company", "");
    if (j.contains("tier")) {
        customer.tier = j.at("tier").get<CustomerTier>();
    } else {
        customer.tier = CustomerTier::Basic;
    }
    customer.createdAt = fromIso8601Utc(j.value("createdAt", ""));
}

inline void to_json(nlohmann::json &j, const Issue &issue)
{
    j = nlohmann::json{
        {"id", issue.id},
        {"customerId", issue.customerId},
        {"title", issue.title},
        {"description", issue.description},
        {"category", issue.category},
        {"productArea", issue.productArea},
        {"severity", issue.severity},
        {"status", issue.status},
        {"priority", issue.priority},
        {"createdAt", toIso8601Utc(issue.createdAt)},
        {"updatedAt", toIso8601Utc(issue.updatedAt)},
        {"resolvedAt", optionalTimeJson(issue.resolvedAt)},
        {"resolutionHours", optionalDoubleJson(issue.resolutionHours)},
        {"tags", tagsToJson(issue.tags)}
    };
}

inline void from_json(const nlohmann::json &j, Issue &issue)
{
    issue.id = j.value("id", static_cast<std::int64_t>(0));
    issue.customerId = j.value("customerId", static_cast<std::int64_t>(0));
    issue.title = j.value("title", "");
    issue.description = j.value("description", "");
    issue.category = j.contains("category") ? j.at("category").get<IssueCategory>()
                                            : IssueCategory::General;
    issue.productArea = j.value("productArea", "");
    issue.severity = j.contains("severity") ? j.at("severity").get<Severity>()
                                            : Severity::Normal;
    issue.status = j.contains("status") ? j.at("status").get<IssueStatus>()
                                        : IssueStatus::Open;
    issue.priority = j.value("priority", 5);
    issue.createdAt = fromIso8601Utc(j.value("createdAt", ""));
    issue.updatedAt = fromIso8601Utc(j.value("updatedAt", ""));
    issue.resolvedAt = optionalTimeFromJson(j, "resolvedAt");
    issue.resolutionHours = optionalDoubleFromJson(j, "resolutionHours");
    issue.tags = j.contains("tags") ? tagsFromJson(j.at("tags")) : TagMap{};
}

inline void to_json(nlohmann::json &j, const CustomerHistory &history)
{
    j = nlohmann::json{
        {"customer", history.customer},
        {"totalIssues", history.totalIssues},
        {"resolvedIssues", history.resolvedIssues},
        {"openIssues", history.openIssues},
        {"criticalIssues", history.criticalIssues},
        {"highIssues", history.highIssues},
        {"recentIssues", history.recentIssues},
        {"averageResolutionHours", optionalDoubleJson(history.averageResolutionHours)},
        {"averageSatisfaction", optionalDoubleJson(history.averageSatisfaction)},
        {"lastIssueAt", optionalTimeJson(history.lastIssueAt)},
        {"statusCounts", history.statusCounts},
        {"severityCounts", history.severityCounts},
        {"recent", history.recent},
        {"riskLevel", history.riskLevel}
    };
}

inline void from_json(const nlohmann::json &j, CustomerHistory &history)
{
    history.customer = j.contains("customer") ? j.at("customer").get<Customer>()
                                              : Customer{};
    history.totalIssues = j.value("totalIssues", 0);
    history.resolvedIssues = j.value("resolvedIssues", 0);
    history.openIssues = j.value("openIssues", 0);
    history.criticalIssues = j.value("criticalIssues", 0);
    history.highIssues = j.value("highIssues", 0);
    history.recentIssues = j.value("recentIssues", 0);
    history.averageResolutionHours = optionalDoubleFromJson(j, "averageResolutionHours");
    history.averageSatisfaction = optionalDoubleFromJson(j, "averageSatisfaction");
    history.lastIssueAt = optionalTimeFromJson(j, "lastIssueAt");
    history.statusCounts.clear();
    history.severityCounts.clear();
    if (j.contains("statusCounts") && j.at("statusCounts").is_object()) {
        history.statusCounts = j.at("statusCounts").get<std::map<std::string, int>>();
    }
    if (j.contains("severityCounts") && j.at("severityCounts").is_object()) {
        history.severityCounts = j.at("severityCounts").get<std::map<std::string, int>>();
    }
    if (j.contains("recent") && j.at("recent").is_array()) {
        history.recent = j.at("recent").get<std::vector<Issue>>();
    } else {
        history.recent.clear();
    }
    history.riskLevel = j.contains("riskLevel") ? j.at("riskLevel").get<RiskLevel>()
                                                : RiskLevel::Low;
}

inline void to_json(nlohmann::json &j, const SimilarIssue &similar)
{
    j = nlohmann::json{
        {"sourceIssueId", similar.sourceIssueId},
        {"issueId", similar.issueId},
        {"title", similar.title},
        {"description", similar.description},
        {"severity", similar.severity},
        {"score", similar.score},
        {"resolutionHours", optionalDoubleJson(similar.resolutionHours)}
    };
}

inline void from_json(const nlohmann::json &j, SimilarIssue &similar)
{
    similar.sourceIssueId = j.value("sourceIssueId", static_cast<std::int64_t>(0));
    similar.issueId = j.value("issueId", static_cast<std::int64_t>(0));
    similar.title = j.value("title", "");
    similar.description = j.value("description", "");
    similar.severity = j.contains("severity") ? j.at("severity").get<Severity>()
                                              : Severity::Normal;
    similar.score = j.value("score", 0.0);
    similar.resolutionHours = optionalDoubleFromJson(j, "resolutionHours");
}

inline void to_json(nlohmann::json &j, const CriticalAlert &alert)
{
    j = nlohmann::json{
        {"id", alert.id},
        {"issueId", alert.issueId},
        {"customerId", alert.customerId},
        {"type", alert.type},
        {"severity", alert.severity},
        {"message", alert.message},
        {"status", alert.status},
        {"createdAt", toIso8601Utc(alert.createdAt)},
        {"acknowledgedAt", optionalTimeJson(alert.acknowledgedAt)},
        {"acknowledgedBy", alert.acknowledgedBy},
        {"resolvedAt", optionalTimeJson(alert.resolvedAt)}
    };
}

inline void from_json(const nlohmann::json &j, CriticalAlert &alert)
{
    alert.id = j.value("id", static_cast<std::int64_t>(0));
    alert.issueId = j.value("issueId", static_cast<std::int64_t>(0));
    alert.customerId = j.value("customerId", static_cast<std::int64_t>(0));
    alert.type = j.contains("type") ? j.at("type").get<AlertType>()
                                    : AlertType::Unattended;
    alert.severity = j.contains("severity") ? j.at("severity").get<Severity>()
                                            : Severity::High;
    alert.message = j.value("message", "");
    alert.status = j.contains("status") ? j.at("status").get<AlertStatus>()
                                        : AlertStatus::Active;
    alert.createdAt = fromIso8601Utc(j.value("createdAt", ""));
    alert.acknowledgedAt = optionalTimeFromJson(j, "acknowledgedAt");
    alert.acknowledgedBy = j.value("acknowledgedBy", "");
    alert.resolvedAt = optionalTimeFromJson(j, "resolvedAt");
}

inline void to_json(nlohmann::json &j, const IssueResolution &resolution)
{
    j = nlohmann::json{
        {"id", resolution.id},
        {"issueId", resolution.issueId},
        {"summary", resolution.summary},
        {"customerSatisfaction", resolution.customerSatisfaction
             ? nlohmann::json(*resolution.customerSatisfaction)
             : nlohmann::json(nullptr)},
        {"createdAt", toIso8601Utc(resolution.createdAt)}
    };
}

inline void to_json(nlohmann::json &j, const AiInsights &insights)
{
    j = nlohmann::json{
        {"root_cause", insights.rootCause},
        {"resolution_approach", insights.resolutionApproach},
        {"estimated_time_hours", insights.estimatedHours},
        {"escalation_triggers", insights.escalationTriggers},
        {"communication_strategy", insights.communicationStrategy}
    };
}

inline void to_json(nlohmann::json &j, const SeverityDecision &decision)
{
    j = nlohmann::json{
        {"severity", decision.severity},
        {"source", toSeveritySourceString(decision.source)},
        {"scores", {
            {"Low", decision.scores[0]},
            {"Normal", decision.scores[1]},
            {"High", decision.scores[2]},
            {"Critical", decision.scores[3]}
        }}
    };
}

inline void to_json(nlohmann::json &j, const RiskAssessment &risk)
{
    j = nlohmann::json{
        {"policy", toPolicyString(risk.policy)},
        {"score", risk.score},
        {"level", risk.level}
    };
}

inline void to_json(nlohmann::json &j, const TriageReport &report)
{
    j = nlohmann::json{
        {"issueId", report.issueId},
        {"severity", report.severity},
        {"priority", report.priority},
        {"customerHistory", report.history},
        {"similarIssues", report.similarIssues},
        {"alerts", report.alerts},
        {"aiInsights", report.insights},
        {"recommendations", report.recommendations},
        {"analysisMs", report.analysisMs}
    };
}

inline void to_json(nlohmann::json &j, const CustomerRiskProfile &profile)
{
    j = nlohmann::json{
        {"customer", profile.history.customer},
        {"history", profile.history},
        {"risk", profile.risk}
    };
}

} // namespace triage
