#include "daemon/recommendation_builder.hpp"

#include <cstdio>

namespace triage {

namespace {

constexpr double kDefaultResolutionHours = 24.0;

} // namespace

std::vector<std::string> buildRecommendations(Severity severity,
                                              const std::vector<SimilarIssue> &similar,
                                              RiskLevel historyRisk)
{
    std::vector<std::string> recommendations;

    if (severity == Severity::Critical) {
        recommendations.insert(recommendations.end(), {
            "Immediately assign to senior technical team",
            "Notify customer within 15 minutes",
            "Set up war room if needed",
            "Prepare executive escalation path"
        });
    } else if (severity == Severity::High) {
        recommendations.insert(recommendations.end(), {
            "Assign to experienced support engineer",
            "Respond to customer within 1 hour",
            "Monitor progress every 2 hours"
        });
    }

    if (!similar.empty()) {
        double total = 0.0;
        for (const auto &issue : similar) {
            total += issue.resolutionHours.value_or(kDefaultResolutionHours);
        }
        char buffer[32];
        std::snprintf(buffer, sizeof(buffer), "%.1f", total / similar.size());
        recommendations.push_back(
            std::string("Based on similar issues, expected resolution time: ") + buffer + " hours");

        if (similar.size() >= 3) {
            recommendations.push_back("Review knowledge base articles from similar resolved issues");
        }
    }

    if (historyRisk == RiskLevel::High) {
        recommendations.insert(recommendations.end(), {
            "Consider proactive communication",
            "Involve account manager if available",
            "Document all interactions thoroughly"
        });
    }

    return recommendations;
}

} // namespace triage
