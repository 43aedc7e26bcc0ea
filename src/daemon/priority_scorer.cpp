#include "daemon/priority_scorer.hpp"

#include <algorithm>

namespace triage {

namespace {

constexpr int kBasePriority = 5;
constexpr int kMinPriority = 1;
constexpr int kMaxPriority = 10;
// More precedents than this make an issue presumably easier.
constexpr std::size_t kWellPrecedentedCount = 3;

int severityAdjustment(Severity severity)
{
    switch (severity) {
    case Severity::Critical:
        return 4;
    case Severity::High:
        return 3;
    case Severity::Normal:
        return 0;
    case Severity::Low:
        return -2;
    }
    return 0;
}

int tierAdjustment(CustomerTier tier)
{
    switch (tier) {
    case CustomerTier::Enterprise:
        return 2;
    case CustomerTier::Premium:
        return 1;
    case CustomerTier::Basic:
        return 0;
    }
    return 0;
}

int riskAdjustment(RiskLevel risk)
{
    switch (risk) {
    case RiskLevel::High:
        return 2;
    case RiskLevel::Medium:
        return 1;
    case RiskLevel::Low:
        return 0;
    }
    return 0;
}

} // namespace

int PriorityScorer::score(Severity severity,
                          CustomerTier tier,
                          RiskLevel historyRisk,
                          std::size_t similarCount)
{
    int priority = kBasePriority;
    priority += severityAdjustment(severity);
    priority += tierAdjustment(tier);
    priority += riskAdjustment(historyRisk);
    if (similarCount > kWellPrecedentedCount) {
        priority -= 1;
    }
    return std::clamp(priority, kMinPriority, kMaxPriority);
}

} // namespace triage
