#include "daemon/risk_scorer.hpp"

#include <algorithm>

namespace triage {

namespace {

constexpr double kMaxScore = 10.0;
constexpr double kSlowResolutionHours = 48.0;

double capped(double score)
{
    return std::clamp(score, 0.0, kMaxScore);
}

} // namespace

RiskAssessment RiskScorer::score(const CustomerHistory &history, RiskPolicy policy)
{
    return policy == RiskPolicy::Dashboard ? scoreDashboard(history) : scoreHistory(history);
}

RiskAssessment RiskScorer::scoreHistory(const CustomerHistory &history)
{
    double score = 0.0;

    if (history.totalIssues > 20) {
        score += 2.0;
    } else if (history.totalIssues > 10) {
        score += 1.0;
    }

    if (history.criticalIssues > 0) {
        score += 3.0;
    }
    if (history.highIssues > 3) {
        score += 2.0;
    }

    if (history.recentIssues > 5) {
        score += 2.0;
    }

    if (history.averageResolutionHours.value_or(0.0) > kSlowResolutionHours) {
        score += 2.0;
    }

    RiskAssessment assessment;
    assessment.policy = RiskPolicy::History;
    assessment.score = capped(score);
    assessment.level = bucket(assessment.score, RiskPolicy::History);
    return assessment;
}

RiskAssessment RiskScorer::scoreDashboard(const CustomerHistory &history)
{
    double score = 0.0;

    if (history.totalIssues > 20) {
        score += 3.0;
    } else if (history.totalIssues > 10) {
        score += 2.0;
    } else if (history.totalIssues > 5) {
        score += 1.0;
    }

    score += history.criticalIssues * 2.0;
    score += history.highIssues * 1.0;
    score += history.openIssues * 1.5;

    if (history.recentIssues > 5) {
        score += 2.0;
    } else if (history.recentIssues > 2) {
        score += 1.0;
    }

    // Customers without any rating are not penalised.
    if (history.averageSatisfaction) {
        if (*history.averageSatisfaction < 3.0) {
            score += 2.0;
        } else if (*history.averageSatisfaction < 4.0) {
            score += 1.0;
        }
    }

    if (history.averageResolutionHours.value_or(0.0) > kSlowResolutionHours) {
        score += 1.0;
    }

    RiskAssessment assessment;
    assessment.policy = RiskPolicy::Dashboard;
    assessment.score = capped(score);
    assessment.level = bucket(assessment.score, RiskPolicy::Dashboard);
    return assessment;
}

RiskLevel RiskScorer::bucket(double score, RiskPolicy policy)
{
    const double high = policy == RiskPolicy::Dashboard ? 7.0 : 6.0;
    const double medium = policy == RiskPolicy::Dashboard ? 4.0 : 3.0;
    if (score >= high) {
        return RiskLevel::High;
    }
    if (score >= medium) {
        return RiskLevel::Medium;
    }
    return RiskLevel::Low;
}

} // namespace triage
