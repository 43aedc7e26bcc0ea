#pragma once

#include "common/models.hpp"

namespace triage {

// RiskScorer turns a customer history aggregate into a bounded risk score.
// The two policies keep their own weights and thresholds:
//   History   - immediate triage, High at >= 6, Medium at >= 3.
//   Dashboard - periodic account review, High at >= 7, Medium at >= 4.
class RiskScorer {
public:
    static RiskAssessment score(const CustomerHistory &history, RiskPolicy policy);

    static RiskAssessment scoreHistory(const CustomerHistory &history);
    static RiskAssessment scoreDashboard(const CustomerHistory &history);

    static RiskLevel bucket(double score, RiskPolicy policy);
};

} // namespace triage
