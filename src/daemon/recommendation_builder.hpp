#pragma once

#include <string>
#include <vector>

#include "common/models.hpp"

namespace triage {

// Actionable next steps from severity, precedent and customer risk.
std::vector<std::string> buildRecommendations(Severity severity,
                                              const std::vector<SimilarIssue> &similar,
                                              RiskLevel historyRisk);

} // namespace triage
