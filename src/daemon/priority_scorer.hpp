#pragma once

#include <cstddef>

#include "common/enums.hpp"

namespace triage {

class PriorityScorer {
public:
    // Always within [1, 10].
    static int score(Severity severity,
                     CustomerTier tier,
                     RiskLevel historyRisk,
                     std::size_t similarCount);
};

} // namespace triage
