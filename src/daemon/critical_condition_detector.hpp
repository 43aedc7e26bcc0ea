#pragma once

#include <cstdint>
#include <vector>

#include "common/cancellation.hpp"
#include "common/models.hpp"
#include "common/triage_error.hpp"
#include "daemon/issue_store.hpp"

namespace triage {

// CriticalConditionDetector evaluates a customer's issues for unattended
// critical work and clusters of high-severity issues.
// Unattended alerts are persisted (at most one Active per issue); the
// customer-scoped cluster alert is returned only.
class CriticalConditionDetector {
public:
    explicit CriticalConditionDetector(IssueStore &store);

    // Pure evaluation; nothing is written.
    static std::vector<CriticalAlert> evaluate(std::int64_t customerId,
                                               const std::vector<Issue> &issues,
                                               TimePoint now);

    Outcome<std::vector<CriticalAlert>> detect(std::int64_t customerId,
                                               TimePoint now,
                                               const CancellationToken &cancel);

private:
    IssueStore &m_store;
};

} // namespace triage
