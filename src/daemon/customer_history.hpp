#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "common/models.hpp"
#include "common/triage_error.hpp"
#include "daemon/cache_facade.hpp"
#include "daemon/issue_store.hpp"

namespace triage {

// CustomerHistoryService builds the per-customer history aggregate and
// memoises it (and the customer record) through the cache facade.
class CustomerHistoryService {
public:
    CustomerHistoryService(IssueStore &store, CacheFacade &cache);

    // issues must belong to customer and be ordered newest first.
    static CustomerHistory aggregate(const Customer &customer,
                                     const std::vector<Issue> &issues,
                                     std::optional<double> averageSatisfaction,
                                     TimePoint now);

    Outcome<Customer> customer(std::int64_t customerId);
    Outcome<CustomerHistory> load(std::int64_t customerId, TimePoint now);

    // Drops the cached history and customer record.
    void invalidate(std::int64_t customerId);

private:
    IssueStore &m_store;
    CacheFacade &m_cache;
};

} // namespace triage
