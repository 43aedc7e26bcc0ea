#include "daemon/customer_history.hpp"

#include <chrono>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "daemon/risk_scorer.hpp"

namespace triage {

namespace {

constexpr auto kRecentWindow = std::chrono::hours(24 * 30);
constexpr std::size_t kRecentIssueCount = 10;

template <typename T>
std::optional<T> decodeCached(const std::optional<nlohmann::json> &cached, const char *kind)
{
    if (!cached) {
        return std::nullopt;
    }
    try {
        return cached->get<T>();
    } catch (const nlohmann::json::exception &ex) {
        TLOG_WARN(QStringLiteral("CustomerHistoryService"),
                  QStringLiteral("decodeCached"),
                  QStringLiteral("cache_payload_ignored"),
                  QStringLiteral("decode_failed"),
                  QStringLiteral("recompute"),
                  logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"kind", kind}, {"error", ex.what()}}));
        return std::nullopt;
    }
}

} // namespace

CustomerHistoryService::CustomerHistoryService(IssueStore &store, CacheFacade &cache)
    : m_store(store)
    , m_cache(cache)
{
}

CustomerHistory CustomerHistoryService::aggregate(const Customer &customer,
                                                  const std::vector<Issue> &issues,
                                                  std::optional<double> averageSatisfaction,
                                                  TimePoint now)
{
    CustomerHistory history;
    history.customer = customer;
    history.averageSatisfaction = averageSatisfaction;

    double resolutionTotal = 0.0;
    int resolutionCount = 0;
    for (const auto &issue : issues) {
        ++history.totalIssues;
        ++history.statusCounts[toStatusString(issue.status)];
        ++history.severityCounts[toSeverityString(issue.severity)];

        if (issue.status == IssueStatus::Resolved) {
            ++history.resolvedIssues;
        }
        if (issue.status == IssueStatus::Open || issue.status == IssueStatus::InProgress) {
            ++history.openIssues;
        }
        if (issue.severity == Severity::Critical) {
            ++history.criticalIssues;
        }
        if (issue.severity == Severity::High) {
            ++history.highIssues;
        }
        if (issue.createdAt >= now - kRecentWindow) {
            ++history.recentIssues;
        }
        if (issue.resolutionHours) {
            resolutionTotal += *issue.resolutionHours;
            ++resolutionCount;
        }
        if (!history.lastIssueAt || issue.createdAt > *history.lastIssueAt) {
            history.lastIssueAt = issue.createdAt;
        }
        if (history.recent.size() < kRecentIssueCount) {
            history.recent.push_back(issue);
        }
    }

    if (resolutionCount > 0) {
        history.averageResolutionHours = resolutionTotal / resolutionCount;
    }
    history.riskLevel = RiskScorer::scoreHistory(history).level;
    return history;
}

Outcome<Customer> CustomerHistoryService::customer(std::int64_t customerId)
{
    if (customerId <= 0) {
        return makeError(ErrorKind::InvalidInput, "customer id must be positive");
    }

    const std::string key = cacheKey(CacheKind::Customer, customerId);
    if (auto cached = decodeCached<Customer>(m_cache.get(key), "customer")) {
        return *cached;
    }

    auto loaded = m_store.getCustomer(customerId);
    if (!loaded) {
        return loaded.error();
    }
    m_cache.set(key, nlohmann::json(loaded.value()), CacheKind::Customer);
    return loaded;
}

Outcome<CustomerHistory> CustomerHistoryService::load(std::int64_t customerId, TimePoint now)
{
    if (customerId <= 0) {
        return makeError(ErrorKind::InvalidInput, "customer id must be positive");
    }

    const std::string key = cacheKey(CacheKind::CustomerHistory, customerId);
    if (auto cached = decodeCached<CustomerHistory>(m_cache.get(key), "customer_history")) {
        return *cached;
    }

    auto owner = customer(customerId);
    if (!owner) {
        return owner.error();
    }

    IssueFilter filter;
    filter.customerId = customerId;
    filter.limit = 0;
    auto issues = m_store.listIssues(filter);
    if (!issues) {
        return issues.error();
    }

    auto satisfaction = m_store.averageSatisfaction(customerId);
    if (!satisfaction) {
        return satisfaction.error();
    }

    CustomerHistory history = aggregate(owner.value(), issues.value(), satisfaction.value(), now);
    m_cache.set(key, nlohmann::json(history), CacheKind::CustomerHistory);
    return history;
}

void CustomerHistoryService::invalidate(std::int64_t customerId)
{
    m_cache.invalidate(cacheKey(CacheKind::CustomerHistory, customerId));
    m_cache.invalidate(cacheKey(CacheKind::Customer, customerId));
}

} // namespace triage
