#include "daemon/cache_facade.hpp"

#include <future>
#include <system_error>
#include <thread>
#include <utility>

#include "common/logging.hpp"

namespace triage {

namespace {

std::chrono::steady_clock::time_point steadyNow()
{
    return std::chrono::steady_clock::now();
}

// Runs a backend call on a detached worker and stops waiting once the deadline
// passes. The worker keeps its own reference to the backend, so a call that
// returns late only touches live state.
template <typename T>
Outcome<T> callWithDeadline(const std::shared_ptr<CacheBackend> &backend,
                            std::chrono::milliseconds timeout,
                            std::function<Outcome<T>(CacheBackend &)> call)
{
    auto task = std::make_shared<std::packaged_task<Outcome<T>()>>(
        [backend, call = std::move(call)]() { return call(*backend); });
    auto result = task->get_future();
    try {
        std::thread([task]() { (*task)(); }).detach();
    } catch (const std::system_error &ex) {
        return makeError(ErrorKind::CollaboratorUnavailable,
                         std::string("cache worker unavailable: ") + ex.what());
    }

    if (timeout.count() > 0 && result.wait_for(timeout) != std::future_status::ready) {
        return makeError(ErrorKind::CollaboratorUnavailable,
                         "cache call exceeded " + std::to_string(timeout.count()) + " ms");
    }
    try {
        return result.get();
    } catch (const std::exception &ex) {
        return makeError(ErrorKind::CollaboratorUnavailable, ex.what());
    }
}

} // namespace

std::string cacheKindPrefix(CacheKind kind)
{
    switch (kind) {
    case CacheKind::CustomerHistory:
        return "customer_history";
    case CacheKind::Customer:
        return "customer";
    case CacheKind::IssueAnalysis:
        return "issue_analysis";
    case CacheKind::SimilarIssues:
        return "similar_issues";
    case CacheKind::Other:
        return "other";
    }
    return "other";
}

std::string cacheKey(CacheKind kind, std::int64_t id)
{
    return cacheKindPrefix(kind) + ":" + std::to_string(id);
}

LocalCacheBackend::LocalCacheBackend(Clock clock)
    : m_clock(clock ? std::move(clock) : Clock(steadyNow))
{
}

Outcome<std::optional<std::string>> LocalCacheBackend::get(const std::string &key,
                                                           std::chrono::milliseconds)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(key);
    if (it == m_entries.end()) {
        return std::optional<std::string>{};
    }
    if (m_clock() >= it->second.expiresAt) {
        m_entries.erase(it);
        return std::optional<std::string>{};
    }
    return std::optional<std::string>{it->second.value};
}

Status LocalCacheBackend::set(const std::string &key,
                              const std::string &value,
                              std::chrono::seconds ttl,
                              std::chrono::milliseconds)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries[key] = Entry{value, m_clock() + ttl};
    return true;
}

Status LocalCacheBackend::remove(const std::string &key, std::chrono::milliseconds)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries.erase(key);
    return true;
}

Outcome<int> LocalCacheBackend::removePrefix(const std::string &prefix,
                                             std::chrono::milliseconds)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    int removed = 0;
    for (auto it = m_entries.begin(); it != m_entries.end();) {
        if (it->first.compare(0, prefix.size(), prefix) == 0) {
            it = m_entries.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

int LocalCacheBackend::sweepExpired()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto now = m_clock();
    int removed = 0;
    for (auto it = m_entries.begin(); it != m_entries.end();) {
        if (now >= it->second.expiresAt) {
            it = m_entries.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

std::size_t LocalCacheBackend::size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.size();
}

CacheFacade::CacheFacade(std::shared_ptr<CacheBackend> remote,
                         CacheTtls ttls,
                         std::chrono::milliseconds timeout,
                         LocalCacheBackend::Clock clock)
    : m_remote(std::move(remote))
    , m_local(std::move(clock))
    , m_ttls(ttls)
    , m_timeout(timeout)
{
}

std::optional<nlohmann::json> CacheFacade::get(const std::string &key)
{
    std::optional<std::string> payload;
    bool served = false;
    if (m_remote) {
        const auto timeout = m_timeout;
        auto remote = callWithDeadline<std::optional<std::string>>(
            m_remote, m_timeout, [key, timeout](CacheBackend &backend) {
                return backend.get(key, timeout);
            });
        if (remote) {
            payload = remote.value();
            served = true;
        } else {
            noteRemoteFailure("get", remote.error());
        }
    }
    if (!served) {
        auto local = m_local.get(key, m_timeout);
        if (local) {
            payload = local.value();
        }
    }

    if (!payload) {
        ++m_misses;
        return std::nullopt;
    }

    auto parsed = nlohmann::json::parse(*payload, nullptr, false);
    if (parsed.is_discarded()) {
        ++m_misses;
        return std::nullopt;
    }
    ++m_hits;
    return parsed;
}

void CacheFacade::set(const std::string &key, const nlohmann::json &value, CacheKind kind)
{
    // Stored text may come straight from a model reply; invalid UTF-8 is
    // replaced instead of failing the write.
    const std::string payload =
        value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    const auto ttl = ttlFor(kind);
    if (m_remote) {
        const auto timeout = m_timeout;
        auto stored = callWithDeadline<bool>(
            m_remote, m_timeout, [key, payload, ttl, timeout](CacheBackend &backend) {
                return backend.set(key, payload, ttl, timeout);
            });
        if (stored) {
            return;
        }
        noteRemoteFailure("set", stored.error());
    }
    m_local.set(key, payload, ttl, m_timeout);
}

void CacheFacade::invalidate(const std::string &key)
{
    if (m_remote) {
        const auto timeout = m_timeout;
        auto removed = callWithDeadline<bool>(
            m_remote, m_timeout, [key, timeout](CacheBackend &backend) {
                return backend.remove(key, timeout);
            });
        if (!removed) {
            noteRemoteFailure("invalidate", removed.error());
        }
    }
    m_local.remove(key, m_timeout);
}

void CacheFacade::invalidatePrefix(const std::string &prefix)
{
    if (m_remote) {
        const auto timeout = m_timeout;
        auto removed = callWithDeadline<int>(
            m_remote, m_timeout, [prefix, timeout](CacheBackend &backend) {
                return backend.removePrefix(prefix, timeout);
            });
        if (!removed) {
            noteRemoteFailure("invalidatePrefix", removed.error());
        }
    }
    m_local.removePrefix(prefix, m_timeout);
}

std::chrono::seconds CacheFacade::ttlFor(CacheKind kind) const
{
    switch (kind) {
    case CacheKind::CustomerHistory:
        return m_ttls.customerHistory;
    case CacheKind::Customer:
        return m_ttls.customer;
    case CacheKind::IssueAnalysis:
        return m_ttls.issueAnalysis;
    case CacheKind::SimilarIssues:
        return m_ttls.similarIssues;
    case CacheKind::Other:
        return m_ttls.fallback;
    }
    return m_ttls.fallback;
}

int CacheFacade::sweepLocal()
{
    return m_local.sweepExpired();
}

CacheStats CacheFacade::stats() const
{
    CacheStats stats;
    stats.hits = m_hits.load();
    stats.misses = m_misses.load();
    stats.remoteFailures = m_remoteFailures.load();
    return stats;
}

bool CacheFacade::hasRemote() const
{
    return m_remote != nullptr;
}

void CacheFacade::noteRemoteFailure(const char *where, const TriageError &error)
{
    ++m_remoteFailures;
    TLOG_WARN(QStringLiteral("CacheFacade"),
              QString::fromUtf8(where),
              QStringLiteral("cache_remote_unavailable"),
              QString::fromStdString(errorKindName(error.kind)),
              QStringLiteral("local_fallback"),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"error", error.message}}));
}

} // namespace triage
