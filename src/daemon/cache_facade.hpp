#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include "common/config.hpp"
#include "common/triage_error.hpp"

namespace triage {

enum class CacheKind {
    CustomerHistory,
    Customer,
    IssueAnalysis,
    SimilarIssues,
    Other
};

std::string cacheKindPrefix(CacheKind kind);

// "<kind>:<id>", e.g. "customer_history:42".
std::string cacheKey(CacheKind kind, std::int64_t id);

// Key-value store behind the cache facade. Values are JSON text.
class CacheBackend {
public:
    virtual ~CacheBackend() = default;

    virtual Outcome<std::optional<std::string>> get(const std::string &key,
                                                    std::chrono::milliseconds timeout) = 0;
    virtual Status set(const std::string &key,
                       const std::string &value,
                       std::chrono::seconds ttl,
                       std::chrono::milliseconds timeout) = 0;
    virtual Status remove(const std::string &key, std::chrono::milliseconds timeout) = 0;
    virtual Outcome<int> removePrefix(const std::string &prefix,
                                      std::chrono::milliseconds timeout) = 0;
};

// Process-local TTL map. Expired entries read as misses and are dropped lazily
// or by sweepExpired().
class LocalCacheBackend : public CacheBackend {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    explicit LocalCacheBackend(Clock clock = Clock());

    Outcome<std::optional<std::string>> get(const std::string &key,
                                            std::chrono::milliseconds timeout) override;
    Status set(const std::string &key,
               const std::string &value,
               std::chrono::seconds ttl,
               std::chrono::milliseconds timeout) override;
    Status remove(const std::string &key, std::chrono::milliseconds timeout) override;
    Outcome<int> removePrefix(const std::string &prefix,
                              std::chrono::milliseconds timeout) override;

    int sweepExpired();
    std::size_t size() const;

private:
    struct Entry {
        std::string value;
        std::chrono::steady_clock::time_point expiresAt;
    };

    Clock m_clock;
    mutable std::mutex m_mutex;
    std::unordered_map<std::string, Entry> m_entries;
};

struct CacheStats {
    std::uint64_t hits = 0;
    std::uint64_t misses = 0;
    std::uint64_t remoteFailures = 0;
};

// CacheFacade memoises JSON payloads with a TTL per entity kind. It prefers the
// distributed backend and falls back to the local one whenever that backend
// fails or times out. Cache trouble never reaches the caller.
class CacheFacade {
public:
    CacheFacade(std::shared_ptr<CacheBackend> remote,
                CacheTtls ttls,
                std::chrono::milliseconds timeout,
                LocalCacheBackend::Clock clock = LocalCacheBackend::Clock());

    std::optional<nlohmann::json> get(const std::string &key);
    void set(const std::string &key, const nlohmann::json &value, CacheKind kind);

    void invalidate(const std::string &key);
    void invalidatePrefix(const std::string &prefix);

    std::chrono::seconds ttlFor(CacheKind kind) const;
    int sweepLocal();

    CacheStats stats() const;
    bool hasRemote() const;

private:
    std::shared_ptr<CacheBackend> m_remote;
    LocalCacheBackend m_local;
    CacheTtls m_ttls;
    std::chrono::milliseconds m_timeout;

    std::atomic<std::uint64_t> m_hits{0};
    std::atomic<std::uint64_t> m_misses{0};
    std::atomic<std::uint64_t> m_remoteFailures{0};

    void noteRemoteFailure(const char *where, const TriageError &error);
};

} // namespace triage
