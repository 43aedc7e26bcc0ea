#include "daemon/redis_cache_backend.hpp"

#include <iterator>
#include <vector>

#include <sw/redis++/redis++.h>

namespace triage {

namespace {

constexpr long long kScanBatch = 100;

TriageError redisError(const char *operation, const sw::redis::Error &error)
{
    return makeError(ErrorKind::CollaboratorUnavailable,
                     std::string("redis ") + operation + ": " + error.what());
}

// Escapes glob metacharacters so a key prefix matches literally in SCAN.
std::string literalPattern(const std::string &prefix)
{
    std::string pattern;
    pattern.reserve(prefix.size() + 1);
    for (char c : prefix) {
        if (c == '*' || c == '?' || c == '[' || c == ']' || c == '\\') {
            pattern += '\\';
        }
        pattern += c;
    }
    pattern += '*';
    return pattern;
}

} // namespace

RedisCacheBackend::RedisCacheBackend(const Options &options)
{
    sw::redis::ConnectionOptions connection;
    connection.host = options.host;
    connection.port = options.port;
    connection.db = options.db;
    if (!options.password.empty()) {
        connection.password = options.password;
    }
    connection.connect_timeout = options.timeout;
    connection.socket_timeout = options.timeout;

    sw::redis::ConnectionPoolOptions pool;
    pool.size = static_cast<std::size_t>(options.poolSize);
    pool.wait_timeout = options.timeout;

    m_redis = std::make_unique<sw::redis::Redis>(connection, pool);
}

RedisCacheBackend::~RedisCacheBackend() = default;

RedisCacheBackend::Options RedisCacheBackend::optionsFromConfig(const TriageConfig &config)
{
    Options options;
    options.host = config.redisHost;
    options.port = config.redisPort;
    options.password = config.redisPassword;
    options.db = config.redisDb;
    options.timeout = config.cacheTimeout;
    return options;
}

Outcome<std::optional<std::string>> RedisCacheBackend::get(const std::string &key,
                                                           std::chrono::milliseconds)
{
    try {
        auto value = m_redis->get(key);
        if (!value) {
            return std::optional<std::string>{};
        }
        return std::optional<std::string>{*value};
    } catch (const sw::redis::Error &error) {
        return redisError("GET", error);
    }
}

Status RedisCacheBackend::set(const std::string &key,
                              const std::string &value,
                              std::chrono::seconds ttl,
                              std::chrono::milliseconds)
{
    try {
        return m_redis->set(key, value,
                            std::chrono::duration_cast<std::chrono::milliseconds>(ttl));
    } catch (const sw::redis::Error &error) {
        return redisError("SET", error);
    }
}

Status RedisCacheBackend::remove(const std::string &key, std::chrono::milliseconds)
{
    try {
        m_redis->del(key);
        return true;
    } catch (const sw::redis::Error &error) {
        return redisError("DEL", error);
    }
}

Outcome<int> RedisCacheBackend::removePrefix(const std::string &prefix,
                                             std::chrono::milliseconds)
{
    const std::string pattern = literalPattern(prefix);
    try {
        long long removed = 0;
        long long cursor = 0;
        do {
            std::vector<std::string> keys;
            cursor = m_redis->scan(cursor, pattern, kScanBatch, std::back_inserter(keys));
            if (!keys.empty()) {
                removed += m_redis->del(keys.begin(), keys.end());
            }
        } while (cursor != 0);
        return static_cast<int>(removed);
    } catch (const sw::redis::Error &error) {
        return redisError("SCAN/DEL", error);
    }
}

Status RedisCacheBackend::ping()
{
    try {
        m_redis->ping();
        return true;
    } catch (const sw::redis::Error &error) {
        return redisError("PING", error);
    }
}

} // namespace triage
