#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "common/config.hpp"
#include "daemon/cache_facade.hpp"

namespace sw::redis {
class Redis;
}

namespace triage {

// RedisCacheBackend keeps cache payloads in Redis with a server-side TTL.
// Connect and socket timeouts come from the cache timeout; every Redis error
// is reported as CollaboratorUnavailable.
class RedisCacheBackend : public CacheBackend {
public:
    struct Options {
        std::string host;
        int port = 6379;
        std::string password;
        int db = 0;
        std::chrono::milliseconds timeout{5000};
        int poolSize = 4;
    };

    explicit RedisCacheBackend(const Options &options);
    ~RedisCacheBackend() override;

    static Options optionsFromConfig(const TriageConfig &config);

    Outcome<std::optional<std::string>> get(const std::string &key,
                                            std::chrono::milliseconds timeout) override;
    Status set(const std::string &key,
               const std::string &value,
               std::chrono::seconds ttl,
               std::chrono::milliseconds timeout) override;
    Status remove(const std::string &key, std::chrono::milliseconds timeout) override;
    Outcome<int> removePrefix(const std::string &prefix,
                              std::chrono::milliseconds timeout) override;

    // PING round trip.
    Status ping();

private:
    std::unique_ptr<sw::redis::Redis> m_redis;
};

} // namespace triage
