#pragma once

#include <chrono>
#include <string>

#include <nlohmann/json.hpp>

namespace triage {

struct CacheTtls {
    std::chrono::seconds customerHistory{300};
    std::chrono::seconds customer{300};
    std::chrono::seconds issueAnalysis{1800};
    std::chrono::seconds similarIssues{3600};
    std::chrono::seconds fallback{3600};
};

// Runtime settings. Resolution order: defaults, JSON config file, environment.
struct TriageConfig {
    std::string databasePath;
    std::string socketName;

    std::string completionUrl = "https://api.mistral.ai";
    std::string completionPath = "/v1/chat/completions";
    std::string completionModel = "mistral-small-latest";
    std::string completionApiKey;

    bool aiAnalysisEnabled = true;
    bool similaritySearchEnabled = true;

    int corpusLimit = 1000;
    int maxFeatures = 1000;
    double similarityThreshold = 0.1;
    int similarLimit = 5;

    std::chrono::milliseconds llmTimeout{10000};
    std::chrono::milliseconds storeTimeout{5000};
    std::chrono::milliseconds cacheTimeout{5000};

    CacheTtls cacheTtls;

    // Distributed cache. An empty host keeps the cache process-local.
    std::string redisHost;
    int redisPort = 6379;
    std::string redisPassword;
    int redisDb = 0;

    std::chrono::minutes housekeepingInterval{60};
    std::chrono::hours alertRetention{24 * 90};

    std::string logLevel = "info";
    bool trace = false;
};

TriageConfig defaultConfig();

// Overlays recognised keys of a JSON object onto config. Unknown keys are ignored.
void applyConfigJson(TriageConfig &config, const nlohmann::json &json);

// Overlays TRIAGE_* (and MISTRAL_API_KEY) environment variables onto config.
void applyEnvironment(TriageConfig &config);

std::string configFilePath();

// defaults -> config file (if present and valid) -> environment.
TriageConfig loadConfig();

nlohmann::json configToJson(const TriageConfig &config);

} // namespace triage
