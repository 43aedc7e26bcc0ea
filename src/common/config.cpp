#include "common/config.hpp"

#include <QFile>
#include <QString>
#include <QtGlobal>

#include <unistd.h>

#include "common/logging.hpp"

namespace triage {

namespace {

std::string homeDir()
{
    const QString home = qEnvironmentVariable("HOME");
    return home.isEmpty() ? std::string(".") : home.toStdString();
}

bool parseBool(const QString &value, bool fallback)
{
    const QString lowered = value.trimmed().toLower();
    if (lowered == QStringLiteral("1") || lowered == QStringLiteral("true")
        || lowered == QStringLiteral("yes") || lowered == QStringLiteral("on")) {
        return true;
    }
    if (lowered == QStringLiteral("0") || lowered == QStringLiteral("false")
        || lowered == QStringLiteral("no") || lowered == QStringLiteral("off")) {
        return false;
    }
    return fallback;
}

void envString(const char *name, std::string &target)
{
    if (qEnvironmentVariableIsSet(name)) {
        const QString value = qEnvironmentVariable(name);
        if (!value.isEmpty()) {
            target = value.toStdString();
        }
    }
}

void envBool(const char *name, bool &target)
{
    if (qEnvironmentVariableIsSet(name)) {
        target = parseBool(qEnvironmentVariable(name), target);
    }
}

void envInt(const char *name, int &target)
{
    bool ok = false;
    const int value = qEnvironmentVariableIntValue(name, &ok);
    if (ok && value > 0) {
        target = value;
    }
}

void envNonNegativeInt(const char *name, int &target)
{
    bool ok = false;
    const int value = qEnvironmentVariableIntValue(name, &ok);
    if (ok && value >= 0) {
        target = value;
    }
}

template <typename Duration>
void envDuration(const char *name, Duration &target)
{
    bool ok = false;
    const int value = qEnvironmentVariableIntValue(name, &ok);
    if (ok && value > 0) {
        target = Duration(value);
    }
}

template <typename Duration>
void jsonDuration(const nlohmann::json &json, const char *key, Duration &target)
{
    if (json.contains(key) && json.at(key).is_number_integer()) {
        const auto value = json.at(key).get<long long>();
        if (value > 0) {
            target = Duration(value);
        }
    }
}

} // namespace

TriageConfig defaultConfig()
{
    TriageConfig config;
    config.databasePath = homeDir() + "/.local/share/triage/triage.db";

    QString runtimeDir = qEnvironmentVariable("XDG_RUNTIME_DIR");
    if (runtimeDir.isEmpty()) {
        runtimeDir = QStringLiteral("/run/user/%1").arg(getuid());
    }
    config.socketName = (runtimeDir + QStringLiteral("/triage.sock")).toStdString();
    return config;
}

void applyConfigJson(TriageConfig &config, const nlohmann::json &json)
{
    if (!json.is_object()) {
        return;
    }
    config.databasePath = json.value("databasePath", config.databasePath);
    config.socketName = json.value("socketName", config.socketName);
    config.completionUrl = json.value("completionUrl", config.completionUrl);
    config.completionPath = json.value("completionPath", config.completionPath);
    config.completionModel = json.value("completionModel", config.completionModel);
    config.completionApiKey = json.value("completionApiKey", config.completionApiKey);
    config.aiAnalysisEnabled = json.value("enableAiAnalysis", config.aiAnalysisEnabled);
    config.similaritySearchEnabled =
        json.value("enableSimilaritySearch", config.similaritySearchEnabled);
    config.corpusLimit = json.value("corpusLimit", config.corpusLimit);
    config.maxFeatures = json.value("maxFeatures", config.maxFeatures);
    config.similarityThreshold =
        json.value("similarityThreshold", config.similarityThreshold);
    config.similarLimit = json.value("similarLimit", config.similarLimit);
    jsonDuration(json, "llmTimeoutMs", config.llmTimeout);
    jsonDuration(json, "storeTimeoutMs", config.storeTimeout);
    jsonDuration(json, "cacheTimeoutMs", config.cacheTimeout);
    jsonDuration(json, "housekeepingIntervalMinutes", config.housekeepingInterval);
    jsonDuration(json, "alertRetentionHours", config.alertRetention);
    if (json.contains("cacheTtlSeconds") && json.at("cacheTtlSeconds").is_object()) {
        const auto &ttl = json.at("cacheTtlSeconds");
        jsonDuration(ttl, "customerHistory", config.cacheTtls.customerHistory);
        jsonDuration(ttl, "customer", config.cacheTtls.customer);
        jsonDuration(ttl, "issueAnalysis", config.cacheTtls.issueAnalysis);
        jsonDuration(ttl, "similarIssues", config.cacheTtls.similarIssues);
        jsonDuration(ttl, "default", config.cacheTtls.fallback);
    }
    config.redisHost = json.value("redisHost", config.redisHost);
    config.redisPort = json.value("redisPort", config.redisPort);
    config.redisPassword = json.value("redisPassword", config.redisPassword);
    config.redisDb = json.value("redisDb", config.redisDb);
    config.logLevel = json.value("logLevel", config.logLevel);
    config.trace = json.value("trace", config.trace);
}

void applyEnvironment(TriageConfig &config)
{
    envString("TRIAGE_DB_PATH", config.databasePath);
    envString("TRIAGE_SOCKET_NAME", config.socketName);
    envString("TRIAGE_LLM_URL", config.completionUrl);
    envString("TRIAGE_LLM_PATH", config.completionPath);
    envString("TRIAGE_LLM_MODEL", config.completionModel);
    envString("MISTRAL_API_KEY", config.completionApiKey);
    envString("TRIAGE_LLM_API_KEY", config.completionApiKey);
    envBool("ENABLE_AI_ANALYSIS", config.aiAnalysisEnabled);
    envBool("TRIAGE_ENABLE_AI_ANALYSIS", config.aiAnalysisEnabled);
    envBool("ENABLE_SIMILARITY_SEARCH", config.similaritySearchEnabled);
    envBool("TRIAGE_ENABLE_SIMILARITY_SEARCH", config.similaritySearchEnabled);
    envInt("TRIAGE_CORPUS_LIMIT", config.corpusLimit);
    envInt("TRIAGE_MAX_FEATURES", config.maxFeatures);
    envInt("TRIAGE_SIMILAR_LIMIT", config.similarLimit);
    envDuration("TRIAGE_LLM_TIMEOUT_MS", config.llmTimeout);
    envDuration("TRIAGE_STORE_TIMEOUT_MS", config.storeTimeout);
    envDuration("TRIAGE_CACHE_TIMEOUT_MS", config.cacheTimeout);
    envString("REDIS_HOST", config.redisHost);
    envInt("REDIS_PORT", config.redisPort);
    envString("REDIS_PASSWORD", config.redisPassword);
    envNonNegativeInt("REDIS_DB", config.redisDb);
    envString("TRIAGE_LOG_LEVEL", config.logLevel);
    envBool("TRIAGE_TRACE", config.trace);
}

std::string configFilePath()
{
    const QString explicitPath = qEnvironmentVariable("TRIAGE_CONFIG");
    if (!explicitPath.isEmpty()) {
        return explicitPath.toStdString();
    }
    return homeDir() + "/.config/triage/config.json";
}

TriageConfig loadConfig()
{
    TriageConfig config = defaultConfig();

    const QString path = QString::fromStdString(configFilePath());
    QFile file(path);
    if (file.exists() && file.open(QIODevice::ReadOnly)) {
        const auto parsed = nlohmann::json::parse(file.readAll().toStdString(), nullptr, false);
        if (parsed.is_discarded() || !parsed.is_object()) {
            TLOG_WARN(QStringLiteral("Config"),
                      QStringLiteral("loadConfig"),
                      QStringLiteral("config_file_ignored"),
                      QStringLiteral("invalid_json"),
                      QStringLiteral("json_parse"),
                      logging::defaultWho(),
                      QString(),
                      (nlohmann::json{{"path", path.toStdString()}}));
        } else {
            try {
                applyConfigJson(config, parsed);
            } catch (const nlohmann::json::type_error &ex) {
                TLOG_WARN(QStringLiteral("Config"),
                          QStringLiteral("loadConfig"),
                          QStringLiteral("config_file_ignored"),
                          QStringLiteral("type_mismatch"),
                          QStringLiteral("json_parse"),
                          logging::defaultWho(),
                          QString(),
                          (nlohmann::json{{"path", path.toStdString()},
                                          {"error", ex.what()}}));
                config = defaultConfig();
            }
        }
    }

    applyEnvironment(config);
    return config;
}

nlohmann::json configToJson(const TriageConfig &config)
{
    return nlohmann::json{
        {"databasePath", config.databasePath},
        {"socketName", config.socketName},
        {"completionUrl", config.completionUrl},
        {"completionPath", config.completionPath},
        {"completionModel", config.completionModel},
        {"completionApiKeySet", !config.completionApiKey.empty()},
        {"enableAiAnalysis", config.aiAnalysisEnabled},
        {"enableSimilaritySearch", config.similaritySearchEnabled},
        {"corpusLimit", config.corpusLimit},
        {"maxFeatures", config.maxFeatures},
        {"similarityThreshold", config.similarityThreshold},
        {"similarLimit", config.similarLimit},
        {"llmTimeoutMs", config.llmTimeout.count()},
        {"storeTimeoutMs", config.storeTimeout.count()},
        {"cacheTimeoutMs", config.cacheTimeout.count()},
        {"redisHost", config.redisHost},
        {"redisPort", config.redisPort},
        {"redisPasswordSet", !config.redisPassword.empty()},
        {"redisDb", config.redisDb},
        {"logLevel", config.logLevel},
        {"trace", config.trace}
    };
}

} // namespace triage
