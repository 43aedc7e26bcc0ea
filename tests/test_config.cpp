#include <QtTest/QtTest>

#include <QDir>
#include <QFile>
#include <QTemporaryDir>

#include "common/config.hpp"

namespace {

const char *const kTriageVariables[] = {
    "TRIAGE_CONFIG", "TRIAGE_DB_PATH", "TRIAGE_SOCKET_NAME", "TRIAGE_LLM_API_KEY",
    "MISTRAL_API_KEY", "ENABLE_AI_ANALYSIS", "TRIAGE_ENABLE_AI_ANALYSIS",
    "ENABLE_SIMILARITY_SEARCH", "TRIAGE_ENABLE_SIMILARITY_SEARCH", "TRIAGE_SIMILAR_LIMIT",
    "TRIAGE_LLM_TIMEOUT_MS", "TRIAGE_LOG_LEVEL", "TRIAGE_TRACE", "XDG_RUNTIME_DIR",
    "REDIS_HOST", "REDIS_PORT", "REDIS_PASSWORD", "REDIS_DB",
};

} // namespace

class ConfigTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();

    void testDefaults();
    void testJsonOverlay();
    void testEnvironmentWinsOverFile();
    void testInvalidFileIgnored();
    void testTypeMismatchFallsBackToDefaults();
    void testConfigToJsonHidesKey();
    void testRedisSettings();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;

    void writeConfigFile(const QByteArray &contents);
};

void ConfigTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void ConfigTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void ConfigTests::init()
{
    for (const char *name : kTriageVariables) {
        qunsetenv(name);
    }
    QFile::remove(QString::fromStdString(triage::configFilePath()));
}

void ConfigTests::writeConfigFile(const QByteArray &contents)
{
    const QString path = QString::fromStdString(triage::configFilePath());
    QVERIFY(QDir().mkpath(QFileInfo(path).absolutePath()));
    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly | QIODevice::Truncate));
    file.write(contents);
}

void ConfigTests::testDefaults()
{
    const auto config = triage::loadConfig();
    QCOMPARE(config.databasePath,
             m_tempDir.path().toStdString() + "/.local/share/triage/triage.db");
    QVERIFY(config.aiAnalysisEnabled);
    QVERIFY(config.similaritySearchEnabled);
    QCOMPARE(config.corpusLimit, 1000);
    QCOMPARE(config.maxFeatures, 1000);
    QCOMPARE(config.similarityThreshold, 0.1);
    QCOMPARE(config.similarLimit, 5);
    QCOMPARE(config.cacheTtls.customerHistory, std::chrono::seconds(300));
    QCOMPARE(config.cacheTtls.issueAnalysis, std::chrono::seconds(1800));
    QCOMPARE(config.cacheTtls.similarIssues, std::chrono::seconds(3600));
    QVERIFY(config.completionApiKey.empty());
    QCOMPARE(triage::configFilePath(), m_tempDir.path().toStdString() + "/.config/triage/config.json");
}

void ConfigTests::testJsonOverlay()
{
    auto config = triage::defaultConfig();
    triage::applyConfigJson(config, nlohmann::json{
        {"enableAiAnalysis", false},
        {"similarLimit", 8},
        {"llmTimeoutMs", 2500},
        {"storeTimeoutMs", -1},
        {"cacheTtlSeconds", {{"customerHistory", 60}, {"default", 120}}},
        {"unknownKey", "ignored"}
    });
    QVERIFY(!config.aiAnalysisEnabled);
    QCOMPARE(config.similarLimit, 8);
    QCOMPARE(config.llmTimeout, std::chrono::milliseconds(2500));
    QCOMPARE(config.storeTimeout, std::chrono::milliseconds(5000));
    QCOMPARE(config.cacheTtls.customerHistory, std::chrono::seconds(60));
    QCOMPARE(config.cacheTtls.fallback, std::chrono::seconds(120));
    QCOMPARE(config.cacheTtls.customer, std::chrono::seconds(300));
}

void ConfigTests::testEnvironmentWinsOverFile()
{
    writeConfigFile(R"({"databasePath": "/tmp/from-file.db", "similarLimit": 3, "trace": false})");
    qputenv("TRIAGE_DB_PATH", "/tmp/from-env.db");
    qputenv("TRIAGE_TRACE", "yes");
    qputenv("ENABLE_AI_ANALYSIS", "off");
    qputenv("MISTRAL_API_KEY", "secret");

    const auto config = triage::loadConfig();
    QCOMPARE(config.databasePath, std::string("/tmp/from-env.db"));
    QCOMPARE(config.similarLimit, 3);
    QVERIFY(config.trace);
    QVERIFY(!config.aiAnalysisEnabled);
    QCOMPARE(config.completionApiKey, std::string("secret"));
}

void ConfigTests::testInvalidFileIgnored()
{
    writeConfigFile("{ not json");
    const auto config = triage::loadConfig();
    QCOMPARE(config.similarLimit, 5);
}

void ConfigTests::testTypeMismatchFallsBackToDefaults()
{
    writeConfigFile(R"({"corpusLimit": 50, "similarLimit": "many"})");
    const auto config = triage::loadConfig();
    QCOMPARE(config.corpusLimit, 1000);
    QCOMPARE(config.similarLimit, 5);
}

void ConfigTests::testConfigToJsonHidesKey()
{
    auto config = triage::defaultConfig();
    config.completionApiKey = "secret";
    const auto json = triage::configToJson(config);
    QVERIFY(!json.contains("completionApiKey"));
    QVERIFY(json["completionApiKeySet"].get<bool>());
    QCOMPARE(json["similarLimit"].get<int>(), 5);
    QVERIFY(json.dump().find("secret") == std::string::npos);
}

void ConfigTests::testRedisSettings()
{
    auto config = triage::loadConfig();
    QVERIFY(config.redisHost.empty());
    QCOMPARE(config.redisPort, 6379);
    QCOMPARE(config.redisDb, 0);

    writeConfigFile(R"({"redisHost": "cache.internal", "redisPort": 6380, "redisDb": 2})");
    qputenv("REDIS_PORT", "7000");
    qputenv("REDIS_PASSWORD", "hunter2");
    config = triage::loadConfig();
    QCOMPARE(config.redisHost, std::string("cache.internal"));
    QCOMPARE(config.redisPort, 7000);
    QCOMPARE(config.redisDb, 2);
    QCOMPARE(config.redisPassword, std::string("hunter2"));

    const auto json = triage::configToJson(config);
    QVERIFY(json["redisPasswordSet"].get<bool>());
    QVERIFY(json.dump().find("hunter2") == std::string::npos);
}

QTEST_MAIN(ConfigTests)
#include "test_config.moc"
