#include <QtTest/QtTest>

#include <QTemporaryDir>
#include <QFile>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

using triage::logging::LogLevel;

namespace {

void logTestEvent(LogLevel level, const QString &what, const QString &corr)
{
    triage::logging::logEvent(level,
                              QStringLiteral("triage-test"),
                              QStringLiteral("Test"),
                              QStringLiteral("logTestEvent"),
                              what,
                              QStringLiteral("unit_test"),
                              QStringLiteral("direct_call"),
                              triage::logging::defaultWho(),
                              corr,
                              nlohmann::json{{"key", "value"}});
}

QList<nlohmann::json> readEvents(const QString &path)
{
    QList<nlohmann::json> events;
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return events;
    }
    while (!file.atEnd()) {
        const QByteArray line = file.readLine().trimmed();
        if (!line.isEmpty()) {
            events.append(nlohmann::json::parse(line.toStdString()));
        }
    }
    return events;
}

} // namespace

class LoggingTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void testLogEventWrites();
    void testTraceWrites();
    void testMinimumLevelFilters();
    void testCorrelationScope();
    void testParseLogLevel();
    void testCustomDirectory();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;

    QString defaultLogPath(const QString &suffix) const;
};

void LoggingTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void LoggingTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

QString LoggingTests::defaultLogPath(const QString &suffix) const
{
    return m_tempDir.path() + "/.local/share/triage/logs/triage-test" + suffix;
}

void LoggingTests::testLogEventWrites()
{
    triage::logging::initLogging(QStringLiteral("triage-test"), false);
    QFile::remove(defaultLogPath(".log"));

    logTestEvent(LogLevel::Info, QStringLiteral("test_log"), QStringLiteral("corr-1"));

    const auto events = readEvents(defaultLogPath(".log"));
    QCOMPARE(events.size(), 1);
    QCOMPARE(QString::fromStdString(events[0].value("what", "")), QStringLiteral("test_log"));
    QCOMPARE(QString::fromStdString(events[0].value("corr", "")), QStringLiteral("corr-1"));
    QCOMPARE(QString::fromStdString(events[0].value("level", "")), QStringLiteral("INFO"));
    QCOMPARE(events[0]["context"]["key"].get<std::string>(), std::string("value"));
}

void LoggingTests::testTraceWrites()
{
    triage::logging::initLogging(QStringLiteral("triage-test"), true);
    QVERIFY(triage::logging::isTraceEnabled());
    QFile::remove(defaultLogPath("-trace.log"));

    logTestEvent(LogLevel::Debug, QStringLiteral("test_trace"), QStringLiteral("corr-2"));

    const auto events = readEvents(defaultLogPath("-trace.log"));
    QCOMPARE(events.size(), 1);
    QCOMPARE(QString::fromStdString(events[0].value("level", "")), QStringLiteral("DEBUG"));
}

void LoggingTests::testMinimumLevelFilters()
{
    triage::logging::LogOptions options;
    options.minimumLevel = LogLevel::Warn;
    triage::logging::initLogging(QStringLiteral("triage-test"), options);
    QFile::remove(defaultLogPath(".log"));

    logTestEvent(LogLevel::Info, QStringLiteral("dropped"), QString());
    logTestEvent(LogLevel::Error, QStringLiteral("kept"), QString());

    const auto events = readEvents(defaultLogPath(".log"));
    QCOMPARE(events.size(), 1);
    QCOMPARE(QString::fromStdString(events[0].value("what", "")), QStringLiteral("kept"));
}

void LoggingTests::testCorrelationScope()
{
    triage::logging::initLogging(QStringLiteral("triage-test"), false);
    QFile::remove(defaultLogPath(".log"));

    triage::logging::setCorrelationId(QString());
    {
        triage::logging::CorrelationScope scope(QStringLiteral("request-7"));
        QCOMPARE(triage::logging::currentCorrelationId(), QStringLiteral("request-7"));
        logTestEvent(LogLevel::Info, QStringLiteral("scoped"), QString());
    }
    QVERIFY(triage::logging::currentCorrelationId().isEmpty());

    const auto events = readEvents(defaultLogPath(".log"));
    QCOMPARE(events.size(), 1);
    QCOMPARE(QString::fromStdString(events[0].value("corr", "")), QStringLiteral("request-7"));
}

void LoggingTests::testParseLogLevel()
{
    QCOMPARE(triage::logging::parseLogLevel(QStringLiteral("debug"), LogLevel::Info), LogLevel::Debug);
    QCOMPARE(triage::logging::parseLogLevel(QStringLiteral(" WARNING "), LogLevel::Info), LogLevel::Warn);
    QCOMPARE(triage::logging::parseLogLevel(QStringLiteral("error"), LogLevel::Info), LogLevel::Error);
    QCOMPARE(triage::logging::parseLogLevel(QStringLiteral("loud"), LogLevel::Info), LogLevel::Info);
}

void LoggingTests::testCustomDirectory()
{
    QTemporaryDir custom;
    QVERIFY(custom.isValid());
    triage::logging::LogOptions options;
    options.directory = custom.path() + "/logs";
    triage::logging::initLogging(QStringLiteral("triage-test"), options);
    QCOMPARE(triage::logging::logDirectory(), custom.path() + "/logs");

    logTestEvent(LogLevel::Warn, QStringLiteral("relocated"), QString());
    QCOMPARE(readEvents(custom.path() + "/logs/triage-test.log").size(), 1);

    triage::logging::initLogging(QStringLiteral("triage-test"), false);
}

QTEST_MAIN(LoggingTests)
#include "test_logging.moc"
