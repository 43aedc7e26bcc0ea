#include "common/logging.hpp"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QThread>

#include <unistd.h>

#include <algorithm>
#include <cstdio>
#include <mutex>

namespace triage::logging {

namespace {

constexpr qint64 kMaxLogSizeBytes = 5 * 1024 * 1024;

std::mutex g_logMutex;
QString g_processName;
LogOptions g_options;

thread_local QString t_corrId;

QString levelToString(LogLevel level)
{
    switch (level) {
    case LogLevel::Debug:
        return QStringLiteral("DEBUG");
    case LogLevel::Info:
        return QStringLiteral("INFO");
    case LogLevel::Warn:
        return QStringLiteral("WARN");
    case LogLevel::Error:
        return QStringLiteral("ERROR");
    }
    return QStringLiteral("INFO");
}

QString logsDirPathLocked()
{
    if (!g_options.directory.isEmpty()) {
        return g_options.directory;
    }
    const QString home = qEnvironmentVariable("HOME");
    if (home.isEmpty()) {
        return QStringLiteral(".local/share/triage/logs");
    }
    return home + QStringLiteral("/.local/share/triage/logs");
}

QString logFilePath(const QString &processName, const QString &suffix)
{
    const QString base = processName.isEmpty()
        ? QStringLiteral("triage")
        : processName;
    return logsDirPathLocked() + QDir::separator() + base + suffix;
}

// live -> .1 -> .2 ... up to keepRotated generations.
void rotateIfNeeded(const QString &path)
{
    QFileInfo info(path);
    if (!info.exists() || info.size() < kMaxLogSizeBytes) {
        return;
    }

    const int keep = std::max(1, g_options.keepRotated);
    QFile::remove(path + QStringLiteral(".%1").arg(keep));
    for (int generation = keep - 1; generation >= 1; --generation) {
        const QString from = path + QStringLiteral(".%1").arg(generation);
        if (QFile::exists(from)) {
            QFile::rename(from, path + QStringLiteral(".%1").arg(generation + 1));
        }
    }
    QFile::rename(path, path + QStringLiteral(".1"));
}

void writeLine(const QString &path, const QString &line)
{
    QDir().mkpath(logsDirPathLocked());
    rotateIfNeeded(path);

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        fprintf(stderr, "%s\n", line.toUtf8().constData());
        return;
    }

    file.write(line.toUtf8());
    file.write("\n");
}

QString threadIdString()
{
    return QStringLiteral("0x%1")
        .arg(reinterpret_cast<quintptr>(QThread::currentThreadId()), 0, 16);
}

} // namespace

void initLogging(const QString &processName, bool traceEnabled)
{
    LogOptions options;
    options.traceEnabled = traceEnabled;
    options.minimumLevel = traceEnabled ? LogLevel::Debug : LogLevel::Info;
    initLogging(processName, options);
}

void initLogging(const QString &processName, const LogOptions &options)
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_processName = processName;
    g_options = options;
    if (g_options.traceEnabled) {
        g_options.minimumLevel = LogLevel::Debug;
    }
}

bool isTraceEnabled()
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    return g_options.traceEnabled;
}

QString logDirectory()
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    return logsDirPathLocked();
}

LogLevel parseLogLevel(const QString &value, LogLevel fallback)
{
    const QString lowered = value.trimmed().toLower();
    if (lowered == QStringLiteral("debug")) {
        return LogLevel::Debug;
    }
    if (lowered == QStringLiteral("info")) {
        return LogLevel::Info;
    }
    if (lowered == QStringLiteral("warn") || lowered == QStringLiteral("warning")) {
        return LogLevel::Warn;
    }
    if (lowered == QStringLiteral("error")) {
        return LogLevel::Error;
    }
    return fallback;
}

void setCorrelationId(const QString &corrId)
{
    t_corrId = corrId;
}

QString currentCorrelationId()
{
    return t_corrId;
}

CorrelationScope::CorrelationScope(const QString &corrId)
    : m_prev(t_corrId)
{
    t_corrId = corrId;
}

CorrelationScope::~CorrelationScope()
{
    t_corrId = m_prev;
}

QString defaultProcessName()
{
    {
        std::lock_guard<std::mutex> lock(g_logMutex);
        if (!g_processName.isEmpty()) {
            return g_processName;
        }
    }
    if (QCoreApplication::instance()) {
        const QString appName = QCoreApplication::applicationName();
        if (!appName.isEmpty()) {
            return appName;
        }
    }
    return QStringLiteral("triage");
}

QString defaultWho()
{
    char hostname[256] = {};
    if (gethostname(hostname, sizeof(hostname)) != 0) {
        hostname[0] = '\0';
    }
    return QStringLiteral("host:%1,uid:%2")
        .arg(QString::fromUtf8(hostname))
        .arg(static_cast<int>(getuid()));
}

void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const QString &who,
              const QString &correlationId,
              const nlohmann::json &context)
{
    const QString corr = correlationId.isEmpty() ? currentCorrelationId() : correlationId;
    nlohmann::json payload = {
        {"ts", QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toStdString()},
        {"level", levelToString(level).toStdString()},
        {"process", processName.toStdString()},
        {"thread", threadIdString().toStdString()},
        {"component", component.toStdString()},
        {"where", where.toStdString()},
        {"what", what.toStdString()},
        {"why", why.toStdString()},
        {"how", how.toStdString()},
        {"who", who.toStdString()},
        {"corr", corr.toStdString()},
        {"context", context}
    };

    const QString line = QString::fromStdString(
        payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));

    std::lock_guard<std::mutex> lock(g_logMutex);
    const QString process = processName.isEmpty()
        ? (g_processName.isEmpty() ? QStringLiteral("triage") : g_processName)
        : processName;
    if (static_cast<int>(level) >= static_cast<int>(g_options.minimumLevel)) {
        writeLine(logFilePath(process, QStringLiteral(".log")), line);
    }

    if (g_options.traceEnabled) {
        writeLine(logFilePath(process, QStringLiteral("-trace.log")), line);
    }
}

} // namespace triage::logging
