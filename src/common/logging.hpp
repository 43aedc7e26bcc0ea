#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace triage::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

struct LogOptions {
    // Empty means $HOME/.local/share/triage/logs.
    QString directory;
    bool traceEnabled = false;
    LogLevel minimumLevel = LogLevel::Info;
    // Number of rotated generations kept next to the live file.
    int keepRotated = 3;
};

// Initialize logging for the current process. Call early in main().
void initLogging(const QString &processName, bool traceEnabled);
void initLogging(const QString &processName, const LogOptions &options);

bool isTraceEnabled();
QString logDirectory();
LogLevel parseLogLevel(const QString &value, LogLevel fallback);

// Thread-local correlation id attached to every event logged by the thread.
void setCorrelationId(const QString &corrId);
QString currentCorrelationId();

class CorrelationScope {
public:
    explicit CorrelationScope(const QString &corrId);
    ~CorrelationScope();

private:
    QString m_prev;
};

// Structured log event. All fields are required; use empty strings where unknown.
void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const QString &who,
              const QString &correlationId,
              const nlohmann::json &context = nlohmann::json::object());

QString defaultProcessName();
QString defaultWho();

} // namespace triage::logging

#define TLOG_DEBUG(component, where, what, why, how, who, corr, ctxJson) \
    ::triage::logging::logEvent(::triage::logging::LogLevel::Debug, \
                                ::triage::logging::defaultProcessName(), \
                                (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define TLOG_INFO(component, where, what, why, how, who, corr, ctxJson) \
    ::triage::logging::logEvent(::triage::logging::LogLevel::Info, \
                                ::triage::logging::defaultProcessName(), \
                                (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define TLOG_WARN(component, where, what, why, how, who, corr, ctxJson) \
    ::triage::logging::logEvent(::triage::logging::LogLevel::Warn, \
                                ::triage::logging::defaultProcessName(), \
                                (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define TLOG_ERROR(component, where, what, why, how, who, corr, ctxJson) \
    ::triage::logging::logEvent(::triage::logging::LogLevel::Error, \
                                ::triage::logging::defaultProcessName(), \
                                (component), (where), (what), (why), (how), (who), (corr), (ctxJson))
