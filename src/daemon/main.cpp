#include <QCoreApplication>
#include <QDebug>

#include <exception>

#include <nlohmann/json.hpp>

#include "common/config.hpp"
#include "common/logging.hpp"
#include "daemon/triage_daemon.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    QCoreApplication::setApplicationName(QStringLiteral("triage-daemon"));
    qInfo() << "Triage daemon starting...";

    triage::TriageConfig config = triage::loadConfig();
    for (int i = 1; i < argc; ++i) {
        if (QString::fromLocal8Bit(argv[i]) == QStringLiteral("--trace")) {
            config.trace = true;
        }
    }

    triage::logging::LogOptions logOptions;
    logOptions.traceEnabled = config.trace;
    logOptions.minimumLevel = triage::logging::parseLogLevel(
        QString::fromStdString(config.logLevel), triage::logging::LogLevel::Info);
    triage::logging::initLogging(QStringLiteral("triage-daemon"), logOptions);
    TLOG_INFO(QStringLiteral("main"),
              QStringLiteral("main"),
              QStringLiteral("daemon_start"),
              QStringLiteral("user_start"),
              QStringLiteral("loaded_config"),
              triage::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"configFile", triage::configFilePath()},
                              {"aiAnalysisEnabled", config.aiAnalysisEnabled},
                              {"similaritySearchEnabled", config.similaritySearchEnabled}}));

    try {
        // The daemon lives for the lifetime of the process.
        triage::TriageDaemon daemon(config);
        if (!daemon.start()) {
            qCritical() << "Triage daemon failed to start the API server";
            return 1;
        }
        return app.exec();
    } catch (const std::exception &ex) {
        TLOG_ERROR(QStringLiteral("main"),
                   QStringLiteral("main"),
                   QStringLiteral("daemon_start_failed"),
                   QStringLiteral("exception"),
                   QStringLiteral("store_open"),
                   triage::logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"what", ex.what()}}));
        qCritical() << "Triage daemon failed:" << ex.what();
        return 1;
    }
}
