#include <QCoreApplication>

#include "report/ReportCli.hpp"
#include "common/config.hpp"
#include "common/logging.hpp"

#include <nlohmann/json.hpp>

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("triage-report"));

    triage::TriageConfig config = triage::loadConfig();
    QStringList filteredArgs;
    filteredArgs.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        const QString arg = QString::fromLocal8Bit(argv[i]);
        if (arg == QStringLiteral("--trace")) {
            config.trace = true;
            continue;
        }
        filteredArgs.push_back(arg);
    }

    triage::logging::LogOptions logOptions;
    logOptions.traceEnabled = config.trace;
    logOptions.minimumLevel = triage::logging::parseLogLevel(
        QString::fromStdString(config.logLevel), triage::logging::LogLevel::Info);
    triage::logging::initLogging(QStringLiteral("triage-report"), logOptions);
    TLOG_INFO(QStringLiteral("main"),
              QStringLiteral("main"),
              QStringLiteral("report_cli_start"),
              QStringLiteral("user_invocation"),
              QStringLiteral("cli"),
              triage::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"args", filteredArgs.size()}}));

    // CLI entry point: delegate to ReportCli for argument parsing and output.
    triage::ReportCli cli(config);
    std::vector<QByteArray> utf8Args;
    std::vector<char *> rawArgs;
    for (const QString &arg : filteredArgs) {
        utf8Args.push_back(arg.toLocal8Bit());
    }
    for (auto &arg : utf8Args) {
        rawArgs.push_back(arg.data());
    }
    return cli.run(static_cast<int>(rawArgs.size()), rawArgs.data());
}
