#include <QCoreApplication>

#include <nlohmann/json.hpp>

#include "cli/FleetCli.hpp"
#include "common/logging.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    bool trace = qEnvironmentVariableIntValue("FLEETSYNC_TRACE") == 1;
    QStringList filteredArgs;
    filteredArgs.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        const QString arg = QString::fromLocal8Bit(argv[i]);
        if (arg == QStringLiteral("--trace")) {
            trace = true;
            continue;
        }
        filteredArgs.push_back(arg);
    }
    fleetsync::logging::initLogging(QStringLiteral("fleetsync"), trace);
    FSLOG_INFO(QStringLiteral("main"),
               QStringLiteral("main"),
               QStringLiteral("fleet_cli_start"),
               QStringLiteral("user_invocation"),
               QStringLiteral("cli"),
               fleetsync::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"args", filteredArgs.size()}}));

    // CLI entry point: delegate to FleetCli for argument parsing and output.
    fleetsync::FleetCli cli;
    return cli.run(filteredArgs);
}
