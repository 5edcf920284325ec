#include <QCoreApplication>
#include <QDebug>

#include <nlohmann/json.hpp>

#include "common/config.hpp"
#include "common/logging.hpp"
#include "daemon/fleet_daemon.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    QCoreApplication::setApplicationName(QStringLiteral("fleetsync-daemon"));
    qInfo() << "fleetsync daemon starting...";

    bool trace = qEnvironmentVariableIntValue("FLEETSYNC_TRACE") == 1;
    bool foreground = false;
    QString configPath = qEnvironmentVariable("FLEETSYNC_CONFIG");
    const QStringList args = QCoreApplication::arguments();
    for (int i = 1; i < args.size(); ++i) {
        const QString &arg = args.at(i);
        if (arg == QStringLiteral("--trace")) {
            trace = true;
        } else if (arg == QStringLiteral("--foreground")) {
            foreground = true;
        } else if (arg == QStringLiteral("--config") && i + 1 < args.size()) {
            configPath = args.at(++i);
        } else {
            qCritical() << "Usage: fleetsync-daemon [--config PATH] [--trace] [--foreground]";
            return 1;
        }
    }

    const fleetsync::ConfigResult loaded = configPath.isEmpty()
        ? fleetsync::loadConfigFromEnvironment()
        : fleetsync::loadConfigFile(configPath);
    if (!loaded) {
        qCritical() << "fleetsync: invalid configuration:"
                    << QString::fromStdString(loaded.error());
        return 1;
    }
    fleetsync::FleetSyncConfig config = loaded.value();
    config.traceEnabled = config.traceEnabled || trace;

    fleetsync::logging::initLogging(QStringLiteral("fleetsync-daemon"), config.traceEnabled);
    fleetsync::logging::setMinimumLevel(config.logLevel);
    fleetsync::logging::setStderrEcho(foreground);
    FSLOG_INFO(QStringLiteral("main"),
               QStringLiteral("main"),
               QStringLiteral("daemon_start"),
               QStringLiteral("user_start"),
               configPath.isEmpty() ? QStringLiteral("environment") : QStringLiteral("config_file"),
               fleetsync::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"accounts", config.accounts.size()}}));

    // The daemon lives for the lifetime of the process.
    fleetsync::FleetDaemon daemon(config);
    QObject::connect(&daemon, &fleetsync::FleetDaemon::reauthenticationRequired, &app,
                     [](const QString &account, const QString &message) {
                         qCritical() << "fleetsync:" << account << message;
                         QCoreApplication::exit(2);
                     });
    if (!daemon.start()) {
        return daemon.exitCode();
    }

    return app.exec();
}
