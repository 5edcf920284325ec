#include "daemon/fleet_daemon.hpp"

#include <QDebug>

#include <nlohmann/json.hpp>

#include "common/fleetsync_version.hpp"
#include "common/logging.hpp"

namespace fleetsync {

FleetDaemon::FleetDaemon(FleetSyncConfig config, ClientFactory factory, QObject *parent)
    : QObject(parent)
    , m_config(std::move(config))
    , m_factory(std::move(factory))
{
}

FleetDaemon::~FleetDaemon() = default;

bool FleetDaemon::start()
{
    qInfo() << "fleetsync: daemon starting (version" << FLEETSYNC_VERSION << ")";

    for (const AccountConfig &account : m_config.accounts) {
        SyncResult<FleetEntry *> added = m_registry.addAccount(
            account.id, m_factory(account), coordinatorOptionsFromAccount(account));
        if (!added) {
            const SyncError &error = added.error();
            m_exitCode = error.kind == SyncErrorKind::ReauthenticationRequired ? 2 : 1;
            qWarning() << "fleetsync: account" << QString::fromStdString(account.id)
                       << "failed to start:" << QString::fromStdString(error.message);
            FSLOG_ERROR(QStringLiteral("FleetDaemon"),
                        QStringLiteral("start"),
                        QStringLiteral("daemon_start_failed"),
                        QString::fromStdString(toString(error.kind)),
                        QStringLiteral("first_refresh"),
                        logging::defaultWho(),
                        QString(),
                        (nlohmann::json{{"account", account.id},
                                        {"message", error.message},
                                        {"registered", m_registry.size()}}));
            while (!m_registry.empty()) {
                m_registry.remove(m_registry.entries().back()->id);
            }
            return false;
        }
        watch(added.value());
    }

    FSLOG_INFO(QStringLiteral("FleetDaemon"),
               QStringLiteral("start"),
               QStringLiteral("daemon_started"),
               QStringLiteral("all_accounts_synced"),
               QStringLiteral("poll_timer"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"accounts", m_registry.size()},
                               {"version", FLEETSYNC_VERSION}}));
    return true;
}

void FleetDaemon::watch(FleetEntry *entry)
{
    const QString account = QString::fromStdString(entry->id);
    SyncCoordinator *coordinator = entry->coordinator.get();

    connect(coordinator, &SyncCoordinator::snapshotPublished, this,
            [this, account](quint64 generation) { logSnapshot(account, generation); });

    connect(coordinator, &SyncCoordinator::refreshFailed, this,
            [account](const QString &kind, const QString &message) {
                qWarning() << "fleetsync:" << account << "refresh failed:" << message;
                FSLOG_WARN(QStringLiteral("FleetDaemon"),
                           QStringLiteral("watch"),
                           QStringLiteral("refresh_failed"),
                           kind,
                           QStringLiteral("poll_timer"),
                           logging::defaultWho(),
                           QString(),
                           (nlohmann::json{{"account", account.toStdString()},
                                           {"message", message.toStdString()}}));
            });

    connect(coordinator, &SyncCoordinator::reauthenticationRequired, this,
            [this, account](const QString &message) {
                m_exitCode = 2;
                FSLOG_ERROR(QStringLiteral("FleetDaemon"),
                            QStringLiteral("watch"),
                            QStringLiteral("reauthentication_required"),
                            QStringLiteral("credentials_rejected"),
                            QStringLiteral("poll_timer"),
                            logging::defaultWho(),
                            QString(),
                            (nlohmann::json{{"account", account.toStdString()},
                                            {"message", message.toStdString()}}));
                emit reauthenticationRequired(account, message);
            });
}

void FleetDaemon::logSnapshot(const QString &account, quint64 generation)
{
    FleetEntry *entry = m_registry.find(account.toStdString());
    if (!entry) {
        return;
    }
    const SnapshotPtr snapshot = entry->coordinator->latest();

    FSLOG_INFO(QStringLiteral("FleetDaemon"),
               QStringLiteral("logSnapshot"),
               QStringLiteral("fleet_summary"),
               QStringLiteral("snapshot_published"),
               QStringLiteral("poll_timer"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"account", account.toStdString()},
                               {"generation", generation},
                               {"latestGeneration", snapshot->generation},
                               {"totalDevices", snapshot->totalDevices()},
                               {"onlineDevices", snapshot->onlineDevices()},
                               {"offlineDevices", snapshot->offlineDevices()},
                               {"pendingTasks", snapshot->pendingTasks()},
                               {"failedTasks", snapshot->failedTasks()},
                               {"groupCount", snapshot->groupCount()},
                               {"taskCount", snapshot->taskCount()}}));
}

} // namespace fleetsync
