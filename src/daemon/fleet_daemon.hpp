#pragma once

#include <memory>

#include <QObject>
#include <QString>

#include "client/http_fleet_client.hpp"
#include "common/config.hpp"
#include "sync/fleet_registry.hpp"

namespace fleetsync {

/**
 * FleetDaemon keeps every configured account in sync for the lifetime of the
 * process:
 * - registers each account (first refresh is synchronous)
 * - logs a summary for every published snapshot
 * - logs every failed round and stops the event loop with exit code 2 when an
 *   account needs new credentials
 *
 * It is designed to be owned from main() and driven by Qt's event loop.
 */
class FleetDaemon : public QObject
{
    Q_OBJECT
public:
    explicit FleetDaemon(FleetSyncConfig config,
                         ClientFactory factory = makeHttpClient,
                         QObject *parent = nullptr);
    ~FleetDaemon() override;

    // Returns false when any account fails its first refresh; no account is
    // left running in that case.
    bool start();

    FleetRegistry &registry() { return m_registry; }
    int exitCode() const { return m_exitCode; }

signals:
    void reauthenticationRequired(const QString &account, const QString &message);

private:
    void watch(FleetEntry *entry);
    void logSnapshot(const QString &account, quint64 generation);

    FleetSyncConfig m_config;
    ClientFactory m_factory;
    FleetRegistry m_registry;
    int m_exitCode = 0;
};

} // namespace fleetsync
