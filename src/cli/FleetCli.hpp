#pragma once

#include <iostream>
#include <optional>

#include <QString>
#include <QStringList>

#include "client/http_fleet_client.hpp"
#include "common/config.hpp"
#include "common/errors.hpp"

namespace fleetsync {

class FleetRegistry;
struct FleetEntry;

class FleetCli
{
public:
    explicit FleetCli(ClientFactory factory = makeHttpClient,
                      std::ostream &out = std::cout,
                      std::ostream &err = std::cerr);

    // CLI dispatcher for fleet status and task commands.
    // returns exit code: 0 ok, 1 usage or command failure,
    // 2 credentials rejected, 3 fleet could not be read
    int run(int argc, char *argv[]);
    int run(const QStringList &args);

private:
    std::optional<FleetSyncConfig> loadConfig(const QStringList &args);
    int startRegistry(const FleetSyncConfig &config, FleetRegistry &registry);
    FleetEntry *selectEntry(const QStringList &args, FleetRegistry &registry,
                            const std::string &deviceId);

    int runCheck(const FleetSyncConfig &config, const QStringList &args);
    int runBatch(const FleetSyncConfig &config, const QStringList &args);
    int runStatus(FleetRegistry &registry, const QStringList &args);
    int runDevices(FleetRegistry &registry, const QStringList &args);
    int runTasks(FleetRegistry &registry, const QStringList &args);
    int runRefresh(FleetRegistry &registry, const QStringList &args);
    int runTaskCommand(const QString &command, FleetRegistry &registry,
                       const QStringList &args);

    int reportCommandResult(const QString &command, const SyncResult<Ack> &result,
                            const QStringList &args);

    ClientFactory m_factory;
    std::ostream &m_out;
    std::ostream &m_err;
};

int exitCodeFor(SyncErrorKind kind);

} // namespace fleetsync
