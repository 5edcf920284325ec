#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <QString>

#include <nlohmann/json.hpp>

#include "client/fleet_client.hpp"
#include "common/errors.hpp"
#include "sync/fleet_snapshot.hpp"

namespace fleetsync {

/**
 * TaskCommands mutate remote task state for one account.
 *
 * Every command validates its input, issues exactly one client call, and on
 * success asks the snapshot owner for one refresh. The snapshot itself is
 * never edited here; it catches up on the next round. A failed call is
 * returned as CommandFailed carrying the client error and triggers nothing.
 */
class TaskCommands
{
public:
    TaskCommands(FleetClient &client, SnapshotOwner &owner);

    SyncResult<Ack> cancelTask(int taskId);
    SyncResult<Ack> bulkCancelTasks(const std::vector<int> &taskIds);
    SyncResult<Ack> createFirmwareTask(const std::string &deviceId, int firmwareId);
    SyncResult<Ack> createConfigurationTask(const std::string &deviceId, int configurationId);
    SyncResult<Ack> retryFailedTasks(int batchId);

    // Cancels every queued task of a device as seen in the latest snapshot.
    // Returns an empty optional, without any network call, when there is
    // nothing to cancel.
    SyncResult<std::optional<Ack>> cancelPendingTasksForDevice(const std::string &deviceId);

private:
    SyncResult<Ack> submit(const QString &command,
                           const std::string &description,
                           const nlohmann::json &context,
                           const std::function<ClientResult<Ack>()> &call);

    FleetClient &m_client;
    SnapshotOwner &m_owner;
};

} // namespace fleetsync
