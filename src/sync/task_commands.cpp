#include "sync/task_commands.hpp"

#include <algorithm>

#include "common/logging.hpp"

namespace fleetsync {

namespace {

SyncResult<Ack> rejected(const QString &command, const std::string &description,
                         const std::string &reason)
{
    FSLOG_WARN(QStringLiteral("TaskCommands"),
               command,
               QStringLiteral("command_rejected"),
               QStringLiteral("invalid_argument"),
               QStringLiteral("validation"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"reason", reason}}));
    return SyncResult<Ack>::failure(invalidCommand(description, reason));
}

} // namespace

TaskCommands::TaskCommands(FleetClient &client, SnapshotOwner &owner)
    : m_client(client)
    , m_owner(owner)
{
}

SyncResult<Ack> TaskCommands::cancelTask(int taskId)
{
    const QString command = QStringLiteral("cancelTask");
    const std::string description = "cancel task";
    if (taskId <= 0) {
        return rejected(command, description, "task id must be positive");
    }
    const std::vector<int> ids{taskId};
    return submit(command, description, nlohmann::json{{"taskId", taskId}},
                  [this, &ids] { return m_client.cancelTasks(ids); });
}

SyncResult<Ack> TaskCommands::bulkCancelTasks(const std::vector<int> &taskIds)
{
    const QString command = QStringLiteral("bulkCancelTasks");
    const std::string description = "bulk cancel tasks";
    if (taskIds.empty()) {
        return rejected(command, description, "task id list must not be empty");
    }
    if (std::any_of(taskIds.begin(), taskIds.end(), [](int id) { return id <= 0; })) {
        return rejected(command, description, "task ids must be positive");
    }
    return submit(command, description, nlohmann::json{{"taskIds", taskIds}},
                  [this, &taskIds] { return m_client.cancelTasks(taskIds); });
}

SyncResult<Ack> TaskCommands::createFirmwareTask(const std::string &deviceId, int firmwareId)
{
    const QString command = QStringLiteral("createFirmwareTask");
    const std::string description = "create firmware task";
    if (deviceId.empty()) {
        return rejected(command, description, "device id must not be empty");
    }
    if (firmwareId <= 0) {
        return rejected(command, description, "firmware id must be positive");
    }
    return submit(command, description,
                  nlohmann::json{{"imei", deviceId}, {"firmwareId", firmwareId}},
                  [this, &deviceId, firmwareId] {
                      return m_client.createFirmwareTask(deviceId, firmwareId);
                  });
}

SyncResult<Ack> TaskCommands::createConfigurationTask(const std::string &deviceId,
                                                      int configurationId)
{
    const QString command = QStringLiteral("createConfigurationTask");
    const std::string description = "create configuration task";
    if (deviceId.empty()) {
        return rejected(command, description, "device id must not be empty");
    }
    if (configurationId <= 0) {
        return rejected(command, description, "configuration id must be positive");
    }
    return submit(command, description,
                  nlohmann::json{{"imei", deviceId}, {"configurationId", configurationId}},
                  [this, &deviceId, configurationId] {
                      return m_client.createConfigurationTask(deviceId, configurationId);
                  });
}

SyncResult<Ack> TaskCommands::retryFailedTasks(int batchId)
{
    const QString command = QStringLiteral("retryFailedTasks");
    const std::string description = "retry failed tasks";
    if (batchId <= 0) {
        return rejected(command, description, "batch id must be positive");
    }
    return submit(command, description, nlohmann::json{{"batchId", batchId}},
                  [this, batchId] { return m_client.retryFailedTasks(batchId); });
}

SyncResult<std::optional<Ack>> TaskCommands::cancelPendingTasksForDevice(
    const std::string &deviceId)
{
    const SnapshotPtr snapshot = m_owner.latest();
    const Device *device = snapshot->findDevice(deviceId);
    const std::vector<int> ids = device ? device->pendingTaskIds() : std::vector<int>{};

    if (ids.empty()) {
        FSLOG_INFO(QStringLiteral("TaskCommands"),
                   QStringLiteral("cancelPendingTasksForDevice"),
                   QStringLiteral("nothing_to_cancel"),
                   QStringLiteral("empty_task_queue"),
                   QStringLiteral("snapshot_lookup"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"imei", deviceId},
                                   {"knownDevice", device != nullptr},
                                   {"generation", snapshot->generation}}));
        return SyncResult<std::optional<Ack>>::success(std::nullopt);
    }

    SyncResult<Ack> result = submit(
        QStringLiteral("cancelPendingTasksForDevice"), "cancel pending tasks",
        nlohmann::json{{"imei", deviceId}, {"taskIds", ids}},
        [this, &ids] { return m_client.cancelTasks(ids); });
    if (!result) {
        return SyncResult<std::optional<Ack>>::failure(result.error());
    }
    return SyncResult<std::optional<Ack>>::success(
        std::make_optional<Ack>(std::move(result.value())));
}

SyncResult<Ack> TaskCommands::submit(const QString &command,
                                     const std::string &description,
                                     const nlohmann::json &context,
                                     const std::function<ClientResult<Ack>()> &call)
{
    const logging::CorrelationScope corrScope(logging::newCorrelationId(QStringLiteral("command")));

    ClientResult<Ack> result = call();
    if (!result) {
        const ClientError &cause = result.error();
        FSLOG_ERROR(QStringLiteral("TaskCommands"),
                    command,
                    QStringLiteral("command_failed"),
                    QString::fromStdString(toString(cause.kind)),
                    QStringLiteral("fota_api"),
                    logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"request", context},
                                    {"httpStatus", cause.httpStatus},
                                    {"message", cause.message}}));
        return SyncResult<Ack>::failure(commandFailure(description, cause));
    }

    FSLOG_INFO(QStringLiteral("TaskCommands"),
               command,
               QStringLiteral("command_succeeded"),
               QStringLiteral("user_request"),
               QStringLiteral("fota_api"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"request", context}}));

    m_owner.requestRefresh();
    return SyncResult<Ack>::success(std::move(result.value()));
}

} // namespace fleetsync
