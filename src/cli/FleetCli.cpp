#include "cli/FleetCli.hpp"

#include <vector>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "sync/fleet_registry.hpp"

namespace fleetsync {

namespace {

QString usageText()
{
    return QStringLiteral(
        "Usage:\n"
        "  fleetsync check [--config PATH]\n"
        "  fleetsync status [--format markdown|json]\n"
        "  fleetsync devices [--format markdown|json]\n"
        "  fleetsync tasks [--status STATUS] [--format markdown|json]\n"
        "  fleetsync refresh [--format markdown|json]\n"
        "  fleetsync cancel-task --task-id N\n"
        "  fleetsync bulk-cancel --task-ids A,B,...\n"
        "  fleetsync cancel-device-tasks --imei IMEI\n"
        "  fleetsync create-firmware-task --imei IMEI --firmware-id N\n"
        "  fleetsync create-config-task --imei IMEI --config-id N\n"
        "  fleetsync retry-failed --batch-id N\n"
        "  fleetsync batch --batch-id N [--format markdown|json]\n"
        "Common options: --config PATH, --account ID\n");
}

QString getArgValue(const QStringList &args, const QString &key)
{
    const int idx = args.indexOf(key);
    if (idx < 0 || idx + 1 >= args.size()) {
        return {};
    }
    return args.at(idx + 1);
}

QString getFormat(const QStringList &args)
{
    const QString value = getArgValue(args, QStringLiteral("--format"));
    if (value.isEmpty()) {
        return QStringLiteral("markdown");
    }
    return value.toLower();
}

bool isValidFormat(const QString &format)
{
    return format == QStringLiteral("markdown") || format == QStringLiteral("json");
}

bool parseIntArg(const QStringList &args, const QString &key, int *out)
{
    const QString value = getArgValue(args, key);
    if (value.isEmpty()) {
        return false;
    }
    bool ok = false;
    *out = value.toInt(&ok);
    return ok;
}

bool parseIdList(const QString &value, std::vector<int> *out)
{
    const QStringList parts = value.split(QLatin1Char(','), Qt::SkipEmptyParts);
    for (const QString &part : parts) {
        bool ok = false;
        const int id = part.trimmed().toInt(&ok);
        if (!ok) {
            return false;
        }
        out->push_back(id);
    }
    return true;
}

nlohmann::json summaryJson(const std::string &account, const FleetSnapshot &snapshot)
{
    nlohmann::json payload;
    payload["account"] = account;
    payload["generation"] = snapshot.generation;
    payload["fetchedAt"] = toIso8601Utc(snapshot.fetchedAt);
    payload["totalDevices"] = snapshot.totalDevices();
    payload["onlineDevices"] = snapshot.onlineDevices();
    payload["offlineDevices"] = snapshot.offlineDevices();
    payload["pendingTasks"] = snapshot.pendingTasks();
    payload["failedTasks"] = snapshot.failedTasks();
    payload["groupCount"] = snapshot.groupCount();
    payload["taskCount"] = snapshot.taskCount();
    return payload;
}

void renderSummaryMarkdown(std::ostream &out, const std::string &account,
                           const FleetSnapshot &snapshot)
{
    out << "## Account: " << account << "\n\n";
    out << "Generation: " << snapshot.generation << "\n";
    out << "Fetched at: " << toIso8601Utc(snapshot.fetchedAt) << "\n";
    out << "Total devices: " << snapshot.totalDevices() << "\n";
    out << "Online devices: " << snapshot.onlineDevices() << "\n";
    out << "Offline devices: " << snapshot.offlineDevices() << "\n";
    out << "Pending tasks: " << snapshot.pendingTasks() << "\n";
    out << "Failed tasks: " << snapshot.failedTasks() << "\n";
    out << "Groups: " << snapshot.groupCount() << "\n";
    out << "Tasks (account): " << snapshot.taskCount() << "\n\n";
}

void renderDevicesMarkdown(std::ostream &out, const std::string &account,
                           const FleetSnapshot &snapshot)
{
    out << "## Account: " << account << "\n\n";
    if (snapshot.devices.empty()) {
        out << "No devices.\n\n";
        return;
    }
    for (const auto &item : snapshot.devices) {
        const Device &device = item.second;
        out << "- " << device.displayName() << " ["
            << toActivityStatusString(device.activityStatus) << "] model "
            << device.model;
        if (device.firmware) {
            out << ", firmware " << *device.firmware;
        }
        out << ", queued tasks " << device.taskQueueCount();
        if (device.hasFirmwareUpdatePending()) {
            out << ", firmware update pending";
        }
        out << "\n";
    }
    out << "\n";
}

void renderTasksMarkdown(std::ostream &out, const std::string &account,
                         const std::vector<Task> &tasks)
{
    out << "## Account: " << account << "\n\n";
    if (tasks.empty()) {
        out << "No tasks.\n\n";
        return;
    }
    for (const Task &task : tasks) {
        out << "- #" << task.id << " " << toTaskTypeString(task.type) << " "
            << toTaskStatusString(task.status);
        if (!task.deviceId.empty()) {
            out << " device " << task.deviceId;
        }
        if (task.batchId) {
            out << " batch " << *task.batchId;
        }
        out << "\n";
    }
    out << "\n";
}

} // namespace

int exitCodeFor(SyncErrorKind kind)
{
    switch (kind) {
    case SyncErrorKind::ReauthenticationRequired:
        return 2;
    case SyncErrorKind::UpdateFailed:
        return 3;
    case SyncErrorKind::CommandFailed:
        return 1;
    }
    return 1;
}

FleetCli::FleetCli(ClientFactory factory, std::ostream &out, std::ostream &err)
    : m_factory(std::move(factory))
    , m_out(out)
    , m_err(err)
{
}

int FleetCli::run(int argc, char *argv[])
{
    QStringList args;
    args.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        args.push_back(QString::fromLocal8Bit(argv[i]));
    }
    return run(args);
}

int FleetCli::run(const QStringList &args)
{
    // CLI entry: parse the subcommand, bring the accounts up, then delegate.
    if (args.size() < 2) {
        m_err << usageText().toStdString();
        return 1;
    }

    const QString command = args.at(1);
    FSLOG_INFO(QStringLiteral("FleetCli"),
               QStringLiteral("run"),
               QStringLiteral("fleet_cli_command"),
               QStringLiteral("user_invocation"),
               QStringLiteral("cli"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"command", command.toStdString()}}));

    static const QStringList knownCommands = {
        QStringLiteral("check"),
        QStringLiteral("status"),
        QStringLiteral("devices"),
        QStringLiteral("tasks"),
        QStringLiteral("refresh"),
        QStringLiteral("cancel-task"),
        QStringLiteral("bulk-cancel"),
        QStringLiteral("cancel-device-tasks"),
        QStringLiteral("create-firmware-task"),
        QStringLiteral("create-config-task"),
        QStringLiteral("retry-failed"),
        QStringLiteral("batch"),
    };
    if (!knownCommands.contains(command)) {
        m_err << usageText().toStdString();
        return 1;
    }

    const QString format = getFormat(args);
    if (!isValidFormat(format)) {
        m_err << "Invalid format. Use markdown or json." << std::endl;
        return 1;
    }

    const std::optional<FleetSyncConfig> config = loadConfig(args);
    if (!config) {
        return 1;
    }

    if (command == QStringLiteral("check")) {
        return runCheck(*config, args);
    }
    if (command == QStringLiteral("batch")) {
        return runBatch(*config, args);
    }

    FleetRegistry registry;
    const int startCode = startRegistry(*config, registry);
    if (startCode != 0) {
        return startCode;
    }

    if (command == QStringLiteral("status")) {
        return runStatus(registry, args);
    }
    if (command == QStringLiteral("devices")) {
        return runDevices(registry, args);
    }
    if (command == QStringLiteral("tasks")) {
        return runTasks(registry, args);
    }
    if (command == QStringLiteral("refresh")) {
        return runRefresh(registry, args);
    }
    return runTaskCommand(command, registry, args);
}

std::optional<FleetSyncConfig> FleetCli::loadConfig(const QStringList &args)
{
    const QString path = getArgValue(args, QStringLiteral("--config"));
    const ConfigResult loaded = path.isEmpty() ? loadConfigFromEnvironment()
                                               : loadConfigFile(path);
    if (!loaded) {
        m_err << "Invalid configuration: " << loaded.error() << std::endl;
        return std::nullopt;
    }
    return loaded.value();
}

int FleetCli::startRegistry(const FleetSyncConfig &config, FleetRegistry &registry)
{
    for (const AccountConfig &account : config.accounts) {
        SyncResult<FleetEntry *> added = registry.addAccount(
            account.id, m_factory(account), coordinatorOptionsFromAccount(account));
        if (!added) {
            m_err << "Account " << account.id << ": " << added.error().message << std::endl;
            return exitCodeFor(added.error().kind);
        }
    }
    return 0;
}

FleetEntry *FleetCli::selectEntry(const QStringList &args, FleetRegistry &registry,
                                  const std::string &deviceId)
{
    const QString accountId = getArgValue(args, QStringLiteral("--account"));
    if (!accountId.isEmpty()) {
        FleetEntry *entry = registry.find(accountId.toStdString());
        if (!entry) {
            m_err << "Unknown account: " << accountId.toStdString() << std::endl;
        }
        return entry;
    }
    if (!deviceId.empty()) {
        return registry.entryForDevice(deviceId);
    }
    return registry.firstEntry();
}

int FleetCli::runCheck(const FleetSyncConfig &config, const QStringList &args)
{
    // Check reads company statistics with every configured token.
    const bool json = getFormat(args) == QStringLiteral("json");
    nlohmann::json payload = nlohmann::json::array();
    int exitCode = 0;

    for (const AccountConfig &account : config.accounts) {
        std::unique_ptr<FleetClient> client = m_factory(account);
        if (!client) {
            m_err << "Account " << account.id << ": no client available" << std::endl;
            return 1;
        }
        const ClientResult<AccountStatistics> stats = client->getAccountStatistics();
        nlohmann::json item{{"account", account.id}, {"ok", stats.ok()}};
        if (stats) {
            item["groupCount"] = stats.value().groupCount;
            item["taskCount"] = stats.value().taskCount;
            if (!json) {
                m_out << "- " << account.id << ": ok (" << stats.value().groupCount
                      << " groups, " << stats.value().taskCount << " tasks)\n";
            }
        } else {
            const SyncError error = classifyRefreshFailure(stats.error());
            item["error"] = toString(error.kind);
            item["message"] = error.message;
            if (!json) {
                m_out << "- " << account.id << ": " << error.message << "\n";
            }
            if (exitCode == 0) {
                exitCode = exitCodeFor(error.kind);
            }
        }
        payload.push_back(item);
    }

    if (json) {
        m_out << payload.dump(2) << std::endl;
    }
    return exitCode;
}

int FleetCli::runBatch(const FleetSyncConfig &config, const QStringList &args)
{
    // A batch lookup is a single read and needs no snapshot.
    int batchId = 0;
    if (!parseIntArg(args, QStringLiteral("--batch-id"), &batchId) || batchId <= 0) {
        m_err << usageText().toStdString();
        return 1;
    }

    const QString accountId = getArgValue(args, QStringLiteral("--account"));
    const AccountConfig *account = config.accounts.empty() ? nullptr : &config.accounts.front();
    if (!accountId.isEmpty()) {
        account = nullptr;
        for (const AccountConfig &candidate : config.accounts) {
            if (candidate.id == accountId.toStdString()) {
                account = &candidate;
            }
        }
    }
    if (!account) {
        m_err << "Unknown account: " << accountId.toStdString() << std::endl;
        return 1;
    }

    std::unique_ptr<FleetClient> client = m_factory(*account);
    if (!client) {
        m_err << "Account " << account->id << ": no client available" << std::endl;
        return 1;
    }
    const ClientResult<nlohmann::json> batch = client->getBatch(batchId);
    if (!batch) {
        const SyncError error = classifyRefreshFailure(batch.error());
        m_err << "Account " << account->id << ": " << error.message << std::endl;
        return exitCodeFor(error.kind);
    }

    if (getFormat(args) == QStringLiteral("json")) {
        m_out << nlohmann::json{{"account", account->id},
                                {"batchId", batchId},
                                {"batch", batch.value()}}
                     .dump(2)
              << std::endl;
    } else {
        m_out << "# Batch " << batchId << "\n\n";
        m_out << "Account: " << account->id << "\n\n";
        m_out << batch.value().dump(2) << "\n";
    }
    return 0;
}

int FleetCli::runStatus(FleetRegistry &registry, const QStringList &args)
{
    const bool json = getFormat(args) == QStringLiteral("json");
    nlohmann::json payload = nlohmann::json::array();

    if (!json) {
        m_out << "# Fleet Status\n\n";
    }
    for (FleetEntry *entry : registry.entries()) {
        const SnapshotPtr snapshot = entry->coordinator->latest();
        if (json) {
            payload.push_back(summaryJson(entry->id, *snapshot));
        } else {
            renderSummaryMarkdown(m_out, entry->id, *snapshot);
        }
    }
    if (json) {
        m_out << payload.dump(2) << std::endl;
    }
    return 0;
}

int FleetCli::runDevices(FleetRegistry &registry, const QStringList &args)
{
    const bool json = getFormat(args) == QStringLiteral("json");
    nlohmann::json payload = nlohmann::json::array();

    if (!json) {
        m_out << "# Devices\n\n";
    }
    for (FleetEntry *entry : registry.entries()) {
        const SnapshotPtr snapshot = entry->coordinator->latest();
        if (json) {
            nlohmann::json devices = nlohmann::json::array();
            for (const auto &item : snapshot->devices) {
                devices.push_back(item.second);
            }
            payload.push_back(nlohmann::json{{"account", entry->id}, {"devices", devices}});
        } else {
            renderDevicesMarkdown(m_out, entry->id, *snapshot);
        }
    }
    if (json) {
        m_out << payload.dump(2) << std::endl;
    }
    return 0;
}

int FleetCli::runTasks(FleetRegistry &registry, const QStringList &args)
{
    const QString statusValue = getArgValue(args, QStringLiteral("--status"));
    std::optional<TaskStatus> statusFilter;
    if (!statusValue.isEmpty()) {
        const TaskStatus status = parseTaskStatusString(statusValue.toLower().toStdString());
        if (status == TaskStatus::Unknown) {
            m_err << "Unknown task status: " << statusValue.toStdString() << std::endl;
            return 1;
        }
        statusFilter = status;
    }

    const bool json = getFormat(args) == QStringLiteral("json");
    nlohmann::json payload = nlohmann::json::array();

    if (!json) {
        m_out << "# Tasks\n\n";
    }
    for (FleetEntry *entry : registry.entries()) {
        const SnapshotPtr snapshot = entry->coordinator->latest();
        const std::vector<Task> tasks =
            statusFilter ? snapshot->tasksWithStatus(*statusFilter) : snapshot->tasks;
        if (json) {
            payload.push_back(nlohmann::json{{"account", entry->id}, {"tasks", tasks}});
        } else {
            renderTasksMarkdown(m_out, entry->id, tasks);
        }
    }
    if (json) {
        m_out << payload.dump(2) << std::endl;
    }
    return 0;
}

int FleetCli::runRefresh(FleetRegistry &registry, const QStringList &args)
{
    // Accounts were refreshed once while starting; this forces a second round.
    const bool json = getFormat(args) == QStringLiteral("json");
    nlohmann::json payload = nlohmann::json::array();

    if (!json) {
        m_out << "# Refresh\n\n";
    }
    for (FleetEntry *entry : registry.entries()) {
        const SyncResult<SnapshotPtr> refreshed = entry->coordinator->refresh();
        if (!refreshed) {
            m_err << "Account " << entry->id << ": " << refreshed.error().message << std::endl;
            return exitCodeFor(refreshed.error().kind);
        }
        if (json) {
            payload.push_back(summaryJson(entry->id, *refreshed.value()));
        } else {
            renderSummaryMarkdown(m_out, entry->id, *refreshed.value());
        }
    }
    if (json) {
        m_out << payload.dump(2) << std::endl;
    }
    return 0;
}

int FleetCli::runTaskCommand(const QString &command, FleetRegistry &registry,
                             const QStringList &args)
{
    const std::string imei = getArgValue(args, QStringLiteral("--imei")).toStdString();
    const bool needsDevice = command == QStringLiteral("cancel-device-tasks")
        || command == QStringLiteral("create-firmware-task")
        || command == QStringLiteral("create-config-task");
    if (needsDevice && imei.empty()) {
        m_err << usageText().toStdString();
        return 1;
    }

    FleetEntry *entry = selectEntry(args, registry, imei);
    if (!entry) {
        return 1;
    }
    TaskCommands &commands = *entry->commands;

    if (command == QStringLiteral("cancel-device-tasks")) {
        const SyncResult<std::optional<Ack>> result = commands.cancelPendingTasksForDevice(imei);
        if (!result) {
            m_err << result.error().message << std::endl;
            return exitCodeFor(result.error().kind);
        }
        if (!result.value()) {
            if (getFormat(args) == QStringLiteral("json")) {
                m_out << nlohmann::json{{"command", command.toStdString()},
                                        {"ok", true},
                                        {"cancelled", false}}
                             .dump(2)
                      << std::endl;
            } else {
                m_out << "No pending tasks for " << imei << ".\n";
            }
            return 0;
        }
        return reportCommandResult(command,
                                   SyncResult<Ack>::success(*result.value()), args);
    }

    int id = 0;
    if (command == QStringLiteral("cancel-task")) {
        if (!parseIntArg(args, QStringLiteral("--task-id"), &id)) {
            m_err << usageText().toStdString();
            return 1;
        }
        return reportCommandResult(command, commands.cancelTask(id), args);
    }
    if (command == QStringLiteral("bulk-cancel")) {
        std::vector<int> ids;
        if (!parseIdList(getArgValue(args, QStringLiteral("--task-ids")), &ids)) {
            m_err << "Task ids must be a comma separated list of integers." << std::endl;
            return 1;
        }
        return reportCommandResult(command, commands.bulkCancelTasks(ids), args);
    }
    if (command == QStringLiteral("create-firmware-task")) {
        if (!parseIntArg(args, QStringLiteral("--firmware-id"), &id)) {
            m_err << usageText().toStdString();
            return 1;
        }
        return reportCommandResult(command, commands.createFirmwareTask(imei, id), args);
    }
    if (command == QStringLiteral("create-config-task")) {
        if (!parseIntArg(args, QStringLiteral("--config-id"), &id)) {
            m_err << usageText().toStdString();
            return 1;
        }
        return reportCommandResult(command, commands.createConfigurationTask(imei, id), args);
    }
    if (command == QStringLiteral("retry-failed")) {
        if (!parseIntArg(args, QStringLiteral("--batch-id"), &id)) {
            m_err << usageText().toStdString();
            return 1;
        }
        return reportCommandResult(command, commands.retryFailedTasks(id), args);
    }

    m_err << usageText().toStdString();
    return 1;
}

int FleetCli::reportCommandResult(const QString &command, const SyncResult<Ack> &result,
                                  const QStringList &args)
{
    if (!result) {
        m_err << result.error().message << std::endl;
        return exitCodeFor(result.error().kind);
    }

    if (getFormat(args) == QStringLiteral("json")) {
        m_out << nlohmann::json{{"command", command.toStdString()},
                                {"ok", true},
                                {"response", result.value()}}
                     .dump(2)
              << std::endl;
    } else {
        m_out << "Command " << command.toStdString() << " accepted.\n";
        if (!result.value().is_null() && !result.value().empty()) {
            m_out << result.value().dump(2) << "\n";
        }
    }
    return 0;
}

} // namespace fleetsync
