#include "sync/fleet_registry.hpp"

#include <algorithm>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

namespace fleetsync {

FleetRegistry::~FleetRegistry()
{
    while (!m_entries.empty()) {
        m_entries.pop_back();
    }
}

SyncResult<FleetEntry *> FleetRegistry::addAccount(const std::string &id,
                                                   std::unique_ptr<FleetClient> client,
                                                   CoordinatorOptions options)
{
    if (!client) {
        return SyncResult<FleetEntry *>::failure(
            invalidCommand("register account " + id, "no client supplied"));
    }
    if (find(id)) {
        return SyncResult<FleetEntry *>::failure(
            invalidCommand("register account " + id, "account id already registered"));
    }

    auto entry = std::make_unique<FleetEntry>();
    entry->id = id;
    entry->client = std::move(client);
    options.name = id;
    entry->coordinator = std::make_unique<SyncCoordinator>(*entry->client, std::move(options));

    SyncResult<SnapshotPtr> first = entry->coordinator->start();
    if (!first) {
        FSLOG_ERROR(QStringLiteral("FleetRegistry"),
                    QStringLiteral("addAccount"),
                    QStringLiteral("account_setup_failed"),
                    QString::fromStdString(toString(first.error().kind)),
                    QStringLiteral("first_refresh"),
                    logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"account", id}, {"message", first.error().message}}));
        return SyncResult<FleetEntry *>::failure(first.error());
    }

    entry->commands = std::make_unique<TaskCommands>(*entry->client, *entry->coordinator);

    FSLOG_INFO(QStringLiteral("FleetRegistry"),
               QStringLiteral("addAccount"),
               QStringLiteral("account_registered"),
               QStringLiteral("first_refresh_succeeded"),
               QStringLiteral("registry"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"account", id},
                               {"devices", first.value()->totalDevices()},
                               {"accounts", m_entries.size() + 1}}));

    m_entries.push_back(std::move(entry));
    return SyncResult<FleetEntry *>::success(m_entries.back().get());
}

bool FleetRegistry::remove(const std::string &id)
{
    auto it = std::find_if(m_entries.begin(), m_entries.end(),
                           [&id](const std::unique_ptr<FleetEntry> &entry) {
                               return entry->id == id;
                           });
    if (it == m_entries.end()) {
        return false;
    }
    m_entries.erase(it);

    FSLOG_INFO(QStringLiteral("FleetRegistry"),
               QStringLiteral("remove"),
               QStringLiteral("account_removed"),
               QStringLiteral("unload"),
               QStringLiteral("registry"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"account", id}, {"accounts", m_entries.size()}}));
    return true;
}

FleetEntry *FleetRegistry::find(const std::string &id) const
{
    for (const auto &entry : m_entries) {
        if (entry->id == id) {
            return entry.get();
        }
    }
    return nullptr;
}

FleetEntry *FleetRegistry::entryForDevice(const std::string &deviceId) const
{
    for (const auto &entry : m_entries) {
        if (entry->coordinator->latest()->findDevice(deviceId)) {
            return entry.get();
        }
    }
    return firstEntry();
}

FleetEntry *FleetRegistry::firstEntry() const
{
    return m_entries.empty() ? nullptr : m_entries.front().get();
}

void FleetRegistry::requestRefreshAll()
{
    for (const auto &entry : m_entries) {
        entry->coordinator->requestRefresh();
    }
}

std::vector<FleetEntry *> FleetRegistry::entries() const
{
    std::vector<FleetEntry *> result;
    result.reserve(m_entries.size());
    for (const auto &entry : m_entries) {
        result.push_back(entry.get());
    }
    return result;
}

} // namespace fleetsync
