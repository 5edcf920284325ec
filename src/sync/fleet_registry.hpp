#pragma once

#include <memory>
#include <string>
#include <vector>

#include "client/fleet_client.hpp"
#include "common/errors.hpp"
#include "sync/sync_coordinator.hpp"
#include "sync/task_commands.hpp"

namespace fleetsync {

// Everything that runs for one configured account.
struct FleetEntry {
    std::string id;
    std::unique_ptr<FleetClient> client;
    std::unique_ptr<SyncCoordinator> coordinator;
    std::unique_ptr<TaskCommands> commands;
};

/**
 * FleetRegistry owns the running accounts of a process, keyed by account id
 * and kept in registration order.
 *
 * The registry is meant to be used from one thread (the main thread of the
 * daemon or CLI). Entries are destroyed in reverse registration order.
 */
class FleetRegistry
{
public:
    FleetRegistry() = default;
    ~FleetRegistry();

    FleetRegistry(const FleetRegistry &) = delete;
    FleetRegistry &operator=(const FleetRegistry &) = delete;

    // Builds a coordinator for the client and runs its first round. Nothing is
    // registered when that round fails or the id is already taken.
    SyncResult<FleetEntry *> addAccount(const std::string &id,
                                        std::unique_ptr<FleetClient> client,
                                        CoordinatorOptions options);

    bool remove(const std::string &id);

    FleetEntry *find(const std::string &id) const;

    // Entry whose latest snapshot knows the device, else the first entry.
    FleetEntry *entryForDevice(const std::string &deviceId) const;

    FleetEntry *firstEntry() const;

    void requestRefreshAll();

    std::vector<FleetEntry *> entries() const;
    std::size_t size() const { return m_entries.size(); }
    bool empty() const { return m_entries.empty(); }

private:
    std::vector<std::unique_ptr<FleetEntry>> m_entries;
};

} // namespace fleetsync
