#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace fleetsync {

/**
 * FleetSnapshot is the result of one complete, successful refresh round.
 *
 * It is built once, published through a shared_ptr<const FleetSnapshot> and
 * never modified afterwards. Counts are computed from the collections on every
 * call rather than stored next to them.
 */
struct FleetSnapshot {
    std::map<std::string, Device> devices;
    std::vector<Task> tasks;
    AccountStatistics stats;

    // 0 for the empty snapshot a coordinator holds before its first round.
    std::uint64_t generation = 0;
    std::chrono::system_clock::time_point fetchedAt;

    int totalDevices() const;
    int onlineDevices() const;
    int offlineDevices() const;
    int pendingTasks() const;
    int failedTasks() const;
    int groupCount() const { return stats.groupCount; }
    int taskCount() const { return stats.taskCount; }

    const Device *findDevice(const std::string &deviceId) const;
    std::vector<Task> tasksWithStatus(TaskStatus status) const;
};

using SnapshotPtr = std::shared_ptr<const FleetSnapshot>;

/**
 * Read side of a coordinator as seen by the task commands.
 */
class SnapshotOwner
{
public:
    virtual ~SnapshotOwner() = default;

    virtual SnapshotPtr latest() const = 0;
    virtual void requestRefresh() = 0;
};

} // namespace fleetsync
