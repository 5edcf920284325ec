#include "sync/fleet_snapshot.hpp"

#include <algorithm>
#include <iterator>

namespace fleetsync {

int FleetSnapshot::totalDevices() const
{
    return static_cast<int>(devices.size());
}

int FleetSnapshot::onlineDevices() const
{
    return static_cast<int>(std::count_if(
        devices.begin(), devices.end(),
        [](const auto &entry) { return entry.second.isOnline(); }));
}

int FleetSnapshot::offlineDevices() const
{
    return totalDevices() - onlineDevices();
}

int FleetSnapshot::pendingTasks() const
{
    return static_cast<int>(tasksWithStatus(TaskStatus::Pending).size());
}

int FleetSnapshot::failedTasks() const
{
    return static_cast<int>(tasksWithStatus(TaskStatus::Failed).size());
}

const Device *FleetSnapshot::findDevice(const std::string &deviceId) const
{
    auto it = devices.find(deviceId);
    if (it == devices.end()) {
        return nullptr;
    }
    return &it->second;
}

std::vector<Task> FleetSnapshot::tasksWithStatus(TaskStatus status) const
{
    std::vector<Task> matching;
    std::copy_if(tasks.begin(), tasks.end(), std::back_inserter(matching),
                 [status](const Task &task) { return task.status == status; });
    return matching;
}

} // namespace fleetsync
