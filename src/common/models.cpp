#include "common/models.hpp"

#include <algorithm>
#include <cctype>

namespace fleetsync {

namespace {

bool containsFirmware(const std::string &type)
{
    std::string lowered = type;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered.find("firmware") != std::string::npos;
}

} // namespace

int Device::taskQueueCount() const
{
    if (!taskQueue.has_value()) {
        return 0;
    }
    return static_cast<int>(taskQueue->size());
}

bool Device::hasPendingTasks() const
{
    return taskQueueCount() > 0;
}

bool Device::hasFirmwareUpdatePending() const
{
    if (nextTask.has_value() && containsFirmware(nextTask->type)) {
        return true;
    }
    if (!taskQueue.has_value()) {
        return false;
    }
    return std::any_of(taskQueue->begin(), taskQueue->end(),
                       [](const TaskSummary &summary) {
                           return containsFirmware(summary.type);
                       });
}

std::vector<int> Device::pendingTaskIds() const
{
    std::vector<int> ids;
    if (!taskQueue.has_value()) {
        return ids;
    }
    for (const auto &summary : *taskQueue) {
        if (summary.id.has_value() && *summary.id > 0) {
            ids.push_back(*summary.id);
        }
    }
    return ids;
}

std::string Device::displayName() const
{
    if (description.has_value() && !description->empty()) {
        return *description + " (" + deviceId + ")";
    }
    return "Teltonika (" + deviceId + ")";
}

} // namespace fleetsync
