#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace fleetsync {

inline std::string toIso8601Utc(std::chrono::system_clock::time_point timestamp)
{
    std::time_t time = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &time);
#else
    gmtime_r(&time, &tm);
#endif
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

inline std::string toActivityStatusString(ActivityStatus status)
{
    switch (status) {
    case ActivityStatus::Online:
        return "Online";
    case ActivityStatus::Offline:
        return "Offline";
    case ActivityStatus::Inactive:
        return "Inactive";
    case ActivityStatus::Unknown:
        return "unknown";
    }
    return "unknown";
}

// The API reports capitalized values; anything else is kept as Unknown.
inline ActivityStatus parseActivityStatusString(const std::string &value)
{
    if (value == "Online") {
        return ActivityStatus::Online;
    }
    if (value == "Offline") {
        return ActivityStatus::Offline;
    }
    if (value == "Inactive") {
        return ActivityStatus::Inactive;
    }
    return ActivityStatus::Unknown;
}

inline std::string toTaskTypeString(TaskType type)
{
    switch (type) {
    case TaskType::Firmware:
        return "firmware";
    case TaskType::Configuration:
        return "configuration";
    case TaskType::Unknown:
        return "unknown";
    }
    return "unknown";
}

inline TaskType parseTaskTypeString(const std::string &value)
{
    if (value == "firmware") {
        return TaskType::Firmware;
    }
    if (value == "configuration") {
        return TaskType::Configuration;
    }
    return TaskType::Unknown;
}

inline std::string toTaskStatusString(TaskStatus status)
{
    switch (status) {
    case TaskStatus::Pending:
        return "pending";
    case TaskStatus::Running:
        return "running";
    case TaskStatus::Completed:
        return "completed";
    case TaskStatus::Failed:
        return "failed";
    case TaskStatus::Cancelled:
        return "cancelled";
    case TaskStatus::Unknown:
        return "unknown";
    }
    return "unknown";
}

inline TaskStatus parseTaskStatusString(const std::string &value)
{
    if (value == "pending") {
        return TaskStatus::Pending;
    }
    if (value == "running") {
        return TaskStatus::Running;
    }
    if (value == "completed") {
        return TaskStatus::Completed;
    }
    if (value == "failed") {
        return TaskStatus::Failed;
    }
    if (value == "cancelled") {
        return TaskStatus::Cancelled;
    }
    return TaskStatus::Unknown;
}

inline void to_json(nlohmann::json &j, const TaskSummary &summary)
{
    j = nlohmann::json{
        {"id", summary.id.has_value() ? nlohmann::json(*summary.id) : nlohmann::json()},
        {"type", summary.type},
        {"status", summary.status}
    };
}

inline void to_json(nlohmann::json &j, const Device &device)
{
    j = nlohmann::json{
        {"imei", device.deviceId},
        {"name", device.displayName()},
        {"activityStatus", device.activityStatusText},
        {"online", device.isOnline()},
        {"model", device.model},
        {"firmware", device.firmware.has_value() ? nlohmann::json(*device.firmware)
                                                 : nlohmann::json()},
        {"serial", device.serial.has_value() ? nlohmann::json(*device.serial)
                                             : nlohmann::json()},
        {"lastConnection", device.lastContact.has_value()
                               ? nlohmann::json(toIso8601Utc(*device.lastContact))
                               : nlohmann::json()},
        {"taskQueueCount", device.taskQueueCount()},
        {"hasPendingTasks", device.hasPendingTasks()},
        {"firmwareUpdatePending", device.hasFirmwareUpdatePending()},
        {"pendingTaskIds", device.pendingTaskIds()}
    };
    if (device.taskQueue.has_value()) {
        j["taskQueue"] = *device.taskQueue;
    }
}

inline void to_json(nlohmann::json &j, const Task &task)
{
    j = nlohmann::json{
        {"id", task.id},
        {"type", toTaskTypeString(task.type)},
        {"status", toTaskStatusString(task.status)},
        {"imei", task.deviceId}
    };
    if (task.batchId.has_value()) {
        j["batchId"] = *task.batchId;
    }
}

inline void to_json(nlohmann::json &j, const AccountStatistics &stats)
{
    j = nlohmann::json{
        {"groupCount", stats.groupCount},
        {"taskCount", stats.taskCount}
    };
}

} // namespace fleetsync
