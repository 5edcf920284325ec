#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/enums.hpp"

namespace fleetsync {

// Raw acknowledgement body returned by a mutation endpoint.
using Ack = nlohmann::json;

// Entry of a device's task queue as embedded in a device record.
struct TaskSummary {
    std::optional<int> id;
    std::string type;
    std::string status;
};

struct Device {
    std::string deviceId;
    ActivityStatus activityStatus = ActivityStatus::Unknown;
    std::string activityStatusText = "unknown";
    std::string model = "Unknown";
    std::optional<std::string> firmware;
    std::optional<std::string> serial;
    std::optional<std::string> description;
    std::optional<std::vector<TaskSummary>> taskQueue;
    std::optional<TaskSummary> nextTask;
    std::optional<std::chrono::system_clock::time_point> lastContact;

    bool isOnline() const { return activityStatus == ActivityStatus::Online; }
    int taskQueueCount() const;
    bool hasPendingTasks() const;
    bool hasFirmwareUpdatePending() const;
    std::vector<int> pendingTaskIds() const;
    std::string displayName() const;
};

struct Task {
    int id = 0;
    TaskType type = TaskType::Unknown;
    TaskStatus status = TaskStatus::Unknown;
    std::string deviceId;
    std::optional<int> batchId;
};

struct AccountStatistics {
    int groupCount = 0;
    int taskCount = 0;
    nlohmann::json raw = nlohmann::json::object();
};

// One page of a listing endpoint.
template <typename T>
struct Page {
    std::vector<T> items;
    int currentPage = 1;
    int lastPage = 1;
};

} // namespace fleetsync
