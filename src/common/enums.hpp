#pragma once

namespace fleetsync {

enum class ActivityStatus {
    Online,
    Offline,
    Inactive,
    Unknown
};

enum class TaskType {
    Firmware,
    Configuration,
    Unknown
};

enum class TaskStatus {
    Pending,
    Running,
    Completed,
    Failed,
    Cancelled,
    Unknown
};

} // namespace fleetsync
