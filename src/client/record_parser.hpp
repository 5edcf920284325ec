#pragma once

#include <chrono>
#include <optional>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/models.hpp"

namespace fleetsync {

/**
 * Tolerant parsing of the loosely shaped records returned by the FOTA API.
 *
 * All field aliasing and fallback rules live here; the rest of the code only
 * sees typed Device/Task/AccountStatistics values. A record never fails to
 * parse: missing or odd fields fall back to the defaults documented on the
 * model types. Records without an identifier come back with an empty device id
 * or a zero task id and are dropped by the coordinator.
 */

Device parseDevice(const nlohmann::json &record);
Task parseTask(const nlohmann::json &record);
TaskSummary parseTaskSummary(const nlohmann::json &record);
AccountStatistics parseAccountStatistics(const nlohmann::json &record);

// Accepts ISO-8601 (with Z or an offset) and "YYYY-MM-DD HH:MM:SS" (UTC).
std::optional<std::chrono::system_clock::time_point> parseTimestamp(
    const nlohmann::json &value);

// Page envelopes look like {"data": [...], "meta": {"current_page", "last_page"}}.
// A missing "data" is an empty page; a non-array "data" is malformed.
ClientResult<Page<Device>> parseDevicePage(const nlohmann::json &body, int requestedPage);
ClientResult<Page<Task>> parseTaskPage(const nlohmann::json &body, int requestedPage);

} // namespace fleetsync
