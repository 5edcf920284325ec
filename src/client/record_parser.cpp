#include "client/record_parser.hpp"

#include <array>
#include <string>

#include <QDateTime>
#include <QString>
#include <QTimeZone>

#include "common/json_utils.hpp"

namespace fleetsync {

namespace {

// Field aliases, tried in order. The first truthy value wins.
constexpr std::array<const char *, 6> kFirmwareFields = {
    "current_firmware", "firmware", "firmware_version", "fw_version", "fw", "version"};
constexpr std::array<const char *, 6> kLastContactFields = {
    "seen_at", "last_connection", "last_update", "lastConnection", "last_seen", "updated_at"};
constexpr std::array<const char *, 5> kDescriptionFields = {
    "description", "name", "title", "label", "alias"};

bool isTruthy(const nlohmann::json &value)
{
    if (value.is_null()) {
        return false;
    }
    if (value.is_boolean()) {
        return value.get<bool>();
    }
    if (value.is_number_integer() || value.is_number_unsigned()) {
        return value.get<long long>() != 0;
    }
    if (value.is_number_float()) {
        return value.get<double>() != 0.0;
    }
    if (value.is_string()) {
        return !value.get<std::string>().empty();
    }
    return !value.empty();
}

const nlohmann::json *field(const nlohmann::json &record, const char *key)
{
    if (!record.is_object()) {
        return nullptr;
    }
    auto it = record.find(key);
    if (it == record.end()) {
        return nullptr;
    }
    return &(*it);
}

std::optional<std::string> scalarText(const nlohmann::json &value)
{
    if (value.is_string()) {
        std::string text = value.get<std::string>();
        if (text.empty()) {
            return std::nullopt;
        }
        return text;
    }
    if (value.is_number_integer() || value.is_number_unsigned()) {
        return std::to_string(value.get<long long>());
    }
    if (value.is_number_float()) {
        return value.dump();
    }
    return std::nullopt;
}

std::optional<int> optionalInt(const nlohmann::json *value)
{
    if (!value) {
        return std::nullopt;
    }
    if (value->is_number_integer() || value->is_number_unsigned()) {
        return value->get<int>();
    }
    if (value->is_string()) {
        bool ok = false;
        const int parsed = QString::fromStdString(value->get<std::string>()).trimmed().toInt(&ok);
        if (ok) {
            return parsed;
        }
    }
    return std::nullopt;
}

std::string textOrEmpty(const nlohmann::json *value)
{
    if (!value) {
        return {};
    }
    return scalarText(*value).value_or(std::string());
}

const nlohmann::json *firstTruthy(const nlohmann::json &record,
                                  const char *const *begin,
                                  const char *const *end)
{
    for (auto it = begin; it != end; ++it) {
        const nlohmann::json *value = field(record, *it);
        if (value && isTruthy(*value)) {
            return value;
        }
    }
    return nullptr;
}

std::optional<std::string> parseFirmware(const nlohmann::json &record)
{
    const nlohmann::json *value =
        firstTruthy(record, kFirmwareFields.data(), kFirmwareFields.data() + kFirmwareFields.size());
    if (!value) {
        return std::nullopt;
    }
    if (value->is_object()) {
        const nlohmann::json *version = field(*value, "version");
        if (version && isTruthy(*version)) {
            return scalarText(*version);
        }
        const nlohmann::json *name = field(*value, "name");
        if (name && isTruthy(*name)) {
            return scalarText(*name);
        }
        return std::nullopt;
    }
    if (value->is_boolean()) {
        return std::string("true");
    }
    if (value->is_array()) {
        return value->dump();
    }
    return scalarText(*value);
}

std::optional<std::vector<TaskSummary>> parseTaskQueue(const nlohmann::json &record)
{
    const nlohmann::json *value = field(record, "task_queue");
    if (!value || value->is_null()) {
        return std::nullopt;
    }
    if (value->is_string()) {
        const std::string text = value->get<std::string>();
        if (text.empty() || text == "Empty") {
            return std::nullopt;
        }
        return std::vector<TaskSummary>{TaskSummary{}};
    }
    if (value->is_array()) {
        std::vector<TaskSummary> queue;
        queue.reserve(value->size());
        for (const auto &entry : *value) {
            queue.push_back(parseTaskSummary(entry));
        }
        return queue;
    }
    if (value->is_object()) {
        return std::vector<TaskSummary>{parseTaskSummary(*value)};
    }
    if (!isTruthy(*value)) {
        return std::nullopt;
    }
    return std::vector<TaskSummary>{TaskSummary{}};
}

std::optional<int> positiveId(const nlohmann::json &record)
{
    const std::optional<int> id = optionalInt(field(record, "id"));
    if (!id.has_value() || *id <= 0) {
        return std::nullopt;
    }
    return id;
}

std::chrono::system_clock::time_point fromMSecs(qint64 msecs)
{
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::milliseconds(msecs)));
}

template <typename T, typename ParseFn>
ClientResult<Page<T>> parsePage(const nlohmann::json &body, int requestedPage, ParseFn parse)
{
    if (!body.is_object()) {
        return ClientResult<Page<T>>::failure(apiError("Malformed page response: expected an object"));
    }

    Page<T> page;
    page.currentPage = requestedPage;
    page.lastPage = 1;

    auto data = body.find("data");
    if (data != body.end() && !data->is_null()) {
        if (!data->is_array()) {
            return ClientResult<Page<T>>::failure(apiError("Malformed page response: 'data' is not a list"));
        }
        page.items.reserve(data->size());
        for (const auto &record : *data) {
            page.items.push_back(parse(record));
        }
    }

    const nlohmann::json *meta = field(body, "meta");
    if (meta && meta->is_object()) {
        page.currentPage = optionalInt(field(*meta, "current_page")).value_or(requestedPage);
        page.lastPage = optionalInt(field(*meta, "last_page")).value_or(1);
    }
    if (page.lastPage < 1) {
        page.lastPage = 1;
    }

    return ClientResult<Page<T>>::success(std::move(page));
}

} // namespace

TaskSummary parseTaskSummary(const nlohmann::json &record)
{
    TaskSummary summary;
    if (!record.is_object()) {
        return summary;
    }
    summary.id = positiveId(record);
    summary.type = textOrEmpty(field(record, "type"));
    summary.status = textOrEmpty(field(record, "status"));
    return summary;
}

Device parseDevice(const nlohmann::json &record)
{
    Device device;
    if (!record.is_object()) {
        return device;
    }

    device.deviceId = textOrEmpty(field(record, "imei"));

    const std::string status = textOrEmpty(field(record, "activity_status"));
    if (!status.empty()) {
        device.activityStatusText = status;
        device.activityStatus = parseActivityStatusString(status);
    }

    const std::string model = textOrEmpty(field(record, "model"));
    if (!model.empty()) {
        device.model = model;
    }

    device.firmware = parseFirmware(record);

    const nlohmann::json *serial = field(record, "serial");
    if (serial) {
        device.serial = scalarText(*serial);
    }

    const nlohmann::json *description = firstTruthy(
        record, kDescriptionFields.data(), kDescriptionFields.data() + kDescriptionFields.size());
    if (description) {
        const QString trimmed =
            QString::fromStdString(textOrEmpty(description)).trimmed();
        if (!trimmed.isEmpty()) {
            device.description = trimmed.toStdString();
        }
    }

    device.taskQueue = parseTaskQueue(record);

    const nlohmann::json *nextTask = field(record, "next_task");
    if (nextTask && nextTask->is_object() && !nextTask->empty()) {
        device.nextTask = parseTaskSummary(*nextTask);
    }

    const nlohmann::json *lastContact = firstTruthy(
        record, kLastContactFields.data(), kLastContactFields.data() + kLastContactFields.size());
    if (lastContact) {
        device.lastContact = parseTimestamp(*lastContact);
    }

    return device;
}

Task parseTask(const nlohmann::json &record)
{
    Task task;
    if (!record.is_object()) {
        return task;
    }
    task.id = positiveId(record).value_or(0);
    task.type = parseTaskTypeString(textOrEmpty(field(record, "type")));
    task.status = parseTaskStatusString(textOrEmpty(field(record, "status")));
    task.deviceId = textOrEmpty(field(record, "imei"));
    task.batchId = optionalInt(field(record, "batch_id"));
    return task;
}

AccountStatistics parseAccountStatistics(const nlohmann::json &record)
{
    AccountStatistics stats;
    if (!record.is_object()) {
        return stats;
    }
    stats.raw = record;
    stats.groupCount = optionalInt(field(record, "group_count")).value_or(0);
    stats.taskCount = optionalInt(field(record, "task_count")).value_or(0);
    return stats;
}

std::optional<std::chrono::system_clock::time_point> parseTimestamp(const nlohmann::json &value)
{
    if (!value.is_string()) {
        return std::nullopt;
    }
    const QString text = QString::fromStdString(value.get<std::string>()).trimmed();
    if (text.isEmpty()) {
        return std::nullopt;
    }

    QDateTime parsed = QDateTime::fromString(text, Qt::ISODate);
    if (!parsed.isValid()) {
        parsed = QDateTime::fromString(text, QStringLiteral("yyyy-MM-dd HH:mm:ss"));
        if (!parsed.isValid()) {
            return std::nullopt;
        }
    }
    // Timestamps without a zone are reported in UTC.
    if (parsed.timeSpec() == Qt::LocalTime) {
        parsed = QDateTime(parsed.date(), parsed.time(), QTimeZone::utc());
    }
    return fromMSecs(parsed.toMSecsSinceEpoch());
}

ClientResult<Page<Device>> parseDevicePage(const nlohmann::json &body, int requestedPage)
{
    return parsePage<Device>(body, requestedPage,
                             [](const nlohmann::json &record) { return parseDevice(record); });
}

ClientResult<Page<Task>> parseTaskPage(const nlohmann::json &body, int requestedPage)
{
    return parsePage<Task>(body, requestedPage,
                           [](const nlohmann::json &record) { return parseTask(record); });
}

} // namespace fleetsync
