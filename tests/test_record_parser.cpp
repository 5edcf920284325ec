#include <QtTest/QtTest>

#include <nlohmann/json.hpp>

#include "client/record_parser.hpp"
#include "common/json_utils.hpp"

using fleetsync::ActivityStatus;
using fleetsync::TaskStatus;
using fleetsync::TaskType;

class RecordParserTests : public QObject
{
    Q_OBJECT
private slots:
    void testDeviceBasics();
    void testDeviceDefaults();
    void testFirmwareAliases();
    void testFirmwareObject();
    void testDisplayNameFallback();
    void testTaskQueueShapes();
    void testFirmwareUpdatePending();
    void testTimestamps();
    void testTask();
    void testStatistics();
    void testPageEnvelope();
    void testPageWithoutMeta();
    void testMalformedPage();
};

void RecordParserTests::testDeviceBasics()
{
    const auto record = nlohmann::json::parse(R"({
        "imei": 352093081234567,
        "activity_status": "Online",
        "model": "FMB920",
        "serial": "1100223344",
        "description": "  Truck 7  ",
        "current_firmware": "03.29.00.Rev.01",
        "seen_at": "2024-03-01T10:15:00Z"
    })");

    const fleetsync::Device device = fleetsync::parseDevice(record);
    QCOMPARE(device.deviceId, std::string("352093081234567"));
    QCOMPARE(device.activityStatus, ActivityStatus::Online);
    QVERIFY(device.isOnline());
    QCOMPARE(device.model, std::string("FMB920"));
    QCOMPARE(*device.serial, std::string("1100223344"));
    QCOMPARE(*device.firmware, std::string("03.29.00.Rev.01"));
    QCOMPARE(device.displayName(), std::string("Truck 7 (352093081234567)"));
    QVERIFY(device.lastContact.has_value());
    QCOMPARE(fleetsync::toIso8601Utc(*device.lastContact), std::string("2024-03-01T10:15:00Z"));
}

void RecordParserTests::testDeviceDefaults()
{
    const fleetsync::Device device = fleetsync::parseDevice(nlohmann::json{{"imei", "42"}});
    QCOMPARE(device.model, std::string("Unknown"));
    QCOMPARE(device.activityStatusText, std::string("unknown"));
    QCOMPARE(device.activityStatus, ActivityStatus::Unknown);
    QVERIFY(!device.firmware.has_value());
    QVERIFY(!device.serial.has_value());
    QVERIFY(!device.taskQueue.has_value());
    QVERIFY(!device.lastContact.has_value());
    QCOMPARE(device.taskQueueCount(), 0);
    QVERIFY(!device.hasPendingTasks());

    const fleetsync::Device missingId = fleetsync::parseDevice(nlohmann::json{{"model", "X"}});
    QVERIFY(missingId.deviceId.empty());
}

void RecordParserTests::testFirmwareAliases()
{
    const auto record = nlohmann::json{
        {"imei", "1"}, {"current_firmware", ""}, {"firmware", nullptr}, {"fw_version", "1.2.3"}, {"version", "9"}};
    QCOMPARE(*fleetsync::parseDevice(record).firmware, std::string("1.2.3"));
}

void RecordParserTests::testFirmwareObject()
{
    const auto withVersion = nlohmann::json{
        {"imei", "1"}, {"firmware", {{"version", "4.0"}, {"name", "fw-name"}}}};
    QCOMPARE(*fleetsync::parseDevice(withVersion).firmware, std::string("4.0"));

    const auto withName = nlohmann::json{{"imei", "1"}, {"firmware", {{"name", "fw-name"}}}};
    QCOMPARE(*fleetsync::parseDevice(withName).firmware, std::string("fw-name"));
}

void RecordParserTests::testDisplayNameFallback()
{
    const auto aliased = nlohmann::json{{"imei", "5"}, {"description", ""}, {"alias", "Van"}};
    QCOMPARE(fleetsync::parseDevice(aliased).displayName(), std::string("Van (5)"));

    const auto bare = nlohmann::json{{"imei", "5"}};
    QCOMPARE(fleetsync::parseDevice(bare).displayName(), std::string("Teltonika (5)"));
}

void RecordParserTests::testTaskQueueShapes()
{
    const auto empty = nlohmann::json{{"imei", "1"}, {"task_queue", "Empty"}};
    QVERIFY(!fleetsync::parseDevice(empty).taskQueue.has_value());

    const auto nullQueue = nlohmann::json{{"imei", "1"}, {"task_queue", nullptr}};
    QVERIFY(!fleetsync::parseDevice(nullQueue).taskQueue.has_value());

    const auto list = nlohmann::json::parse(R"({"imei": "1", "task_queue": [
        {"id": 11, "type": "firmware", "status": "pending"},
        {"id": 12, "type": "configuration", "status": "pending"},
        {"type": "configuration"}
    ]})");
    const fleetsync::Device listed = fleetsync::parseDevice(list);
    QVERIFY(listed.taskQueue.has_value());
    QCOMPARE(listed.taskQueueCount(), 3);
    QVERIFY(listed.hasPendingTasks());
    QCOMPARE(listed.pendingTaskIds(), (std::vector<int>{11, 12}));

    const auto object = nlohmann::json::parse(R"({"imei": "1", "task_queue": {"id": 5, "type": "x"}})");
    const fleetsync::Device single = fleetsync::parseDevice(object);
    QCOMPARE(single.taskQueueCount(), 1);
    QCOMPARE(single.pendingTaskIds(), (std::vector<int>{5}));

    const auto opaque = nlohmann::json{{"imei", "1"}, {"task_queue", "2 tasks"}};
    const fleetsync::Device unknown = fleetsync::parseDevice(opaque);
    QCOMPARE(unknown.taskQueueCount(), 1);
    QVERIFY(unknown.pendingTaskIds().empty());
}

void RecordParserTests::testFirmwareUpdatePending()
{
    const auto queued = nlohmann::json::parse(
        R"({"imei": "1", "task_queue": [{"id": 1, "type": "FOTA Firmware update"}]})");
    QVERIFY(fleetsync::parseDevice(queued).hasFirmwareUpdatePending());

    const auto next = nlohmann::json::parse(
        R"({"imei": "1", "next_task": {"id": 3, "type": "Firmware"}})");
    const fleetsync::Device withNext = fleetsync::parseDevice(next);
    QVERIFY(withNext.nextTask.has_value());
    QVERIFY(withNext.hasFirmwareUpdatePending());
    QVERIFY(!withNext.hasPendingTasks());

    const auto config = nlohmann::json::parse(
        R"({"imei": "1", "task_queue": [{"id": 1, "type": "configuration"}]})");
    QVERIFY(!fleetsync::parseDevice(config).hasFirmwareUpdatePending());
}

void RecordParserTests::testTimestamps()
{
    const auto offset = fleetsync::parseTimestamp("2024-03-01T12:15:00+02:00");
    QVERIFY(offset.has_value());
    QCOMPARE(fleetsync::toIso8601Utc(*offset), std::string("2024-03-01T10:15:00Z"));

    const auto plain = fleetsync::parseTimestamp("2024-03-01 10:15:00");
    QVERIFY(plain.has_value());
    QCOMPARE(fleetsync::toIso8601Utc(*plain), std::string("2024-03-01T10:15:00Z"));

    QVERIFY(!fleetsync::parseTimestamp("yesterday").has_value());
    QVERIFY(!fleetsync::parseTimestamp(12345).has_value());

    // A later alias is used when the earlier ones are empty.
    const auto record = nlohmann::json{
        {"imei", "1"}, {"seen_at", ""}, {"last_seen", "2024-03-01 10:15:00"}};
    QVERIFY(fleetsync::parseDevice(record).lastContact.has_value());
}

void RecordParserTests::testTask()
{
    const auto record = nlohmann::json::parse(
        R"({"id": "77", "type": "firmware", "status": "failed", "imei": 123, "batch_id": 9})");
    const fleetsync::Task task = fleetsync::parseTask(record);
    QCOMPARE(task.id, 77);
    QCOMPARE(task.type, TaskType::Firmware);
    QCOMPARE(task.status, TaskStatus::Failed);
    QCOMPARE(task.deviceId, std::string("123"));
    QCOMPARE(*task.batchId, 9);

    const fleetsync::Task anonymous = fleetsync::parseTask(nlohmann::json{{"status", "pending"}});
    QCOMPARE(anonymous.id, 0);
    QVERIFY(!anonymous.batchId.has_value());
}

void RecordParserTests::testStatistics()
{
    const auto stats = fleetsync::parseAccountStatistics(
        nlohmann::json{{"group_count", 4}, {"task_count", "12"}, {"extra", true}});
    QCOMPARE(stats.groupCount, 4);
    QCOMPARE(stats.taskCount, 12);
    QVERIFY(stats.raw.contains("extra"));

    const auto empty = fleetsync::parseAccountStatistics(nlohmann::json::object());
    QCOMPARE(empty.groupCount, 0);
    QCOMPARE(empty.taskCount, 0);
}

void RecordParserTests::testPageEnvelope()
{
    const auto body = nlohmann::json::parse(R"({
        "data": [{"imei": "1"}, {"imei": "2"}],
        "meta": {"current_page": 2, "last_page": 4}
    })");
    const auto page = fleetsync::parseDevicePage(body, 2);
    QVERIFY(page.ok());
    QCOMPARE(page.value().items.size(), static_cast<size_t>(2));
    QCOMPARE(page.value().currentPage, 2);
    QCOMPARE(page.value().lastPage, 4);
}

void RecordParserTests::testPageWithoutMeta()
{
    const auto page = fleetsync::parseTaskPage(nlohmann::json{{"data", nlohmann::json::array()}}, 3);
    QVERIFY(page.ok());
    QVERIFY(page.value().items.empty());
    QCOMPARE(page.value().currentPage, 3);
    QCOMPARE(page.value().lastPage, 1);

    const auto noData = fleetsync::parseTaskPage(nlohmann::json::object(), 1);
    QVERIFY(noData.ok());
    QVERIFY(noData.value().items.empty());
}

void RecordParserTests::testMalformedPage()
{
    const auto page = fleetsync::parseDevicePage(nlohmann::json{{"data", "nope"}}, 1);
    QVERIFY(!page.ok());
    QCOMPARE(page.error().kind, fleetsync::ClientErrorKind::Api);

    const auto notObject = fleetsync::parseDevicePage(nlohmann::json::array(), 1);
    QVERIFY(!notObject.ok());
}

QTEST_MAIN(RecordParserTests)
#include "test_record_parser.moc"
