#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <memory>
#include <sstream>

#include <nlohmann/json.hpp>

#include "cli/FleetCli.hpp"
#include "common/logging.hpp"
#include "fake_fleet_client.hpp"

using fleetsync::FleetCli;
using fleetsync::testing::FakeFleetClient;
using fleetsync::testing::ForwardingFleetClient;
using fleetsync::testing::makeDevice;
using fleetsync::testing::makeTask;

namespace {

QStringList cliArgs(std::initializer_list<const char *> args)
{
    QStringList list{QStringLiteral("fleetsync")};
    for (const char *arg : args) {
        list << QString::fromUtf8(arg);
    }
    return list;
}

} // namespace

class FleetCliTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();

    void testStatusMarkdown();
    void testStatusJson();
    void testDevicesMarkdown();
    void testTasksFilteredByStatus();
    void testTasksUnknownStatus();
    void testUnknownCommand();
    void testInvalidFormat();
    void testMissingToken();
    void testBulkCancel();
    void testCancelDeviceTasksWithoutQueue();
    void testCommandFailure();
    void testStartupAuthenticationFailure();
    void testStartupApiFailure();
    void testCheck();
    void testCheckAuthenticationFailure();
    void testBatch();
    void testBatchFailure();
    void testExitCodeFor();

private:
    int run(const QStringList &args);

    QTemporaryDir m_tempDir;
    QByteArray m_prevLogDir;
    std::unique_ptr<FakeFleetClient> m_client;
    int m_clientsMade = 0;
    std::ostringstream m_out;
    std::ostringstream m_err;
};

void FleetCliTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevLogDir = qgetenv("FLEETSYNC_LOG_DIR");
    qputenv("FLEETSYNC_LOG_DIR", m_tempDir.path().toUtf8());
    fleetsync::logging::initLogging(QStringLiteral("fleetsync-test"), false);
}

void FleetCliTests::cleanupTestCase()
{
    qunsetenv("FLEETSYNC_API_TOKEN");
    if (m_prevLogDir.isEmpty()) {
        qunsetenv("FLEETSYNC_LOG_DIR");
    } else {
        qputenv("FLEETSYNC_LOG_DIR", m_prevLogDir);
    }
}

void FleetCliTests::init()
{
    qputenv("FLEETSYNC_API_TOKEN", "cli-token");
    m_client = std::make_unique<FakeFleetClient>();
    m_client->setDevices({makeDevice("352093081234567"),
                          makeDevice("352093089999999", fleetsync::ActivityStatus::Offline)});
    m_client->setTasks({makeTask(1, fleetsync::TaskStatus::Failed),
                        makeTask(2, fleetsync::TaskStatus::Pending)});
    m_client->setStats(3, 9);
    m_clientsMade = 0;
    m_out.str(std::string());
    m_err.str(std::string());
}

int FleetCliTests::run(const QStringList &args)
{
    FakeFleetClient *target = m_client.get();
    int *made = &m_clientsMade;
    FleetCli cli(
        [target, made](const fleetsync::AccountConfig &) -> std::unique_ptr<fleetsync::FleetClient> {
            ++*made;
            return std::make_unique<ForwardingFleetClient>(*target);
        },
        m_out, m_err);
    return cli.run(args);
}

void FleetCliTests::testStatusMarkdown()
{
    QCOMPARE(run(cliArgs({"status"})), 0);
    const QString out = QString::fromStdString(m_out.str());
    QVERIFY(out.contains(QStringLiteral("# Fleet Status")));
    QVERIFY(out.contains(QStringLiteral("## Account: default")));
    QVERIFY(out.contains(QStringLiteral("Total devices: 2")));
    QVERIFY(out.contains(QStringLiteral("Online devices: 1")));
    QVERIFY(out.contains(QStringLiteral("Offline devices: 1")));
    QVERIFY(out.contains(QStringLiteral("Failed tasks: 1")));
    QVERIFY(out.contains(QStringLiteral("Groups: 3")));
    QCOMPARE(m_clientsMade, 1);
}

void FleetCliTests::testStatusJson()
{
    QCOMPARE(run(cliArgs({"status", "--format", "json"})), 0);
    const auto parsed = nlohmann::json::parse(m_out.str());
    QVERIFY(parsed.is_array());
    QCOMPARE(parsed.size(), static_cast<size_t>(1));
    const auto &summary = parsed.at(0);
    QCOMPARE(QString::fromStdString(summary.value("account", "")), QStringLiteral("default"));
    QCOMPARE(summary.value("generation", 0), 1);
    QCOMPARE(summary.value("totalDevices", 0), 2);
    QCOMPARE(summary.value("pendingTasks", 0), 1);
    QCOMPARE(summary.value("taskCount", 0), 9);
}

void FleetCliTests::testDevicesMarkdown()
{
    QCOMPARE(run(cliArgs({"devices"})), 0);
    const QString out = QString::fromStdString(m_out.str());
    QVERIFY(out.contains(QStringLiteral("# Devices")));
    QVERIFY(out.contains(QStringLiteral("352093081234567")));
    QVERIFY(out.contains(QStringLiteral("352093089999999")));
    QVERIFY(out.contains(QStringLiteral("model FMB920")));
}

void FleetCliTests::testTasksFilteredByStatus()
{
    QCOMPARE(run(cliArgs({"tasks", "--status", "failed"})), 0);
    const QString out = QString::fromStdString(m_out.str());
    QVERIFY(out.contains(QStringLiteral("# Tasks")));
    QVERIFY(out.contains(QStringLiteral("- #1 ")));
    QVERIFY(!out.contains(QStringLiteral("- #2 ")));
}

void FleetCliTests::testTasksUnknownStatus()
{
    QCOMPARE(run(cliArgs({"tasks", "--status", "sideways"})), 1);
    QVERIFY(QString::fromStdString(m_err.str()).contains(QStringLiteral("Unknown task status")));
}

void FleetCliTests::testUnknownCommand()
{
    QCOMPARE(run(cliArgs({"launch"})), 1);
    QVERIFY(QString::fromStdString(m_err.str()).contains(QStringLiteral("Usage:")));
    QCOMPARE(m_clientsMade, 0);

    QCOMPARE(run(QStringList{QStringLiteral("fleetsync")}), 1);
}

void FleetCliTests::testInvalidFormat()
{
    QCOMPARE(run(cliArgs({"status", "--format", "yaml"})), 1);
    QVERIFY(QString::fromStdString(m_err.str()).contains(QStringLiteral("Invalid format")));
    QCOMPARE(m_clientsMade, 0);
}

void FleetCliTests::testMissingToken()
{
    qunsetenv("FLEETSYNC_API_TOKEN");
    QCOMPARE(run(cliArgs({"status"})), 1);
    QVERIFY(QString::fromStdString(m_err.str()).contains(QStringLiteral("Invalid configuration")));
    QCOMPARE(m_clientsMade, 0);
}

void FleetCliTests::testBulkCancel()
{
    m_client->setCommandResponse(nlohmann::json{{"cancelled", 2}});
    QCOMPARE(run(cliArgs({"bulk-cancel", "--task-ids", "5,7"})), 0);

    QCOMPARE(m_client->cancelledCalls().size(), static_cast<size_t>(1));
    QCOMPARE(m_client->cancelledCalls().front(), (std::vector<int>{5, 7}));
    const QString out = QString::fromStdString(m_out.str());
    QVERIFY(out.contains(QStringLiteral("Command bulk-cancel accepted.")));
    QVERIFY(out.contains(QStringLiteral("\"cancelled\": 2")));

    QCOMPARE(run(cliArgs({"bulk-cancel", "--task-ids", "5,x"})), 1);
    QCOMPARE(m_client->cancelledCalls().size(), static_cast<size_t>(1));
}

void FleetCliTests::testCancelDeviceTasksWithoutQueue()
{
    QCOMPARE(run(cliArgs({"cancel-device-tasks", "--imei", "352093081234567"})), 0);
    QVERIFY(QString::fromStdString(m_out.str())
                .contains(QStringLiteral("No pending tasks for 352093081234567.")));
    QCOMPARE(m_client->commandCalls.load(), 0);

    QCOMPARE(run(cliArgs({"cancel-device-tasks"})), 1);
}

void FleetCliTests::testCommandFailure()
{
    m_client->failCommands(fleetsync::apiError("Connection error: refused", 0));
    QCOMPARE(run(cliArgs({"retry-failed", "--batch-id", "4"})), 1);
    QVERIFY(QString::fromStdString(m_err.str()).contains(QStringLiteral("Failed to")));
    QCOMPARE(m_client->lastBatchId, 4);
}

void FleetCliTests::testStartupAuthenticationFailure()
{
    m_client->failStats(fleetsync::authenticationError("Invalid or expired API token", 401));
    QCOMPARE(run(cliArgs({"status"})), 2);
    QVERIFY(QString::fromStdString(m_err.str()).contains(QStringLiteral("Account default")));
}

void FleetCliTests::testStartupApiFailure()
{
    m_client->failDevicePage(1, fleetsync::apiError("Server error", 500));
    QCOMPARE(run(cliArgs({"devices"})), 3);
    QVERIFY(m_out.str().empty());
}

void FleetCliTests::testCheck()
{
    QCOMPARE(run(cliArgs({"check"})), 0);
    QVERIFY(QString::fromStdString(m_out.str())
                .contains(QStringLiteral("- default: ok (3 groups, 9 tasks)")));
    QCOMPARE(m_client->statsCalls.load(), 1);
    QCOMPARE(m_client->deviceCalls.load(), 0);
}

void FleetCliTests::testCheckAuthenticationFailure()
{
    m_client->failStats(fleetsync::authenticationError("Invalid or expired API token", 401));
    QCOMPARE(run(cliArgs({"check", "--format", "json"})), 2);
    const auto parsed = nlohmann::json::parse(m_out.str());
    QCOMPARE(parsed.size(), static_cast<size_t>(1));
    QVERIFY(!parsed.at(0).value("ok", true));
}

void FleetCliTests::testBatch()
{
    m_client->setBatch(nlohmann::json{{"id", 12}, {"status", "completed"}});
    QCOMPARE(run(cliArgs({"batch", "--batch-id", "12"})), 0);
    QCOMPARE(m_client->lastBatchId, 12);
    const QString out = QString::fromStdString(m_out.str());
    QVERIFY(out.contains(QStringLiteral("# Batch 12")));
    QVERIFY(out.contains(QStringLiteral("\"status\": \"completed\"")));
    // No refresh round is needed for a single read.
    QCOMPARE(m_client->deviceCalls.load(), 0);

    m_out.str(std::string());
    QCOMPARE(run(cliArgs({"batch", "--batch-id", "12", "--format", "json"})), 0);
    const auto parsed = nlohmann::json::parse(m_out.str());
    QCOMPARE(parsed.value("batchId", 0), 12);
    QVERIFY(parsed.at("batch").at("status") == "completed");

    QCOMPARE(run(cliArgs({"batch"})), 1);
    QCOMPARE(run(cliArgs({"batch", "--batch-id", "0"})), 1);
    QCOMPARE(run(cliArgs({"batch", "--batch-id", "12", "--account", "elsewhere"})), 1);
    QVERIFY(QString::fromStdString(m_err.str()).contains(QStringLiteral("Unknown account: elsewhere")));
}

void FleetCliTests::testBatchFailure()
{
    m_client->failBatch(fleetsync::apiError("Server error", 404));
    QCOMPARE(run(cliArgs({"batch", "--batch-id", "99"})), 3);
    QVERIFY(QString::fromStdString(m_err.str()).contains(QStringLiteral("Error communicating with API")));
    QCOMPARE(m_client->lastBatchId, 99);

    m_client->failBatch(fleetsync::authenticationError("Invalid or expired API token", 401));
    QCOMPARE(run(cliArgs({"batch", "--batch-id", "99"})), 2);
    QVERIFY(m_out.str().empty());
}

void FleetCliTests::testExitCodeFor()
{
    QCOMPARE(fleetsync::exitCodeFor(fleetsync::SyncErrorKind::ReauthenticationRequired), 2);
    QCOMPARE(fleetsync::exitCodeFor(fleetsync::SyncErrorKind::UpdateFailed), 3);
    QCOMPARE(fleetsync::exitCodeFor(fleetsync::SyncErrorKind::CommandFailed), 1);
}

QTEST_MAIN(FleetCliTests)
#include "test_fleet_cli.moc"
