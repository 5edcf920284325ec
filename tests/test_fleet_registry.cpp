#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <memory>

#include "common/logging.hpp"
#include "sync/fleet_registry.hpp"
#include "fake_fleet_client.hpp"

using fleetsync::FleetEntry;
using fleetsync::FleetRegistry;
using fleetsync::testing::FakeFleetClient;
using fleetsync::testing::makeDevice;

namespace {

fleetsync::CoordinatorOptions quietOptions()
{
    fleetsync::CoordinatorOptions options;
    options.pollInterval = std::chrono::hours(1);
    return options;
}

std::unique_ptr<FakeFleetClient> clientWithDevices(std::vector<std::string> imeis)
{
    auto client = std::make_unique<FakeFleetClient>();
    std::vector<fleetsync::Device> devices;
    for (const auto &imei : imeis) {
        devices.push_back(makeDevice(imei));
    }
    client->setDevices(devices);
    return client;
}

} // namespace

class FleetRegistryTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();

    void testAddAndFind();
    void testFailedStartRegistersNothing();
    void testDuplicateIdRejected();
    void testEntryForDeviceFallsBackToFirst();
    void testRemove();
    void testRequestRefreshAll();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevLogDir;
};

void FleetRegistryTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevLogDir = qgetenv("FLEETSYNC_LOG_DIR");
    qputenv("FLEETSYNC_LOG_DIR", m_tempDir.path().toUtf8());
    fleetsync::logging::initLogging(QStringLiteral("fleetsync-test"), false);
}

void FleetRegistryTests::cleanupTestCase()
{
    if (m_prevLogDir.isEmpty()) {
        qunsetenv("FLEETSYNC_LOG_DIR");
    } else {
        qputenv("FLEETSYNC_LOG_DIR", m_prevLogDir);
    }
}

void FleetRegistryTests::testAddAndFind()
{
    FleetRegistry registry;
    const auto added = registry.addAccount("fleet-a", clientWithDevices({"1", "2"}), quietOptions());
    QVERIFY(added.ok());

    FleetEntry *entry = added.value();
    QCOMPARE(QString::fromStdString(entry->id), QStringLiteral("fleet-a"));
    QVERIFY(entry->coordinator->isStarted());
    QVERIFY(entry->commands != nullptr);
    QCOMPARE(entry->coordinator->latest()->totalDevices(), 2);
    QCOMPARE(QString::fromStdString(entry->coordinator->options().name), QStringLiteral("fleet-a"));

    QCOMPARE(registry.size(), static_cast<size_t>(1));
    QCOMPARE(registry.find("fleet-a"), entry);
    QVERIFY(registry.find("fleet-b") == nullptr);
    QCOMPARE(registry.firstEntry(), entry);
}

void FleetRegistryTests::testFailedStartRegistersNothing()
{
    FleetRegistry registry;
    auto client = clientWithDevices({"1"});
    client->failStats(fleetsync::authenticationError("Invalid or expired API token", 401));

    const auto added = registry.addAccount("fleet-a", std::move(client), quietOptions());
    QVERIFY(!added.ok());
    QCOMPARE(added.error().kind, fleetsync::SyncErrorKind::ReauthenticationRequired);
    QVERIFY(registry.empty());
    QVERIFY(registry.firstEntry() == nullptr);
}

void FleetRegistryTests::testDuplicateIdRejected()
{
    FleetRegistry registry;
    QVERIFY(registry.addAccount("fleet-a", clientWithDevices({"1"}), quietOptions()).ok());

    const auto added = registry.addAccount("fleet-a", clientWithDevices({"2"}), quietOptions());
    QVERIFY(!added.ok());
    QCOMPARE(added.error().kind, fleetsync::SyncErrorKind::CommandFailed);
    QCOMPARE(registry.size(), static_cast<size_t>(1));
}

void FleetRegistryTests::testEntryForDeviceFallsBackToFirst()
{
    FleetRegistry registry;
    FleetEntry *first = registry.addAccount("fleet-a", clientWithDevices({"1"}), quietOptions()).value();
    FleetEntry *second = registry.addAccount("fleet-b", clientWithDevices({"2"}), quietOptions()).value();

    QCOMPARE(registry.entryForDevice("2"), second);
    QCOMPARE(registry.entryForDevice("1"), first);
    QCOMPARE(registry.entryForDevice("unknown"), first);

    const std::vector<FleetEntry *> entries = registry.entries();
    QCOMPARE(entries.size(), static_cast<size_t>(2));
    QCOMPARE(entries.at(0), first);
    QCOMPARE(entries.at(1), second);
}

void FleetRegistryTests::testRemove()
{
    FleetRegistry registry;
    QVERIFY(registry.addAccount("fleet-a", clientWithDevices({"1"}), quietOptions()).ok());
    QVERIFY(registry.addAccount("fleet-b", clientWithDevices({"2"}), quietOptions()).ok());

    QVERIFY(registry.remove("fleet-a"));
    QVERIFY(!registry.remove("fleet-a"));
    QCOMPARE(registry.size(), static_cast<size_t>(1));
    QCOMPARE(QString::fromStdString(registry.firstEntry()->id), QStringLiteral("fleet-b"));
}

void FleetRegistryTests::testRequestRefreshAll()
{
    FleetRegistry registry;
    auto clientA = clientWithDevices({"1"});
    auto clientB = clientWithDevices({"2"});
    FakeFleetClient *rawA = clientA.get();
    FakeFleetClient *rawB = clientB.get();
    QVERIFY(registry.addAccount("fleet-a", std::move(clientA), quietOptions()).ok());
    QVERIFY(registry.addAccount("fleet-b", std::move(clientB), quietOptions()).ok());

    registry.requestRefreshAll();
    QTRY_COMPARE_WITH_TIMEOUT(rawA->roundsStarted.load(), 2, 5000);
    QTRY_COMPARE_WITH_TIMEOUT(rawB->roundsStarted.load(), 2, 5000);
    QTRY_COMPARE_WITH_TIMEOUT(registry.find("fleet-b")->coordinator->latest()->generation,
                              static_cast<std::uint64_t>(2), 5000);
}

QTEST_MAIN(FleetRegistryTests)
#include "test_fleet_registry.moc"
