#include "sync/sync_coordinator.hpp"

#include <atomic>

#include <QTimer>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"
#include "sync/pagination.hpp"

namespace fleetsync {

namespace {

CoordinatorOptions sanitized(CoordinatorOptions options)
{
    if (options.pollInterval <= std::chrono::milliseconds::zero()) {
        options.pollInterval = std::chrono::minutes(kDefaultScanIntervalMinutes);
    }
    if (options.pageSize < 1) {
        options.pageSize = kDefaultPageSize;
    }
    return options;
}

qint64 elapsedMs(std::chrono::steady_clock::time_point since)
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - since)
        .count();
}

} // namespace

CoordinatorOptions coordinatorOptionsFromAccount(const AccountConfig &account)
{
    CoordinatorOptions options;
    options.name = account.id;
    options.pollInterval = std::chrono::minutes(account.scanIntervalMinutes);
    options.pageSize = account.pageSize;
    return options;
}

SyncCoordinator::SyncCoordinator(FleetClient &client, CoordinatorOptions options,
                                 QObject *parent)
    : QObject(parent)
    , m_client(client)
    , m_options(sanitized(std::move(options)))
    , m_snapshot(std::make_shared<const FleetSnapshot>())
    , m_worker(std::make_unique<QObject>())
{
    m_thread.setObjectName(QStringLiteral("fleetsync-refresh-%1")
                               .arg(QString::fromStdString(m_options.name)));
    m_worker->moveToThread(&m_thread);
    m_thread.start();
}

SyncCoordinator::~SyncCoordinator()
{
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        m_stopping = true;
    }

    if (m_thread.isRunning()) {
        // The timer belongs to the worker thread and has to be stopped there.
        // m_worker deletes it once the thread has finished.
        QMetaObject::invokeMethod(
            m_worker.get(),
            [this] {
                if (m_timer) {
                    m_timer->stop();
                }
            },
            Qt::BlockingQueuedConnection);
        m_thread.quit();
        m_thread.wait();
    }
}

SyncResult<SnapshotPtr> SyncCoordinator::start()
{
    bool alreadyStarted = false;
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        alreadyStarted = m_started;
    }
    if (alreadyStarted) {
        return refresh();
    }

    SyncResult<SnapshotPtr> first = runRound(QStringLiteral("startup"));
    if (!first) {
        return first;
    }

    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        m_started = true;
    }
    QMetaObject::invokeMethod(m_worker.get(), [this] { armTimer(); }, Qt::QueuedConnection);

    FSLOG_INFO(QStringLiteral("SyncCoordinator"),
               QStringLiteral("start"),
               QStringLiteral("coordinator_started"),
               QStringLiteral("first_refresh_succeeded"),
               QStringLiteral("poll_timer"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"account", m_options.name},
                               {"pollIntervalMs", m_options.pollInterval.count()},
                               {"devices", first.value()->totalDevices()}}));
    return first;
}

SyncResult<SnapshotPtr> SyncCoordinator::refresh()
{
    return runRound(QStringLiteral("manual"));
}

void SyncCoordinator::requestRefresh()
{
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        if (m_stopping) {
            return;
        }
        if (m_refreshQueued) {
            FSLOG_DEBUG(QStringLiteral("SyncCoordinator"),
                        QStringLiteral("requestRefresh"),
                        QStringLiteral("refresh_request_coalesced"),
                        QStringLiteral("round_already_queued"),
                        QStringLiteral("dedup"),
                        logging::defaultWho(),
                        QString(),
                        (nlohmann::json{{"account", m_options.name}}));
            return;
        }
        m_refreshQueued = true;
    }

    QMetaObject::invokeMethod(m_worker.get(), [this] { runRequestedRound(); },
                              Qt::QueuedConnection);
}

SnapshotPtr SyncCoordinator::latest() const
{
    return std::atomic_load(&m_snapshot);
}

bool SyncCoordinator::isStarted() const
{
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_started;
}

bool SyncCoordinator::lastRefreshSucceeded() const
{
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        if (m_lastError.has_value()) {
            return false;
        }
    }
    return latest()->generation > 0;
}

std::optional<SyncError> SyncCoordinator::lastError() const
{
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_lastError;
}

void SyncCoordinator::runRequestedRound()
{
    if (m_workerRoundActive) {
        // Delivered from inside the running round. m_refreshQueued stays set
        // so later requests keep collapsing into the round posted below.
        m_rerunAfterRound = true;
        FSLOG_DEBUG(QStringLiteral("SyncCoordinator"),
                    QStringLiteral("runRequestedRound"),
                    QStringLiteral("refresh_deferred"),
                    QStringLiteral("round_in_flight"),
                    QStringLiteral("dedup"),
                    logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"account", m_options.name}}));
        return;
    }

    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        m_refreshQueued = false;
        if (m_stopping) {
            return;
        }
    }

    m_workerRoundActive = true;
    // Failures are already logged, recorded in lastError() and signalled.
    runRound(QStringLiteral("requested"));
    m_workerRoundActive = false;

    if (m_rerunAfterRound) {
        m_rerunAfterRound = false;
        QMetaObject::invokeMethod(m_worker.get(), [this] { runRequestedRound(); },
                                  Qt::QueuedConnection);
    }
}

void SyncCoordinator::armTimer()
{
    if (m_timer) {
        return;
    }
    m_timer = new QTimer(m_worker.get());
    m_timer->setInterval(m_options.pollInterval);
    connect(m_timer, &QTimer::timeout, m_worker.get(), [this] {
        FSLOG_DEBUG(QStringLiteral("SyncCoordinator"),
                    QStringLiteral("armTimer"),
                    QStringLiteral("poll_timer_fired"),
                    QStringLiteral("scheduled_refresh"),
                    QStringLiteral("poll_timer"),
                    logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"account", m_options.name}}));
        requestRefresh();
    });
    m_timer->start();
}

SyncResult<SnapshotPtr> SyncCoordinator::runRound(const QString &trigger)
{
    SyncResult<SnapshotPtr> result = [this, &trigger] {
        std::lock_guard<std::mutex> roundLock(m_roundMutex);
        return collectRound(trigger);
    }();

    // Slots run without the round lock, so they may start another round.
    emitOutcome(result);
    return result;
}

void SyncCoordinator::emitOutcome(const SyncResult<SnapshotPtr> &result)
{
    if (result) {
        emit snapshotPublished(result.value()->generation);
        return;
    }
    const SyncError &error = result.error();
    const QString message = QString::fromStdString(error.message);
    emit refreshFailed(QString::fromStdString(toString(error.kind)), message);
    if (error.kind == SyncErrorKind::ReauthenticationRequired) {
        emit reauthenticationRequired(message);
    }
}

SyncResult<SnapshotPtr> SyncCoordinator::collectRound(const QString &trigger)
{
    const logging::CorrelationScope corrScope(logging::newCorrelationId(QStringLiteral("refresh")));
    const auto roundStart = std::chrono::steady_clock::now();

    FSLOG_DEBUG(QStringLiteral("SyncCoordinator"),
                QStringLiteral("runRound"),
                QStringLiteral("refresh_round_start"),
                trigger,
                QStringLiteral("fota_api"),
                logging::defaultWho(),
                QString(),
                (nlohmann::json{{"account", m_options.name}}));

    auto snapshot = std::make_shared<FleetSnapshot>();

    const PageFetcher<Device> fetchDevices = [this](int page) {
        return m_client.listDevices(page, m_options.pageSize);
    };
    ClientResult<std::vector<Device>> devices = aggregatePages<Device>(fetchDevices);
    if (!devices) {
        return failRound(QStringLiteral("devices"), devices.error());
    }

    int skippedDevices = 0;
    for (Device &device : devices.value()) {
        if (device.deviceId.empty()) {
            ++skippedDevices;
            continue;
        }
        const std::string key = device.deviceId;
        snapshot->devices.insert_or_assign(key, std::move(device));
    }

    // Only the first task page is read.
    ClientResult<Page<Task>> tasks = m_client.listTasks(1, m_options.pageSize);
    if (!tasks) {
        return failRound(QStringLiteral("tasks"), tasks.error());
    }

    int skippedTasks = 0;
    for (Task &task : tasks.value().items) {
        if (task.id <= 0) {
            ++skippedTasks;
            continue;
        }
        snapshot->tasks.push_back(std::move(task));
    }

    ClientResult<AccountStatistics> stats = m_client.getAccountStatistics();
    if (!stats) {
        return failRound(QStringLiteral("stats"), stats.error());
    }
    snapshot->stats = std::move(stats.value());

    if (skippedDevices > 0 || skippedTasks > 0) {
        FSLOG_WARN(QStringLiteral("SyncCoordinator"),
                   QStringLiteral("runRound"),
                   QStringLiteral("records_skipped"),
                   QStringLiteral("missing_identifier"),
                   QStringLiteral("record_filter"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"account", m_options.name},
                                   {"devices", skippedDevices},
                                   {"tasks", skippedTasks}}));
    }

    snapshot->generation = ++m_generation;
    snapshot->fetchedAt = std::chrono::system_clock::now();

    const SnapshotPtr published = snapshot;
    std::atomic_store(&m_snapshot, published);
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        m_lastError.reset();
    }

    FSLOG_INFO(QStringLiteral("SyncCoordinator"),
               QStringLiteral("runRound"),
               QStringLiteral("snapshot_published"),
               trigger,
               QStringLiteral("fota_api"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"account", m_options.name},
                               {"generation", published->generation},
                               {"devices", published->totalDevices()},
                               {"online", published->onlineDevices()},
                               {"tasks", published->tasks.size()},
                               {"pendingTasks", published->pendingTasks()},
                               {"failedTasks", published->failedTasks()},
                               {"durationMs", elapsedMs(roundStart)}}));

    return SyncResult<SnapshotPtr>::success(published);
}

SyncResult<SnapshotPtr> SyncCoordinator::failRound(const QString &step, const ClientError &cause)
{
    const SyncError error = classifyRefreshFailure(cause);
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        m_lastError = error;
    }

    FSLOG_ERROR(QStringLiteral("SyncCoordinator"),
                QStringLiteral("runRound"),
                QStringLiteral("refresh_round_failed"),
                QString::fromStdString(toString(error.kind)),
                step,
                logging::defaultWho(),
                QString(),
                (nlohmann::json{{"account", m_options.name},
                                {"step", step.toStdString()},
                                {"cause", toString(cause.kind)},
                                {"httpStatus", cause.httpStatus},
                                {"message", cause.message}}));

    return SyncResult<SnapshotPtr>::failure(error);
}

} // namespace fleetsync
