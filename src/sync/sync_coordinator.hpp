#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <QObject>
#include <QString>
#include <QThread>

#include "client/fleet_client.hpp"
#include "common/config.hpp"
#include "common/errors.hpp"
#include "sync/fleet_snapshot.hpp"

class QTimer;

namespace fleetsync {

struct CoordinatorOptions {
    std::string name = kDefaultAccountId;
    std::chrono::milliseconds pollInterval = std::chrono::minutes(kDefaultScanIntervalMinutes);
    int pageSize = kDefaultPageSize;
};

CoordinatorOptions coordinatorOptionsFromAccount(const AccountConfig &account);

/**
 * SyncCoordinator keeps one FleetSnapshot of a FOTA account up to date.
 *
 * A refresh round reads every device page, the first task page and the account
 * statistics, then publishes a new snapshot in a single atomic store. A failed
 * round leaves the previous snapshot in place and reports either
 * ReauthenticationRequired or UpdateFailed.
 *
 * Rounds never overlap: the worker thread and synchronous refresh() callers
 * share one round mutex. The worker thread owns the poll timer and executes
 * requestRefresh() rounds; requests made while a round is already queued
 * collapse into that round. A request that reaches the worker while its own
 * round is still waiting on the client runs once that round has returned.
 *
 * Signals are emitted on the thread that ran the round, after the round mutex
 * has been released.
 *
 * The coordinator must be destroyed from a thread other than its worker.
 */
class SyncCoordinator : public QObject, public SnapshotOwner
{
    Q_OBJECT
public:
    SyncCoordinator(FleetClient &client, CoordinatorOptions options,
                    QObject *parent = nullptr);
    ~SyncCoordinator() override;

    // Runs the first round synchronously. Only a successful first round arms
    // the poll timer; a failure is returned to the caller and nothing is
    // scheduled.
    SyncResult<SnapshotPtr> start();

    // One full round on the calling thread. Waits for a round in flight.
    SyncResult<SnapshotPtr> refresh();

    // Schedules a round on the worker thread without blocking.
    void requestRefresh() override;

    // Lock-free read of the last published snapshot.
    SnapshotPtr latest() const override;

    bool isStarted() const;
    bool lastRefreshSucceeded() const;
    std::optional<SyncError> lastError() const;
    const CoordinatorOptions &options() const { return m_options; }

signals:
    void snapshotPublished(quint64 generation);
    void refreshFailed(const QString &kind, const QString &message);
    void reauthenticationRequired(const QString &message);

private:
    SyncResult<SnapshotPtr> runRound(const QString &trigger);
    SyncResult<SnapshotPtr> collectRound(const QString &trigger);
    SyncResult<SnapshotPtr> failRound(const QString &step, const ClientError &cause);
    void emitOutcome(const SyncResult<SnapshotPtr> &result);
    void runRequestedRound();
    void armTimer();

    FleetClient &m_client;
    const CoordinatorOptions m_options;

    // Only accessed through std::atomic_load / std::atomic_store.
    SnapshotPtr m_snapshot;

    std::mutex m_roundMutex;
    std::uint64_t m_generation = 0;

    mutable std::mutex m_stateMutex;
    bool m_refreshQueued = false;
    bool m_started = false;
    bool m_stopping = false;
    std::optional<SyncError> m_lastError;

    // Worker thread only. A client that waits on a nested event loop can
    // deliver a queued round while another one is still running.
    bool m_workerRoundActive = false;
    bool m_rerunAfterRound = false;

    QThread m_thread;
    std::unique_ptr<QObject> m_worker;
    QTimer *m_timer = nullptr; // child of m_worker
};

} // namespace fleetsync
