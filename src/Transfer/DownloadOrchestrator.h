// DownloadOrchestrator.h
//
// Turns download requests into DownloadWorkers and funnels everything they
// report into one TransferEventQueue.
//
// Policy:
//   - single file   : one worker, submitted immediately
//   - directory     : RemoteEnumerator runs to completion first (one error
//                     notice on failure), then one worker per file, launches
//                     paced by launchDelayMs
//   - workers run on a private QThreadPool capped at maxConcurrent; extra
//     tasks stay Queued until a thread frees up
//   - workers are independent: one failure never cancels the others
//   - shutdown() is cooperative: pending launches are dropped, running
//     workers stop at the next chunk boundary
//
// Threading:
//   request*() are called from the interaction loop; enumeration and paced
//   launching happen on a dispatch pool so the caller never blocks.

#pragma once

#include <QElapsedTimer>
#include <QMutex>
#include <QString>
#include <QThreadPool>
#include <QVector>
#include <QWaitCondition>
#include <atomic>

#include "LocalNamePlanner.h"
#include "TransferTypes.h"

class RemoteAccess;
class TransferEventQueue;

class DownloadOrchestrator
{
public:
    struct Options {
        int maxConcurrent = 4;
        int launchDelayMs = 100;
        int chunkSize     = 8 * 1024;
        int maxDepth      = 64;
        QString destinationDir = ".";
        LocalNamePlanner::Layout layout = LocalNamePlanner::Layout::Flat;
        bool removePartialOnCancel = true;
    };

    DownloadOrchestrator(RemoteAccess *remote,
                         TransferEventQueue *events,
                         const Options& options = Options());
    ~DownloadOrchestrator();

    const Options& options() const { return m_options; }

    // Returns the new task id (0 when shutting down).
    quint64 requestFile(const QString& remotePath, quint64 totalBytes);

    void requestDirectory(const QString& remotePath);

    // Cooperative cancellation + bounded wait. Safe to call more than once.
    void shutdown(int waitMs = 3000);
    bool isShuttingDown() const { return m_cancel.load(); }

    // Waits for enumeration, pending launches and running workers.
    bool waitForIdle(int waitMs);

    int runningWorkers() const;
    int totalLaunched() const;

    // Milliseconds since construction at which each worker was submitted.
    QVector<qint64> launchTimesMs() const;

private:
    void runDirectoryRequest(const QString& remotePath);
    quint64 launch(const QString& remotePath, quint64 totalBytes, const QString& mirrorRelative);

    // Blocks until launchDelayMs has passed since the previous launch.
    // Returns false when shutdown() interrupted the wait.
    bool pace();

    RemoteAccess *m_remote = nullptr;
    TransferEventQueue *m_events = nullptr;
    Options m_options;

    LocalNamePlanner m_names;

    std::atomic_bool m_cancel { false };
    std::atomic<quint64> m_nextTaskId { 1 };

    QElapsedTimer m_clock;

    QMutex m_paceMutex;
    QWaitCondition m_paceCond;
    qint64 m_lastLaunchMs = -1;

    mutable QMutex m_statsMutex;
    QVector<qint64> m_launchTimes;
    int m_running = 0;

    // Declared last: destroyed first, and their destructors wait for every
    // runnable that still references the members above.
    QThreadPool m_workerPool;
    QThreadPool m_dispatchPool;
};
