// DownloadWorker.h
//
// Streams one remote file to one local file in fixed-size chunks and reports
// every step through TransferEventQueue:
//
//   Started -> InProgress(done, total)* -> Completed
//                                       \-> Failed(reason)
//
// Exactly one terminal event is emitted per run. The worker never retries and
// never touches display state. On failure the partial local file is left in
// place; on cancellation it is removed when removePartialOnCancel is set.

#pragma once

#include <QRunnable>
#include <QString>
#include <functional>
#include <atomic>

#include "TransferTypes.h"

class RemoteAccess;
class TransferEventQueue;

class DownloadWorker : public QRunnable
{
public:
    static constexpr int kDefaultChunkSize = 8 * 1024;

    struct Job {
        quint64 taskId = 0;
        QString remotePath;
        QString localPath;
        QString displayName;
        quint64 totalBytes = 0;
    };

    using FinishedCb = std::function<void(const Job& job, bool ok)>;

    DownloadWorker(RemoteAccess *remote,
                   const Job& job,
                   TransferEventQueue *events,
                   int chunkSize = kDefaultChunkSize);

    void setCancelFlag(const std::atomic_bool *flag, bool removePartialOnCancel);

    // Called on the worker thread after the terminal event has been queued.
    void setFinishedCallback(FinishedCb cb) { m_finished = std::move(cb); }

    const Job& job() const { return m_job; }

    void run() override;

    // Synchronous body of run(); returns true on Completed.
    bool transfer();

private:
    void emitEvent(TransferPhase phase, quint64 done, const QString& reason = QString());
    bool fail(const QString& reason, quint64 done);

    RemoteAccess *m_remote = nullptr;
    Job m_job;
    TransferEventQueue *m_events = nullptr;
    int m_chunkSize = kDefaultChunkSize;

    const std::atomic_bool *m_cancel = nullptr;
    bool m_removePartialOnCancel = true;

    FinishedCb m_finished;
};
