// ProgressAggregator.cpp
#include "ProgressAggregator.h"
#include "TransferEventQueue.h"
#include "../SessionLog.h"

#include <QDebug>

ProgressAggregator::ProgressAggregator(SessionLog *log)
    : m_log(log)
{
}

int ProgressAggregator::consume(TransferEventQueue *queue, int maxEvents)
{
    if (!queue) return 0;

    const QVector<TransferEvent> batch = queue->drain(maxEvents);
    for (const TransferEvent& ev : batch)
        apply(ev);
    return batch.size();
}

void ProgressAggregator::apply(const TransferEvent& ev)
{
    switch (ev.kind) {
        case TransferEvent::Kind::Progress:
            applyProgress(ev.progress);
            return;
        case TransferEvent::Kind::Info:
            if (m_log) m_log->append(ev.message);
            return;
        case TransferEvent::Kind::Error:
            if (m_log) m_log->append(ev.message, SessionLog::Level::Error);
            return;
    }
}

bool ProgressAggregator::visibleTask(TransferTask *out) const
{
    const auto it = m_tasks.constFind(m_visibleId);
    if (m_visibleId == 0 || it == m_tasks.constEnd())
        return false;
    if (out) *out = it.value();
    return true;
}

TransferTask& ProgressAggregator::upsert(const ProgressEvent& ev)
{
    auto it = m_tasks.find(ev.taskId);
    if (it == m_tasks.end()) {
        TransferTask t;
        t.id          = ev.taskId;
        t.remotePath  = ev.remotePath;
        t.displayName = ev.displayName;
        it = m_tasks.insert(ev.taskId, t);
    }

    TransferTask& t = it.value();
    if (ev.totalBytes > 0)
        t.totalBytes = ev.totalBytes;
    // Progress is monotonic per task; a stale value never moves the bar back.
    if (ev.bytesDone > t.bytesDone)
        t.bytesDone = ev.bytesDone;
    return t;
}

void ProgressAggregator::applyProgress(const ProgressEvent& ev)
{
    switch (ev.phase) {
        case TransferPhase::Queued: {
            TransferTask& t = upsert(ev);
            t.phase = TransferPhase::Queued;
            qDebug().noquote() << QString("[XFER] queued #%1 '%2'").arg(QString::number(ev.taskId), ev.displayName);
            return;
        }

        case TransferPhase::Started: {
            TransferTask& t = upsert(ev);
            t.phase = TransferPhase::Started;
            m_visibleId = ev.taskId;
            if (m_log) m_log->append(QString("Starting download for '%1'").arg(ev.displayName));
            return;
        }

        case TransferPhase::InProgress: {
            TransferTask& t = upsert(ev);
            t.phase = TransferPhase::InProgress;
            m_visibleId = ev.taskId;
            return;
        }

        case TransferPhase::Completed:
            m_completed++;
            if (m_log) m_log->append(QString("Download complete: %1").arg(ev.displayName));
            break;

        case TransferPhase::Failed:
            m_failed++;
            if (m_log) m_log->append(QString("Download failed for %1: %2").arg(ev.displayName, ev.reason),
                                     SessionLog::Level::Error);
            break;
    }

    // Terminal: drop the task; the slot clears when it showed this task.
    m_tasks.remove(ev.taskId);
    if (m_visibleId == ev.taskId)
        m_visibleId = 0;
}
