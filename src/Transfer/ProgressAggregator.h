// ProgressAggregator.h
//
// Reduces the TransferEvent stream into what the display shows:
//   - a map task id -> TransferTask of every non-terminal task
//   - the single "visible" slot (last event wins), kept for the progress bar
//   - session-log lines for starts, completions, failures and notices
//
// Lives on the interaction loop thread; consume() never blocks.

#pragma once

#include <QMap>
#include <QtGlobal>

#include "TransferTypes.h"

class SessionLog;
class TransferEventQueue;

class ProgressAggregator
{
public:
    explicit ProgressAggregator(SessionLog *log);

    // Applies up to maxEvents queued events (all when < 0). Returns how many.
    int consume(TransferEventQueue *queue, int maxEvents = -1);

    void apply(const TransferEvent& ev);

    const QMap<quint64, TransferTask>& activeTasks() const { return m_tasks; }

    bool hasVisible() const { return m_visibleId != 0 && m_tasks.contains(m_visibleId); }
    bool visibleTask(TransferTask *out) const;

    int completedCount() const { return m_completed; }
    int failedCount() const { return m_failed; }

private:
    void applyProgress(const ProgressEvent& ev);
    TransferTask& upsert(const ProgressEvent& ev);

    SessionLog *m_log = nullptr;

    QMap<quint64, TransferTask> m_tasks;
    quint64 m_visibleId = 0;

    int m_completed = 0;
    int m_failed = 0;
};
