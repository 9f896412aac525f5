#pragma once

#include <QMutex>
#include <QQueue>
#include <QVector>

#include "TransferTypes.h"

// Multi-producer / single-consumer FIFO between download workers and the
// interaction loop. push() is safe from any thread; the consumer polls with
// drain() and never blocks on transfers.
class TransferEventQueue
{
public:
    void push(const TransferEvent& ev);
    void pushProgress(const ProgressEvent& ev) { push(TransferEvent::fromProgress(ev)); }

    // Pops up to maxEvents (all when maxEvents < 0).
    QVector<TransferEvent> drain(int maxEvents = -1);

    int size() const;
    bool isEmpty() const { return size() == 0; }

private:
    mutable QMutex m_mutex;
    QQueue<TransferEvent> m_queue;
};
