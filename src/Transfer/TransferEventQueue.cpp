#include "TransferEventQueue.h"

#include <QMutexLocker>

void TransferEventQueue::push(const TransferEvent& ev)
{
    QMutexLocker lock(&m_mutex);
    m_queue.enqueue(ev);
}

QVector<TransferEvent> TransferEventQueue::drain(int maxEvents)
{
    QVector<TransferEvent> out;

    QMutexLocker lock(&m_mutex);
    const int n = (maxEvents < 0) ? m_queue.size() : qMin(maxEvents, m_queue.size());
    out.reserve(n);
    for (int i = 0; i < n; ++i)
        out.push_back(m_queue.dequeue());
    return out;
}

int TransferEventQueue::size() const
{
    QMutexLocker lock(&m_mutex);
    return m_queue.size();
}
