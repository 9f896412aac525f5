#include "SessionLog.h"

#include <QDebug>

SessionLog::SessionLog(int capacity)
    : m_capacity(qMax(1, capacity))
{
}

void SessionLog::append(const QString& line, Level level)
{
    if (level == Level::Error)
        qWarning().noquote() << "[UI]" << line;
    else
        qInfo().noquote() << "[UI]" << line;

    m_lines << line;
    m_total++;
    trim();
}

QStringList SessionLog::tail(int n) const
{
    if (n <= 0) return {};
    if (n >= m_lines.size()) return m_lines;
    return m_lines.mid(m_lines.size() - n);
}

void SessionLog::trim()
{
    while (m_lines.size() > m_capacity)
        m_lines.removeFirst();
}
