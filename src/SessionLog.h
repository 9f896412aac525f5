#pragma once

#include <QString>
#include <QStringList>

// Bounded ring of human-readable lines shown in the log pane.
// Owned by the interaction loop (single thread); every line is mirrored to
// the file log under the [UI] tag.
class SessionLog
{
public:
    enum class Level {
        Info,
        Error
    };

    explicit SessionLog(int capacity = 500);

    int capacity() const { return m_capacity; }

    void append(const QString& line, Level level = Level::Info);

    const QStringList& lines() const { return m_lines; }

    // Newest n lines, oldest first.
    QStringList tail(int n) const;

    int size() const { return m_lines.size(); }

    // Lines ever appended, including those rotated out.
    quint64 totalAppended() const { return m_total; }

private:
    void trim();

    QStringList m_lines;
    int m_capacity = 500;
    quint64 m_total = 0;
};
