#pragma once

#include <QMutex>
#include <QSet>
#include <QString>

// Chooses the local file for each download and keeps two in-flight tasks of
// this process from writing the same file.
//
//   Flat   : <dest>/<basename>, collisions become "stem (1).ext", "stem (2).ext", ...
//   Mirror : <dest>/<requested dir name>/<relative path> for directory requests
//
// A reservation lives until release(); an existing file on disk that is not
// reserved is simply truncated by the next download.
class LocalNamePlanner
{
public:
    enum class Layout {
        Flat,
        Mirror
    };

    LocalNamePlanner(const QString& destinationDir, Layout layout);

    QString destinationDir() const { return m_destinationDir; }
    Layout layout() const { return m_layout; }

    // mirrorRelative is "<dirname>/<relative path>" for files found by a directory
    // request; ignored in Flat layout.
    QString reserve(const QString& remotePath, const QString& mirrorRelative = QString());
    void release(const QString& localPath);

    static Layout layoutFromString(const QString& s);
    static QString layoutToString(Layout layout);

private:
    QString m_destinationDir;
    Layout m_layout = Layout::Flat;

    QMutex m_mutex;
    QSet<QString> m_reserved;
};
