// RemoteEnumerator.h
//
// Expands a remote directory into the flat list of leaf files below it.
//
// Contract:
//   - depth-first, files appended in the order the server lists them
//   - all-or-nothing: the first failing listing aborts with that error and
//     no partial result is returned
//   - iterative (explicit stack), bounded by maxDepth
//   - directories whose canonical path was already visited are skipped
//     (symlink loops) and reported in warnings()

#pragma once

#include <QString>
#include <QStringList>
#include <QVector>
#include <atomic>

#include "../RemoteAccess.h"

struct RemoteFile {
    QString remotePath;
    QString relativePath;   // below the enumerated root, '/'-separated
    quint64 size = 0;
};

class RemoteEnumerator
{
public:
    explicit RemoteEnumerator(RemoteAccess *remote);

    void setMaxDepth(int depth) { m_maxDepth = qMax(1, depth); }
    int  maxDepth() const { return m_maxDepth; }

    // Checked between listings; a raised flag aborts with "Cancelled".
    void setCancelFlag(const std::atomic_bool *flag) { m_cancel = flag; }

    bool enumerate(const QString& root, QVector<RemoteFile> *outFiles, QString *err = nullptr);

    // Non-fatal findings of the last enumerate() call.
    QStringList warnings() const { return m_warnings; }
    int directoriesListed() const { return m_directoriesListed; }

private:
    RemoteAccess *m_remote = nullptr;
    int m_maxDepth = 64;
    const std::atomic_bool *m_cancel = nullptr;

    QStringList m_warnings;
    int m_directoriesListed = 0;
};
