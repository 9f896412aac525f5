// RemoteEnumerator.cpp
#include "RemoteEnumerator.h"
#include "../RemotePath.h"

#include <QDebug>
#include <QSet>

namespace {

// One directory being walked: its listing and the next entry to visit.
struct Frame {
    QString path;
    QString relative;
    QVector<RemoteEntry> entries;
    int next  = 0;
    int depth = 0;
};

} // namespace

RemoteEnumerator::RemoteEnumerator(RemoteAccess *remote)
    : m_remote(remote)
{
}

bool RemoteEnumerator::enumerate(const QString& root, QVector<RemoteFile> *outFiles, QString *err)
{
    if (err) err->clear();
    if (outFiles) outFiles->clear();
    m_warnings.clear();
    m_directoriesListed = 0;

    if (!m_remote) {
        if (err) *err = QStringLiteral("Not connected.");
        return false;
    }

    auto cancelled = [this]() {
        return m_cancel && m_cancel->load();
    };

    QString failure;
    QSet<QString> visited;
    QVector<RemoteFile> files;
    QVector<Frame> stack;

    // Lists one directory and pushes it; false aborts the whole walk.
    auto descend = [&](const QString& path, const QString& relative, int depth) -> bool {
        if (cancelled()) {
            failure = QStringLiteral("Cancelled");
            return false;
        }

        QString canonical;
        QString e;
        if (!m_remote->canonicalPath(path, &canonical, &e)) {
            failure = QString("Cannot resolve '%1': %2").arg(path, e);
            return false;
        }
        if (visited.contains(canonical)) {
            const QString w = QString("Skipped '%1': already visited as '%2'").arg(path, canonical);
            qWarning().noquote() << "[ENUM]" << w;
            m_warnings << w;
            return true;
        }
        visited.insert(canonical);

        Frame f;
        f.path = path;
        f.relative = relative;
        f.depth = depth;
        if (!m_remote->listDirectory(path, &f.entries, &e)) {
            failure = QString("Cannot list '%1': %2").arg(path, e);
            return false;
        }
        ++m_directoriesListed;
        stack.push_back(f);
        return true;
    };

    const QString start = RemotePath::clean(root);

    auto fail = [&]() -> bool {
        qWarning().noquote() << QString("[ENUM] FAIL root='%1': %2").arg(start, failure);
        if (err) *err = failure;
        return false;
    };

    if (!descend(start, QString(), 0))
        return fail();

    while (!stack.isEmpty()) {
        Frame& top = stack.last();
        if (top.next >= top.entries.size()) {
            stack.pop_back();
            continue;
        }

        // Copy: descend() may reallocate the stack.
        const RemoteEntry entry = top.entries[top.next++];
        const int depth = top.depth;
        const QString parentPath = top.path;
        const QString parentRel = top.relative;

        const QString path = entry.fullPath.isEmpty()
                                 ? RemotePath::join(parentPath, entry.name)
                                 : entry.fullPath;
        const QString rel = parentRel.isEmpty() ? entry.name : (parentRel + "/" + entry.name);

        if (entry.isDir) {
            if (depth + 1 > m_maxDepth) {
                failure = QString("Maximum directory depth (%1) exceeded at '%2'")
                              .arg(m_maxDepth).arg(path);
                return fail();
            }
            if (!descend(path, rel, depth + 1))
                return fail();
            continue;
        }

        RemoteFile f;
        f.remotePath = path;
        f.relativePath = rel;
        f.size = entry.size;
        files.push_back(f);
    }

    qInfo().noquote() << QString("[ENUM] root='%1' files=%2 dirs=%3")
                         .arg(start, QString::number(files.size()), QString::number(m_directoriesListed));

    if (outFiles) *outFiles = files;
    return true;
}
