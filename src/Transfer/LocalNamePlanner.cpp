#include "LocalNamePlanner.h"
#include "../RemotePath.h"

#include <QDir>
#include <QFileInfo>
#include <QMutexLocker>

// "a.tar.gz" -> ("a.tar", ".gz"); ".bashrc" -> (".bashrc", "")
static void splitName(const QString& name, QString *stem, QString *ext)
{
    const int dot = name.lastIndexOf('.');
    if (dot <= 0) {
        *stem = name;
        ext->clear();
        return;
    }
    *stem = name.left(dot);
    *ext = name.mid(dot);
}

LocalNamePlanner::LocalNamePlanner(const QString& destinationDir, Layout layout)
    : m_destinationDir(destinationDir.trimmed().isEmpty() ? QStringLiteral(".") : destinationDir.trimmed())
    , m_layout(layout)
{
}

QString LocalNamePlanner::reserve(const QString& remotePath, const QString& mirrorRelative)
{
    QString rel = (m_layout == Layout::Mirror && !mirrorRelative.isEmpty())
                      ? mirrorRelative
                      : RemotePath::baseName(remotePath);
    if (rel.isEmpty())
        rel = QStringLiteral("download");

    const QString first = QDir::cleanPath(QDir(m_destinationDir).filePath(rel));

    QMutexLocker lock(&m_mutex);

    QString candidate = first;
    if (m_reserved.contains(candidate)) {
        const QFileInfo fi(first);
        QString stem, ext;
        splitName(fi.fileName(), &stem, &ext);

        for (int n = 1; m_reserved.contains(candidate); ++n)
            candidate = QDir::cleanPath(QDir(fi.path()).filePath(QString("%1 (%2)%3").arg(stem, QString::number(n), ext)));
    }

    m_reserved.insert(candidate);
    return candidate;
}

void LocalNamePlanner::release(const QString& localPath)
{
    QMutexLocker lock(&m_mutex);
    m_reserved.remove(localPath);
}

LocalNamePlanner::Layout LocalNamePlanner::layoutFromString(const QString& s)
{
    const QString v = s.trimmed().toLower();
    if (v == "mirror") return Layout::Mirror;
    return Layout::Flat;
}

QString LocalNamePlanner::layoutToString(Layout layout)
{
    switch (layout) {
        case Layout::Flat:   return "flat";
        case Layout::Mirror: return "mirror";
    }
    return "flat";
}
