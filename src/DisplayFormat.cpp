#include "DisplayFormat.h"

namespace DisplayFormat {

QString prettySize(quint64 bytes)
{
    const double b = (double)bytes;
    if (b < 1024.0) return QString("%1 B").arg(bytes);
    if (b < 1024.0 * 1024.0) return QString::number(b / 1024.0, 'f', 1) + " KB";
    if (b < 1024.0 * 1024.0 * 1024.0) return QString::number(b / (1024.0 * 1024.0), 'f', 1) + " MB";
    return QString::number(b / (1024.0 * 1024.0 * 1024.0), 'f', 1) + " GB";
}

QString itemLabel(const NavigationState::Item& item)
{
    switch (item.kind) {
        case NavigationState::Item::Kind::ParentLink: return "../";
        case NavigationState::Item::Kind::Directory:  return item.name + "/";
        case NavigationState::Item::Kind::File:       return item.name;
    }
    return item.name;
}

QString progressLabel(const TransferTask& task)
{
    const QString total = task.totalBytes > 0 ? prettySize(task.totalBytes) : QString("?");
    return QString("Downloading '%1' %2/%3...")
        .arg(task.displayName, prettySize(task.bytesDone), total);
}

int progressPercent(const TransferTask& task)
{
    if (task.totalBytes == 0) return 0;
    const quint64 done = qMin(task.bytesDone, task.totalBytes);
    return int((done * 100) / task.totalBytes);
}

} // namespace DisplayFormat
