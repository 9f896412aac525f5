#include "RemoteAccess.h"
#include "RemotePath.h"

bool RemoteAccess::canonicalPath(const QString& remotePath, QString *outPath, QString *err)
{
    if (err) err->clear();
    if (!outPath) {
        if (err) *err = QStringLiteral("canonicalPath: outPath is null.");
        return false;
    }

    *outPath = RemotePath::clean(remotePath);
    return true;
}
