// RemotePath.cpp
//
// Remote paths are treated as POSIX-like strings. Nothing here touches the
// network; ".." segments are kept verbatim because only the server knows what
// they resolve to.

#include "RemotePath.h"

namespace RemotePath {

QString clean(const QString& path)
{
    const QString s = path.trimmed();
    if (s.isEmpty())
        return QStringLiteral(".");

    const bool absolute = s.startsWith('/');

    QStringList parts;
    for (const QString& seg : s.split('/')) {
        if (seg.isEmpty() || seg == ".")
            continue;
        parts << seg;
    }

    if (parts.isEmpty())
        return absolute ? QStringLiteral("/") : QStringLiteral(".");

    const QString joined = parts.join('/');
    return absolute ? ("/" + joined) : joined;
}

QString join(const QString& base, const QString& name)
{
    if (name.startsWith('/'))
        return clean(name);
    return clean(base + "/" + name);
}

QString parent(const QString& path)
{
    const QString c = clean(path);
    if (c == "/" || c == "." || c == "~")
        return c;

    // Cannot strip a ".." lexically; climb one more level instead.
    if (c == ".." || c.endsWith("/.."))
        return c + "/..";

    const int idx = c.lastIndexOf('/');
    if (idx < 0) return QStringLiteral(".");
    if (idx == 0) return QStringLiteral("/");
    return c.left(idx);
}

QString baseName(const QString& path)
{
    const QString c = clean(path);
    if (c == "/")
        return QString();
    return c.mid(c.lastIndexOf('/') + 1);
}

bool isRoot(const QString& path, const QStringList& roots)
{
    const QString c = clean(path);
    for (const QString& r : roots) {
        if (clean(r) == c)
            return true;
    }
    return false;
}

QStringList defaultRoots()
{
    return { QStringLiteral("/"), QStringLiteral("."), QStringLiteral("~") };
}

} // namespace RemotePath
