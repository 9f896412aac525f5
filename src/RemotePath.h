#pragma once

#include <QString>
#include <QStringList>

// POSIX-style remote path helpers.
// Remote paths always use forward slashes, even on a Windows client.
namespace RemotePath {

// "/a/b/" -> "/a/b", "a//b" -> "a/b", "" -> "."
QString clean(const QString& path);

QString join(const QString& base, const QString& name);

// "/a/b" -> "/a", "/a" -> "/", "a" -> ".", "~/a" -> "~". Parent of a root is itself.
QString parent(const QString& path);

// Last segment ("/a/b.txt" -> "b.txt"). Empty for "/".
QString baseName(const QString& path);

bool isRoot(const QString& path, const QStringList& roots);

QStringList defaultRoots();

} // namespace RemotePath
