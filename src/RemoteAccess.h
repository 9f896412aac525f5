// RemoteAccess.h
//
// Purpose:
//   Abstract "remote file access" port used by the browser core:
//     - list one remote directory
//     - open a remote file for streaming read
//     - resolve a remote path to its canonical form (loop detection)
//
// Design boundary:
//   The core never talks to libssh directly. SshClient is the production
//   implementation; tests plug in an in-memory fake.
//
// Threading:
//   Implementations must tolerate concurrent calls from several threads
//   (directory refresh, enumeration and any number of download workers).

#pragma once

#include <QString>
#include <QVector>
#include <QSharedPointer>
#include <QtGlobal>

// Remote listing entry (minimal metadata for the browser view).
struct RemoteEntry
{
    QString name;       // basename
    QString fullPath;   // combined path (as listed)
    bool    isDir = false;

    quint64 size  = 0;  // bytes (0 when unknown)
};

// Streaming reader over one open remote file.
class RemoteFileReader
{
public:
    virtual ~RemoteFileReader() = default;

    // Reads up to maxBytes into buf.
    // Returns >0 bytes read, 0 on end-of-stream, <0 on error (err filled).
    virtual qint64 read(char *buf, qint64 maxBytes, QString *err = nullptr) = 0;
};

class RemoteAccess
{
public:
    virtual ~RemoteAccess() = default;

    // Non-recursive listing, "." and ".." excluded, order as reported by the server.
    virtual bool listDirectory(const QString& remotePath,
                               QVector<RemoteEntry> *outItems,
                               QString *err = nullptr) = 0;

    virtual bool openFile(const QString& remotePath,
                          QSharedPointer<RemoteFileReader> *outReader,
                          QString *err = nullptr) = 0;

    // Default: lexical clean-up only. Servers that can resolve symlinks override it.
    virtual bool canonicalPath(const QString& remotePath,
                               QString *outPath,
                               QString *err = nullptr);
};
