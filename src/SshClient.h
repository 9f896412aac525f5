// SshClient.h
//
// Purpose:
//   libssh-backed implementation of the RemoteAccess port:
//     - Connection/authentication (agent, public key, password)
//     - Remote directory listing via SFTP
//     - Streaming file reads via SFTP
//     - Canonical path resolution (sftp realpath)
//
// Threading:
//   One ssh_session + one sftp_session are shared by every caller (refresh,
//   enumeration, all download workers). Each libssh call is serialised by an
//   internal mutex that is held for one call only, never across a whole
//   transfer, so concurrent streams interleave chunk by chunk.

#pragma once

#include <QObject>
#include <QMutex>
#include <QString>
#include <QSharedPointer>

#include "RemoteAccess.h"
#include "RemoteTarget.h"

struct SshSessionState;

class SshClient : public QObject, public RemoteAccess
{
    Q_OBJECT
public:
    explicit SshClient(QObject *parent = nullptr);
    ~SshClient() override;

    void setConnectTimeoutSec(int sec) { m_timeoutSec = sec; }

    // Connect + authenticate + start SFTP.
    // Password may be empty (agent/public key only). It is never logged.
    bool connectTarget(const RemoteTarget& target,
                       const QByteArray& password,
                       QString *err = nullptr);

    // Close/free current session (safe to call multiple times).
    // Open readers keep the shared state alive until they are destroyed.
    void disconnect();

    bool isConnected() const;

    bool listDirectory(const QString& remotePath,
                       QVector<RemoteEntry> *outItems,
                       QString *err = nullptr) override;

    bool openFile(const QString& remotePath,
                  QSharedPointer<RemoteFileReader> *outReader,
                  QString *err = nullptr) override;

    bool canonicalPath(const QString& remotePath,
                       QString *outPath,
                       QString *err = nullptr) override;

private:
    QSharedPointer<SshSessionState> state() const;

    mutable QMutex m_stateMutex;   // guards m_state (not libssh calls)
    QSharedPointer<SshSessionState> m_state;
    int m_timeoutSec = 8;
};
