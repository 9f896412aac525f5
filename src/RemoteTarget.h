#pragma once

#include <QString>

// Connection target given on the command line: user@host[:port]
struct RemoteTarget {
    QString user;
    QString host;
    int     port = 22;

    // "user@host:port" (IPv6 hosts bracketed), for logs and titles.
    QString toString() const;
};

// Parses "user@host", "host:2222", "user@[::1]:2222".
// Missing user falls back to $USER (or "user").
bool parseRemoteTarget(const QString& text, RemoteTarget *out, QString *err = nullptr);
