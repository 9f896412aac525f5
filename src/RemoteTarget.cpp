// RemoteTarget.cpp
#include "RemoteTarget.h"

#include <QtGlobal>

QString RemoteTarget::toString() const
{
    const QString h = host.contains(':') ? QString("[%1]").arg(host) : host;
    return QString("%1@%2:%3").arg(user, h, QString::number(port));
}

bool parseRemoteTarget(const QString& text, RemoteTarget *out, QString *err)
{
    if (err) err->clear();
    if (!out) {
        if (err) *err = QStringLiteral("parseRemoteTarget: out is null.");
        return false;
    }

    QString user;
    QString rest = text.trimmed();

    // Split user@host (user optional). The last '@' wins so user names may contain '@'.
    const int atPos = rest.lastIndexOf('@');
    if (atPos >= 0) {
        user = rest.left(atPos).trimmed();
        rest = rest.mid(atPos + 1).trimmed();
    }

    QString host;
    QString portText;

    if (rest.startsWith('[')) {
        // [v6-literal] or [v6-literal]:port
        const int close = rest.indexOf(']');
        if (close < 0) {
            if (err) *err = QStringLiteral("Unterminated '[' in host '%1'.").arg(rest);
            return false;
        }
        host = rest.mid(1, close - 1).trimmed();
        const QString tail = rest.mid(close + 1);
        if (!tail.isEmpty()) {
            if (!tail.startsWith(':')) {
                if (err) *err = QStringLiteral("Unexpected text after ']': '%1'.").arg(tail);
                return false;
            }
            portText = tail.mid(1);
        }
    } else {
        const int colon = rest.indexOf(':');
        if (colon >= 0 && rest.indexOf(':', colon + 1) < 0) {
            host = rest.left(colon).trimmed();
            portText = rest.mid(colon + 1);
        } else {
            // Bare IPv6 literal without brackets cannot carry a port.
            host = rest;
        }
    }

    if (host.isEmpty()) {
        if (err) *err = QStringLiteral("No host specified.");
        return false;
    }

    int port = 22;
    if (!portText.isNull()) {
        bool ok = false;
        port = portText.trimmed().toInt(&ok);
        if (!ok || port < 1 || port > 65535) {
            if (err) *err = QStringLiteral("Invalid port '%1'.").arg(portText);
            return false;
        }
    }

    RemoteTarget t;
    t.user = user.isEmpty() ? qEnvironmentVariable("USER", "user") : user;
    t.host = host;
    t.port = port;

    *out = t;
    return true;
}
