    // SshClient.cpp
    //
    // Purpose:
    //   SSH/SFTP adapter for sftp-browser.
    //   - Creates and owns a libssh session + one SFTP subsystem
    //   - Authenticates with agent, public key auto-discovery, then password
    //   - Lists remote directories and streams remote files (RemoteAccess port)
    //
    // Design notes:
    //   - libssh sessions are not safe for unsynchronised use from several
    //     threads, so every libssh call goes through SshSessionState::io.
    //   - Never log secrets (passwords).

    #include "SshClient.h"

    #include <QDebug>
    #include <QMutex>
    #include <QMutexLocker>

    #include <libssh/libssh.h>
    #include <libssh/sftp.h>

    #include <fcntl.h>
    #include <sys/stat.h>

    // ------------------------------------------------------------
    // Shared session state (outlives SshClient::disconnect while
    // readers still hold it)
    // ------------------------------------------------------------
    struct SshSessionState
    {
        ssh_session  session = nullptr;
        sftp_session sftp    = nullptr;

        // Serialises every libssh call on session/sftp.
        QMutex io;

        ~SshSessionState()
        {
            if (sftp) sftp_free(sftp);
            if (session) {
                ssh_disconnect(session);
                ssh_free(session);
            }
        }
    };

    // ------------------------------------------------------------
    // Small helper to turn libssh's last error into QString
    // ------------------------------------------------------------
    static QString libsshError(ssh_session s)
    {
        if (!s) return QStringLiteral("libssh: null session");
        return QString::fromLocal8Bit(ssh_get_error(s));
    }

    // SFTP paths without a leading '/' are relative to the login directory;
    // the server does not expand "~".
    static QByteArray toSftpPath(const QString& remotePath)
    {
        QString p = remotePath.trimmed();
        if (p.isEmpty() || p == "~")
            p = QStringLiteral(".");
        else if (p.startsWith("~/"))
            p = p.mid(2);
        return p.toUtf8();
    }

    static void ensureLibsshInitialised()
    {
        static const int rc = ssh_init();
        if (rc != SSH_OK)
            qWarning().noquote() << "[SSH] ssh_init failed";
    }

    // ------------------------------------------------------------
    // SftpFileReader: one open remote file
    // ------------------------------------------------------------
    class SftpFileReader : public RemoteFileReader
    {
    public:
        SftpFileReader(QSharedPointer<SshSessionState> state, sftp_file file, const QString& path)
            : m_state(std::move(state)), m_file(file), m_path(path) {}

        ~SftpFileReader() override
        {
            QMutexLocker lock(&m_state->io);
            if (m_file) sftp_close(m_file);
        }

        qint64 read(char *buf, qint64 maxBytes, QString *err) override
        {
            if (err) err->clear();
            if (maxBytes <= 0) return 0;

            QMutexLocker lock(&m_state->io);

            const ssize_t n = sftp_read(m_file, buf, (size_t)maxBytes);
            if (n < 0) {
                if (err) *err = QString("SFTP read failed for '%1': %2")
                                    .arg(m_path, libsshError(m_state->session));
                return -1;
            }
            return (qint64)n;
        }

    private:
        QSharedPointer<SshSessionState> m_state;
        sftp_file m_file = nullptr;
        QString m_path;
    };

    SshClient::SshClient(QObject *parent) : QObject(parent) {}

    SshClient::~SshClient()
    {
        disconnect();
    }

    QSharedPointer<SshSessionState> SshClient::state() const
    {
        QMutexLocker lock(&m_stateMutex);
        return m_state;
    }

    // ------------------------------------------------------------
    // connectTarget(): establish libssh session + SFTP subsystem
    // ------------------------------------------------------------
bool SshClient::connectTarget(const RemoteTarget& target,
                              const QByteArray& password,
                              QString *err)
{
    if (err) err->clear();

    const QString host = target.host.trimmed();
    const QString user = target.user.trimmed();

    if (host.isEmpty()) {
        if (err) *err = QStringLiteral("No host specified.");
        qWarning().noquote() << "[SSH] connect FAILED: no host";
        return false;
    }
    if (user.isEmpty()) {
        if (err) *err = QStringLiteral("No user specified.");
        qWarning().noquote() << QString("[SSH] connect FAILED host='%1': no user").arg(host);
        return false;
    }

    const int port = (target.port > 0) ? target.port : 22;

    qInfo().noquote() << QString("[SSH] connect start user='%1' host='%2' port=%3")
                         .arg(user, host, QString::number(port));

    if (isConnected()) {
        qInfo().noquote() << "[SSH] existing session present -> disconnecting before reconnect";
    }
    disconnect();

    ensureLibsshInitialised();

    ssh_session s = ssh_new();
    if (!s) {
        if (err) *err = QStringLiteral("ssh_new() failed.");
        qWarning().noquote() << "[SSH] connect FAILED: ssh_new";
        return false;
    }

    auto failAndFree = [&](const QString &msg) -> bool {
        if (err) *err = msg;
        qWarning().noquote() << QString("[SSH] connect FAILED user='%1' host='%2': %3")
                                .arg(user, host, msg);
        ssh_disconnect(s);
        ssh_free(s);
        return false;
    };

    auto optSet = [&](enum ssh_options_e opt, const void *val, const char *what) -> bool {
        const int r = ssh_options_set(s, opt, val);
        if (r != SSH_OK) {
            qWarning().noquote() << QString("[SSH] ssh_options_set(%1) failed: %2")
                                    .arg(QString::fromLatin1(what), libsshError(s));
            return false;
        }
        return true;
    };

    const QByteArray hostUtf8 = host.toUtf8();
    const QByteArray userUtf8 = user.toUtf8();
    long timeoutSec = (m_timeoutSec > 0) ? m_timeoutSec : 8;

    if (!optSet(SSH_OPTIONS_HOST, hostUtf8.constData(), "HOST"))
        return failAndFree(QStringLiteral("Invalid host '%1'.").arg(host));
    optSet(SSH_OPTIONS_USER, userUtf8.constData(), "USER");
    optSet(SSH_OPTIONS_PORT, &port, "PORT");
    optSet(SSH_OPTIONS_TIMEOUT, &timeoutSec, "TIMEOUT");

    // Network connect
    int rc = ssh_connect(s);
    if (rc != SSH_OK)
        return failAndFree(QStringLiteral("ssh_connect failed: %1").arg(libsshError(s)));

    qInfo().noquote() << QString("[SSH] ssh_connect OK host='%1' port=%2").arg(host, QString::number(port));

    // Host key check against ~/.ssh/known_hosts.
    // Unknown hosts are accepted with a warning; a changed key is refused.
    switch (ssh_session_is_known_server(s)) {
        case SSH_KNOWN_HOSTS_OK:
            break;
        case SSH_KNOWN_HOSTS_CHANGED:
        case SSH_KNOWN_HOSTS_OTHER:
            return failAndFree(QStringLiteral("Host key for '%1' does not match known_hosts.").arg(host));
        case SSH_KNOWN_HOSTS_NOT_FOUND:
        case SSH_KNOWN_HOSTS_UNKNOWN:
            qWarning().noquote() << QString("[SSH] host '%1' not in known_hosts (accepted)").arg(host);
            break;
        case SSH_KNOWN_HOSTS_ERROR:
            return failAndFree(QStringLiteral("Host key check failed: %1").arg(libsshError(s)));
    }

    const char *kexAlgoC = ssh_get_kex_algo(s);
    const QString rawKex = kexAlgoC ? QString::fromLatin1(kexAlgoC) : QString();
    qInfo().noquote() << QString("[SSH] negotiated kex='%1'").arg(rawKex.isEmpty() ? "?" : rawKex);

    // Authentication strategy: agent -> publickey_auto -> password
    rc = ssh_userauth_agent(s, nullptr);
    if (rc == SSH_AUTH_SUCCESS) {
        qInfo().noquote() << QString("[SSH] auth OK via agent user='%1'").arg(user);
    }

    if (rc != SSH_AUTH_SUCCESS) {
        rc = ssh_userauth_publickey_auto(s, nullptr, nullptr);
        if (rc == SSH_AUTH_SUCCESS)
            qInfo().noquote() << QString("[SSH] auth OK via publickey_auto user='%1'").arg(user);
    }

    if (rc != SSH_AUTH_SUCCESS && !password.isEmpty()) {
        rc = ssh_userauth_password(s, nullptr, password.constData());
        if (rc == SSH_AUTH_SUCCESS)
            qInfo().noquote() << QString("[SSH] auth OK via password user='%1'").arg(user);
    }

    if (rc != SSH_AUTH_SUCCESS)
        return failAndFree(QStringLiteral("Authentication failed: %1").arg(libsshError(s)));

    sftp_session sftp = sftp_new(s);
    if (!sftp)
        return failAndFree(QStringLiteral("sftp_new failed: %1").arg(libsshError(s)));

    if (sftp_init(sftp) != SSH_OK) {
        sftp_free(sftp);
        return failAndFree(QStringLiteral("sftp_init failed: %1").arg(libsshError(s)));
    }

    auto st = QSharedPointer<SshSessionState>::create();
    st->session = s;
    st->sftp = sftp;
    {
        QMutexLocker lock(&m_stateMutex);
        m_state = st;
    }

    qInfo().noquote() << QString("[SSH] connect OK %1").arg(target.toString());
    return true;
}

    // ------------------------------------------------------------
    // Drop our reference; libssh objects are freed by the last owner.
    // ------------------------------------------------------------
    void SshClient::disconnect()
    {
        QSharedPointer<SshSessionState> old;
        {
            QMutexLocker lock(&m_stateMutex);
            old.swap(m_state);
        }
        if (old)
            qInfo().noquote() << "[SSH] disconnect";
    }

    bool SshClient::isConnected() const
    {
        return !state().isNull();
    }

    // ------------------------------------------------------------
    // SFTP: list remote directory (non-recursive).
    // ------------------------------------------------------------
    bool SshClient::listDirectory(const QString& remotePath,
                                  QVector<RemoteEntry> *outItems,
                                  QString *err)
    {
        if (err) err->clear();
        if (outItems) outItems->clear();

        const QSharedPointer<SshSessionState> st = state();
        if (!st) {
            if (err) *err = "Not connected.";
            return false;
        }

        const QString path = remotePath.trimmed().isEmpty() ? QStringLiteral(".") : remotePath.trimmed();

        sftp_dir dir = nullptr;
        {
            QMutexLocker lock(&st->io);
            dir = sftp_opendir(st->sftp, toSftpPath(path).constData());
            if (!dir) {
                if (err) *err = QString("sftp_opendir failed for '%1': %2").arg(path, libsshError(st->session));
                return false;
            }
        }

        QVector<RemoteEntry> items;
        bool eof = false;

        // The io lock is taken per readdir so streams on other threads interleave.
        while (true) {
            QMutexLocker lock(&st->io);
            sftp_attributes a = sftp_readdir(st->sftp, dir);
            if (!a) {
                // readdir returns NULL both at EOF and on error.
                eof = sftp_dir_eof(dir) != 0;
                break;
            }
            lock.unlock();

            const QString name = QString::fromUtf8(a->name ? a->name : "");
            if (name.isEmpty() || name == "." || name == "..") {
                sftp_attributes_free(a);
                continue;
            }

            RemoteEntry e;
            e.name = name;
            e.fullPath = path.endsWith('/') ? (path + name) : (path + "/" + name);
            e.size  = (a->flags & SSH_FILEXFER_ATTR_SIZE) ? (quint64)a->size : 0;
            e.isDir = ((a->permissions & S_IFMT) == S_IFDIR);

            items.push_back(e);
            sftp_attributes_free(a);
        }

        QString readErr;
        {
            QMutexLocker lock(&st->io);
            if (!eof)
                readErr = libsshError(st->session);
            sftp_closedir(dir);
        }

        if (!eof) {
            if (err) *err = QString("sftp_readdir failed for '%1': %2").arg(path, readErr);
            return false;
        }

        if (outItems) *outItems = items;
        return true;
    }

    // ------------------------------------------------------------
    // SFTP: open remote file for streaming read.
    // ------------------------------------------------------------
    bool SshClient::openFile(const QString& remotePath,
                             QSharedPointer<RemoteFileReader> *outReader,
                             QString *err)
    {
        if (err) err->clear();
        if (!outReader) { if (err) *err = "openFile: outReader is null."; return false; }
        outReader->reset();

        const QSharedPointer<SshSessionState> st = state();
        if (!st) {
            if (err) *err = "Not connected.";
            return false;
        }
        if (remotePath.trimmed().isEmpty()) {
            if (err) *err = "Remote path is empty.";
            return false;
        }

        sftp_file f = nullptr;
        {
            QMutexLocker lock(&st->io);
            f = sftp_open(st->sftp, toSftpPath(remotePath).constData(), O_RDONLY, 0);
            if (!f) {
                if (err) *err = QString("Cannot open remote file '%1': %2").arg(remotePath, libsshError(st->session));
                return false;
            }
        }

        *outReader = QSharedPointer<RemoteFileReader>(new SftpFileReader(st, f, remotePath));
        return true;
    }

    // ------------------------------------------------------------
    // SFTP: realpath (resolves symlinks and "..").
    // ------------------------------------------------------------
    bool SshClient::canonicalPath(const QString& remotePath, QString *outPath, QString *err)
    {
        if (err) err->clear();
        if (!outPath) { if (err) *err = "canonicalPath: outPath is null."; return false; }

        const QSharedPointer<SshSessionState> st = state();
        if (!st) {
            if (err) *err = "Not connected.";
            return false;
        }

        QMutexLocker lock(&st->io);

        char *resolved = sftp_canonicalize_path(st->sftp, toSftpPath(remotePath).constData());
        if (!resolved) {
            if (err) *err = QString("sftp_canonicalize_path failed for '%1': %2")
                                .arg(remotePath, libsshError(st->session));
            return false;
        }

        *outPath = QString::fromUtf8(resolved);
        ssh_string_free_char(resolved);
        return true;
    }
