// DownloadWorker.cpp
#include "DownloadWorker.h"
#include "TransferEventQueue.h"
#include "../RemoteAccess.h"

#include <QByteArray>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSharedPointer>

DownloadWorker::DownloadWorker(RemoteAccess *remote,
                               const Job& job,
                               TransferEventQueue *events,
                               int chunkSize)
    : m_remote(remote)
    , m_job(job)
    , m_events(events)
    , m_chunkSize(chunkSize > 0 ? chunkSize : kDefaultChunkSize)
{
    setAutoDelete(true);
}

void DownloadWorker::setCancelFlag(const std::atomic_bool *flag, bool removePartialOnCancel)
{
    m_cancel = flag;
    m_removePartialOnCancel = removePartialOnCancel;
}

void DownloadWorker::emitEvent(TransferPhase phase, quint64 done, const QString& reason)
{
    if (!m_events) return;

    ProgressEvent ev;
    ev.taskId      = m_job.taskId;
    ev.phase       = phase;
    ev.bytesDone   = done;
    ev.totalBytes  = m_job.totalBytes;
    ev.displayName = m_job.displayName;
    ev.remotePath  = m_job.remotePath;
    ev.reason      = reason;
    m_events->pushProgress(ev);
}

bool DownloadWorker::fail(const QString& reason, quint64 done)
{
    qWarning().noquote() << QString("[XFER] FAIL #%1 %2 -> %3 : %4")
                            .arg(m_job.taskId)
                            .arg(m_job.remotePath, m_job.localPath, reason);
    emitEvent(TransferPhase::Failed, done, reason);
    return false;
}

void DownloadWorker::run()
{
    const bool ok = transfer();
    if (m_finished)
        m_finished(m_job, ok);
}

// ------------------------------------------------------------
// Streaming copy remote -> local.
//   - creates missing local directories
//   - truncates an existing local file
//   - one InProgress event per chunk written
// ------------------------------------------------------------
bool DownloadWorker::transfer()
{
    emitEvent(TransferPhase::Started, 0);

    qInfo().noquote() << QString("[XFER] start #%1 %2 -> %3 (%4 bytes)")
                         .arg(QString::number(m_job.taskId), m_job.remotePath, m_job.localPath,
                              QString::number(m_job.totalBytes));

    // Queued behind the pool cap and cancelled before it got a thread:
    // do not touch the local file at all.
    if (m_cancel && m_cancel->load())
        return fail(QStringLiteral("Cancelled"), 0);

    if (!m_remote)
        return fail(QStringLiteral("Not connected."), 0);

    QSharedPointer<RemoteFileReader> reader;
    QString e;
    if (!m_remote->openFile(m_job.remotePath, &reader, &e) || !reader)
        return fail(e.isEmpty() ? QStringLiteral("Cannot open remote file.") : e, 0);

    const QFileInfo li(m_job.localPath);
    if (!li.absolutePath().isEmpty())
        QDir().mkpath(li.absolutePath());

    QFile out(m_job.localPath);
    if (!out.open(QIODevice::WriteOnly | QIODevice::Truncate))
        return fail(QString("Cannot create local file '%1': %2").arg(m_job.localPath, out.errorString()), 0);

    QByteArray buf(m_chunkSize, Qt::Uninitialized);
    quint64 done = 0;

    while (true) {

        if (m_cancel && m_cancel->load()) {
            out.close();
            if (m_removePartialOnCancel)
                out.remove();
            return fail(QStringLiteral("Cancelled"), done);
        }

        const qint64 n = reader->read(buf.data(), buf.size(), &e);
        if (n == 0)
            break; // EOF
        if (n < 0) {
            out.close();
            return fail(e.isEmpty() ? QStringLiteral("Remote read failed.") : e, done);
        }

        const qint64 w = out.write(buf.constData(), n);
        if (w != n) {
            const QString why = out.errorString();
            out.close();
            return fail(QString("Local write failed: %1").arg(why), done);
        }

        done += (quint64)n;
        emitEvent(TransferPhase::InProgress, done);
    }

    if (!out.flush()) {
        const QString why = out.errorString();
        out.close();
        return fail(QString("Local write failed: %1").arg(why), done);
    }
    out.close();

    qInfo().noquote() << QString("[XFER] OK #%1 %2 (%3 bytes)")
                         .arg(QString::number(m_job.taskId), m_job.localPath, QString::number(done));

    emitEvent(TransferPhase::Completed, done);
    return true;
}
