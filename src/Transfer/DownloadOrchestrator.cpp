// DownloadOrchestrator.cpp
#include "DownloadOrchestrator.h"
#include "DownloadWorker.h"
#include "RemoteEnumerator.h"
#include "TransferEventQueue.h"
#include "../RemoteAccess.h"
#include "../RemotePath.h"

#include <QDebug>
#include <QFileInfo>
#include <QMutexLocker>
#include <QtConcurrent/QtConcurrent>

DownloadOrchestrator::DownloadOrchestrator(RemoteAccess *remote,
                                           TransferEventQueue *events,
                                           const Options& options)
    : m_remote(remote)
    , m_events(events)
    , m_options(options)
    , m_names(options.destinationDir, options.layout)
{
    m_options.maxConcurrent = qBound(1, m_options.maxConcurrent, 32);
    m_options.launchDelayMs = qMax(0, m_options.launchDelayMs);
    m_options.maxDepth      = qMax(1, m_options.maxDepth);
    if (m_options.chunkSize <= 0)
        m_options.chunkSize = DownloadWorker::kDefaultChunkSize;

    m_workerPool.setMaxThreadCount(m_options.maxConcurrent);
    m_dispatchPool.setMaxThreadCount(2);

    m_clock.start();

    qInfo().noquote() << QString("[XFER] orchestrator maxConcurrent=%1 launchDelayMs=%2 chunk=%3 dest='%4' layout=%5")
                         .arg(m_options.maxConcurrent)
                         .arg(m_options.launchDelayMs)
                         .arg(m_options.chunkSize)
                         .arg(m_names.destinationDir(),
                              LocalNamePlanner::layoutToString(m_names.layout()));
}

DownloadOrchestrator::~DownloadOrchestrator()
{
    shutdown();
}

quint64 DownloadOrchestrator::requestFile(const QString& remotePath, quint64 totalBytes)
{
    if (isShuttingDown()) return 0;

    qInfo().noquote() << QString("[XFER] request file '%1'").arg(remotePath);

    {
        QMutexLocker lock(&m_paceMutex);
        m_lastLaunchMs = m_clock.elapsed();
    }
    return launch(remotePath, totalBytes, QString());
}

void DownloadOrchestrator::requestDirectory(const QString& remotePath)
{
    if (isShuttingDown()) return;

    qInfo().noquote() << QString("[XFER] request directory '%1'").arg(remotePath);

    if (m_events)
        m_events->push(TransferEvent::info(
            QString("Queueing directory '%1' for download...").arg(RemotePath::baseName(remotePath))));

    QtConcurrent::run(&m_dispatchPool, [this, remotePath]() {
        runDirectoryRequest(remotePath);
    });
}

// ------------------------------------------------------------
// Directory request: discovery first, then paced launches.
// Runs on the dispatch pool.
// ------------------------------------------------------------
void DownloadOrchestrator::runDirectoryRequest(const QString& remotePath)
{
    RemoteEnumerator enumerator(m_remote);
    enumerator.setMaxDepth(m_options.maxDepth);
    enumerator.setCancelFlag(&m_cancel);

    QVector<RemoteFile> files;
    QString err;
    if (!enumerator.enumerate(remotePath, &files, &err)) {
        if (m_events)
            m_events->push(TransferEvent::error(
                QString("Error finding files in '%1': %2").arg(remotePath, err)));
        return;
    }

    if (m_events) {
        for (const QString& w : enumerator.warnings())
            m_events->push(TransferEvent::info(w));
        m_events->push(TransferEvent::info(
            QString("Found %1 files to download.").arg(files.size())));
    }
    qInfo().noquote() << QString("[XFER] directory '%1': %2 file(s) in %3 listing(s)")
                         .arg(remotePath, QString::number(files.size()),
                              QString::number(enumerator.directoriesListed()));

    QString rootName = RemotePath::baseName(remotePath);
    if (rootName.isEmpty() || rootName == "." || rootName == "~")
        rootName = QStringLiteral("download");

    for (int i = 0; i < files.size(); ++i) {
        if (!pace()) {
            const int skipped = files.size() - i;
            qInfo().noquote() << QString("[XFER] directory '%1' cancelled, %2 file(s) not started")
                                 .arg(remotePath, QString::number(skipped));
            if (m_events)
                m_events->push(TransferEvent::error(
                    QString("Cancelled: %1 file(s) from '%2' not started.").arg(QString::number(skipped), remotePath)));
            return;
        }

        const RemoteFile& f = files[i];
        launch(f.remotePath, f.size, rootName + "/" + f.relativePath);
    }

    const QVector<qint64> launches = launchTimesMs();
    if (!files.isEmpty() && launches.size() >= files.size())
        qDebug().noquote() << QString("[XFER] directory '%1' launches done, paced over %2 ms")
                              .arg(remotePath,
                                   QString::number(launches.last() - launches[launches.size() - files.size()]));
}

bool DownloadOrchestrator::pace()
{
    QMutexLocker lock(&m_paceMutex);

    if (m_lastLaunchMs >= 0) {
        while (!m_cancel.load()) {
            const qint64 remaining = m_lastLaunchMs + m_options.launchDelayMs - m_clock.elapsed();
            if (remaining <= 0)
                break;
            m_paceCond.wait(&m_paceMutex, (unsigned long)remaining);
        }
    }

    if (m_cancel.load())
        return false;

    m_lastLaunchMs = m_clock.elapsed();
    return true;
}

// ------------------------------------------------------------
// Creates the task, announces it as Queued and hands the worker to the pool.
// ------------------------------------------------------------
quint64 DownloadOrchestrator::launch(const QString& remotePath,
                                     quint64 totalBytes,
                                     const QString& mirrorRelative)
{
    DownloadWorker::Job job;
    job.taskId      = m_nextTaskId.fetch_add(1);
    job.remotePath  = remotePath;
    job.localPath   = m_names.reserve(remotePath, mirrorRelative);
    job.displayName = QFileInfo(job.localPath).fileName();
    job.totalBytes  = totalBytes;

    if (m_events) {
        ProgressEvent ev;
        ev.taskId      = job.taskId;
        ev.phase       = TransferPhase::Queued;
        ev.totalBytes  = totalBytes;
        ev.displayName = job.displayName;
        ev.remotePath  = remotePath;
        m_events->pushProgress(ev);
    }

    auto *worker = new DownloadWorker(m_remote, job, m_events, m_options.chunkSize);
    worker->setCancelFlag(&m_cancel, m_options.removePartialOnCancel);
    worker->setFinishedCallback([this](const DownloadWorker::Job& j, bool /*ok*/) {
        m_names.release(j.localPath);
        QMutexLocker lock(&m_statsMutex);
        m_running--;
    });

    {
        QMutexLocker lock(&m_statsMutex);
        m_running++;
        m_launchTimes.push_back(m_clock.elapsed());
    }

    qInfo().noquote() << QString("[XFER] launch #%1 '%2' -> '%3'")
                         .arg(job.taskId)
                         .arg(remotePath, job.localPath);

    m_workerPool.start(worker);
    return job.taskId;
}

void DownloadOrchestrator::shutdown(int waitMs)
{
    const bool first = !m_cancel.exchange(true);

    {
        QMutexLocker lock(&m_paceMutex);
        m_paceCond.wakeAll();
    }

    if (first)
        qInfo().noquote() << QString("[XFER] shutdown requested running=%1").arg(runningWorkers());

    if (!waitForIdle(waitMs))
        qWarning().noquote() << QString("[XFER] shutdown: %1 worker(s) still running after %2 ms")
                                .arg(runningWorkers())
                                .arg(waitMs);
}

bool DownloadOrchestrator::waitForIdle(int waitMs)
{
    QElapsedTimer t;
    t.start();

    if (!m_dispatchPool.waitForDone(waitMs))
        return false;

    const int remaining = (waitMs < 0) ? -1 : (int)qMax<qint64>(0, waitMs - t.elapsed());
    return m_workerPool.waitForDone(remaining);
}

int DownloadOrchestrator::runningWorkers() const
{
    QMutexLocker lock(&m_statsMutex);
    return m_running;
}

int DownloadOrchestrator::totalLaunched() const
{
    QMutexLocker lock(&m_statsMutex);
    return m_launchTimes.size();
}

QVector<qint64> DownloadOrchestrator::launchTimesMs() const
{
    QMutexLocker lock(&m_statsMutex);
    return m_launchTimes;
}
