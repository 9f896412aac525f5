// Logger.cpp
#include "Logger.h"

#include <QDir>
#include <QDateTime>
#include <QFile>
#include <QFileInfo>
#include <QStandardPaths>
#include <QTextStream>
#include <QMutex>
#include <QMutexLocker>
#include <QAtomicInt>
#include <QDebug>

#include <cstdio>     // fprintf
#include <cstdlib>    // abort

// =====================================================
// Global logger state (process-wide)
// =====================================================

static QFile*     g_file  = nullptr;   // Open log file handle
static QMutex     g_mutex;             // Guards concurrent writes
static QString    g_path;              // Absolute path to log file
static QAtomicInt g_level(1);

// Prevent recursion if something inside handler triggers Qt logging again
static thread_local bool g_inHandler = false;

static QString levelToString(QtMsgType t)
{
    switch (t) {
        case QtDebugMsg:    return "DEBUG";
        case QtInfoMsg:     return "INFO";
        case QtWarningMsg:  return "WARN";
        case QtCriticalMsg: return "ERROR";
        case QtFatalMsg:    return "FATAL";
    }
    return "LOG";
}

// =====================================================
// Filtering by runtime logging level
// =====================================================
//
// 0 = WARN/ERROR/FATAL
// 1 = INFO and above
// 2 = everything
//
static bool allowMessage(QtMsgType type)
{
    const int lvl = g_level.loadAcquire();

    if (lvl <= 0)
        return (type == QtWarningMsg || type == QtCriticalMsg || type == QtFatalMsg);
    if (lvl == 1)
        return type != QtDebugMsg;
    return true;
}

static void closeFileLocked()
{
    if (!g_file) return;
    if (g_file->isOpen()) g_file->close();
    delete g_file;
    g_file = nullptr;
}

static void writeRecord(QtMsgType type, const QMessageLogContext& ctx, const QString& msg)
{
    QMutexLocker lock(&g_mutex);

    const QString ts  = QDateTime::currentDateTime().toString("yyyy-MM-dd HH:mm:ss.zzz");
    const QString lvl = levelToString(type);

    const QString where =
        (ctx.file && ctx.function)
            ? QString("%1:%2 %3")
                  .arg(QFileInfo(QString::fromUtf8(ctx.file)).fileName(),
                       QString::number(ctx.line),
                       QString::fromUtf8(ctx.function))
            : QString();

    const QString clean = Logger::normalizeMessage(msg);
    const QString record = where.isEmpty()
        ? QString("%1 [%2] %3").arg(ts, lvl, clean)
        : QString("%1 [%2] %3 - %4").arg(ts, lvl, where, clean);

    if (!g_file || !g_file->isOpen()) {
        const QByteArray utf8 = record.toUtf8();
        std::fprintf(stderr, "%s\n", utf8.constData());
        std::fflush(stderr);
        return;
    }

    QTextStream out(g_file);
    out.setCodec("UTF-8");
    out << record << "\n";
    out.flush();
}

static void handler(QtMsgType type, const QMessageLogContext& ctx, const QString& msg)
{
    if (!allowMessage(type) || g_inHandler) {
        if (type == QtFatalMsg) abort(); // never suppress fatal
        return;
    }

    g_inHandler = true;
    writeRecord(type, ctx, msg);
    g_inHandler = false;

    if (type == QtFatalMsg)
        abort();
}

// =====================================================
// Public Logger API
// =====================================================

namespace Logger {

QString normalizeMessage(QString s)
{
    s.replace("\r\n", "\n");
    s.replace('\r', '\n');
    s.replace('\n', ' ');
    s.replace('\t', ' ');
    return s.simplified();
}

bool rotateIfNeeded(const QString& path, qint64 maxBytes, int keep)
{
    QFileInfo fi(path);
    if (!fi.exists() || maxBytes <= 0 || fi.size() < maxBytes)
        return false;

    if (keep < 1) {
        QFile::remove(path);
        return true;
    }

    // Drop the oldest, then shift: .(keep-1) -> .keep, ..., log -> .1
    const QString oldest = path + "." + QString::number(keep);
    if (QFileInfo::exists(oldest))
        QFile::remove(oldest);

    for (int i = keep - 1; i >= 1; --i) {
        const QString older = path + "." + QString::number(i);
        if (QFileInfo::exists(older))
            QFile::rename(older, path + "." + QString::number(i + 1));
    }

    return QFile::rename(path, path + ".1");
}

void install(const QString& appName, const Options& options)
{
    setLogLevel(options.level);

    QString chosen = QDir::cleanPath(options.filePath.trimmed());
    if (options.filePath.trimmed().isEmpty()) {
        const QString dir =
            QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation) + "/logs";
        chosen = dir + "/" + appName + ".log";
    }

    QDir().mkpath(QFileInfo(chosen).absolutePath());
    rotateIfNeeded(chosen, options.rotateBytes, options.keepRotated);

    {
        QMutexLocker lock(&g_mutex);
        closeFileLocked();

        g_path = chosen;
        g_file = new QFile(g_path);
        if (!g_file->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
            std::fprintf(stderr, "Logger: failed to open log file: %s\n",
                         g_path.toUtf8().constData());
            std::fflush(stderr);
        }
    }

    qInstallMessageHandler(handler);
    qInfo().noquote() << QString("[LOG] Logger initialized: %1 (level %2)").arg(g_path, QString::number(logLevel()));
}

void uninstall()
{
    qInstallMessageHandler(nullptr);

    QMutexLocker lock(&g_mutex);
    closeFileLocked();
}

void setLogLevel(int level)
{
    g_level.storeRelease(qBound(0, level, 2));
}

int logLevel()
{
    return g_level.loadAcquire();
}

QString logFilePath()
{
    QMutexLocker lock(&g_mutex);
    return g_path;
}

} // namespace Logger
