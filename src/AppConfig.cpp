#include "AppConfig.h"

#include <QDebug>
#include <QSettings>

static int clampedInt(QSettings& s, const char *key, int def, int lo, int hi)
{
    bool ok = false;
    const int v = s.value(key, def).toInt(&ok);
    if (!ok) {
        qWarning().noquote() << QString("[CFG] %1: not a number, using %2").arg(QString::fromLatin1(key), QString::number(def));
        return def;
    }
    const int c = qBound(lo, v, hi);
    if (c != v)
        qWarning().noquote() << QString("[CFG] %1=%2 out of range, clamped to %3").arg(QString::fromLatin1(key), QString::number(v), QString::number(c));
    return c;
}

AppConfig AppConfig::load(QSettings& s)
{
    AppConfig c;

    c.chunkSize     = clampedInt(s, "transfer/chunkSize", c.chunkSize, 1, 4 * 1024 * 1024);
    c.launchDelayMs = clampedInt(s, "transfer/launchDelayMs", c.launchDelayMs, 0, 10000);
    c.maxConcurrent = clampedInt(s, "transfer/maxConcurrent", c.maxConcurrent, 1, 32);

    const QString dest = s.value("transfer/destinationDir", c.destinationDir).toString().trimmed();
    if (!dest.isEmpty())
        c.destinationDir = dest;

    const QString layout = s.value("transfer/layout", "flat").toString().trimmed().toLower();
    if (layout != "flat" && layout != "mirror")
        qWarning().noquote() << QString("[CFG] transfer/layout='%1' unknown, using flat").arg(layout);
    c.layout = LocalNamePlanner::layoutFromString(layout);

    c.removePartialOnCancel = s.value("transfer/removePartialOnCancel", c.removePartialOnCancel).toBool();

    c.maxDepth = clampedInt(s, "enumerate/maxDepth", c.maxDepth, 1, 4096);

    c.tickMs   = clampedInt(s, "ui/tickMs", c.tickMs, 10, 1000);
    c.logLines = clampedInt(s, "ui/logLines", c.logLines, 10, 100000);

    QStringList roots;
    for (const QString& r : s.value("ui/roots", c.roots).toStringList()) {
        const QString t = r.trimmed();
        if (!t.isEmpty()) roots << t;
    }
    if (!roots.isEmpty())
        c.roots = roots;

    c.sshTimeoutSec = clampedInt(s, "ssh/timeoutSec", c.sshTimeoutSec, 1, 600);

    c.logLevel    = clampedInt(s, "logging/level", c.logLevel, 0, 2);
    c.logFilePath = s.value("logging/filePath", "").toString().trimmed();

    return c;
}

void AppConfig::save(QSettings& s) const
{
    s.setValue("transfer/chunkSize", chunkSize);
    s.setValue("transfer/launchDelayMs", launchDelayMs);
    s.setValue("transfer/maxConcurrent", maxConcurrent);
    s.setValue("transfer/destinationDir", destinationDir);
    s.setValue("transfer/layout", LocalNamePlanner::layoutToString(layout));
    s.setValue("transfer/removePartialOnCancel", removePartialOnCancel);
    s.setValue("enumerate/maxDepth", maxDepth);
    s.setValue("ui/tickMs", tickMs);
    s.setValue("ui/logLines", logLines);
    s.setValue("ui/roots", roots);
    s.setValue("ssh/timeoutSec", sshTimeoutSec);
    s.setValue("logging/level", logLevel);
    s.setValue("logging/filePath", logFilePath);
}

DownloadOrchestrator::Options AppConfig::orchestratorOptions() const
{
    DownloadOrchestrator::Options o;
    o.maxConcurrent  = maxConcurrent;
    o.launchDelayMs  = launchDelayMs;
    o.chunkSize      = chunkSize;
    o.maxDepth       = maxDepth;
    o.destinationDir = destinationDir;
    o.layout         = layout;
    o.removePartialOnCancel = removePartialOnCancel;
    return o;
}

Logger::Options AppConfig::loggerOptions() const
{
    Logger::Options o;
    o.level = logLevel;
    o.filePath = logFilePath;
    return o;
}
