#pragma once
#include <QString>

// Process-wide file logger installed as the Qt message handler.
// Everything logs through qDebug()/qInfo()/qWarning() with a [TAG] prefix.
namespace Logger {
    struct Options {
        int level = 1;                          // 0=Warnings+errors, 1=Normal, 2=Debug
        QString filePath;                       // empty => <AppLocalData>/logs/<app>.log
        qint64 rotateBytes = 2 * 1024 * 1024;
        int keepRotated = 3;
    };

    void install(const QString& appName, const Options& options = Options());

    // Restores the default Qt handler and closes the file.
    void uninstall();

    void setLogLevel(int level);
    int  logLevel();

    QString logFilePath();

    // One record = one physical line.
    QString normalizeMessage(QString s);

    // path -> path.1 -> ... -> path.<keep>; oldest beyond keep is dropped.
    // Returns true when a rotation happened.
    bool rotateIfNeeded(const QString& path, qint64 maxBytes, int keep);
}
