#pragma once

#include <QString>
#include <QStringList>

#include "Logger.h"
#include "RemotePath.h"
#include "Transfer/DownloadOrchestrator.h"

class QSettings;

// Start-up configuration snapshot.
// Read once from QSettings; the rest of the program only sees this struct.
struct AppConfig
{
    // transfer/*
    int chunkSize = 8 * 1024;
    int launchDelayMs = 100;
    int maxConcurrent = 4;
    QString destinationDir = ".";
    LocalNamePlanner::Layout layout = LocalNamePlanner::Layout::Flat;
    bool removePartialOnCancel = true;

    // enumerate/*
    int maxDepth = 64;

    // ui/*
    int tickMs = 50;
    int logLines = 500;
    QStringList roots = RemotePath::defaultRoots();

    // ssh/*
    int sshTimeoutSec = 8;

    // logging/*
    int logLevel = 1;
    QString logFilePath;

    // Missing keys keep their defaults; numbers are clamped to their ranges.
    static AppConfig load(QSettings& s);

    // Writes every key (used to seed a fresh settings file).
    void save(QSettings& s) const;

    DownloadOrchestrator::Options orchestratorOptions() const;
    Logger::Options loggerOptions() const;
};
