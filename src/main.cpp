/*
 * SFTP Browser
 *
 * Copyright (c) 2025 Timo Erkvaara / CPUNK
 *
 * Licensed under the Apache License, Version 2.0
 * http://www.apache.org/licenses/LICENSE-2.0
 */

#include <QApplication>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QInputDialog>
#include <QLineEdit>
#include <QMessageBox>
#include <QSettings>
#include <iostream>

#include <sodium.h>

#include "AppConfig.h"
#include "BrowserController.h"
#include "BrowserWindow.h"
#include "Logger.h"
#include "RemoteTarget.h"
#include "SshClient.h"

// main.cpp
// --------
// Application entry point.
//
// Responsibilities:
// - Parse "remote" (user@host[:port]) and optional start "path"
// - Load AppConfig from QSettings, install the file logger
// - Prompt for the password, connect, wipe the password
// - Run the browser window until quit
//
// A failed connect is fatal: nothing is shown but an error, exit code 1.

static int fail(const QString& msg)
{
    qCritical().noquote() << QString("[MAIN] %1").arg(msg);
    std::cerr << msg.toStdString() << std::endl;
    QMessageBox::critical(nullptr, QObject::tr("SFTP Browser"), msg);
    return 1;
}

int main(int argc, char *argv[])
{
    QApplication app(argc, argv);

    // Stable names: QSettings keys and QStandardPaths layout depend on them.
    QCoreApplication::setOrganizationName("sftp-browser");
    QCoreApplication::setApplicationName("sftp-browser");
    QCoreApplication::setApplicationVersion("0.1.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Browse a remote host over SFTP and download files or whole directories.");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("remote", "Remote target, user@host[:port].");
    parser.addPositionalArgument("path", "Initial remote directory (default: .).", "[path]");

    QCommandLineOption levelOpt("log-level", "File log level: 0=warnings, 1=normal, 2=debug.", "level");
    parser.addOption(levelOpt);
    parser.process(app);

    if (sodium_init() < 0) {
        std::cerr << "libsodium initialisation failed" << std::endl;
        return 1;
    }

    QSettings s;
    AppConfig config = AppConfig::load(s);
    // Write back clamped values so the settings file lists every key.
    config.save(s);

    if (parser.isSet(levelOpt)) {
        bool ok = false;
        const int lvl = parser.value(levelOpt).toInt(&ok);
        if (ok) config.logLevel = qBound(0, lvl, 2);
    }

    Logger::install("sftp-browser", config.loggerOptions());

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty() || args.size() > 2) {
        std::cerr << parser.helpText().toStdString();
        return 1;
    }

    RemoteTarget target;
    QString err;
    if (!parseRemoteTarget(args.at(0), &target, &err))
        return fail(QObject::tr("Invalid remote '%1': %2").arg(args.at(0), err));

    const QString startPath = (args.size() > 1) ? args.at(1) : QString(".");

    bool ok = false;
    QString pw = QInputDialog::getText(nullptr,
                                       QObject::tr("SFTP Browser"),
                                       QObject::tr("Password for %1:").arg(target.toString()),
                                       QLineEdit::Password,
                                       QString(),
                                       &ok);
    if (!ok) {
        qInfo().noquote() << "[MAIN] password prompt cancelled";
        return 1;
    }

    QByteArray password = pw.toUtf8();
    sodium_memzero(pw.data(), (size_t)pw.size() * sizeof(QChar));
    pw.clear();

    SshClient ssh;
    ssh.setConnectTimeoutSec(config.sshTimeoutSec);
    const bool connected = ssh.connectTarget(target, password, &err);

    sodium_memzero(password.data(), (size_t)password.size());
    password.clear();

    if (!connected)
        return fail(QObject::tr("Failed to connect to %1: %2").arg(target.toString(), err));

    BrowserController controller(&ssh, config, startPath);
    BrowserWindow w(&controller);
    w.show();
    controller.start();

    const int rc = app.exec();

    ssh.disconnect();
    qInfo().noquote() << QString("[MAIN] exit %1").arg(rc);
    Logger::uninstall();
    return rc;
}
