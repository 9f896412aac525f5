// BrowserController.h
//
// Purpose:
//   The interaction loop. Owns the browsing state and the transfer pipeline
//   and turns input actions into state transitions, listings and downloads.
//
// Threading:
//   Lives on the GUI thread. Directory listings run on a private pool and
//   come back through a QFutureWatcher; download workers report through the
//   TransferEventQueue, drained on every timer tick.

#pragma once

#include <QObject>
#include <QStringList>
#include <QThreadPool>
#include <QTimer>
#include <QVector>

#include "AppConfig.h"
#include "NavigationState.h"
#include "Transfer/DownloadOrchestrator.h"
#include "Transfer/ProgressAggregator.h"
#include "Transfer/TransferEventQueue.h"

class RemoteAccess;

class BrowserController : public QObject
{
    Q_OBJECT
public:
    enum class InputAction {
        MoveUp,
        MoveDown,
        Activate,
        ActivateModified,   // Ctrl+Enter: download a whole directory
        Refresh,
        Quit
    };

    // What the window draws; copied out once per tick.
    struct Snapshot {
        QString path;
        QVector<NavigationState::Item> items;
        int selected = -1;
        bool refreshPending = false;
        QStringList logLines;
        bool hasVisibleTransfer = false;
        TransferTask visibleTransfer;
        QVector<TransferTask> activeTransfers;
        int transfersRunning = 0;
        int transfersLaunched = 0;
        int transfersCompleted = 0;
        int transfersFailed = 0;
        bool shuttingDown = false;
    };

    BrowserController(RemoteAccess *remote,
                      const AppConfig& config,
                      const QString& initialPath,
                      QObject *parent = nullptr);
    ~BrowserController() override;

    // Lists the initial directory and starts the tick timer.
    void start();

    void handleInput(InputAction action);

    // Mouse selection from the view.
    void select(int index);

    // Drains transfer events and publishes a snapshot. Called by the timer.
    void tick();

    Snapshot snapshot() const;

    bool isQuitting() const { return m_quitting; }

    NavigationState& navigation() { return m_nav; }

    static QString actionName(InputAction action);

signals:
    void stateChanged();
    void quitRequested();

private:
    struct ListResult {
        bool ok = false;
        QVector<RemoteEntry> entries;
        QString error;
    };

    void execute(const NavigationState::Command& cmd);
    void startListing(const QString& path);
    void quit();

    RemoteAccess *m_remote = nullptr;
    AppConfig m_config;

    NavigationState m_nav;
    TransferEventQueue m_events;
    ProgressAggregator m_aggregator;
    DownloadOrchestrator m_orchestrator;

    QTimer m_timer;
    quint64 m_listSeq = 0;   // newest listing request; older results are stale
    bool m_quitting = false;

    QThreadPool m_listPool;  // destroyed first: waits for a listing still running
};
