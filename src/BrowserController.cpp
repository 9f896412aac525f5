// BrowserController.cpp
#include "BrowserController.h"

#include <QDebug>
#include <QFutureWatcher>
#include <QtConcurrent/QtConcurrent>

#include "RemoteAccess.h"

BrowserController::BrowserController(RemoteAccess *remote,
                                     const AppConfig& config,
                                     const QString& initialPath,
                                     QObject *parent)
    : QObject(parent)
    , m_remote(remote)
    , m_config(config)
    , m_nav(initialPath, config.roots, config.logLines)
    , m_aggregator(&m_nav.log())
    , m_orchestrator(remote, &m_events, config.orchestratorOptions())
{
    m_listPool.setMaxThreadCount(1);

    m_timer.setInterval(m_config.tickMs);
    connect(&m_timer, &QTimer::timeout, this, &BrowserController::tick);
}

BrowserController::~BrowserController()
{
    m_timer.stop();
    m_orchestrator.shutdown();
}

void BrowserController::start()
{
    qInfo().noquote() << QString("[NAV] start at '%1'").arg(m_nav.currentPath());

    execute(m_nav.requestRefresh());
    m_timer.start();
    emit stateChanged();
}

QString BrowserController::actionName(InputAction action)
{
    switch (action) {
        case InputAction::MoveUp:           return "Up";
        case InputAction::MoveDown:         return "Down";
        case InputAction::Activate:         return "Enter";
        case InputAction::ActivateModified: return "Ctrl+Enter";
        case InputAction::Refresh:          return "Refresh";
        case InputAction::Quit:             return "Quit";
    }
    return "?";
}

void BrowserController::handleInput(InputAction action)
{
    qDebug().noquote() << QString("[NAV] key %1").arg(actionName(action));

    if (m_quitting) return;

    switch (action) {
        case InputAction::MoveUp:
            m_nav.moveUp();
            break;
        case InputAction::MoveDown:
            m_nav.moveDown();
            break;
        case InputAction::Activate:
            execute(m_nav.activateSelected(false));
            break;
        case InputAction::ActivateModified:
            execute(m_nav.activateSelected(true));
            break;
        case InputAction::Refresh:
            execute(m_nav.requestRefresh());
            break;
        case InputAction::Quit:
            quit();
            return;
    }

    emit stateChanged();
}

void BrowserController::select(int index)
{
    if (m_quitting) return;
    m_nav.setSelectedIndex(index);
    emit stateChanged();
}

void BrowserController::execute(const NavigationState::Command& cmd)
{
    switch (cmd.type) {
        case NavigationState::CommandType::None:
            return;
        case NavigationState::CommandType::Refresh:
            startListing(cmd.path);
            return;
        case NavigationState::CommandType::DownloadFile:
            m_orchestrator.requestFile(cmd.path, cmd.size);
            return;
        case NavigationState::CommandType::DownloadDirectory:
            m_orchestrator.requestDirectory(cmd.path);
            return;
    }
}

// ------------------------------------------------------------
// startListing()
// ------------------------------------------------------------
// The listing runs off the GUI thread. Only the newest request may
// touch the navigation state; anything older is dropped.
// ------------------------------------------------------------
void BrowserController::startListing(const QString& path)
{
    const quint64 seq = ++m_listSeq;
    RemoteAccess *remote = m_remote;

    auto *watcher = new QFutureWatcher<ListResult>(this);
    connect(watcher, &QFutureWatcher<ListResult>::finished, this, [this, watcher, seq, path]() {
        const ListResult r = watcher->future().result();
        watcher->deleteLater();

        if (seq != m_listSeq || m_quitting) {
            qDebug().noquote() << QString("[NAV] discarding stale listing of '%1'").arg(path);
            return;
        }

        if (r.ok) {
            qInfo().noquote() << QString("[NAV] listed '%1': %2 entries").arg(path, QString::number(r.entries.size()));
            m_nav.refreshCompleted(r.entries);
        } else {
            qWarning().noquote() << QString("[NAV] list '%1' failed: %2").arg(path, r.error);
            m_nav.refreshFailed(r.error);
        }
        emit stateChanged();
    });

    watcher->setFuture(QtConcurrent::run(&m_listPool, [remote, path]() -> ListResult {
        ListResult r;
        if (!remote) {
            r.error = "Not connected";
            return r;
        }
        r.ok = remote->listDirectory(path, &r.entries, &r.error);
        return r;
    }));
}

void BrowserController::tick()
{
    const int applied = m_aggregator.consume(&m_events);
    if (applied > 0 || m_aggregator.hasVisible())
        emit stateChanged();
}

void BrowserController::quit()
{
    qInfo().noquote() << "[NAV] quit requested";

    m_quitting = true;
    m_timer.stop();

    m_orchestrator.shutdown(3000);

    // Final events (cancellations) still reach the log file.
    m_aggregator.consume(&m_events);

    emit stateChanged();
    emit quitRequested();
}

BrowserController::Snapshot BrowserController::snapshot() const
{
    Snapshot s;
    s.path = m_nav.currentPath();
    s.items = m_nav.items();
    s.selected = m_nav.selectedIndex();
    s.refreshPending = m_nav.isRefreshPending();
    s.logLines = m_nav.log().lines();
    s.hasVisibleTransfer = m_aggregator.visibleTask(&s.visibleTransfer);

    const auto& tasks = m_aggregator.activeTasks();
    s.activeTransfers.reserve(tasks.size());
    for (auto it = tasks.constBegin(); it != tasks.constEnd(); ++it)
        s.activeTransfers.push_back(it.value());

    s.transfersRunning   = m_orchestrator.runningWorkers();
    s.transfersLaunched  = m_orchestrator.totalLaunched();
    s.transfersCompleted = m_aggregator.completedCount();
    s.transfersFailed    = m_aggregator.failedCount();
    s.shuttingDown       = m_orchestrator.isShuttingDown();

    return s;
}
