// BrowserWindow.cpp
#include "BrowserWindow.h"
#include "DisplayFormat.h"

#include <QApplication>
#include <QCloseEvent>
#include <QDebug>
#include <QHeaderView>
#include <QKeyEvent>
#include <QLabel>
#include <QListWidget>
#include <QPlainTextEdit>
#include <QProgressBar>
#include <QScrollBar>
#include <QSplitter>
#include <QStatusBar>
#include <QTableWidget>
#include <QVBoxLayout>

BrowserWindow::BrowserWindow(BrowserController *controller, QWidget *parent)
    : QMainWindow(parent)
    , m_controller(controller)
{
    buildUi();

    connect(m_controller, &BrowserController::stateChanged, this, &BrowserWindow::render);
    connect(m_controller, &BrowserController::quitRequested, this, &QWidget::close);

    render();
}

// -----------------------------------------------------------------------------
// buildUi()
// -----------------------------------------------------------------------------
// Layout (top to bottom):
//   - file list (left) | active transfers table (right)
//   - progress label + bar for the visible transfer
//   - session log pane
//   - status bar "Path: ..."
// -----------------------------------------------------------------------------
void BrowserWindow::buildUi()
{
    setWindowTitle(tr("SFTP Browser"));
    resize(1000, 700);

    auto *central = new QWidget(this);
    auto *root = new QVBoxLayout(central);
    root->setContentsMargins(8, 8, 8, 8);
    root->setSpacing(6);

    auto *top = new QSplitter(Qt::Horizontal, central);

    m_list = new QListWidget(top);
    m_list->setSelectionMode(QAbstractItemView::SingleSelection);
    m_list->installEventFilter(this);

    m_transfers = new QTableWidget(top);
    m_transfers->setColumnCount(4);
    m_transfers->setHorizontalHeaderLabels({tr("#"), tr("File"), tr("State"), tr("Progress")});
    m_transfers->verticalHeader()->setVisible(false);
    m_transfers->setEditTriggers(QAbstractItemView::NoEditTriggers);
    m_transfers->setSelectionMode(QAbstractItemView::NoSelection);
    m_transfers->setFocusPolicy(Qt::NoFocus);
    m_transfers->horizontalHeader()->setSectionResizeMode(1, QHeaderView::Stretch);

    top->addWidget(m_list);
    top->addWidget(m_transfers);
    top->setStretchFactor(0, 3);
    top->setStretchFactor(1, 2);

    m_progressLabel = new QLabel(central);
    m_progress = new QProgressBar(central);
    m_progress->setRange(0, 100);
    m_progressLabel->setVisible(false);
    m_progress->setVisible(false);

    m_log = new QPlainTextEdit(central);
    m_log->setReadOnly(true);
    m_log->setFocusPolicy(Qt::NoFocus);
    m_log->setMaximumBlockCount(m_controller->navigation().log().capacity());

    root->addWidget(top, 3);
    root->addWidget(m_progressLabel);
    root->addWidget(m_progress);
    root->addWidget(m_log, 2);

    setCentralWidget(central);

    m_pathLabel = new QLabel(this);
    statusBar()->addWidget(m_pathLabel, 1);

    m_transferSummary = new QLabel(this);
    statusBar()->addPermanentWidget(m_transferSummary);

    // Mouse: click selects, double-click activates.
    connect(m_list, &QListWidget::currentRowChanged, this, [this](int row) {
        if (!m_renderingList && row >= 0)
            m_controller->select(row);
    });
    connect(m_list, &QListWidget::itemActivated, this, [this](QListWidgetItem *) {
        const bool ctrl = (QApplication::keyboardModifiers() & Qt::ControlModifier);
        m_controller->handleInput(ctrl ? BrowserController::InputAction::ActivateModified
                                       : BrowserController::InputAction::Activate);
    });

    m_list->setFocus();
}

// -----------------------------------------------------------------------------
// Key handling
// -----------------------------------------------------------------------------
// The list would consume Up/Down/Enter itself; route them to the controller
// so selection wraps and activation follows the navigation rules.
// -----------------------------------------------------------------------------
bool BrowserWindow::handleKey(QKeyEvent *event)
{
    using A = BrowserController::InputAction;

    switch (event->key()) {
        case Qt::Key_Up:
            m_controller->handleInput(A::MoveUp);
            return true;
        case Qt::Key_Down:
            m_controller->handleInput(A::MoveDown);
            return true;
        case Qt::Key_Return:
        case Qt::Key_Enter:
            m_controller->handleInput((event->modifiers() & Qt::ControlModifier) ? A::ActivateModified
                                                                                : A::Activate);
            return true;
        case Qt::Key_F5:
            m_controller->handleInput(A::Refresh);
            return true;
        case Qt::Key_Q:
            if (event->modifiers() & (Qt::ControlModifier | Qt::AltModifier))
                return false;
            m_controller->handleInput(A::Quit);
            return true;
        case Qt::Key_Escape:
            m_controller->handleInput(A::Quit);
            return true;
        default:
            return false;
    }
}

bool BrowserWindow::eventFilter(QObject *obj, QEvent *event)
{
    if (obj == m_list && event->type() == QEvent::KeyPress) {
        if (handleKey(static_cast<QKeyEvent*>(event)))
            return true;
    }
    return QMainWindow::eventFilter(obj, event);
}

void BrowserWindow::keyPressEvent(QKeyEvent *event)
{
    if (!handleKey(event))
        QMainWindow::keyPressEvent(event);
}

void BrowserWindow::closeEvent(QCloseEvent *event)
{
    // Window manager close goes through the same exit policy as q/Esc.
    if (!m_controller->isQuitting())
        m_controller->handleInput(BrowserController::InputAction::Quit);
    event->accept();
}

// -----------------------------------------------------------------------------
// render()
// -----------------------------------------------------------------------------
void BrowserWindow::render()
{
    const BrowserController::Snapshot s = m_controller->snapshot();

    renderItems(s);
    renderLog();
    renderTransfers(s);

    if (s.hasVisibleTransfer) {
        m_progressLabel->setText(DisplayFormat::progressLabel(s.visibleTransfer));
        m_progress->setValue(DisplayFormat::progressPercent(s.visibleTransfer));
    }
    m_progressLabel->setVisible(s.hasVisibleTransfer);
    m_progress->setVisible(s.hasVisibleTransfer);

    QString status = tr("Path: %1").arg(s.path);
    if (s.refreshPending)
        status += tr("  (loading...)");
    m_pathLabel->setText(status);

    QString summary = tr("%1 running, %2 done, %3 failed (%4 started)")
                          .arg(QString::number(s.transfersRunning),
                               QString::number(s.transfersCompleted),
                               QString::number(s.transfersFailed),
                               QString::number(s.transfersLaunched));
    if (s.shuttingDown)
        summary += tr(", stopping");
    m_transferSummary->setText(summary);
}

void BrowserWindow::renderItems(const BrowserController::Snapshot& s)
{
    m_renderingList = true;

    // Rebuild only when the listing changed; selection moves are cheap.
    bool same = (m_list->count() == s.items.size());
    for (int i = 0; same && i < s.items.size(); ++i)
        same = (m_list->item(i)->text() == DisplayFormat::itemLabel(s.items[i]));

    if (!same) {
        m_list->clear();
        for (const auto& it : s.items) {
            auto *row = new QListWidgetItem(DisplayFormat::itemLabel(it), m_list);
            if (it.kind == NavigationState::Item::Kind::File)
                row->setToolTip(DisplayFormat::prettySize(it.size));
        }
    }

    if (s.selected >= 0 && s.selected < m_list->count()) {
        m_list->setCurrentRow(s.selected);
        m_list->scrollToItem(m_list->item(s.selected));
    } else {
        m_list->setCurrentRow(-1);
    }

    m_renderingList = false;
}

void BrowserWindow::renderLog()
{
    const SessionLog& log = m_controller->navigation().log();
    const quint64 total = log.totalAppended();
    if (total == m_logShown)
        return;

    // Lines appended since the last render (bounded by what the ring still holds).
    const int fresh = int(qMin<quint64>(total - m_logShown, (quint64)log.capacity()));
    for (const QString& line : log.tail(fresh))
        m_log->appendPlainText(line);

    m_logShown = total;
    m_log->verticalScrollBar()->setValue(m_log->verticalScrollBar()->maximum());
}

void BrowserWindow::renderTransfers(const BrowserController::Snapshot& s)
{
    m_transfers->setRowCount(s.activeTransfers.size());

    for (int r = 0; r < s.activeTransfers.size(); ++r) {
        const TransferTask& t = s.activeTransfers[r];

        const QString progress = t.totalBytes > 0
            ? QString("%1 / %2 (%3%)")
                  .arg(DisplayFormat::prettySize(t.bytesDone), DisplayFormat::prettySize(t.totalBytes))
                  .arg(DisplayFormat::progressPercent(t))
            : DisplayFormat::prettySize(t.bytesDone);

        m_transfers->setItem(r, 0, new QTableWidgetItem(QString::number(t.id)));
        m_transfers->setItem(r, 1, new QTableWidgetItem(t.displayName));
        m_transfers->setItem(r, 2, new QTableWidgetItem(transferPhaseToString(t.phase)));
        m_transfers->setItem(r, 3, new QTableWidgetItem(progress));
        m_transfers->item(r, 1)->setToolTip(t.remotePath);
    }
}
