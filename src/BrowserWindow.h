#pragma once

#include <QMainWindow>

#include "BrowserController.h"

class QLabel;
class QListWidget;
class QPlainTextEdit;
class QProgressBar;
class QTableWidget;

// Main window: file list, session log, progress of the visible transfer and a
// table of every active transfer. All state comes from BrowserController.
class BrowserWindow : public QMainWindow
{
    Q_OBJECT
public:
    explicit BrowserWindow(BrowserController *controller, QWidget *parent = nullptr);

protected:
    bool eventFilter(QObject *obj, QEvent *event) override;
    void keyPressEvent(QKeyEvent *event) override;
    void closeEvent(QCloseEvent *event) override;

private slots:
    void render();

private:
    void buildUi();
    bool handleKey(QKeyEvent *event);

    void renderItems(const BrowserController::Snapshot& s);
    void renderLog();
    void renderTransfers(const BrowserController::Snapshot& s);

    BrowserController *m_controller = nullptr;

    QListWidget *m_list = nullptr;
    QPlainTextEdit *m_log = nullptr;
    QLabel *m_progressLabel = nullptr;
    QProgressBar *m_progress = nullptr;
    QTableWidget *m_transfers = nullptr;
    QLabel *m_pathLabel = nullptr;
    QLabel *m_transferSummary = nullptr;

    quint64 m_logShown = 0;   // SessionLog lines already in the pane
    bool m_renderingList = false;
};
