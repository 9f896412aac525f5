// NavigationState.h
//
// Purpose:
//   Pure browsing state for one remote directory view:
//     - current path, ordered items, selection cursor, session log
//     - transitions driven by input and by directory-refresh results
//
// Boundaries:
//   No I/O here. Transitions that need the network return a Command
//   (Refresh / DownloadFile / DownloadDirectory) that the caller executes.
//
// Invariants:
//   - items: ParentLink first (iff the path is not a root), then directories,
//     then files, each group sorted by name
//   - selectedIndex() == -1 iff items is empty, otherwise a valid index
//   - while a refresh is pending, activations are ignored; moves still work

#pragma once

#include <QString>
#include <QStringList>
#include <QVector>

#include "RemoteAccess.h"
#include "RemotePath.h"
#include "SessionLog.h"

class NavigationState
{
public:
    struct Item {
        enum class Kind {
            ParentLink,
            Directory,
            File
        };

        Kind kind = Kind::File;
        QString name;
        quint64 size = 0;   // File only
    };

    enum class CommandType {
        None,
        Refresh,
        DownloadFile,
        DownloadDirectory
    };

    struct Command {
        CommandType type = CommandType::None;
        QString path;       // remote path to list / download
        QString name;
        quint64 size = 0;   // DownloadFile only
    };

    explicit NavigationState(const QString& initialPath,
                             const QStringList& roots = RemotePath::defaultRoots(),
                             int logCapacity = 500);

    QString currentPath() const { return m_path; }
    const QVector<Item>& items() const { return m_items; }
    int selectedIndex() const { return m_selected; }
    bool isRefreshPending() const { return m_pending; }
    bool isRoot() const { return RemotePath::isRoot(m_path, m_roots); }

    SessionLog& log() { return m_log; }
    const SessionLog& log() const { return m_log; }

    // Cyclic; no-op on an empty list.
    void moveUp();
    void moveDown();
    void setSelectedIndex(int index);

    Command activate(int index, bool modified);
    Command activateSelected(bool modified) { return activate(m_selected, modified); }

    // Re-list the current directory.
    Command requestRefresh();

    void refreshCompleted(const QVector<RemoteEntry>& entries);

    // Items stay as they were and the path returns to the listed directory.
    void refreshFailed(const QString& error);

    static QVector<Item> buildItems(const QVector<RemoteEntry>& entries, bool withParent);

private:
    Command beginRefresh(const QString& path);

    QString m_path;
    QString m_listedPath;   // path the current items belong to
    QStringList m_roots;

    QVector<Item> m_items;
    int m_selected = -1;
    bool m_pending = false;

    SessionLog m_log;
};
