// NavigationState.cpp
#include "NavigationState.h"

#include <QDebug>
#include <algorithm>

NavigationState::NavigationState(const QString& initialPath,
                                 const QStringList& roots,
                                 int logCapacity)
    : m_path(RemotePath::clean(initialPath))
    , m_listedPath(m_path)
    , m_roots(roots.isEmpty() ? RemotePath::defaultRoots() : roots)
    , m_log(logCapacity)
{
    m_log.append("App initialized");
}

// -----------------------------------------------------------------------------
// buildItems()
// -----------------------------------------------------------------------------
// Ordering policy (always):
//   1) Parent row ".." first
//   2) Directories next
//   3) Files last
// Ties broken by name (plain code-unit comparison, case-sensitive).
// -----------------------------------------------------------------------------
QVector<NavigationState::Item> NavigationState::buildItems(const QVector<RemoteEntry>& entries,
                                                           bool withParent)
{
    QVector<RemoteEntry> sorted = entries;
    std::stable_sort(sorted.begin(), sorted.end(), [](const RemoteEntry& a, const RemoteEntry& b) {
        if (a.isDir != b.isDir) return a.isDir;
        return a.name < b.name;
    });

    QVector<Item> items;
    items.reserve(sorted.size() + 1);

    if (withParent) {
        Item up;
        up.kind = Item::Kind::ParentLink;
        up.name = "..";
        items.push_back(up);
    }

    for (const RemoteEntry& e : sorted) {
        Item it;
        it.kind = e.isDir ? Item::Kind::Directory : Item::Kind::File;
        it.name = e.name;
        it.size = e.isDir ? 0 : e.size;
        items.push_back(it);
    }

    return items;
}

void NavigationState::moveUp()
{
    if (m_items.isEmpty()) return;

    const int n = m_items.size();
    m_selected = (m_selected < 0) ? 0 : (m_selected - 1 + n) % n;
}

void NavigationState::moveDown()
{
    if (m_items.isEmpty()) return;

    const int n = m_items.size();
    m_selected = (m_selected < 0) ? 0 : (m_selected + 1) % n;
}

void NavigationState::setSelectedIndex(int index)
{
    if (m_items.isEmpty()) {
        m_selected = -1;
        return;
    }
    m_selected = qBound(0, index, m_items.size() - 1);
}

NavigationState::Command NavigationState::beginRefresh(const QString& path)
{
    m_path = RemotePath::clean(path);
    m_pending = true;
    m_log.append(QString("Fetching files from '%1'...").arg(m_path));

    Command c;
    c.type = CommandType::Refresh;
    c.path = m_path;
    return c;
}

NavigationState::Command NavigationState::requestRefresh()
{
    if (m_pending) return Command{};
    return beginRefresh(m_path);
}

NavigationState::Command NavigationState::activate(int index, bool modified)
{
    if (index < 0 || index >= m_items.size())
        return Command{};

    if (m_pending) {
        m_log.append(QString("Still loading '%1', ignoring selection.").arg(m_path));
        return Command{};
    }

    const Item item = m_items[index];

    switch (item.kind) {
        case Item::Kind::ParentLink:
            return beginRefresh(RemotePath::parent(m_path));

        case Item::Kind::Directory: {
            const QString full = RemotePath::join(m_path, item.name);
            if (!modified)
                return beginRefresh(full);

            Command c;
            c.type = CommandType::DownloadDirectory;
            c.path = full;
            c.name = item.name;
            return c;
        }

        case Item::Kind::File: {
            Command c;
            c.type = CommandType::DownloadFile;
            c.path = RemotePath::join(m_path, item.name);
            c.name = item.name;
            c.size = item.size;
            return c;
        }
    }

    return Command{};
}

void NavigationState::refreshCompleted(const QVector<RemoteEntry>& entries)
{
    m_items = buildItems(entries, !isRoot());
    m_selected = m_items.isEmpty() ? -1 : 0;
    m_pending = false;
    m_listedPath = m_path;

    m_log.append(QString("Found %1 items.").arg(m_items.size()));
}

void NavigationState::refreshFailed(const QString& error)
{
    m_pending = false;
    m_path = m_listedPath;

    m_log.append(QString("Error fetching files: %1").arg(error), SessionLog::Level::Error);
}
