#include <gtest/gtest.h>

#include "NavigationState.h"

using Kind = NavigationState::Item::Kind;
using CommandType = NavigationState::CommandType;

static RemoteEntry dirEntry(const QString& name)
{
    RemoteEntry e;
    e.name = name;
    e.isDir = true;
    return e;
}

static RemoteEntry fileEntry(const QString& name, quint64 size)
{
    RemoteEntry e;
    e.name = name;
    e.size = size;
    return e;
}

static QStringList names(const NavigationState& nav)
{
    QStringList out;
    for (const auto& it : nav.items())
        out << it.name;
    return out;
}

class NavigationStateTest : public ::testing::Test {
protected:
    // Brings the state to a listed directory.
    static void listed(NavigationState& nav, const QVector<RemoteEntry>& entries)
    {
        const auto cmd = nav.requestRefresh();
        ASSERT_EQ(cmd.type, CommandType::Refresh);
        nav.refreshCompleted(entries);
    }
};

TEST_F(NavigationStateTest, StartsEmptyWithoutSelection)
{
    NavigationState nav("/home/alice/");
    EXPECT_EQ(nav.currentPath(), "/home/alice");
    EXPECT_TRUE(nav.items().isEmpty());
    EXPECT_EQ(nav.selectedIndex(), -1);
    EXPECT_FALSE(nav.isRefreshPending());
}

TEST_F(NavigationStateTest, DirectoriesFirstThenByName)
{
    NavigationState nav("/srv");
    listed(nav, {fileEntry("zeta.txt", 1), dirEntry("beta"), fileEntry("Alpha.txt", 2),
                 dirEntry("alpha"), fileEntry("alpha.txt", 3)});

    EXPECT_EQ(names(nav), (QStringList{"..", "alpha", "beta", "Alpha.txt", "alpha.txt", "zeta.txt"}));
    EXPECT_EQ(nav.items()[0].kind, Kind::ParentLink);
    EXPECT_EQ(nav.items()[1].kind, Kind::Directory);
    EXPECT_EQ(nav.items()[3].kind, Kind::File);
    EXPECT_EQ(nav.items()[3].size, 2u);
    EXPECT_EQ(nav.selectedIndex(), 0);
}

TEST_F(NavigationStateTest, NoParentLinkAtRoots)
{
    for (const QString& root : {QString("/"), QString("."), QString("~")}) {
        NavigationState nav(root);
        listed(nav, {fileEntry("f", 1)});
        ASSERT_EQ(nav.items().size(), 1) << root.toStdString();
        EXPECT_EQ(nav.items()[0].kind, Kind::File);
    }
}

TEST_F(NavigationStateTest, CustomRootsControlParentLink)
{
    NavigationState nav("/srv/ftp", QStringList{"/srv/ftp"});
    listed(nav, {fileEntry("f", 1)});
    EXPECT_EQ(nav.items().size(), 1);
}

TEST_F(NavigationStateTest, EmptyListingAtRootHasNoSelection)
{
    NavigationState nav("/");
    listed(nav, {});
    EXPECT_TRUE(nav.items().isEmpty());
    EXPECT_EQ(nav.selectedIndex(), -1);

    nav.moveDown();
    nav.moveUp();
    EXPECT_EQ(nav.selectedIndex(), -1);
    EXPECT_EQ(nav.activateSelected(false).type, CommandType::None);
}

TEST_F(NavigationStateTest, SelectionWrapsModuloLength)
{
    NavigationState nav("/");
    listed(nav, {fileEntry("a", 1), fileEntry("b", 1), fileEntry("c", 1)});
    const int L = nav.items().size();

    for (int n = 0; n < 7; ++n) {
        nav.setSelectedIndex(1);
        for (int k = 0; k < n; ++k) nav.moveDown();
        EXPECT_EQ(nav.selectedIndex(), (1 + n) % L);

        nav.setSelectedIndex(1);
        for (int k = 0; k < n; ++k) nav.moveUp();
        EXPECT_EQ(nav.selectedIndex(), ((1 - n) % L + L) % L);
    }
}

TEST_F(NavigationStateTest, ParentLinkPopsSegmentAndRequestsOneRefresh)
{
    NavigationState nav("/a/b");
    listed(nav, {fileEntry("x", 1)});
    ASSERT_EQ(nav.items()[0].kind, Kind::ParentLink);

    const auto cmd = nav.activate(0, false);
    EXPECT_EQ(cmd.type, CommandType::Refresh);
    EXPECT_EQ(cmd.path, "/a");
    EXPECT_EQ(nav.currentPath(), "/a");
    EXPECT_TRUE(nav.isRefreshPending());

    // Nothing else is requested until the listing arrives.
    EXPECT_EQ(nav.activate(0, false).type, CommandType::None);
    EXPECT_EQ(nav.requestRefresh().type, CommandType::None);
}

TEST_F(NavigationStateTest, DirectoryActivationPushesSegment)
{
    NavigationState nav("/data");
    listed(nav, {dirEntry("sub"), fileEntry("a.txt", 10)});

    const auto cmd = nav.activate(1, false);
    EXPECT_EQ(cmd.type, CommandType::Refresh);
    EXPECT_EQ(cmd.path, "/data/sub");
    EXPECT_EQ(nav.currentPath(), "/data/sub");
}

TEST_F(NavigationStateTest, ModifiedDirectoryActivationDownloads)
{
    NavigationState nav("/data");
    listed(nav, {dirEntry("sub"), fileEntry("a.txt", 10)});

    const auto cmd = nav.activate(1, true);
    EXPECT_EQ(cmd.type, CommandType::DownloadDirectory);
    EXPECT_EQ(cmd.path, "/data/sub");
    EXPECT_EQ(nav.currentPath(), "/data");
    EXPECT_FALSE(nav.isRefreshPending());
}

TEST_F(NavigationStateTest, FileActivationDownloadsWithSize)
{
    NavigationState nav("/data");
    listed(nav, {dirEntry("sub"), fileEntry("a.txt", 10)});

    for (bool modified : {false, true}) {
        const auto cmd = nav.activate(2, modified);
        EXPECT_EQ(cmd.type, CommandType::DownloadFile);
        EXPECT_EQ(cmd.path, "/data/a.txt");
        EXPECT_EQ(cmd.name, "a.txt");
        EXPECT_EQ(cmd.size, 10u);
    }
    EXPECT_EQ(nav.currentPath(), "/data");
}

TEST_F(NavigationStateTest, RelativePathsNavigate)
{
    NavigationState nav(".");
    listed(nav, {dirEntry("docs")});

    EXPECT_EQ(nav.activate(0, false).path, "docs");
    nav.refreshCompleted({fileEntry("readme", 4)});
    EXPECT_EQ(nav.items()[0].kind, Kind::ParentLink);

    EXPECT_EQ(nav.activate(0, false).path, ".");
}

TEST_F(NavigationStateTest, RefreshFailureKeepsItemsAndRevertsPath)
{
    NavigationState nav("/data");
    listed(nav, {dirEntry("locked"), fileEntry("a.txt", 10)});
    const QStringList before = names(nav);
    nav.moveDown();
    const int selected = nav.selectedIndex();

    nav.activate(1, false);
    EXPECT_EQ(nav.currentPath(), "/data/locked");

    nav.refreshFailed("Permission denied");
    EXPECT_FALSE(nav.isRefreshPending());
    EXPECT_EQ(nav.currentPath(), "/data");
    EXPECT_EQ(names(nav), before);
    EXPECT_EQ(nav.selectedIndex(), selected);
    EXPECT_TRUE(nav.log().lines().last().contains("Permission denied"));
}

TEST_F(NavigationStateTest, MovesStillWorkWhileRefreshPending)
{
    NavigationState nav("/");
    listed(nav, {fileEntry("a", 1), fileEntry("b", 1)});
    nav.requestRefresh();

    nav.moveDown();
    EXPECT_EQ(nav.selectedIndex(), 1);
}

TEST_F(NavigationStateTest, OutOfRangeActivationIsIgnored)
{
    NavigationState nav("/");
    listed(nav, {fileEntry("a", 1)});
    EXPECT_EQ(nav.activate(5, false).type, CommandType::None);
    EXPECT_EQ(nav.activate(-1, false).type, CommandType::None);
}

TEST_F(NavigationStateTest, LogsFetchAndCount)
{
    NavigationState nav("/a");
    listed(nav, {fileEntry("x", 1), fileEntry("y", 1)});

    const QStringList lines = nav.log().lines();
    EXPECT_TRUE(lines.contains("Fetching files from '/a'..."));
    EXPECT_EQ(lines.last(), "Found 3 items.");
}
