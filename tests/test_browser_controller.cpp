#include <gtest/gtest.h>

#include <QFileInfo>
#include <QTemporaryDir>

#include "BrowserController.h"
#include "FakeRemoteAccess.h"
#include "TestUtil.h"

using Action = BrowserController::InputAction;
using test_util::waitUntil;

class BrowserControllerTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        ASSERT_TRUE(m_dir.isValid());
        m_config.destinationDir = m_dir.path();
        m_config.tickMs = 10;
        m_config.launchDelayMs = 0;

        m_remote.addFile("/data/a.txt", QByteArray("0123456789"));
        m_remote.addFile("/data/sub/b.txt", QByteArray("hello"));
        m_remote.addDir("/data/locked");
        m_remote.failList("/data/locked", "Permission denied");
    }

    bool listed(BrowserController& c)
    {
        return waitUntil([&]() { return !c.snapshot().refreshPending; });
    }

    static QStringList names(const BrowserController::Snapshot& s)
    {
        QStringList out;
        for (const auto& it : s.items)
            out << it.name;
        return out;
    }

    // Moves the cursor onto the named row.
    static void selectByName(BrowserController& c, const QString& name)
    {
        const auto s = c.snapshot();
        for (int i = 0; i < s.items.size(); ++i) {
            if (s.items[i].name == name) {
                c.select(i);
                return;
            }
        }
        FAIL() << "no row " << name.toStdString();
    }

    QTemporaryDir m_dir;
    FakeRemoteAccess m_remote;
    AppConfig m_config;
};

TEST_F(BrowserControllerTest, StartListsInitialDirectory)
{
    BrowserController c(&m_remote, m_config, "/data");
    c.start();
    EXPECT_TRUE(c.snapshot().refreshPending);
    ASSERT_TRUE(listed(c));

    const auto s = c.snapshot();
    EXPECT_EQ(s.path, "/data");
    EXPECT_EQ(names(s), (QStringList{"..", "locked", "sub", "a.txt"}));
    EXPECT_EQ(s.selected, 0);
    EXPECT_TRUE(s.logLines.contains("Found 4 items."));
}

TEST_F(BrowserControllerTest, EnterDirectoryAndGoBack)
{
    BrowserController c(&m_remote, m_config, "/data");
    c.start();
    ASSERT_TRUE(listed(c));

    selectByName(c, "sub");
    c.handleInput(Action::Activate);
    ASSERT_TRUE(listed(c));
    EXPECT_EQ(c.snapshot().path, "/data/sub");
    EXPECT_EQ(names(c.snapshot()), (QStringList{"..", "b.txt"}));

    const int before = m_remote.listCalls("/data");
    c.handleInput(Action::Activate);   // ".." is selected after a refresh
    ASSERT_TRUE(listed(c));
    EXPECT_EQ(c.snapshot().path, "/data");
    EXPECT_EQ(m_remote.listCalls("/data"), before + 1);
}

TEST_F(BrowserControllerTest, ListFailureKeepsView)
{
    BrowserController c(&m_remote, m_config, "/data");
    c.start();
    ASSERT_TRUE(listed(c));
    const QStringList before = names(c.snapshot());

    selectByName(c, "locked");
    c.handleInput(Action::Activate);
    ASSERT_TRUE(listed(c));

    const auto s = c.snapshot();
    EXPECT_EQ(s.path, "/data");
    EXPECT_EQ(names(s), before);
    EXPECT_TRUE(s.logLines.last().contains("Permission denied"));
}

TEST_F(BrowserControllerTest, MoveKeysWrap)
{
    BrowserController c(&m_remote, m_config, "/data");
    c.start();
    ASSERT_TRUE(listed(c));

    c.handleInput(Action::MoveUp);
    EXPECT_EQ(c.snapshot().selected, 3);
    c.handleInput(Action::MoveDown);
    EXPECT_EQ(c.snapshot().selected, 0);
}

TEST_F(BrowserControllerTest, ActivateFileDownloadsIt)
{
    BrowserController c(&m_remote, m_config, "/data");
    c.start();
    ASSERT_TRUE(listed(c));

    selectByName(c, "a.txt");
    c.handleInput(Action::Activate);
    EXPECT_EQ(c.snapshot().path, "/data");

    ASSERT_TRUE(waitUntil([&]() { return c.snapshot().transfersCompleted == 1; }));
    EXPECT_EQ(test_util::readAll(m_dir.filePath("a.txt")), QByteArray("0123456789"));

    const auto s = c.snapshot();
    EXPECT_TRUE(s.logLines.contains("Starting download for 'a.txt'"));
    EXPECT_TRUE(s.logLines.contains("Download complete: a.txt"));
    EXPECT_FALSE(s.hasVisibleTransfer);
    EXPECT_TRUE(s.activeTransfers.isEmpty());
    EXPECT_EQ(s.transfersLaunched, 1);
    EXPECT_EQ(s.transfersFailed, 0);
}

TEST_F(BrowserControllerTest, ModifiedActivateDownloadsDirectory)
{
    BrowserController c(&m_remote, m_config, "/");
    c.start();
    ASSERT_TRUE(listed(c));

    selectByName(c, "data");
    c.handleInput(Action::Activate);
    ASSERT_TRUE(listed(c));

    selectByName(c, "sub");
    c.handleInput(Action::ActivateModified);
    EXPECT_EQ(c.snapshot().path, "/data");

    ASSERT_TRUE(waitUntil([&]() { return c.snapshot().transfersCompleted == 1; }));
    EXPECT_EQ(test_util::readAll(m_dir.filePath("b.txt")), QByteArray("hello"));

    const QStringList lines = c.snapshot().logLines;
    EXPECT_TRUE(lines.contains("Queueing directory 'sub' for download..."));
    EXPECT_TRUE(lines.contains("Found 1 files to download."));
}

TEST_F(BrowserControllerTest, ActivationIgnoredWhileListing)
{
    BrowserController c(&m_remote, m_config, "/data");
    c.start();
    ASSERT_TRUE(listed(c));

    m_remote.setListDelayMs(200);
    selectByName(c, "sub");
    c.handleInput(Action::Activate);
    ASSERT_TRUE(c.snapshot().refreshPending);

    c.handleInput(Action::Activate);
    c.handleInput(Action::ActivateModified);
    c.handleInput(Action::Refresh);

    ASSERT_TRUE(listed(c));
    EXPECT_EQ(c.snapshot().path, "/data/sub");
    EXPECT_EQ(m_remote.listCalls("/data/sub"), 1);
    EXPECT_EQ(c.snapshot().transfersLaunched, 0);
}

TEST_F(BrowserControllerTest, QuitStopsEverything)
{
    BrowserController c(&m_remote, m_config, "/data");
    int quitSignals = 0;
    QObject::connect(&c, &BrowserController::quitRequested, [&]() { quitSignals++; });

    c.start();
    ASSERT_TRUE(listed(c));

    c.handleInput(Action::Quit);
    EXPECT_TRUE(c.isQuitting());
    EXPECT_EQ(quitSignals, 1);
    EXPECT_TRUE(c.snapshot().shuttingDown);

    const int selected = c.snapshot().selected;
    c.handleInput(Action::MoveDown);
    c.handleInput(Action::Quit);
    EXPECT_EQ(c.snapshot().selected, selected);
    EXPECT_EQ(quitSignals, 1);
}

TEST_F(BrowserControllerTest, ListingArrivingAfterQuitIsDropped)
{
    m_remote.setListDelayMs(150);

    BrowserController c(&m_remote, m_config, "/data");
    c.start();
    c.handleInput(Action::Quit);

    // Let the background listing finish and its watcher fire.
    waitUntil([]() { return false; }, 400);

    EXPECT_TRUE(c.snapshot().items.isEmpty());
}

TEST_F(BrowserControllerTest, LogCapacityFollowsConfig)
{
    m_config.logLines = 10;

    BrowserController c(&m_remote, m_config, "/data");
    EXPECT_EQ(c.navigation().log().capacity(), 10);

    c.start();
    ASSERT_TRUE(listed(c));
    for (int i = 0; i < 20; ++i) {
        c.handleInput(Action::Refresh);
        ASSERT_TRUE(listed(c));
    }

    EXPECT_EQ(c.snapshot().logLines.size(), 10);
    EXPECT_EQ(c.navigation().log().tail(1), QStringList{"Found 4 items."});
}
