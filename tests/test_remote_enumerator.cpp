#include <gtest/gtest.h>

#include "FakeRemoteAccess.h"
#include "Transfer/RemoteEnumerator.h"

static QStringList pathsOf(const QVector<RemoteFile>& files)
{
    QStringList out;
    for (const auto& f : files)
        out << f.remotePath;
    return out;
}

TEST(RemoteEnumeratorTest, FlatDirectoryInListingOrder)
{
    FakeRemoteAccess remote;
    remote.addFile("/flat/c.bin", 3);
    remote.addFile("/flat/a.bin", 1);
    remote.addFile("/flat/b.bin", 2);

    RemoteEnumerator en(&remote);
    QVector<RemoteFile> files;
    QString err;
    ASSERT_TRUE(en.enumerate("/flat", &files, &err)) << err.toStdString();

    EXPECT_EQ(pathsOf(files), (QStringList{"/flat/c.bin", "/flat/a.bin", "/flat/b.bin"}));
    EXPECT_EQ(files[0].size, 3u);
    EXPECT_EQ(files[0].relativePath, "c.bin");
    EXPECT_EQ(en.directoriesListed(), 1);
}

TEST(RemoteEnumeratorTest, NestedTreeYieldsAllLeavesDepthFirst)
{
    FakeRemoteAccess remote;
    remote.addFile("/data/a.txt", 10);
    remote.addFile("/data/sub/b.txt", 5);
    remote.addFile("/data/sub/deeper/c.txt", 7);
    remote.addFile("/data/z.txt", 1);
    remote.addDir("/data/empty");

    RemoteEnumerator en(&remote);
    QVector<RemoteFile> files;
    ASSERT_TRUE(en.enumerate("/data", &files));

    EXPECT_EQ(pathsOf(files), (QStringList{"/data/a.txt", "/data/sub/b.txt",
                                           "/data/sub/deeper/c.txt", "/data/z.txt"}));
    EXPECT_EQ(files[2].relativePath, "sub/deeper/c.txt");
    EXPECT_EQ(en.directoriesListed(), 4);
}

TEST(RemoteEnumeratorTest, NestedListFailureAbortsWithoutPartialResult)
{
    FakeRemoteAccess remote;
    remote.addFile("/data/a.txt", 10);
    remote.addFile("/data/sub/b.txt", 5);
    remote.addFile("/data/tail.txt", 1);
    remote.failList("/data/sub", "Permission denied");

    RemoteEnumerator en(&remote);
    QVector<RemoteFile> files;
    files.push_back(RemoteFile());   // stale content must be cleared
    QString err;

    EXPECT_FALSE(en.enumerate("/data", &files, &err));
    EXPECT_TRUE(files.isEmpty());
    EXPECT_TRUE(err.contains("Permission denied"));
    EXPECT_TRUE(err.contains("/data/sub"));
}

TEST(RemoteEnumeratorTest, RootListFailure)
{
    FakeRemoteAccess remote;
    RemoteEnumerator en(&remote);
    QVector<RemoteFile> files;
    QString err;

    EXPECT_FALSE(en.enumerate("/missing", &files, &err));
    EXPECT_FALSE(err.isEmpty());
}

TEST(RemoteEnumeratorTest, DeepChainDoesNotRecurse)
{
    FakeRemoteAccess remote;
    QString path = "/deep";
    for (int i = 0; i < 300; ++i)
        path += QString("/d%1").arg(i);
    remote.addFile(path + "/leaf.txt", 4);

    RemoteEnumerator en(&remote);
    en.setMaxDepth(1000);
    QVector<RemoteFile> files;
    ASSERT_TRUE(en.enumerate("/deep", &files));
    ASSERT_EQ(files.size(), 1);
    EXPECT_EQ(files[0].remotePath, path + "/leaf.txt");
}

TEST(RemoteEnumeratorTest, DepthLimitIsAnError)
{
    FakeRemoteAccess remote;
    remote.addFile("/t/1/2/3/f", 1);

    RemoteEnumerator en(&remote);
    en.setMaxDepth(2);
    QVector<RemoteFile> files;
    QString err;

    EXPECT_FALSE(en.enumerate("/t", &files, &err));
    EXPECT_TRUE(err.contains("Maximum directory depth (2)"));
    EXPECT_TRUE(files.isEmpty());

    en.setMaxDepth(3);
    EXPECT_TRUE(en.enumerate("/t", &files, &err));
    EXPECT_EQ(files.size(), 1);
}

TEST(RemoteEnumeratorTest, SymlinkLoopIsSkippedWithWarning)
{
    FakeRemoteAccess remote;
    remote.addFile("/loop/a.txt", 2);
    remote.addLink("/loop/self", "/loop");

    RemoteEnumerator en(&remote);
    QVector<RemoteFile> files;
    QString err;
    ASSERT_TRUE(en.enumerate("/loop", &files, &err)) << err.toStdString();

    EXPECT_EQ(pathsOf(files), QStringList{"/loop/a.txt"});
    ASSERT_EQ(en.warnings().size(), 1);
    EXPECT_TRUE(en.warnings().first().contains("/loop/self"));
    EXPECT_EQ(remote.listCalls("/loop/self"), 0);
}

TEST(RemoteEnumeratorTest, CancelFlagStopsBeforeListing)
{
    FakeRemoteAccess remote;
    remote.addFile("/data/a.txt", 1);

    std::atomic_bool cancel { true };
    RemoteEnumerator en(&remote);
    en.setCancelFlag(&cancel);

    QVector<RemoteFile> files;
    QString err;
    EXPECT_FALSE(en.enumerate("/data", &files, &err));
    EXPECT_EQ(err, "Cancelled");
    EXPECT_EQ(remote.totalListCalls(), 0);
}
