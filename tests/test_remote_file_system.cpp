// *****************************************************************************
// * This file is part of the RemoteFs project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include <condition_variable>
#include <mutex>
#include <thread>
#include <gtest/gtest.h>
#include <remote/remote_file_system.h>
#include "fake_ftp_server.h"

using namespace rfs;
using namespace rfs::test;


namespace
{
struct RemoteFileSystemTest : public testing::Test
{
    RemoteFileSystemTest() : fs(makeTestSettings(), server.makeClientFactory(), createLocalPathLockProvider())
    {
        server.addFile("/a/f1", "0123456789");
        server.addFile("/a/b/f2", "abcde");
    }

    void write(const std::string& path, const std::string& content, WriteMode mode, bool createParentDirs = false)
    {
        MemoryInputStream stream(content);
        fs.write(RemotePath(path), stream, mode, true /*lock*/, createParentDirs);
    }

    FileAttributes getAttributes(const std::string& path)
    {
        std::optional<FileAttributes> attr = fs.getFileAttributes(RemotePath(path));
        if (!attr)
            throw FileError("Cannot find " + path);
        return *attr;
    }

    FakeFtpServer server;
    RemoteFileSystem fs;
};
}


TEST_F(RemoteFileSystemTest, FileAttributes)
{
    const FileAttributes attr = getAttributes("a/f1");
    EXPECT_TRUE(attr.isRegularFile());
    EXPECT_EQ(attr.getSize(), 10u);
    EXPECT_EQ(attr.getPath(), RemotePath("a/f1"));

    EXPECT_TRUE(getAttributes("a/b").isDirectory());
    EXPECT_TRUE(fs.getFileAttributes(RemotePath())->isDirectory()); //server root
    EXPECT_FALSE(fs.getFileAttributes(RemotePath("a/missing")));
    EXPECT_FALSE(fs.getFileAttributes(RemotePath("missing/f1")));
}


TEST_F(RemoteFileSystemTest, ListSkipsVirtualEntries)
{
    std::vector<std::string> names;
    for (const FileAttributes& attr : fs.list(RemotePath("a")))
        names.push_back(attr.getName());

    EXPECT_EQ(names, (std::vector<std::string>{"b", "f1"}));
    EXPECT_THROW(fs.list(RemotePath("missing")), ErrorItemNotFound);
}


TEST_F(RemoteFileSystemTest, ReadIsLazy)
{
    const FileAttributes attr = getAttributes("a/f1");
    const size_t acquiredBefore = fs.getConnectionSource().getStats().acquired;

    std::unique_ptr<LazyRemoteStream> stream = fs.read(attr);
    EXPECT_EQ(fs.getConnectionSource().getStats().acquired, acquiredBefore);
    EXPECT_EQ(loadStream(*stream), "0123456789");
    EXPECT_EQ(fs.getConnectionSource().getStats().acquired, acquiredBefore + 1);
}


TEST_F(RemoteFileSystemTest, WriteModes)
{
    write("a/new", "hello", WriteMode::createNew);
    EXPECT_EQ(server.getContent("/a/new"), "hello");

    write("a/new", " world", WriteMode::append);
    EXPECT_EQ(server.getContent("/a/new"), "hello world");

    write("a/new", "replaced", WriteMode::overwrite);
    EXPECT_EQ(server.getContent("/a/new"), "replaced");

    write("a/appended", "created", WriteMode::append);
    EXPECT_EQ(server.getContent("/a/appended"), "created");
}


TEST_F(RemoteFileSystemTest, WriteCreateNewOnExistingFile)
{
    try
    {
        write("a/f1", "new", WriteMode::createNew);
        FAIL() << "write did not fail";
    }
    catch (const ErrorTargetExisting& e)
    {
        EXPECT_NE(e.toString().find("Use a different write mode or point to a path which doesn't exist"), std::string::npos);
    }
    EXPECT_EQ(server.getContent("/a/f1"), "0123456789");
}


TEST_F(RemoteFileSystemTest, WriteOntoDirectory)
{
    EXPECT_THROW(write("a/b", "data", WriteMode::overwrite), ErrorIllegalPath);
    EXPECT_TRUE(server.isFolder("/a/b"));
}


TEST_F(RemoteFileSystemTest, WriteWithMissingParent)
{
    try
    {
        write("x/y/new", "data", WriteMode::createNew);
        FAIL() << "write did not fail";
    }
    catch (const ErrorIllegalPath& e)
    {
        EXPECT_NE(e.toString().find("because path to it doesn't exist"), std::string::npos);
    }
    EXPECT_FALSE(server.exists("/x"));

    write("x/y/new", "data", WriteMode::createNew, true /*createParentDirs*/);
    EXPECT_EQ(server.getContent("/x/y/new"), "data");
}


TEST_F(RemoteFileSystemTest, WriteOnLockedPath)
{
    const PathLock lock = fs.getConnectionSource().getLockProvider()->acquire(getLockKey(RemotePath("a/f1")));

    MemoryInputStream stream("data");
    EXPECT_THROW(fs.write(RemotePath("a/f1"), stream, WriteMode::overwrite, true  /*lock*/, false), ErrorFileLocked);
    EXPECT_THROW(fs.write(RemotePath("a/f1"), stream, WriteMode::overwrite, false /*lock*/, false), ErrorFileLocked);
    EXPECT_EQ(server.getContent("/a/f1"), "0123456789");
}


TEST_F(RemoteFileSystemTest, RemoveTree)
{
    fs.remove(RemotePath("a"));
    EXPECT_FALSE(server.exists("/a"));
    EXPECT_THROW(fs.remove(RemotePath("a")), ErrorItemNotFound);
}


TEST_F(RemoteFileSystemTest, CreateDirectory)
{
    fs.createDirectory(RemotePath("x/y/z"));
    EXPECT_TRUE(server.isFolder("/x/y/z"));

    EXPECT_THROW(fs.createDirectory(RemotePath("a/b")), ErrorTargetExisting);
    EXPECT_THROW(fs.createDirectory(RemotePath("a/f1")), ErrorTargetExisting);
}


TEST_F(RemoteFileSystemTest, Rename)
{
    fs.rename(RemotePath("a/f1"), "g1", false);
    EXPECT_FALSE(server.exists("/a/f1"));
    EXPECT_EQ(server.getContent("/a/g1"), "0123456789");

    EXPECT_THROW(fs.rename(RemotePath("a/f1"), "h1", false), ErrorItemNotFound);
    EXPECT_THROW(fs.rename(RemotePath("a/g1"), "../escape", false), ErrorIllegalPath);
}


TEST_F(RemoteFileSystemTest, RenameOntoExistingItem)
{
    server.addFile("/a/g1", "old");

    EXPECT_THROW(fs.rename(RemotePath("a/f1"), "g1", false), ErrorTargetExisting);
    EXPECT_EQ(server.getContent("/a/g1"), "old");

    fs.rename(RemotePath("a/f1"), "g1", true);
    EXPECT_EQ(server.getContent("/a/g1"), "0123456789");
}


TEST_F(RemoteFileSystemTest, RenameFolder)
{
    fs.rename(RemotePath("a"), "c", false);
    EXPECT_EQ(server.getContent("/c/b/f2"), "abcde");
    EXPECT_FALSE(server.exists("/a"));
}


TEST_F(RemoteFileSystemTest, CopyTreeEndToEnd)
{
    fs.copy(getAttributes("a"), RemotePath("dest"), false);

    EXPECT_EQ(getAttributes("dest/f1").getSize(), 10u);
    EXPECT_EQ(getAttributes("dest/b/f2").getSize(), 5u);
    EXPECT_LE(server.getPeakConnections(), 2u);

    server.clearCommands();
    fs.remove(RemotePath("a"));

    std::vector<std::string> deletions;
    for (const std::string& cmd : server.getCommands())
        if (startsWith(cmd, "DELE ") || startsWith(cmd, "RMD "))
            deletions.push_back(cmd);
    EXPECT_EQ(deletions, (std::vector<std::string>{"DELE /a/f1", "DELE /a/b/f2", "RMD /a/b", "RMD /a"}));
}


TEST_F(RemoteFileSystemTest, CopiesToDisjointPathsRunConcurrently)
{
    std::mutex lockStores;
    std::condition_variable storeStarted;
    size_t storesRunning = 0;
    bool bothRunning = false;

    server.setOnStore([&](const std::string& serverPath)
    {
        std::unique_lock dummy(lockStores);
        ++storesRunning;
        storeStarted.notify_all();
        if (storeStarted.wait_for(dummy, std::chrono::seconds(5), [&] { return storesRunning >= 2; }))
            bothRunning = true;
    });

    const FileAttributes attr = getAttributes("a/f1");
    std::thread worker([&] { fs.copy(attr, RemotePath("t1"), false); });
    fs.copy(attr, RemotePath("t2"), false);
    worker.join();

    EXPECT_TRUE(bothRunning);
    EXPECT_EQ(server.getContent("/t1"), "0123456789");
    EXPECT_EQ(server.getContent("/t2"), "0123456789");
}


TEST_F(RemoteFileSystemTest, CopiesToSamePathAreSerialized)
{
    std::mutex lockStores;
    size_t storesRunning = 0;
    size_t maxStoresRunning = 0;

    server.setOnStore([&](const std::string& serverPath)
    {
        {
            std::lock_guard dummy(lockStores);
            maxStoresRunning = std::max(maxStoresRunning, ++storesRunning);
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        std::lock_guard dummy(lockStores);
        --storesRunning;
    });

    const FileAttributes attr = getAttributes("a/f1");
    int succeeded = 0;
    int targetExisting = 0;
    std::mutex lockResults;

    auto copyOnce = [&]
    {
        try
        {
            fs.copy(attr, RemotePath("same"), false);
            std::lock_guard dummy(lockResults);
            ++succeeded;
        }
        catch (const ErrorTargetExisting&)
        {
            std::lock_guard dummy(lockResults);
            ++targetExisting;
        }
    };
    std::thread worker(copyOnce);
    copyOnce();
    worker.join();

    EXPECT_EQ(maxStoresRunning, 1u);
    EXPECT_EQ(succeeded, 1); //the second copy sees the completed first one
    EXPECT_EQ(targetExisting, 1);
    EXPECT_EQ(server.getContent("/same"), "0123456789");
}


TEST_F(RemoteFileSystemTest, TestConnection)
{
    EXPECT_NO_THROW(fs.testConnection());

    RemoteFileSystem rejected(makeTestSettings(), server.makeClientFactory(), createLocalPathLockProvider());
    server.setLoginReplyCode(530);
    try
    {
        rejected.testConnection();
        FAIL() << "login did not fail";
    }
    catch (const ConnectionError& e)
    {
        EXPECT_EQ(e.getType(), ConnectionErrorType::invalidCredentials);
    }
}


TEST_F(RemoteFileSystemTest, DisplayPath)
{
    EXPECT_EQ(fs.getDisplayPath(RemotePath("a/f1")), "ftp://tester@ftp.example.com/a/f1");
    EXPECT_EQ(fs.getDisplayPath(RemotePath()), "ftp://tester@ftp.example.com");
}
