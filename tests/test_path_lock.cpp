// *****************************************************************************
// * This file is part of the RemoteFs project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include <atomic>
#include <thread>
#include <gtest/gtest.h>
#include <remote/path_lock.h>
#include <remote/remote_path.h>

using namespace rfs;


TEST(PathLock, DistinctKeysDoNotContend)
{
    const std::shared_ptr<PathLockProvider> provider = createLocalPathLockProvider();

    const PathLock lock1 = provider->acquire(getLockKey(RemotePath("a/f1")));
    const std::optional<PathLock> lock2 = provider->tryAcquire(getLockKey(RemotePath("a/f2")));
    EXPECT_TRUE(lock2);
    EXPECT_TRUE(provider->isLocked("/a/f1"));
    EXPECT_TRUE(provider->isLocked("/a/f2"));
    EXPECT_FALSE(provider->isLocked("/a"));
}


TEST(PathLock, SameKeyConflicts)
{
    const std::shared_ptr<PathLockProvider> provider = createLocalPathLockProvider();
    {
        const PathLock lock = provider->acquire("/a/f1");
        EXPECT_FALSE(provider->tryAcquire("/a/f1"));
    }
    EXPECT_FALSE(provider->isLocked("/a/f1"));
    EXPECT_TRUE(provider->tryAcquire("/a/f1"));
}


TEST(PathLock, MoveAndReleaseUnlockOnce)
{
    const std::shared_ptr<PathLockProvider> provider = createLocalPathLockProvider();

    PathLock lock1 = provider->acquire("/x");
    PathLock lock2 = std::move(lock1);
    lock1.release(); //moved-from: no-op
    EXPECT_TRUE(provider->isLocked("/x"));

    lock2.release();
    EXPECT_FALSE(provider->isLocked("/x"));
    lock2.release();

    const PathLock lock3 = provider->acquire("/x");
    EXPECT_EQ(lock3.getKey(), "/x");
}


TEST(PathLock, LockOutlivesProvider)
{
    std::optional<PathLock> lock;
    {
        const std::shared_ptr<PathLockProvider> provider = createLocalPathLockProvider();
        lock = provider->acquire("/y");
    }
    lock.reset(); //provider kept alive by the lock
}


TEST(PathLock, AcquireBlocksUntilReleased)
{
    const std::shared_ptr<PathLockProvider> provider = createLocalPathLockProvider();
    std::optional<PathLock> lock = provider->acquire("/a");
    std::atomic<bool> acquired = false;

    std::thread worker([&]
    {
        const PathLock lock2 = provider->acquire("/a");
        acquired = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(acquired);

    lock.reset();
    worker.join();
    EXPECT_TRUE(acquired);
}
