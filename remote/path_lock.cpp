// *****************************************************************************
// * This file is part of the RemoteFs project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "path_lock.h"
#include <condition_variable>
#include <mutex>
#include <set>

using namespace rfs;


namespace
{
class LocalPathLockProvider : public PathLockProvider, public std::enable_shared_from_this<LocalPathLockProvider>
{
public:
    PathLock acquire(const std::string& lockKey) override
    {
        {
            std::unique_lock dummy(lockAdmin_);
            conditionUnlocked_.wait(dummy, [&] { return !lockedKeys_.contains(lockKey); });
            lockedKeys_.insert(lockKey);
        }
        return makeLock(lockKey);
    }

    std::optional<PathLock> tryAcquire(const std::string& lockKey) override
    {
        {
            std::lock_guard dummy(lockAdmin_);
            if (!lockedKeys_.insert(lockKey).second)
                return {};
        }
        return makeLock(lockKey);
    }

    bool isLocked(const std::string& lockKey) override
    {
        std::lock_guard dummy(lockAdmin_);
        return lockedKeys_.contains(lockKey);
    }

private:
    PathLock makeLock(const std::string& lockKey)
    {
        //keep provider alive while locks are held
        return PathLock(lockKey, [provider = shared_from_this(), lockKey] { provider->unlock(lockKey); });
    }

    void unlock(const std::string& lockKey)
    {
        {
            std::lock_guard dummy(lockAdmin_);
            lockedKeys_.erase(lockKey);
        }
        conditionUnlocked_.notify_all();
    }

    std::mutex lockAdmin_;
    std::set<std::string> lockedKeys_;
    std::condition_variable conditionUnlocked_;
};
}


std::shared_ptr<PathLockProvider> rfs::createLocalPathLockProvider()
{
    return std::make_shared<LocalPathLockProvider>();
}
