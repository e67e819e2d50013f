// *****************************************************************************
// * This file is part of the RemoteFs project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef PATH_LOCK_H_2209854713306618
#define PATH_LOCK_H_2209854713306618

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>


namespace rfs
{
/*  RAII guard for a named lock on a canonical remote path (see getLockKey())
    - move-only: unlocks exactly once, when the last owner goes away
    - distinct keys never contend
    - NOT recursive: acquiring the same key twice from one thread deadlocks        */
class PathLock
{
public:
    PathLock(const std::string& lockKey, const std::function<void()>& unlock) : lockKey_(lockKey), unlock_(unlock) {}

    PathLock(PathLock&& tmp) noexcept : lockKey_(std::move(tmp.lockKey_)), unlock_(std::exchange(tmp.unlock_, nullptr)) {}
    PathLock& operator=(PathLock&& tmp) noexcept
    {
        release();
        lockKey_ = std::move(tmp.lockKey_);
        unlock_ = std::exchange(tmp.unlock_, nullptr);
        return *this;
    }

    ~PathLock() { release(); }

    const std::string& getKey() const { return lockKey_; }

    void release() //nothrow
    {
        if (unlock_)
            std::exchange(unlock_, nullptr)();
    }

private:
    PathLock           (const PathLock&) = delete;
    PathLock& operator=(const PathLock&) = delete;

    std::string lockKey_;
    std::function<void()> unlock_; //nothrow!
};


class PathLockProvider
{
public:
    virtual ~PathLockProvider() {}

    virtual PathLock acquire(const std::string& lockKey) = 0; //blocks until available
    virtual std::optional<PathLock> tryAcquire(const std::string& lockKey) = 0;
    virtual bool isLocked(const std::string& lockKey) = 0;
};


//process-local locks; share one instance between all file systems accessing the same server
std::shared_ptr<PathLockProvider> createLocalPathLockProvider();
}

#endif //PATH_LOCK_H_2209854713306618
