// *****************************************************************************
// * This file is part of the RemoteFs project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef SCOPE_GUARD_H_5620318746190253
#define SCOPE_GUARD_H_5620318746190253

#include <cassert>
#include <exception>
#include <type_traits>
#include <utility>


namespace rfs
{
/*  Scope Guard

        auto guardSession = rfs::makeGuard<ScopeGuardRunMode::onExit>([&] { handle.release(); });
            ...
        guardSession.dismiss();

    Scope Exit:
        RFS_ON_SCOPE_EXIT(cleanUp());
        RFS_ON_SCOPE_FAIL(undoTemporaryWork());                    */

enum class ScopeGuardRunMode
{
    onExit,
    onFail
};


//cleanup code running while an exception is in flight must be nothrow: report errors via logExtraError() instead
template <typename F> inline
void runScopeGuardDestructor(F& fun, bool failed, std::integral_constant<ScopeGuardRunMode, ScopeGuardRunMode::onExit>)
{
    (void)failed;
    fun(); //throw X (only if !failed)
}


template <typename F> inline
void runScopeGuardDestructor(F& fun, bool failed, std::integral_constant<ScopeGuardRunMode, ScopeGuardRunMode::onFail>) noexcept
{
    if (failed)
        fun(); //nothrow!
}


template <ScopeGuardRunMode runMode, typename F>
class ScopeGuard
{
public:
    explicit ScopeGuard(const F&  fun) : fun_(fun) {}
    explicit ScopeGuard(      F&& fun) : fun_(std::move(fun)) {}

    ScopeGuard(ScopeGuard&& tmp) :
        fun_(std::move(tmp.fun_)),
        exceptionCount_(tmp.exceptionCount_),
        dismissed_(tmp.dismissed_) { tmp.dismissed_ = true; }

    ~ScopeGuard() noexcept(runMode == ScopeGuardRunMode::onFail)
    {
        if (!dismissed_)
        {
            const bool failed = std::uncaught_exceptions() > exceptionCount_;
            runScopeGuardDestructor(fun_, failed, std::integral_constant<ScopeGuardRunMode, runMode>());
        }
    }

    void dismiss() { dismissed_ = true; }

private:
    ScopeGuard           (const ScopeGuard&) = delete;
    ScopeGuard& operator=(const ScopeGuard&) = delete;

    const F fun_;
    const int exceptionCount_ = std::uncaught_exceptions();
    bool dismissed_ = false;
};


template <ScopeGuardRunMode runMode, class F> inline
auto makeGuard(F&& fun) { return ScopeGuard<runMode, std::decay_t<F>>(std::forward<F>(fun)); }
}

#define RFS_CONCAT_SUB(X, Y) X ## Y
#define RFS_CONCAT(X, Y) RFS_CONCAT_SUB(X, Y)

#define RFS_CHECK_CASE_FOR_CONSTANT(X) case X: return #X


#define RFS_ON_SCOPE_EXIT(X)    [[maybe_unused]] auto RFS_CONCAT(scopeGuard, __LINE__) = rfs::makeGuard<rfs::ScopeGuardRunMode::onExit   >([&]{ X; });
#define RFS_ON_SCOPE_FAIL(X)    [[maybe_unused]] auto RFS_CONCAT(scopeGuard, __LINE__) = rfs::makeGuard<rfs::ScopeGuardRunMode::onFail   >([&]{ X; });

#endif //SCOPE_GUARD_H_5620318746190253
