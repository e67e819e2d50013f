// *****************************************************************************
// * This file is part of the RemoteFs project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef THREAD_H_6491837502218754
#define THREAD_H_6491837502218754

#include <mutex>
#include <thread>


namespace rfs
{
//exception thrown into a worker thread to make it leave its current blocking call
class ThreadStopRequest {};


//thread-safe access to an arbitrary value
template <class T>
class Protected
{
public:
    Protected() {}
    explicit Protected(T& value) : value_(value) {}

    template <class Function>
    auto access(Function fun) //-> decltype(fun(std::declval<T&>()))
    {
        std::lock_guard dummy(lockValue_);
        return fun(value_);
    }

private:
    Protected           (const Protected&) = delete;
    Protected& operator=(const Protected&) = delete;

    std::mutex lockValue_;
    T value_{};
};


//std::thread that joins on destruction; a still-running worker must be told to stop *before* this happens!
class JoiningThread
{
public:
    JoiningThread() {}
    template <class Function>
    explicit JoiningThread(Function&& f) : stdThread_(std::forward<Function>(f)) {}

    JoiningThread           (JoiningThread&& tmp) noexcept = default;
    JoiningThread& operator=(JoiningThread&& tmp) noexcept { join(); stdThread_ = std::move(tmp.stdThread_); return *this; }

    ~JoiningThread() { join(); }

    void join()
    {
        if (stdThread_.joinable())
            stdThread_.join();
    }

private:
    std::thread stdThread_;
};
}

#endif //THREAD_H_6491837502218754
