// *****************************************************************************
// * This file is part of the RemoteFs project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef STREAM_BUFFER_H_8813420957613204
#define STREAM_BUFFER_H_8813420957613204

#include <algorithm>
#include <cassert>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <exception>
#include <mutex>
#include <stdexcept>
#include "string_tools.h"


namespace rfs
{
/*  implement pull-based streaming on top of libcurl's callback-based design:
        producer: worker thread inside curl_easy_perform() => write()
        consumer: caller of InputStream::tryRead()          => tryRead()

    both sides block while the buffer is full/empty; errors are forwarded to the other side   */
class AsyncStreamBuffer
{
public:
    explicit AsyncStreamBuffer(size_t capacity) : capacity_(capacity) {}

    //context of input thread, blocking
    size_t tryRead(void* buffer, size_t bytesToRead) //throw <write error>; may return short; only 0 means EOF! CONTRACT: bytesToRead > 0!
    {
        if (bytesToRead == 0) //"read() with a count of 0 returns zero" => indistinguishable from end of file! => check!
            throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");

        size_t bytesRead = 0;
        {
            std::unique_lock dummy(lockStream_);
            assert(!errorRead_);

            conditionBytesWritten_.wait(dummy, [this] { return errorWrite_ || !buf_.empty() || eof_; });

            if (errorWrite_)
                std::rethrow_exception(errorWrite_); //throw <write error>

            bytesRead = std::min(bytesToRead, buf_.size());
            std::copy(buf_.begin(), buf_.begin() + bytesRead, static_cast<std::byte*>(buffer));
            buf_.erase(buf_.begin(), buf_.begin() + bytesRead);
            totalBytesRead_ += bytesRead;
        }
        if (bytesRead > 0)
            conditionBytesRead_.notify_all(); //...*outside* the lock
        return bytesRead;
    }

    //context of output thread, blocking
    void write(const void* buffer, size_t bytesToWrite) //throw <read error>
    {
        std::unique_lock dummy(lockStream_);
        assert(!eof_ && !errorWrite_);

        while (bytesToWrite > 0)
        {
            conditionBytesRead_.wait(dummy, [this] { return errorRead_ || buf_.size() < capacity_; });

            if (errorRead_)
                std::rethrow_exception(errorRead_); //throw <read error>

            const size_t junkSize = std::min(bytesToWrite, capacity_ - buf_.size());
            const auto junkBegin = static_cast<const std::byte*>(buffer);
            buf_.insert(buf_.end(), junkBegin, junkBegin + junkSize);
            totalBytesWritten_ += junkSize;

            buffer = junkBegin + junkSize;
            bytesToWrite -= junkSize;

            dummy.unlock();
            conditionBytesWritten_.notify_all();
            dummy.lock();
        }
    }

    //context of output thread
    void closeStream()
    {
        {
            std::lock_guard dummy(lockStream_);
            assert(!eof_ && !errorWrite_);
            eof_ = true;
        }
        conditionBytesWritten_.notify_all();
    }

    //context of input thread
    void setReadError(const std::exception_ptr& error)
    {
        {
            std::lock_guard dummy(lockStream_);
            assert(error);
            if (!errorRead_)
                errorRead_ = error;
        }
        conditionBytesRead_.notify_all();
    }

    //context of output thread
    void setWriteError(const std::exception_ptr& error)
    {
        {
            std::lock_guard dummy(lockStream_);
            assert(error);
            if (!errorWrite_)
                errorWrite_ = error;
        }
        conditionBytesWritten_.notify_all();
    }

    uint64_t getTotalBytesWritten() const { std::lock_guard dummy(lockStream_); return totalBytesWritten_; }
    uint64_t getTotalBytesRead   () const { std::lock_guard dummy(lockStream_); return totalBytesRead_; }

private:
    AsyncStreamBuffer           (const AsyncStreamBuffer&) = delete;
    AsyncStreamBuffer& operator=(const AsyncStreamBuffer&) = delete;

    mutable std::mutex lockStream_;
    const size_t capacity_;
    std::deque<std::byte> buf_; //prefetch buffer
    bool eof_ = false;
    std::exception_ptr errorWrite_;
    std::exception_ptr errorRead_;

    uint64_t totalBytesWritten_ = 0;
    uint64_t totalBytesRead_    = 0;

    std::condition_variable conditionBytesWritten_;
    std::condition_variable conditionBytesRead_;
};
}

#endif //STREAM_BUFFER_H_8813420957613204
