// *****************************************************************************
// * This file is part of the RemoteFs project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef EXTRA_LOG_H_2985710649327718
#define EXTRA_LOG_H_2985710649327718

#include <functional>
#include <utility>
#include "error_log.h"
#include "thread.h"

/*  process-wide log for messages that have no other way to reach the user, e.g.
    - errors while an exception is in flight
    - cleanup errors (session release, pre-release hooks)
    - advisory notices of long-running operations                              */

namespace rfs
{
namespace impl
{
class ExtraLog
{
public:
    ~ExtraLog()
    {
        if (!log_.empty() && reportOutstandingLog_)
            reportOutstandingLog_(log_);
    }

    void init(const std::function<void(const ErrorLog& log)>& reportOutstandingLog) { reportOutstandingLog_ = reportOutstandingLog; }

    void setSink(const std::function<void(const LogEntry& entry)>& sink) { sink_ = sink; }

    ErrorLog fetchLog() { return std::exchange(log_, ErrorLog()); }

    void log(const std::string& msg, MessageType type) //nothrow!
    {
        logMsg(log_, msg, type);
        if (sink_)
            sink_(log_.back());
    }

private:
    ErrorLog log_;
    std::function<void(const ErrorLog& log)> reportOutstandingLog_;
    std::function<void(const LogEntry& entry)> sink_; //optional; nothrow!
};


//one instance per process: must not live inside the accessExtraLog() template (one static per lambda type!)
inline
Protected<ExtraLog>& getGlobalExtraLog()
{
    static Protected<ExtraLog> globalExtraLog; //thread-safe init
    return globalExtraLog;
}


template <class Function>
auto accessExtraLog(Function fun)
{
    return getGlobalExtraLog().access([&](ExtraLog& log) { return fun(log); });
}
}

inline
void initExtraLog(const std::function<void(const ErrorLog& log)>& reportOutstandingLog /*nothrow! runs during global shutdown!*/)
{
    impl::accessExtraLog([&](impl::ExtraLog& el) { el.init(reportOutstandingLog); });
}


//forward each entry as it is logged, e.g. to the application's own logger
inline
void setExtraLogSink(const std::function<void(const LogEntry& entry)>& sink /*nothrow! called under lock!*/)
{
    impl::accessExtraLog([&](impl::ExtraLog& el) { el.setSink(sink); });
}


inline
ErrorLog fetchExtraLog()
{
    return impl::accessExtraLog([](impl::ExtraLog& el) { return el.fetchLog(); });
}


inline void logExtraError  (const std::string& msg) { impl::accessExtraLog([&](impl::ExtraLog& el) { el.log(msg, MSG_TYPE_ERROR); }); } //
inline void logExtraWarning(const std::string& msg) { impl::accessExtraLog([&](impl::ExtraLog& el) { el.log(msg, MSG_TYPE_WARNING); }); } //nothrow!
inline void logExtraInfo   (const std::string& msg) { impl::accessExtraLog([&](impl::ExtraLog& el) { el.log(msg, MSG_TYPE_INFO); }); } //
}

#endif //EXTRA_LOG_H_2985710649327718
