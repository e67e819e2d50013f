// *****************************************************************************
// * This file is part of the RemoteFs project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef ERROR_LOG_H_1860473226957105
#define ERROR_LOG_H_1860473226957105

#include <cassert>
#include <ctime>
#include <iterator>
#include <string>
#include <vector>


namespace rfs
{
enum MessageType
{
    MSG_TYPE_INFO    = 0x1,
    MSG_TYPE_WARNING = 0x2,
    MSG_TYPE_ERROR   = 0x4,
};

struct LogEntry
{
    time_t      time = 0;
    MessageType type = MSG_TYPE_ERROR;
    std::string message;
};

std::string formatMessage(const LogEntry& entry);

using ErrorLog = std::vector<LogEntry>;

void logMsg(ErrorLog& log, const std::string& msg, MessageType type, time_t time = std::time(nullptr));

struct ErrorLogStats
{
    int info    = 0;
    int warning = 0;
    int error   = 0;
};
ErrorLogStats getStats(const ErrorLog& log);







//######################## implementation ##########################
inline
void logMsg(ErrorLog& log, const std::string& msg, MessageType type, time_t time)
{
    log.push_back({time, type, msg});
}


inline
ErrorLogStats getStats(const ErrorLog& log)
{
    ErrorLogStats count;
    for (const LogEntry& entry : log)
        switch (entry.type)
        {
            case MSG_TYPE_INFO:
                ++count.info;
                break;
            case MSG_TYPE_WARNING:
                ++count.warning;
                break;
            case MSG_TYPE_ERROR:
                ++count.error;
                break;
        }
    assert(std::ssize(log) == count.info + count.warning + count.error);
    return count;
}


inline
std::string getMessageTypeLabel(MessageType type)
{
    switch (type)
    {
        case MSG_TYPE_INFO:
            return "Info";
        case MSG_TYPE_WARNING:
            return "Warning";
        case MSG_TYPE_ERROR:
            return "Error";
    }
    assert(false);
    return std::string();
}


inline
std::string formatMessage(const LogEntry& entry)
{
    std::string timeStamp;
    std::tm tm = {};
    if (::localtime_r(&entry.time, &tm))
    {
        char buf[32] = {};
        if (std::strftime(buf, sizeof(buf), "%H:%M:%S", &tm) != 0)
            timeStamp = buf;
    }

    const std::string prefix = '[' + timeStamp + "]  " + getMessageTypeLabel(entry.type) + ": ";

    //indent multi-line messages to align with the first line
    std::string msgFmt;
    for (const char c : entry.message)
    {
        msgFmt += c;
        if (c == '\n')
            msgFmt += std::string(prefix.size(), ' ');
    }
    return prefix + msgFmt;
}
}

#endif //ERROR_LOG_H_1860473226957105
