// *****************************************************************************
// * This file is part of the RemoteFs project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef CONNECTION_ERROR_H_5402917386601283
#define CONNECTION_ERROR_H_5402917386601283

#include <rfs/file_error.h>


namespace rfs
{
enum class ConnectionErrorType
{
    timeout,
    cannotReach,
    unknownHost,
    invalidCredentials,
    serviceUnavailable,
    connectivity, //reply code available
    generic,
};


//raised only while acquiring a session
class ConnectionError : public FileError
{
public:
    ConnectionError(ConnectionErrorType type, int replyCode, const std::string& msg, const std::string& details) :
        FileError(msg, details), type_(type), replyCode_(replyCode) {}

    ConnectionErrorType getType() const { return type_; }
    int getReplyCode() const { return replyCode_; } //0 if not available

    //retry makes sense?
    bool isTransientError() const { return type_ == ConnectionErrorType::timeout || type_ == ConnectionErrorType::serviceUnavailable; }

private:
    ConnectionErrorType type_;
    int replyCode_;
};

const char* getConnectionErrorLabel(ConnectionErrorType type);

//login was rejected or the server sent a negative reply while connecting
ConnectionErrorType classifyReplyCode(int replyCode);
}

#endif //CONNECTION_ERROR_H_5402917386601283
