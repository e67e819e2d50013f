// *****************************************************************************
// * This file is part of the RemoteFs project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "connection_error.h"

using namespace rfs;


const char* rfs::getConnectionErrorLabel(ConnectionErrorType type)
{
    switch (type)
    {
        case ConnectionErrorType::timeout:
            return "Connection timeout";
        case ConnectionErrorType::cannotReach:
            return "Cannot reach server";
        case ConnectionErrorType::unknownHost:
            return "Unknown host";
        case ConnectionErrorType::invalidCredentials:
            return "Invalid credentials";
        case ConnectionErrorType::serviceUnavailable:
            return "Service unavailable";
        case ConnectionErrorType::connectivity:
            return "Connectivity error";
        case ConnectionErrorType::generic:
            return "Connection failure";
    }
    return "Connection failure";
}


ConnectionErrorType rfs::classifyReplyCode(int replyCode)
{
    switch (replyCode)
    {
        case 501: //"Syntax error in parameters or arguments." e.g. empty user name
        case 530: //"User not logged in."
            return ConnectionErrorType::invalidCredentials;
        case 421: //"Service not available, closing control connection."
            return ConnectionErrorType::serviceUnavailable;
        case 0:
            return ConnectionErrorType::generic;
        default:
            return ConnectionErrorType::connectivity;
    }
}
