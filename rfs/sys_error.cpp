// *****************************************************************************
// * This file is part of the RemoteFs project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "sys_error.h"

using namespace rfs;


namespace
{
std::string formatSystemErrorCode(ErrorCode ec)
{
    switch (ec) //codes to expect from socket and file handling
    {
            RFS_CHECK_CASE_FOR_CONSTANT(EPERM);
            RFS_CHECK_CASE_FOR_CONSTANT(ENOENT);
            RFS_CHECK_CASE_FOR_CONSTANT(EINTR);
            RFS_CHECK_CASE_FOR_CONSTANT(EIO);
            RFS_CHECK_CASE_FOR_CONSTANT(EBADF);
            RFS_CHECK_CASE_FOR_CONSTANT(EAGAIN);
            RFS_CHECK_CASE_FOR_CONSTANT(ENOMEM);
            RFS_CHECK_CASE_FOR_CONSTANT(EACCES);
            RFS_CHECK_CASE_FOR_CONSTANT(EBUSY);
            RFS_CHECK_CASE_FOR_CONSTANT(EEXIST);
            RFS_CHECK_CASE_FOR_CONSTANT(ENOTDIR);
            RFS_CHECK_CASE_FOR_CONSTANT(EISDIR);
            RFS_CHECK_CASE_FOR_CONSTANT(EINVAL);
            RFS_CHECK_CASE_FOR_CONSTANT(EMFILE);
            RFS_CHECK_CASE_FOR_CONSTANT(ENOSPC);
            RFS_CHECK_CASE_FOR_CONSTANT(EPIPE);
            RFS_CHECK_CASE_FOR_CONSTANT(ENAMETOOLONG);
            RFS_CHECK_CASE_FOR_CONSTANT(ENOTEMPTY);
            RFS_CHECK_CASE_FOR_CONSTANT(ENOTSOCK);
            RFS_CHECK_CASE_FOR_CONSTANT(EADDRINUSE);
            RFS_CHECK_CASE_FOR_CONSTANT(EADDRNOTAVAIL);
            RFS_CHECK_CASE_FOR_CONSTANT(ENETDOWN);
            RFS_CHECK_CASE_FOR_CONSTANT(ENETUNREACH);
            RFS_CHECK_CASE_FOR_CONSTANT(ENETRESET);
            RFS_CHECK_CASE_FOR_CONSTANT(ECONNABORTED);
            RFS_CHECK_CASE_FOR_CONSTANT(ECONNRESET);
            RFS_CHECK_CASE_FOR_CONSTANT(ENOTCONN);
            RFS_CHECK_CASE_FOR_CONSTANT(ETIMEDOUT);
            RFS_CHECK_CASE_FOR_CONSTANT(ECONNREFUSED);
            RFS_CHECK_CASE_FOR_CONSTANT(EHOSTDOWN);
            RFS_CHECK_CASE_FOR_CONSTANT(EHOSTUNREACH);

        default:
            return replaceCpy("Error code %x", "%x", numberTo<std::string>(ec));
    }
}
}


std::string rfs::getSystemErrorDescription(ErrorCode ec) //return empty string on error
{
    const ErrorCode ecCurrent = getLastError(); //not necessarily == ec
    RFS_ON_SCOPE_EXIT(errno = ecCurrent);

    std::string errorMsg = ::g_strerror(ec); //... vs strerror(): "marginally improves thread safety, and marginally improves consistency"
    trim(errorMsg);
    return errorMsg;
}


std::string rfs::formatSystemError(const std::string& functionName, ErrorCode ec)
{
    return formatSystemError(functionName, formatSystemErrorCode(ec), getSystemErrorDescription(ec));
}


std::string rfs::formatSystemError(const std::string& functionName, const std::string& errorCode, const std::string& errorMsg)
{
    std::string output(trimCpy(errorCode));

    const std::string_view errorMsgFmt = trimCpy(errorMsg);
    if (!output.empty() && !errorMsgFmt.empty())
        output += ": ";

    output += errorMsgFmt;

    if (!functionName.empty())
        output += " [" + functionName + ']';

    return std::string(trimCpy(output));
}


std::string rfs::formatGlibError(const std::string& functionName, GError* error)
{
    if (!error)
        return formatSystemError(functionName, "", "Error description not available. null GError");

    if (error->domain == G_FILE_ERROR) //"values corresponding to errno codes"
        return formatSystemError(functionName, error->code);

    std::string errorCode;
    if (error->domain == G_CONVERT_ERROR)
        errorCode = [&]() -> std::string
    {
        switch (error->code)
        {
                RFS_CHECK_CASE_FOR_CONSTANT(G_CONVERT_ERROR_NO_CONVERSION);
                RFS_CHECK_CASE_FOR_CONSTANT(G_CONVERT_ERROR_ILLEGAL_SEQUENCE);
                RFS_CHECK_CASE_FOR_CONSTANT(G_CONVERT_ERROR_FAILED);
                RFS_CHECK_CASE_FOR_CONSTANT(G_CONVERT_ERROR_PARTIAL_INPUT);
                RFS_CHECK_CASE_FOR_CONSTANT(G_CONVERT_ERROR_BAD_URI);
                RFS_CHECK_CASE_FOR_CONSTANT(G_CONVERT_ERROR_NOT_ABSOLUTE_PATH);
                RFS_CHECK_CASE_FOR_CONSTANT(G_CONVERT_ERROR_NO_MEMORY);
                RFS_CHECK_CASE_FOR_CONSTANT(G_CONVERT_ERROR_EMBEDDED_NUL);
        }
        return "GConvertError " + numberTo<std::string>(error->code);
    }();

    if (errorCode.empty())
        errorCode = replaceCpy("Error code %x", "%x", numberTo<std::string>(error->code));

    return formatSystemError(functionName, errorCode, error->message ? error->message : "");
}
