// *****************************************************************************
// * This file is part of the RemoteFs project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef FTP_LISTING_H_0448167320958871
#define FTP_LISTING_H_0448167320958871

#include <functional>
#include <string_view>
#include <vector>
#include <rfs/sys_error.h>
#include "file_attributes.h"


namespace rfs
{
//convert item names from the server's encoding to UTF-8
using DecodeServerName = std::function<std::string(std::string_view rawName)>; //throw SysError

std::vector<std::string_view> splitFtpResponse(const std::string& buf);
std::vector<std::string_view> splitFtpResponse(std::string&&) = delete;

std::string formatFtpStatus(int sc);

//https://tools.ietf.org/html/rfc3659: "." and ".." are reported as folders
std::vector<NativeEntry> parseMlsdListing(const std::string& buf, const DecodeServerName& decodeName); //throw SysError
NativeEntry parseMlstLine(std::string_view rawLine, const DecodeServerName& decodeName);              //throw SysError

//"ls -l" or "dir"-style output of LIST
std::vector<NativeEntry> parseUnixListing   (const std::string& buf, time_t utcTimeNow, const DecodeServerName& decodeName); //throw SysError
std::vector<NativeEntry> parseWindowsListing(const std::string& buf, time_t utcTimeNow, const DecodeServerName& decodeName); //throw SysError
std::vector<NativeEntry> parseListListing   (const std::string& buf, time_t utcTimeNow, const DecodeServerName& decodeName); //throw SysError

struct FtpFeatures
{
    bool mlsd = false;
    bool utf8 = false;
};
FtpFeatures parseFeatResponse(const std::string& featResponse);

//"257 "/home/user" is current directory."
std::string parsePwdResponse(const std::string& pwdResponse); //throw SysError
}

#endif //FTP_LISTING_H_0448167320958871
