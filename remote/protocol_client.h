// *****************************************************************************
// * This file is part of the RemoteFs project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef PROTOCOL_CLIENT_H_6625019847703315
#define PROTOCOL_CLIENT_H_6625019847703315

#include <chrono>
#include <functional>
#include <memory>
#include <vector>
#include <rfs/sys_error.h>
#include "file_attributes.h"
#include "streams.h"


namespace rfs
{
struct SysErrorFtpProtocol : public SysError
{
    SysErrorFtpProtocol(const std::string& msg, long ftpError) : SysError(msg), ftpErrorCode(ftpError) {}

    long ftpErrorCode;
};

DEFINE_NEW_SYS_ERROR(SysErrorTimeout)           //socket connect or server response timed out
DEFINE_NEW_SYS_ERROR(SysErrorConnectionRefused) //nobody listening on server:port
DEFINE_NEW_SYS_ERROR(SysErrorUnknownHost)       //DNS lookup failed


/*  one stateful control connection to an FTP server: NOT thread-safe!

    commands the server rejects with a negative reply return "false" (see getReplyCode())
    transport failures (timeouts, broken connections, protocol violations) throw SysError  */
class ProtocolClient
{
public:
    virtual ~ProtocolClient() {}

    virtual void connect(const std::string& server, uint16_t port, std::chrono::seconds connectTimeout) = 0; //throw SysError
    virtual bool login(const std::string& username, const std::string& password) = 0;                   //throw SysError
    virtual void disconnect() = 0; //throw SysError

    //last FTP reply code received; 0 if none
    virtual int getReplyCode() const = 0;

    virtual void setTransferMode(TransferMode mode) = 0;
    virtual void setPassiveMode(bool passive) = 0;
    virtual void setResponseTimeout(std::chrono::seconds timeout) = 0;

    virtual bool sendNoOp() = 0; //throw SysError

    //server paths: absolute (leading '/') or relative to the current working directory
    virtual std::unique_ptr<InputStream> retrieve(const std::string& serverPath) = 0; //throw SysError; errors may also surface while reading: FileError, ErrorItemNotFound

    virtual void store(const std::string& serverPath,
                       const std::function<size_t(void* buffer, size_t bytesToRead)>& readBlock /*throw X*/, //return "bytesToRead" bytes unless end of stream
                       bool append) = 0; //throw SysError, X

    //may contain "." and ".."; empty path: current working directory
    virtual std::vector<NativeEntry> listEntries(const std::string& serverPath) = 0; //throw SysError

    virtual bool deleteFile     (const std::string& serverPath) = 0; //
    virtual bool makeDirectory  (const std::string& serverPath) = 0; //throw SysError
    virtual bool removeDirectory(const std::string& serverPath) = 0; //
    virtual bool rename(const std::string& serverPathFrom, const std::string& serverPathTo) = 0; //throw SysError

    virtual bool changeWorkingDirectory(const std::string& serverPath) = 0; //throw SysError
    virtual bool changeToParentDirectory() = 0;                            //
    virtual std::string printWorkingDirectory() = 0;                       //
};


using ProtocolClientFactory = std::function<std::unique_ptr<ProtocolClient>()>;
}

#endif //PROTOCOL_CLIENT_H_6625019847703315
