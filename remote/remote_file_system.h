// *****************************************************************************
// * This file is part of the RemoteFs project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef REMOTE_FILE_SYSTEM_H_5820341197736092
#define REMOTE_FILE_SYSTEM_H_5820341197736092

#include "lazy_remote_stream.h"


namespace rfs
{
/*  file operations on one FTP server configuration; thread-safe
    - every call checks out its own session(s): calls on disjoint paths run concurrently
    - calls on the same path are serialized by path locks where they mutate
    - streams returned by read() must not outlive this object!                          */
class RemoteFileSystem
{
public:
    explicit RemoteFileSystem(const ConnectionSettings& settings, const SessionPoolConfig& poolCfg = SessionPoolConfig()); //libcurl FTP client
    RemoteFileSystem(const ConnectionSettings& settings,
                     const ProtocolClientFactory& clientFactory,
                     const std::shared_ptr<PathLockProvider>& lockProvider,
                     const SessionPoolConfig& poolCfg = SessionPoolConfig());

    std::optional<FileAttributes> getFileAttributes(const RemotePath& itemPath); //throw FileError, ConnectionError
    std::vector<FileAttributes> list(const RemotePath& folderPath);              //throw FileError, ErrorItemNotFound, ConnectionError

    //no connection until the first read
    std::unique_ptr<LazyRemoteStream> read(const FileAttributes& file,
                                           std::optional<std::chrono::milliseconds> recheckInterval = std::nullopt,
                                           const BeforeReleaseHook& beforeRelease = nullptr);

    //lock: hold a path lock during the write, else only verify nobody else holds one
    void write(const RemotePath& filePath, InputStream& content, WriteMode mode, bool lock, bool createParentDirs); //throw FileError, ErrorTargetExisting, ErrorIllegalPath, ErrorFileLocked, ConnectionError

    void copy(const FileAttributes& source, const RemotePath& targetPath, bool overwrite); //throw FileError, ErrorTargetExisting, ConnectionError
    void remove(const RemotePath& itemPath);          //throw FileError, ErrorItemNotFound, ErrorFileLocked, ConnectionError
    void createDirectory(const RemotePath& folderPath); //throw FileError, ErrorTargetExisting, ConnectionError
    void rename(const RemotePath& itemPath, const std::string& newName, bool overwrite); //throw FileError, ErrorItemNotFound, ErrorTargetExisting, ErrorFileLocked, ConnectionError

    void testConnection(); //throw ConnectionError

    ConnectionSource& getConnectionSource() { return source_; }
    std::string getDisplayPath(const RemotePath& itemPath) const { return rfs::getDisplayPath(source_.getSettings(), itemPath); }

private:
    RemoteFileSystem           (const RemoteFileSystem&) = delete;
    RemoteFileSystem& operator=(const RemoteFileSystem&) = delete;

    ConnectionSource source_;
};
}

#endif //REMOTE_FILE_SYSTEM_H_5820341197736092
