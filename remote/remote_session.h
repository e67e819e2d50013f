// *****************************************************************************
// * This file is part of the RemoteFs project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef REMOTE_SESSION_H_8830271946651023
#define REMOTE_SESSION_H_8830271946651023

#include <optional>
#include <vector>
#include "connection_settings.h"
#include "path_lock.h"
#include "protocol_client.h"


namespace rfs
{
enum class WriteLock
{
    acquire, //hold a PathLock for the duration of the write; conflict => ErrorFileLocked
    verify,  //fail with ErrorFileLocked if somebody else holds the lock
    skip,    //caller synchronizes, e.g. recursive copy
};


/*  one checked-out, stateful FTP connection: NOT thread-safe!
    - owned by exactly one logical operation between ConnectionSource::acquire() and release()
    - the protocol client's working directory is implicit state: applyBorrowSettings() resets it   */
class RemoteSession
{
public:
    RemoteSession(std::unique_ptr<ProtocolClient>&& client,
                  const ConnectionSettings& settings,
                  const std::shared_ptr<PathLockProvider>& lockProvider,
                  const RemotePath& baseFolder);

    const ConnectionSettings& getSettings() const { return settings_; }
    const RemotePath& getBaseFolder() const { return baseFolder_; }
    std::string getDisplayPath(const RemotePath& itemPath) const { return rfs::getDisplayPath(settings_, itemPath); }

    //transfer mode, passive mode, response timeout, working directory
    void applyBorrowSettings(); //throw SysError
    bool validate() noexcept;   //protocol-level no-op
    void disconnect();          //throw SysError

    //----------------------------------------------------------------------------------------
    std::optional<FileAttributes> getFileAttributes(const RemotePath& itemPath); //throw FileError; no value if not existing
    std::vector<FileAttributes> list(const RemotePath& folderPath);              //throw FileError, ErrorItemNotFound; without "." and ".."

    //content is streamed via this session's connection: destroy the stream before issuing further commands!
    std::unique_ptr<InputStream> retrieveFileContent(const FileAttributes& file); //throw FileError; reading may throw ErrorItemNotFound

    void write(const RemotePath& filePath, InputStream& content, WriteMode mode, WriteLock lock, bool createParentDirs); //throw FileError, ErrorTargetExisting, ErrorIllegalPath, ErrorFileLocked

    void deleteFile(const RemotePath& filePath);         //throw FileError
    void removeDirectory(const RemotePath& folderPath);  //throw FileError; must be empty
    void createDirectory(const RemotePath& folderPath, bool createParentDirs); //throw FileError, ErrorTargetExisting, ErrorIllegalPath
    void rename(const RemotePath& pathFrom, const RemotePath& pathTo);         //throw FileError

    //navigation primitives: state is kept by the connection
    void changeWorkingDirectory(const RemotePath& folderPath); //throw FileError
    void changeToParentDirectory();                             //throw FileError
    RemotePath getWorkingDirectory();                           //throw FileError
    std::vector<FileAttributes> listWorkingDirectory();         //throw FileError; without "." and ".."

    //----------------------------------------------------------------------------------------
    void verifyNotLocked(const RemotePath& itemPath); //throw ErrorFileLocked

private:
    RemoteSession           (const RemoteSession&) = delete;
    RemoteSession& operator=(const RemoteSession&) = delete;

    std::string getReplyDetails() const;
    void ensureParentFolderExists(const RemotePath& itemPath, bool createParentDirs, const std::string& errorMsg); //throw FileError

    const std::unique_ptr<ProtocolClient> client_;
    const ConnectionSettings settings_;
    const std::shared_ptr<PathLockProvider> lockProvider_;
    const RemotePath baseFolder_;
};
}

#endif //REMOTE_SESSION_H_8830271946651023
