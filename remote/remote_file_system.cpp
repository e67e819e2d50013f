// *****************************************************************************
// * This file is part of the RemoteFs project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "remote_file_system.h"
#include "copy_engine.h"
#include "delete_engine.h"
#include "ftp_client.h"

using namespace rfs;


RemoteFileSystem::RemoteFileSystem(const ConnectionSettings& settings, const SessionPoolConfig& poolCfg) :
    RemoteFileSystem(settings,
                     [useTls = settings.useTls] { return createFtpClient(useTls); },
                     createLocalPathLockProvider(), poolCfg) {}


RemoteFileSystem::RemoteFileSystem(const ConnectionSettings& settings,
                                   const ProtocolClientFactory& clientFactory,
                                   const std::shared_ptr<PathLockProvider>& lockProvider,
                                   const SessionPoolConfig& poolCfg) :
    source_(settings, clientFactory, lockProvider, poolCfg) {}


std::optional<FileAttributes> RemoteFileSystem::getFileAttributes(const RemotePath& itemPath) //throw FileError, ConnectionError
{
    SessionHandle session = source_.acquire(); //throw ConnectionError
    return session->getFileAttributes(itemPath); //throw FileError
}


std::vector<FileAttributes> RemoteFileSystem::list(const RemotePath& folderPath) //throw FileError, ErrorItemNotFound, ConnectionError
{
    SessionHandle session = source_.acquire(); //throw ConnectionError
    return session->list(folderPath); //throw FileError, ErrorItemNotFound
}


std::unique_ptr<LazyRemoteStream> RemoteFileSystem::read(const FileAttributes& file,
                                                         std::optional<std::chrono::milliseconds> recheckInterval,
                                                         const BeforeReleaseHook& beforeRelease)
{
    return std::make_unique<LazyRemoteStream>(source_, file, recheckInterval, beforeRelease);
}


void RemoteFileSystem::write(const RemotePath& filePath, InputStream& content, WriteMode mode, bool lock, bool createParentDirs) //throw FileError, ErrorTargetExisting, ErrorIllegalPath, ErrorFileLocked, ConnectionError
{
    SessionHandle session = source_.acquire(); //throw ConnectionError
    session->write(filePath, content, mode, lock ? WriteLock::acquire : WriteLock::verify, createParentDirs); //throw FileError, ErrorTargetExisting, ErrorIllegalPath, ErrorFileLocked
}


void RemoteFileSystem::copy(const FileAttributes& source, const RemotePath& targetPath, bool overwrite) //throw FileError, ErrorTargetExisting, ConnectionError
{
    //serialize copies onto the same target: the second one sees the completed result of the first
    const PathLock targetLock = source_.getLockProvider()->acquire(getLockKey(targetPath)); //blocking

    SessionHandle reader = source_.acquire(); //throw ConnectionError
    RecursiveCopyEngine(source_).copy(*reader, source, targetPath, overwrite); //throw FileError, ErrorTargetExisting, ConnectionError
}


void RemoteFileSystem::remove(const RemotePath& itemPath) //throw FileError, ErrorItemNotFound, ErrorFileLocked, ConnectionError
{
    SessionHandle session = source_.acquire(); //throw ConnectionError
    RecursiveDeleteEngine(*session).remove(itemPath); //throw FileError, ErrorItemNotFound, ErrorFileLocked
}


void RemoteFileSystem::createDirectory(const RemotePath& folderPath) //throw FileError, ErrorTargetExisting, ConnectionError
{
    SessionHandle session = source_.acquire(); //throw ConnectionError
    session->createDirectory(folderPath, true /*createParentDirs*/); //throw FileError, ErrorTargetExisting
}


void RemoteFileSystem::rename(const RemotePath& itemPath, const std::string& newName, bool overwrite) //throw FileError, ErrorItemNotFound, ErrorTargetExisting, ErrorFileLocked, ConnectionError
{
    const std::optional<RemotePath> parentPath = getParentPath(itemPath);
    if (!parentPath || newName.empty() || contains(newName, REMOTE_PATH_SEPARATOR) || isVirtualDirectory(newName))
        throw ErrorIllegalPath(replaceCpy("Cannot move file %x.", "%x", fmtPath(getDisplayPath(itemPath))),
                               replaceCpy("Invalid item name %x.", "%x", fmtPath(newName)));

    const RemotePath targetPath = appendPath(*parentPath, newName);
    const std::string errorMsg = replaceCpy(replaceCpy("Cannot move file %x to %y.", "%x", fmtPath(getDisplayPath(itemPath))), "%y", fmtPath(getDisplayPath(targetPath)));

    SessionHandle session = source_.acquire(); //throw ConnectionError

    if (!session->getFileAttributes(itemPath)) //throw FileError
        throw ErrorItemNotFound(errorMsg, replaceCpy("Cannot find %x.", "%x", fmtPath(getDisplayPath(itemPath))));

    session->verifyNotLocked(itemPath); //throw ErrorFileLocked

    if (targetPath != itemPath && session->getFileAttributes(targetPath)) //throw FileError
    {
        if (!overwrite)
            throw ErrorTargetExisting(errorMsg, "The item already exists.");

        RecursiveDeleteEngine(*session).remove(targetPath); //throw FileError, ErrorFileLocked
    }
    session->rename(itemPath, targetPath); //throw FileError
}


void RemoteFileSystem::testConnection() //throw ConnectionError
{
    SessionHandle session = source_.acquire(); //throw ConnectionError; includes login
}
