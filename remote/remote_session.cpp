// *****************************************************************************
// * This file is part of the RemoteFs project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "remote_session.h"
#include <stdexcept>
#include "ftp_listing.h"

using namespace rfs;


RemoteSession::RemoteSession(std::unique_ptr<ProtocolClient>&& client,
                             const ConnectionSettings& settings,
                             const std::shared_ptr<PathLockProvider>& lockProvider,
                             const RemotePath& baseFolder) :
    client_(std::move(client)),
    settings_(settings),
    lockProvider_(lockProvider),
    baseFolder_(baseFolder)
{
    if (!client_ || !lockProvider_)
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");
}


void RemoteSession::applyBorrowSettings() //throw SysError
{
    client_->setTransferMode(settings_.transferMode);
    client_->setPassiveMode(settings_.passiveMode);
    client_->setResponseTimeout(std::chrono::seconds(settings_.responseTimeoutSec));

    if (!client_->changeWorkingDirectory(getServerPath(baseFolder_))) //throw SysError
        throw SysError(replaceCpy("Cannot open directory %x.", "%x", fmtPath(getDisplayPath(baseFolder_))) + ' ' + getReplyDetails());
}


bool RemoteSession::validate() noexcept
{
    try
    {
        return client_->sendNoOp(); //throw SysError
    }
    catch (const SysError&) { return false; } //connection is broken: exactly what we want to find out
}


void RemoteSession::disconnect() //throw SysError
{
    client_->disconnect(); //throw SysError
}


std::string RemoteSession::getReplyDetails() const
{
    if (const int replyCode = client_->getReplyCode();
        replyCode != 0)
        return formatFtpStatus(replyCode);
    return {};
}


std::optional<FileAttributes> RemoteSession::getFileAttributes(const RemotePath& itemPath) //throw FileError
{
    const std::optional<RemotePath> parentPath = getParentPath(itemPath);
    if (!parentPath) //server root
        return FileAttributes(RemotePath(), NativeEntry{ItemType::folder});

    const std::string itemName = getItemName(itemPath);
    try
    {
        for (const NativeEntry& entry : client_->listEntries(getServerPath(*parentPath))) //throw SysError
            if (entry.itemName == itemName)
                return FileAttributes(*parentPath, entry);
        return {};
    }
    catch (const SysErrorFtpProtocol& e)
    {
        if (e.ftpErrorCode == 550) //parent folder not existing
            return {};
        throw FileError(replaceCpy("Cannot read file attributes of %x.", "%x", fmtPath(getDisplayPath(itemPath))), e.toString());
    }
    catch (const SysError& e) { throw FileError(replaceCpy("Cannot read file attributes of %x.", "%x", fmtPath(getDisplayPath(itemPath))), e.toString()); }
}


std::vector<FileAttributes> RemoteSession::list(const RemotePath& folderPath) //throw FileError, ErrorItemNotFound
{
    const std::string errorMsg = replaceCpy("Cannot open directory %x.", "%x", fmtPath(getDisplayPath(folderPath)));
    try
    {
        std::vector<FileAttributes> output;
        for (const NativeEntry& entry : client_->listEntries(getServerPath(folderPath))) //throw SysError
            if (!isVirtualDirectory(entry.itemName))
                output.emplace_back(folderPath, entry);
        return output;
    }
    catch (const SysErrorFtpProtocol& e)
    {
        if (e.ftpErrorCode == 550)
            throw ErrorItemNotFound(errorMsg, e.toString());
        throw FileError(errorMsg, e.toString());
    }
    catch (const SysError& e) { throw FileError(errorMsg, e.toString()); }
}


std::unique_ptr<InputStream> RemoteSession::retrieveFileContent(const FileAttributes& file) //throw FileError
{
    try
    {
        return client_->retrieve(getServerPath(file.getPath())); //throw SysError
    }
    catch (const SysError& e) { throw FileError(replaceCpy("Cannot read file %x.", "%x", fmtPath(getDisplayPath(file.getPath()))), e.toString()); }
}


void RemoteSession::ensureParentFolderExists(const RemotePath& itemPath, bool createParentDirs, const std::string& errorMsg) //throw FileError
{
    const std::optional<RemotePath> parentPath = getParentPath(itemPath);
    if (!parentPath || parentPath->value.empty()) //server root always exists
        return;

    if (const std::optional<FileAttributes> parentAttr = getFileAttributes(*parentPath)) //throw FileError
    {
        if (parentAttr->isRegularFile())
            throw ErrorIllegalPath(errorMsg, replaceCpy("%x is not a directory.", "%x", fmtPath(getDisplayPath(*parentPath))));
        return;
    }

    if (!createParentDirs)
        throw ErrorIllegalPath(errorMsg, replaceCpy("Cannot create %x because path to it doesn't exist.", "%x", fmtPath(getDisplayPath(itemPath))));

    createDirectory(*parentPath, true /*createParentDirs*/); //throw FileError
}


/*  write semantics:
    - target is a directory                 => ErrorIllegalPath
    - target exists + WriteMode::createNew  => ErrorTargetExisting
    - parent missing and !createParentDirs  => ErrorIllegalPath
    - WriteMode::append on a missing file creates it                          */
void RemoteSession::write(const RemotePath& filePath, InputStream& content, WriteMode mode, WriteLock lock, bool createParentDirs) //throw FileError, ErrorTargetExisting, ErrorIllegalPath, ErrorFileLocked
{
    const std::string errorMsg = replaceCpy("Cannot write file %x.", "%x", fmtPath(getDisplayPath(filePath)));

    std::optional<PathLock> pathLock;
    switch (lock)
    {
        case WriteLock::acquire:
            pathLock = lockProvider_->tryAcquire(getLockKey(filePath));
            if (!pathLock)
                throw ErrorFileLocked(errorMsg, "The file is locked by another operation.");
            break;
        case WriteLock::verify:
            verifyNotLocked(filePath); //throw ErrorFileLocked
            break;
        case WriteLock::skip:
            break;
    }

    if (const std::optional<FileAttributes> targetAttr = getFileAttributes(filePath)) //throw FileError
    {
        if (targetAttr->isDirectory())
            throw ErrorIllegalPath(errorMsg, replaceCpy("%x is a directory.", "%x", fmtPath(getDisplayPath(filePath))));

        if (mode == WriteMode::createNew)
            throw ErrorTargetExisting(errorMsg, "The file already exists. Use a different write mode or point to a path which doesn't exist.");
    }
    else
        ensureParentFolderExists(filePath, createParentDirs, errorMsg); //throw FileError

    try
    {
        client_->store(getServerPath(filePath), [&](void* buffer, size_t bytesToRead)
        {
            return readFully(content, buffer, bytesToRead); //throw FileError
        }, mode == WriteMode::append); //throw SysError, FileError
    }
    catch (const SysError& e) { throw FileError(errorMsg, e.toString()); }
}


void RemoteSession::deleteFile(const RemotePath& filePath) //throw FileError
{
    const std::string errorMsg = replaceCpy("Cannot delete file %x.", "%x", fmtPath(getDisplayPath(filePath)));
    try
    {
        if (!client_->deleteFile(getServerPath(filePath))) //throw SysError
            throw FileError(errorMsg, getReplyDetails());
    }
    catch (const SysError& e) { throw FileError(errorMsg, e.toString()); }
}


void RemoteSession::removeDirectory(const RemotePath& folderPath) //throw FileError
{
    const std::string errorMsg = replaceCpy("Cannot delete directory %x.", "%x", fmtPath(getDisplayPath(folderPath)));
    try
    {
        if (!client_->removeDirectory(getServerPath(folderPath))) //throw SysError
            throw FileError(errorMsg, getReplyDetails());
    }
    catch (const SysError& e) { throw FileError(errorMsg, e.toString()); }
}


void RemoteSession::createDirectory(const RemotePath& folderPath, bool createParentDirs) //throw FileError, ErrorTargetExisting, ErrorIllegalPath
{
    const std::string errorMsg = replaceCpy("Cannot create directory %x.", "%x", fmtPath(getDisplayPath(folderPath)));

    if (getFileAttributes(folderPath)) //throw FileError
        throw ErrorTargetExisting(errorMsg, "The item already exists.");

    ensureParentFolderExists(folderPath, createParentDirs, errorMsg); //throw FileError
    try
    {
        if (!client_->makeDirectory(getServerPath(folderPath))) //throw SysError
            throw FileError(errorMsg, getReplyDetails());
    }
    catch (const SysError& e) { throw FileError(errorMsg, e.toString()); }
}


void RemoteSession::rename(const RemotePath& pathFrom, const RemotePath& pathTo) //throw FileError
{
    const std::string errorMsg = replaceCpy(replaceCpy("Cannot move file %x to %y.", "%x", fmtPath(getDisplayPath(pathFrom))), "%y", fmtPath(getDisplayPath(pathTo)));
    try
    {
        if (!client_->rename(getServerPath(pathFrom), getServerPath(pathTo))) //throw SysError
            throw FileError(errorMsg, getReplyDetails());
    }
    catch (const SysError& e) { throw FileError(errorMsg, e.toString()); }
}


void RemoteSession::changeWorkingDirectory(const RemotePath& folderPath) //throw FileError
{
    const std::string errorMsg = replaceCpy("Cannot open directory %x.", "%x", fmtPath(getDisplayPath(folderPath)));
    try
    {
        if (!client_->changeWorkingDirectory(getServerPath(folderPath))) //throw SysError
            throw FileError(errorMsg, getReplyDetails());
    }
    catch (const SysError& e) { throw FileError(errorMsg, e.toString()); }
}


void RemoteSession::changeToParentDirectory() //throw FileError
{
    try
    {
        if (!client_->changeToParentDirectory()) //throw SysError
            throw FileError("Cannot change to parent directory.", getReplyDetails());
    }
    catch (const SysError& e) { throw FileError("Cannot change to parent directory.", e.toString()); }
}


RemotePath RemoteSession::getWorkingDirectory() //throw FileError
{
    try
    {
        return sanitizeRemotePath(client_->printWorkingDirectory()); //throw SysError
    }
    catch (const SysError& e) { throw FileError("Cannot determine working directory.", e.toString()); }
}


std::vector<FileAttributes> RemoteSession::listWorkingDirectory() //throw FileError
{
    const RemotePath folderPath = getWorkingDirectory(); //throw FileError
    try
    {
        std::vector<FileAttributes> output;
        for (const NativeEntry& entry : client_->listEntries("")) //throw SysError
            if (!isVirtualDirectory(entry.itemName))
                output.emplace_back(folderPath, entry);
        return output;
    }
    catch (const SysError& e) { throw FileError(replaceCpy("Cannot open directory %x.", "%x", fmtPath(getDisplayPath(folderPath))), e.toString()); }
}


void RemoteSession::verifyNotLocked(const RemotePath& itemPath) //throw ErrorFileLocked
{
    if (lockProvider_->isLocked(getLockKey(itemPath)))
        throw ErrorFileLocked(replaceCpy("Cannot modify %x.", "%x", fmtPath(getDisplayPath(itemPath))), "The item is locked by another operation.");
}
