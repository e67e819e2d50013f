// *****************************************************************************
// * This file is part of the RemoteFs project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "delete_engine.h"
#include <rfs/extra_log.h>

using namespace rfs;


void RecursiveDeleteEngine::remove(const RemotePath& itemPath) //throw FileError, ErrorItemNotFound, ErrorFileLocked, X
{
    const std::optional<FileAttributes> attr = session_.getFileAttributes(itemPath); //throw FileError
    if (!attr)
        throw ErrorItemNotFound(replaceCpy("Cannot find %x.", "%x", fmtPath(session_.getDisplayPath(itemPath))));

    if (attr->isDirectory())
        removeFolderRecursion(itemPath); //throw FileError, ErrorFileLocked, X
    else
        removeFile(itemPath); //throw FileError, ErrorFileLocked, X

    logExtraInfo(replaceCpy("Successfully deleted %x.", "%x", fmtPath(session_.getDisplayPath(itemPath))));
}


void RecursiveDeleteEngine::removeFile(const RemotePath& filePath) //throw FileError, ErrorFileLocked, X
{
    if (verifyLocks_)
        session_.verifyNotLocked(filePath); //throw ErrorFileLocked

    if (onBeforeFileDeletion_)
        onBeforeFileDeletion_(session_.getDisplayPath(filePath)); //throw X

    session_.deleteFile(filePath); //throw FileError
}


void RecursiveDeleteEngine::removeFolderRecursion(const RemotePath& folderPath) //throw FileError, ErrorFileLocked, X
{
    struct FolderFrame
    {
        RemotePath folderPath;
        bool childFilesRemoved = false;
        std::vector<RemotePath> pendingSubFolders; //process from the back
    };
    //explicit stack: allow deletion of extremely deep hierarchies!
    std::vector<FolderFrame> stack{{folderPath}};

    while (!stack.empty())
    {
        if (!stack.back().childFilesRemoved)
        {
            const RemotePath curFolderPath = stack.back().folderPath;

            if (verifyLocks_)
                session_.verifyNotLocked(curFolderPath); //throw ErrorFileLocked

            std::vector<FileAttributes> children;
            try
            {
                session_.changeWorkingDirectory(curFolderPath); //throw FileError
                children = session_.listWorkingDirectory();     //throw FileError
            }
            catch (const FileError& e) //add context
            {
                throw FileError(replaceCpy("Cannot delete directory %x.", "%x", fmtPath(session_.getDisplayPath(curFolderPath))),
                                replaceCpy(e.toString(), "\n\n", "\n"));
            }

            std::vector<RemotePath> subFolders;
            for (const FileAttributes& child : children)
                if (child.isDirectory())
                    subFolders.push_back(child.getPath());
                else
                    removeFile(child.getPath()); //throw FileError, ErrorFileLocked, X

            stack.back().childFilesRemoved = true;
            stack.back().pendingSubFolders.assign(subFolders.rbegin(), subFolders.rend());
        }

        if (!stack.back().pendingSubFolders.empty())
        {
            RemotePath subFolderPath = std::move(stack.back().pendingSubFolders.back());
            stack.back().pendingSubFolders.pop_back();
            stack.push_back({std::move(subFolderPath)}); //invalidates references into "stack"!
            continue;
        }

        //all children gone: leave the folder, then remove it
        const RemotePath curFolderPath = std::move(stack.back().folderPath);
        stack.pop_back();

        session_.changeToParentDirectory(); //throw FileError

        if (onBeforeFolderDeletion_)
            onBeforeFolderDeletion_(session_.getDisplayPath(curFolderPath)); //throw X

        session_.removeDirectory(curFolderPath); //throw FileError
    }
}
