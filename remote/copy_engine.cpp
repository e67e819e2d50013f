// *****************************************************************************
// * This file is part of the RemoteFs project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "copy_engine.h"
#include <typeinfo>
#include "delete_engine.h"

using namespace rfs;


namespace
{
void copyFolder(RemoteSession& writer, const FileAttributes& source, const RemotePath& targetPath, bool overwrite) //throw FileError, ErrorTargetExisting
{
    if (const std::optional<FileAttributes> targetAttr = writer.getFileAttributes(targetPath)) //throw FileError
    {
        if (targetAttr->isDirectory()) //merge into existing folder
            return;

        if (!overwrite)
            throw ErrorTargetExisting(replaceCpy("Cannot create directory %x.", "%x", fmtPath(writer.getDisplayPath(targetPath))),
                                      "The item already exists.");

        RecursiveDeleteEngine(writer, false /*verifyLocks*/).remove(targetPath); //throw FileError
    }
    writer.createDirectory(targetPath, true /*createParentDirs*/); //throw FileError
}


void copyFile(RemoteSession& reader, RemoteSession& writer, const FileAttributes& source, const RemotePath& targetPath, bool overwrite) //throw FileError, ErrorTargetExisting
{
    if (writer.getFileAttributes(targetPath)) //throw FileError
    {
        if (!overwrite)
            throw ErrorTargetExisting(replaceCpy("Cannot write file %x.", "%x", fmtPath(writer.getDisplayPath(targetPath))),
                                      "The file already exists. Use a different write mode or point to a path which doesn't exist.");

        RecursiveDeleteEngine(writer, false /*verifyLocks*/).remove(targetPath); //throw FileError
    }

    //stream must be gone before "reader" executes the next command
    const std::unique_ptr<InputStream> content = reader.retrieveFileContent(source); //throw FileError

    writer.write(targetPath, *content, overwrite ? WriteMode::overwrite : WriteMode::createNew,
                 WriteLock::skip, true /*createParentDirs*/); //throw FileError
}
}


void RecursiveCopyEngine::copy(RemoteSession& reader, const FileAttributes& source, const RemotePath& targetPath, bool overwrite) //throw FileError, ErrorTargetExisting, ConnectionError
{
    SessionHandle writer = targetSource_.acquire(); //throw ConnectionError
    //released by ~SessionHandle on every exit path; "reader" belongs to the caller

    struct CopyItem
    {
        FileAttributes source;
        RemotePath targetPath;
    };
    std::vector<CopyItem> workItems{{source, targetPath}}; //process from the back

    while (!workItems.empty())
    {
        const CopyItem item = std::move(workItems.back());
        workItems.pop_back();
        try
        {
            if (item.source.isDirectory())
            {
                copyFolder(*writer, item.source, item.targetPath, overwrite); //throw FileError, ErrorTargetExisting

                const std::vector<FileAttributes> children = reader.list(item.source.getPath()); //throw FileError, ErrorItemNotFound; without "." and ".."
                for (auto it = children.rbegin(); it != children.rend(); ++it) //keep listing order
                    workItems.push_back({*it, appendPath(item.targetPath, it->getName())});
            }
            else
                copyFile(reader, *writer, item.source, item.targetPath, overwrite); //throw FileError, ErrorTargetExisting
        }
        catch (const FileError& e)
        {
            if (typeid(e) != typeid(FileError)) //already classified
                throw;

            throw FileError(replaceCpy(replaceCpy("Cannot copy %x to %y.",
                                                  "%x", fmtPath(reader.getDisplayPath(item.source.getPath()))),
                                       "%y", fmtPath(writer->getDisplayPath(item.targetPath))), e.toString());
        }
    }
}
