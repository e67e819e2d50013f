// *****************************************************************************
// * This file is part of the RemoteFs project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef DELETE_ENGINE_H_3390281746620517
#define DELETE_ENGINE_H_3390281746620517

#include "remote_session.h"


namespace rfs
{
/*  delete a file or a complete directory tree using one session held for the whole walk
    - post-order: children are removed strictly before their parent folder
    - first failure aborts: no partial cleanup, remaining siblings are left alone
    - the walk navigates via CWD/CDUP: the session's working directory is changed!                        */
class RecursiveDeleteEngine
{
public:
    explicit RecursiveDeleteEngine(RemoteSession& session, bool verifyLocks = true) : session_(session), verifyLocks_(verifyLocks) {}

    //optional; one call for each object!
    void setOnBeforeFileDeletion  (const std::function<void(const std::string& displayPath)>& fun /*throw X*/) { onBeforeFileDeletion_   = fun; }
    void setOnBeforeFolderDeletion(const std::function<void(const std::string& displayPath)>& fun /*throw X*/) { onBeforeFolderDeletion_ = fun; }

    void remove(const RemotePath& itemPath); //throw FileError, ErrorItemNotFound, ErrorFileLocked, X

private:
    RecursiveDeleteEngine           (const RecursiveDeleteEngine&) = delete;
    RecursiveDeleteEngine& operator=(const RecursiveDeleteEngine&) = delete;

    void removeFile(const RemotePath& filePath); //throw FileError, ErrorFileLocked, X
    void removeFolderRecursion(const RemotePath& folderPath); //throw FileError, ErrorFileLocked, X

    RemoteSession& session_;
    const bool verifyLocks_;
    std::function<void(const std::string& displayPath)> onBeforeFileDeletion_;
    std::function<void(const std::string& displayPath)> onBeforeFolderDeletion_;
};
}

#endif //DELETE_ENGINE_H_3390281746620517
