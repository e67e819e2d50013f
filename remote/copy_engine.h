// *****************************************************************************
// * This file is part of the RemoteFs project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef COPY_ENGINE_H_1760293485517304
#define COPY_ENGINE_H_1760293485517304

#include "connection_source.h"


namespace rfs
{
/*  copy a file or directory tree between two paths of the same server
    - caller holds the reading session; the engine checks out a second session for writing
    - pre-order: a folder is created before its children are copied
    - target writes skip path locks: the caller serializes on the target path
    - domain errors (ErrorTargetExisting, ErrorItemNotFound, ConnectionError, ...) pass through unchanged,
      plain FileErrors get source/target context
    - no rollback of partially copied trees                                                         */
class RecursiveCopyEngine
{
public:
    explicit RecursiveCopyEngine(ConnectionSource& targetSource) : targetSource_(targetSource) {}

    void copy(RemoteSession& reader, const FileAttributes& source, const RemotePath& targetPath, bool overwrite); //throw FileError, ErrorTargetExisting, ConnectionError

private:
    RecursiveCopyEngine           (const RecursiveCopyEngine&) = delete;
    RecursiveCopyEngine& operator=(const RecursiveCopyEngine&) = delete;

    ConnectionSource& targetSource_;
};
}

#endif //COPY_ENGINE_H_1760293485517304
