// *****************************************************************************
// * This file is part of the RemoteFs project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef FILE_ATTRIBUTES_H_9182304756612093
#define FILE_ATTRIBUTES_H_9182304756612093

#include <cstdint>
#include <ctime>
#include "remote_path.h"


namespace rfs
{
enum class ItemType : unsigned char
{
    file,
    folder,
    symlink,
};


enum class WriteMode
{
    append,    //add to existing content, create if missing
    overwrite, //replace content
    createNew, //fail if target exists
};


enum class TransferMode
{
    binary,
    ascii,
};


//one entry of a server directory listing
struct NativeEntry
{
    ItemType    type = ItemType::file;
    std::string itemName;
    uint64_t    fileSize = 0;
    time_t      modTime = 0;
    std::string uniqueId; //MLSD "unique" fact; optional
};


//point-in-time snapshot of a remote item: staleness must be re-checked explicitly
class FileAttributes
{
public:
    FileAttributes(const RemotePath& parentPath, const NativeEntry& entry) : path_(appendPath(parentPath, entry.itemName)), entry_(entry) {}

    const RemotePath& getPath() const { return path_; }
    const std::string& getName() const { return entry_.itemName; }
    uint64_t getSize() const { return entry_.fileSize; }
    time_t getModTime() const { return entry_.modTime; }

    bool isDirectory  () const { return entry_.type == ItemType::folder; }
    bool isRegularFile() const { return entry_.type == ItemType::file; }
    bool isSymbolicLink() const { return entry_.type == ItemType::symlink; }

    const NativeEntry& getNativeEntry() const { return entry_; }

private:
    RemotePath path_;
    NativeEntry entry_;
};
}

#endif //FILE_ATTRIBUTES_H_9182304756612093
