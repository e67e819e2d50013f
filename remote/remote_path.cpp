// *****************************************************************************
// * This file is part of the RemoteFs project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "remote_path.h"
#include <cassert>
#include <vector>
#include <rfs/string_tools.h>

using namespace rfs;


bool rfs::isValidRelPath(std::string_view relPath)
{
    if (relPath.empty())
        return true;

    if (startsWith(relPath, REMOTE_PATH_SEPARATOR) ||
        endsWith  (relPath, REMOTE_PATH_SEPARATOR) ||
        contains  (relPath, "//"))
        return false;

    bool valid = true;
    split(relPath, REMOTE_PATH_SEPARATOR, [&](std::string_view itemName)
    {
        if (isVirtualDirectory(itemName))
            valid = false;
    });
    return valid;
}


RemotePath::RemotePath(const std::string& p) : value(p) { assert(isValidRelPath(value)); }


RemotePath rfs::sanitizeRemotePath(std::string_view path)
{
    std::vector<std::string_view> itemNames;

    split(path, REMOTE_PATH_SEPARATOR, [&](std::string_view itemName)
    {
        if (itemName.empty() || itemName == ".")
            return;
        if (itemName == "..")
        {
            if (!itemNames.empty())
                itemNames.pop_back();
            return;
        }
        itemNames.push_back(itemName);
    });

    std::string relPath;
    for (const std::string_view itemName : itemNames)
    {
        if (!relPath.empty())
            relPath += REMOTE_PATH_SEPARATOR;
        relPath += itemName;
    }
    return RemotePath(relPath);
}


RemotePath rfs::resolveRemotePath(const RemotePath& baseFolder, std::string_view path)
{
    if (startsWith(path, REMOTE_PATH_SEPARATOR))
        return sanitizeRemotePath(path);

    return sanitizeRemotePath(baseFolder.value + REMOTE_PATH_SEPARATOR + std::string(path));
}


std::optional<RemotePath> rfs::getParentPath(const RemotePath& itemPath)
{
    if (!itemPath.value.empty())
        return RemotePath(std::string(beforeLast(itemPath.value, "/", IfNotFoundReturn::none)));

    return {};
}


std::string rfs::getItemName(const RemotePath& itemPath)
{
    return std::string(afterLast(itemPath.value, "/", IfNotFoundReturn::all));
}


RemotePath rfs::appendPath(const RemotePath& basePath, std::string_view relPath)
{
    return sanitizeRemotePath(basePath.value + REMOTE_PATH_SEPARATOR + std::string(relPath));
}


std::string rfs::getServerPath(const RemotePath& itemPath)
{
    return REMOTE_PATH_SEPARATOR + itemPath.value;
}
