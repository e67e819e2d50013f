// *****************************************************************************
// * This file is part of the RemoteFs project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef REMOTE_PATH_H_7310982645508127
#define REMOTE_PATH_H_7310982645508127

#include <compare>
#include <optional>
#include <string>
#include <string_view>


namespace rfs
{
const char REMOTE_PATH_SEPARATOR = '/';

bool isValidRelPath(std::string_view relPath);


struct RemotePath //= path relative to the server root folder (no leading/trailing separator, no "." or ".." components)
{
    RemotePath() {}
    explicit RemotePath(const std::string& p);
    std::string value;

    std::strong_ordering operator<=>(const RemotePath&) const = default;
};

//collapse duplicate separators, "." and ".." components; ".." above root stays at root
RemotePath sanitizeRemotePath(std::string_view path);

//absolute if path starts with '/', else relative to baseFolder
RemotePath resolveRemotePath(const RemotePath& baseFolder, std::string_view path);

std::optional<RemotePath> getParentPath(const RemotePath& itemPath); //no value for server root
std::string getItemName(const RemotePath& itemPath);
RemotePath appendPath(const RemotePath& basePath, std::string_view relPath);

//leading '/', e.g. "/a/b"; server root: "/"
std::string getServerPath(const RemotePath& itemPath);

//key for named path locks: one per remote item
inline std::string getLockKey(const RemotePath& itemPath) { return getServerPath(itemPath); }

//"." and ".." entries returned by some server listings
inline bool isVirtualDirectory(std::string_view itemName) { return itemName == "." || itemName == ".."; }
}

#endif //REMOTE_PATH_H_7310982645508127
