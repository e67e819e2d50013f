// *****************************************************************************
// * This file is part of the RemoteFs project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "connection_settings.h"
#include <rfs/base64.h>
#include <rfs/extra_log.h>
#include <rfs/string_tools.h>

using namespace rfs;


namespace
{
const char ftpPrefix[] = "ftp:";


//the username must not contain raw @ and : => we don't need a full urlencode!
std::string encodeFtpUsername(std::string name)
{
    replace(name, "%", "%25"); //first!
    replace(name, "@", "%40");
    replace(name, ":", "%3A");
    return name;
}


std::string decodeFtpUsername(std::string name)
{
    replace(name, "%40", "@");
    replace(name, "%3A", ":");
    replace(name, "%3a", ":");
    replace(name, "%25", "%"); //last!
    return name;
}


std::string_view trimSlashes(std::string_view str)
{
    while (!str.empty() && (str.front() == '/' || str.front() == '\\'))
        str.remove_prefix(1);
    while (!str.empty() && (str.back() == '/' || str.back() == '\\'))
        str.remove_suffix(1);
    return str;
}
}


ConnectionSettings rfs::condenseSettings(const ConnectionSettings& settings)
{
    ConnectionSettings tmp = settings;
    trim(tmp.server);
    trim(tmp.username);

    tmp.connectionTimeoutSec = std::max(1, tmp.connectionTimeoutSec);
    tmp.responseTimeoutSec   = std::max(1, tmp.responseTimeoutSec);

    if (startsWithAsciiNoCase(tmp.server, "http:" ) ||
        startsWithAsciiNoCase(tmp.server, "https:") ||
        startsWithAsciiNoCase(tmp.server, "ftp:"  ) ||
        startsWithAsciiNoCase(tmp.server, "ftps:" ))
        tmp.server = std::string(afterFirst(tmp.server, ":", IfNotFoundReturn::none));
    tmp.server = std::string(trimSlashes(tmp.server));

    if (!trimCpy(tmp.workingDir).empty())
        tmp.workingDir = getServerPath(sanitizeRemotePath(tmp.workingDir));
    else
        tmp.workingDir.clear();
    return tmp;
}


bool rfs::acceptsConnectionPhrase(const std::string& pathPhrase) //noexcept
{
    return startsWithAsciiNoCase(trimCpy(pathPhrase), ftpPrefix); //check for explicit FTP path
}


ConnectionPhrase rfs::parseConnectionPhrase(const std::string& pathPhraseIn) //noexcept
{
    std::string_view pathPhrase = trimCpy(pathPhraseIn);

    if (startsWithAsciiNoCase(pathPhrase, ftpPrefix))
        pathPhrase.remove_prefix(std::string_view(ftpPrefix).size());
    while (!pathPhrase.empty() && (pathPhrase.front() == '/' || pathPhrase.front() == '\\'))
        pathPhrase.remove_prefix(1);

    const std::string_view fullPathOpt = beforeFirst(pathPhrase, "|", IfNotFoundReturn::all);
    const std::string_view options     =  afterFirst(pathPhrase, "|", IfNotFoundReturn::none);

    //user names may contain '@' only in encoded form => last '@' before the path separates credentials
    const std::string_view credentials = beforeLast(beforeFirst(fullPathOpt, "/", IfNotFoundReturn::all), "@", IfNotFoundReturn::none);
    const std::string_view fullPath = credentials.empty() && !startsWith(fullPathOpt, '@') ? fullPathOpt : fullPathOpt.substr(credentials.size() + 1);

    ConnectionSettings settings;
    settings.username = decodeFtpUsername(std::string(beforeFirst(credentials, ":", IfNotFoundReturn::all))); //support standard FTP syntax, even though
    settings.password =                   std::string( afterFirst(credentials, ":", IfNotFoundReturn::none)); //formatConnectionPhrase() uses "pass64" instead

    auto it = std::find_if(fullPath.begin(), fullPath.end(), [](char c) { return c == '/' || c == '\\'; });
    const std::string_view serverPort = makeStringView(fullPath.begin(), it);
    const RemotePath itemPath = sanitizeRemotePath(replaceCpy(std::string(it, fullPath.end()), "\\", "/"));

    settings.server = std::string(beforeLast(serverPort, ":", IfNotFoundReturn::all));
    settings.portCfg = stringTo<int>(afterLast(serverPort, ":", IfNotFoundReturn::none)); //0 if empty

    split(options, '|', [&](std::string_view optPhrase)
    {
        optPhrase = trimCpy(optPhrase);
        if (!optPhrase.empty())
        {
            if (startsWith(optPhrase, "timeout="))
                settings.connectionTimeoutSec = settings.responseTimeoutSec = stringTo<int>(afterFirst(optPhrase, "=", IfNotFoundReturn::none));
            else if (optPhrase == "ssl")
                settings.useTls = true;
            else if (startsWith(optPhrase, "pass64="))
                settings.password = stringDecodeBase64(afterFirst(optPhrase, "=", IfNotFoundReturn::none));
            else if (optPhrase == "active")
                settings.passiveMode = false;
            else if (optPhrase == "ascii")
                settings.transferMode = TransferMode::ascii;
            else if (startsWith(optPhrase, "workdir="))
                settings.workingDir = std::string(afterFirst(optPhrase, "=", IfNotFoundReturn::none));
            else
                logExtraWarning("Unknown connection option ignored: " + std::string(optPhrase));
        }
    });
    return {condenseSettings(settings), itemPath};
}


std::string rfs::formatConnectionPhrase(const ConnectionSettings& settings, const RemotePath& itemPath) //noexcept
{
    std::string username;
    if (!settings.username.empty())
        username = encodeFtpUsername(settings.username) + '@';

    std::string port;
    if (settings.portCfg > 0)
        port = ':' + numberTo<std::string>(settings.portCfg);

    std::string relPath = getServerPath(itemPath);
    if (relPath == "/")
        relPath.clear();

    std::string options;
    if (settings.connectionTimeoutSec != ConnectionSettings().connectionTimeoutSec)
        options += "|timeout=" + numberTo<std::string>(settings.connectionTimeoutSec);

    if (settings.useTls)
        options += "|ssl";

    if (!settings.passiveMode)
        options += "|active";

    if (settings.transferMode == TransferMode::ascii)
        options += "|ascii";

    if (!settings.workingDir.empty())
        options += "|workdir=" + settings.workingDir;

    if (!settings.password.empty()) //password always last => visually truncated by folder input field
        options += "|pass64=" + stringEncodeBase64(settings.password);

    return std::string(ftpPrefix) + "//" + username + settings.server + port + relPath + options;
}


std::string rfs::getDisplayPath(const ConnectionSettings& settings, const RemotePath& itemPath)
{
    std::string displayPath = std::string(ftpPrefix) + "//";

    if (!settings.username.empty()) //show username!
        displayPath += settings.username + '@';

    displayPath += settings.server;

    const std::string relPath = getServerPath(itemPath);
    if (relPath != "/")
        displayPath += relPath;

    return displayPath;
}
