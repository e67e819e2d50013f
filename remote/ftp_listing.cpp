// *****************************************************************************
// * This file is part of the RemoteFs project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "ftp_listing.h"
#include <algorithm>
#include <iterator>
#include <optional>

using namespace rfs;


namespace
{
struct TimeComp //UTC
{
    int year   = 0; //
    int month  = 0; //1-12
    int day    = 0; //1-31
    int hour   = 0; //0-23
    int minute = 0; //0-59
    int second = 0; //0-60 (including leap second)
};


std::optional<time_t> utcToTimeT(const TimeComp& tc)
{
    if (tc.month < 1 || tc.month > 12 || tc.day < 1 || tc.day > 31 ||
        tc.hour < 0 || tc.hour > 23 || tc.minute < 0 || tc.minute > 59 || tc.second < 0 || tc.second > 60)
        return {};

    std::tm ctc = {};
    ctc.tm_year = tc.year - 1900;
    ctc.tm_mon  = tc.month - 1;
    ctc.tm_mday = tc.day;
    ctc.tm_hour = tc.hour;
    ctc.tm_min  = tc.minute;
    ctc.tm_sec  = tc.second;
    ctc.tm_isdst = 0;

    const time_t utcTime = ::timegm(&ctc);
    if (utcTime == -1 && !(tc.year == 1969 && tc.month == 12 && tc.day == 31)) //-1 is a valid time, too
        return {};
    return utcTime;
}


int getUtcYear(time_t utcTime) //throw SysError
{
    std::tm ctc = {};
    if (!::gmtime_r(&utcTime, &ctc))
        throw SysError("Failed to determine current time: " + numberTo<std::string>(utcTime));
    return ctc.tm_year + 1900;
}


//"YYYYMMDDHHMMSS"
std::optional<time_t> parseMlsdTime(std::string_view str)
{
    if (str.size() != 14 || !std::all_of(str.begin(), str.end(), isDigit))
        return {};

    TimeComp tc;
    tc.year   = stringTo<int>(str.substr(0, 4));
    tc.month  = stringTo<int>(str.substr(4, 2));
    tc.day    = stringTo<int>(str.substr(6, 2));
    tc.hour   = stringTo<int>(str.substr(8, 2));
    tc.minute = stringTo<int>(str.substr(10, 2));
    tc.second = stringTo<int>(str.substr(12, 2));
    return utcToTimeT(tc);
}


class FtpLineParser
{
public:
    explicit FtpLineParser(std::string_view line) : it_(line.begin()), itEnd_(line.end()) {}

    template <class Function>
    std::string_view readRange(size_t count, Function acceptChar) //throw SysError
    {
        if (static_cast<ptrdiff_t>(count) > itEnd_ - it_)
            throw SysError("Unexpected end of line.");

        const auto rngEnd = it_ + count;

        if (!std::all_of(it_, rngEnd, acceptChar))
            throw SysError("Expected char type not found.");

        return makeStringView(std::exchange(it_, rngEnd), rngEnd);
    }

    template <class Function> //expects non-empty range!
    std::string_view readRange(Function acceptChar) //throw SysError
    {
        auto rngEnd = std::find_if_not(it_, itEnd_, acceptChar);
        if (rngEnd == it_)
            throw SysError("Expected char range not found.");

        return makeStringView(std::exchange(it_, rngEnd), rngEnd);
    }

    char peekNextChar() const { return it_ == itEnd_ ? '\0' : *it_; }

private:
    std::string_view::const_iterator it_;
    const std::string_view::const_iterator itEnd_;
};


auto notWhiteSpace = [](char c) { return !isWhiteSpace(c); };


NativeEntry parseUnixLine(std::string_view rawLine, time_t utcTimeNow, int utcCurrentYear, int ownerGroupCount, const DecodeServerName& decodeName) //throw SysError
{
    /*  Unix standard listing: "ls -l --all"

            total 4953                                                  <- optional first line
            drwxr-xr-x 1 root root    4096 Jan 10 11:58 version
            -rwxr-xr-x 1 root root    1084 Sep  2 01:17 Unit Test.vcxproj.user
            -rwxr-xr-x 1 1000  300    2217 Feb 28  2016 win32.manifest
            lrwxr-xr-x 1 root root      18 Apr 26 15:17 Projects -> /mnt/hgfs/Projects

        No group:          dr-xr-xr-x   2 root                  512 Apr  8  1994 etc
        No owner, group:   drwxrwxrwx 1              0 Jan  1 00:00 dirname/           */
    try
    {
        FtpLineParser parser(rawLine);

        const std::string_view typeTag = parser.readRange(1, [](char c) //throw SysError
        {
            return c == '-' || c == 'b' || c == 'c' || c == 'd' || c == 'l' || c == 'p' || c == 's';
        });
        //permissions
        parser.readRange(9, [](char c) //throw SysError
        {
            return c == '-' || c == 'r' || c == 'w' || c == 'x' || c == 's' || c == 'S' || c == 't' || c == 'T';
        });
        parser.readRange(isWhiteSpace); //throw SysError
        //hard-link count
        parser.readRange(isDigit);      //throw SysError
        parser.readRange(isWhiteSpace); //throw SysError
        //both owner + group, owner only, or none at all
        for (int i = 0; i < ownerGroupCount; ++i)
        {
            parser.readRange(notWhiteSpace); //throw SysError
            parser.readRange(isWhiteSpace);  //throw SysError
        }
        //file size
        const uint64_t fileSize = stringTo<uint64_t>(parser.readRange(isDigit)); //throw SysError
        parser.readRange(isWhiteSpace);                                          //throw SysError

        const std::string_view monthStr = parser.readRange(notWhiteSpace); //throw SysError
        parser.readRange(isWhiteSpace);                                    //throw SysError

        const char* months[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun", "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};
        auto itMonth = std::find_if(std::begin(months), std::end(months), [&](const char* name) { return equalAsciiNoCase(name, monthStr); });
        if (itMonth == std::end(months))
            throw SysError("Failed to parse month name.");

        const int day = stringTo<int>(parser.readRange(isDigit)); //throw SysError
        parser.readRange(isWhiteSpace);                           //throw SysError
        if (day < 1 || day > 31)
            throw SysError("Failed to parse day of month.");

        const std::string_view timeOrYear = parser.readRange([](char c) { return c == ':' || isDigit(c); }); //throw SysError
        parser.readRange(isWhiteSpace);                                                                      //throw SysError

        TimeComp timeComp;
        timeComp.month = 1 + static_cast<int>(itMonth - std::begin(months));
        timeComp.day = day;

        if (contains(timeOrYear, ':'))
        {
            timeComp.hour   = stringTo<int>(beforeFirst(timeOrYear, ":", IfNotFoundReturn::none));
            timeComp.minute = stringTo<int>(afterFirst (timeOrYear, ":", IfNotFoundReturn::none));
            timeComp.year = utcCurrentYear; //tentatively

            const std::optional<time_t> serverLocalTime = utcToTimeT(timeComp);
            if (!serverLocalTime)
                throw SysError("Modification time is invalid.");

            if (*serverLocalTime > utcTimeNow + 24 * 3600) //time-zones range from UTC-12:00 to UTC+14:00, consider DST
                --timeComp.year; //"more likely" this time is from last year
        }
        else if (timeOrYear.size() == 4)
        {
            timeComp.year = stringTo<int>(timeOrYear);

            if (timeComp.year < 1600 || timeComp.year >= 3000)
                throw SysError("Failed to parse modification time.");
        }
        else
            throw SysError("Failed to parse modification time.");

        //let's pretend the time listing is UTC (same behavior as FileZilla)
        const std::optional<time_t> modTime = utcToTimeT(timeComp);
        if (!modTime)
            throw SysError("Modification time is invalid.");

        const std::string_view trail = parser.readRange([](char) { return true; }); //throw SysError
        const std::string_view itemName = typeTag == "l" ? beforeFirst(trail, " -> ", IfNotFoundReturn::none) : trail;
        if (itemName.empty())
            throw SysError("Item name not available.");

        if (isVirtualDirectory(itemName))
            return {ItemType::folder, std::string(itemName), 0, 0, {}};

        NativeEntry entry;
        if (typeTag == "d")
            entry.type = ItemType::folder;
        else if (typeTag == "l")
            entry.type = ItemType::symlink;
        else
            entry.fileSize = fileSize;

        entry.itemName = decodeName(itemName); //throw SysError
        if (entry.type == ItemType::folder && endsWith(entry.itemName, '/'))
            entry.itemName.pop_back();

        entry.modTime = *modTime;
        return entry;
    }
    catch (const SysError& e)
    {
        throw SysError("Unexpected FTP response. (" + std::string(rawLine) + ") [ownerGroupCount: " + numberTo<std::string>(ownerGroupCount) + "] " + e.toString());
    }
}
}


std::vector<std::string_view> rfs::splitFtpResponse(const std::string& buf)
{
    std::vector<std::string_view> lines;

    std::string_view remaining = buf;
    while (!remaining.empty())
    {
        const auto itLineEnd = std::find_if(remaining.begin(), remaining.end(), [](char c) { return isLineBreak(c) || c == '\0'; });
        const std::string_view line = makeStringView(remaining.begin(), itLineEnd);
        if (!line.empty()) //consider Windows' <CR><LF>
            lines.push_back(line);

        remaining.remove_prefix(std::min(line.size() + 1, remaining.size()));
    }
    return lines;
}


std::string rfs::formatFtpStatus(int sc)
{
    const char* statusText = [&] //https://en.wikipedia.org/wiki/List_of_FTP_server_return_codes
    {
        switch (sc)
        {
            //*INDENT-OFF*
            case 400: return "The command was not accepted but the error condition is temporary.";
            case 421: return "Service not available, closing control connection.";
            case 425: return "Cannot open data connection.";
            case 426: return "Connection closed; transfer aborted.";
            case 430: return "Invalid username or password.";
            case 434: return "Requested host unavailable.";
            case 450: return "Requested file action not taken.";
            case 451: return "Local error in processing.";
            case 452: return "Insufficient storage space in system. File unavailable, e.g. file busy.";

            case 500: return "Syntax error, command unrecognized or command line too long.";
            case 501: return "Syntax error in parameters or arguments.";
            case 502: return "Command not implemented.";
            case 503: return "Bad sequence of commands.";
            case 504: return "Command not implemented for that parameter.";
            case 530: return "User not logged in.";
            case 532: return "Need account for storing files.";
            case 534: return "Could not connect to server; issue regarding SSL.";
            case 550: return "File unavailable, e.g. file not found, no access.";
            case 551: return "Requested action aborted. Page type unknown.";
            case 552: return "Requested file action aborted. Exceeded storage allocation.";
            case 553: return "File name not allowed.";

            default:  return "";
            //*INDENT-ON*
        }
    }();

    if (std::string_view(statusText).empty())
        return replaceCpy("FTP status %x.", "%x", numberTo<std::string>(sc));
    else
        return replaceCpy("FTP status %x: ", "%x", numberTo<std::string>(sc)) + statusText;
}


NativeEntry rfs::parseMlstLine(std::string_view rawLine, const DecodeServerName& decodeName) //throw SysError
{
    /*  https://tools.ietf.org/html/rfc3659
        type=cdir;sizd=4096;modify=20170116230740;UNIX.mode=0755;UNIX.uid=874;UNIX.gid=869;unique=902g36e1c55; .
        type=pdir;sizd=4096;modify=20170116230740;UNIX.mode=0755;UNIX.uid=874;UNIX.gid=869;unique=902g36e1c55; ..
        type=file;size=4;modify=20170113063314;UNIX.mode=0600;UNIX.uid=874;UNIX.gid=869;unique=902g36e1c5d; readme.txt
        type=dir;sizd=4096;modify=20170117144634;UNIX.mode=0755;UNIX.uid=874;UNIX.gid=869;unique=902g36e418a; folder   */
    try
    {
        NativeEntry entry;

        auto itBegin = rawLine.begin();
        if (startsWith(rawLine, ' ')) //leading blank is already trimmed if MLSD was processed by curl
            ++itBegin;
        auto itBlank = std::find(itBegin, rawLine.end(), ' ');
        if (itBlank == rawLine.end())
            throw SysError("Item name not available.");

        const std::string_view facts = makeStringView(itBegin, itBlank);
        const std::string_view rawName = makeStringView(itBlank + 1, rawLine.end());

        std::string_view typeFact;
        std::string_view fileSize;

        split(facts, ';', [&](std::string_view fact)
        {
            if (startsWithAsciiNoCase(fact, "type=")) //must be case-insensitive!!!
            {
                const std::string_view tmp = afterFirst(fact, "=", IfNotFoundReturn::none);
                typeFact = beforeFirst(tmp, ":", IfNotFoundReturn::all);
            }
            else if (startsWithAsciiNoCase(fact, "size="))
                fileSize = afterFirst(fact, "=", IfNotFoundReturn::none);
            else if (startsWithAsciiNoCase(fact, "modify="))
            {
                std::string_view modifyFact = afterFirst(fact, "=", IfNotFoundReturn::none);
                modifyFact = beforeLast(modifyFact, ".", IfNotFoundReturn::all); //truncate millisecond precision if available

                const std::optional<time_t> modTime = parseMlsdTime(modifyFact);
                if (!modTime)
                    throw SysError("Modification time is invalid.");
                entry.modTime = *modTime;
            }
            else if (startsWithAsciiNoCase(fact, "unique="))
                entry.uniqueId = afterFirst(fact, "=", IfNotFoundReturn::none);
        });

        if (equalAsciiNoCase(typeFact, "cdir"))
            return {ItemType::folder, ".", 0, 0, {}};
        if (equalAsciiNoCase(typeFact, "pdir"))
            return {ItemType::folder, "..", 0, 0, {}};

        if (equalAsciiNoCase(typeFact, "dir"))
            entry.type = ItemType::folder;
        else if (equalAsciiNoCase(typeFact, "OS.unix=slink") || //the OS.unix=slink:/target syntax is a hack and often skips
                 equalAsciiNoCase(typeFact, "OS.unix=symlink")) //the target path after the colon
            entry.type = ItemType::symlink;

        if (rawName.empty())
            throw SysError("Item name not available.");
        entry.itemName = decodeName(rawName); //throw SysError

        if (entry.type == ItemType::file)
        {
            if (fileSize.empty() || !std::all_of(fileSize.begin(), fileSize.end(), isDigit))
                throw SysError("File size not available."); //crazy, but can be "-1"
            entry.fileSize = stringTo<uint64_t>(fileSize);
        }
        return entry;
    }
    catch (const SysError& e)
    {
        throw SysError("Unexpected FTP response. (" + std::string(rawLine) + ") " + e.toString());
    }
}


std::vector<NativeEntry> rfs::parseMlsdListing(const std::string& buf, const DecodeServerName& decodeName) //throw SysError
{
    std::vector<NativeEntry> output;
    for (const std::string_view line : splitFtpResponse(buf))
        output.push_back(parseMlstLine(line, decodeName)); //throw SysError
    return output;
}


std::vector<NativeEntry> rfs::parseUnixListing(const std::string& buf, time_t utcTimeNow, const DecodeServerName& decodeName) //throw SysError
{
    const std::vector<std::string_view> lines = splitFtpResponse(buf);
    auto it = lines.begin();

    if (it != lines.end() && startsWith(*it, "total "))
        ++it;

    const int utcCurrentYear = getUtcYear(utcTimeNow); //throw SysError

    //different listing formats: caveat: differentiate per item type!
    std::optional<int> dirOwnerGroupCount;
    std::optional<int> fileOwnerGroupCount;
    std::optional<int> linkOwnerGroupCount;

    std::vector<NativeEntry> output;

    std::for_each(it, lines.end(), [&](std::string_view line)
    {
        std::optional<int>& ownerGroupCount = line[0] == 'd' ? dirOwnerGroupCount :
                                              line[0] == 'l' ? linkOwnerGroupCount : fileOwnerGroupCount;
        if (!ownerGroupCount)
            ownerGroupCount = [&]
        {
            std::optional<SysError> firstError;

            for (int i = 3; i-- > 0;)
                try
                {
                    parseUnixLine(line, utcTimeNow, utcCurrentYear, i /*ownerGroupCount*/, decodeName); //throw SysError
                    return i;
                }
                catch (const SysError& e)
                {
                    if (!firstError)
                        firstError = e;
                }
            throw* firstError; //most likely the relevant one
        }();

        output.push_back(parseUnixLine(line, utcTimeNow, utcCurrentYear, *ownerGroupCount, decodeName)); //throw SysError
    });

    return output;
}


std::vector<NativeEntry> rfs::parseWindowsListing(const std::string& buf, time_t utcTimeNow, const DecodeServerName& decodeName) //throw SysError
{
    /*  listing supported by libcurl (US server)
            10-27-15  03:46AM       <DIR>          pub
            04-08-14  03:09PM               11,399 readme.txt

        IIS option "four-digit years"
            06-22-2017  04:25PM       <DIR>          test
            06-20-2017  12:50PM              1875499 zstring.obj       */
    const int utcCurrentYear = getUtcYear(utcTimeNow); //throw SysError

    std::vector<NativeEntry> output;
    for (const std::string_view line : splitFtpResponse(buf))
        try
        {
            FtpLineParser parser(line);

            const int month = stringTo<int>(parser.readRange(2, isDigit));    //throw SysError
            parser.readRange(1, [](char c) { return c == '-' || c == '/'; }); //throw SysError
            const int day = stringTo<int>(parser.readRange(2, isDigit));      //throw SysError
            parser.readRange(1, [](char c) { return c == '-' || c == '/'; }); //throw SysError
            const std::string_view yearString = parser.readRange(isDigit);    //throw SysError
            parser.readRange(isWhiteSpace);                                   //throw SysError

            int year = 0;
            if (yearString.size() == 2)
            {
                year = (utcCurrentYear / 100) * 100 + stringTo<int>(yearString);
                if (year > utcCurrentYear + 1 /*local time leeway*/)
                    year -= 100;
            }
            else if (yearString.size() == 4)
                year = stringTo<int>(yearString);
            else
                throw SysError("Failed to parse modification time.");

            int hour = stringTo<int>(parser.readRange(2, isDigit));         //throw SysError
            parser.readRange(1, [](char c) { return c == ':'; });           //throw SysError
            const int minute = stringTo<int>(parser.readRange(2, isDigit)); //throw SysError
            if (!isWhiteSpace(parser.peekNextChar()))
            {
                const std::string_view period = parser.readRange(2, [](char c) { return c == 'A' || c == 'P' || c == 'M'; }); //throw SysError
                if (period == "PM")
                {
                    if (0 <= hour && hour < 12)
                        hour += 12;
                }
                else if (hour == 12)
                    hour = 0;
            }
            parser.readRange(isWhiteSpace); //throw SysError

            TimeComp timeComp;
            timeComp.year   = year;
            timeComp.month  = month;
            timeComp.day    = day;
            timeComp.hour   = hour;
            timeComp.minute = minute;
            const std::optional<time_t> modTime = utcToTimeT(timeComp);
            if (!modTime)
                throw SysError("Modification time is invalid.");

            const std::string_view dirTagOrSize = parser.readRange(notWhiteSpace); //throw SysError
            parser.readRange(isWhiteSpace); //throw SysError

            const bool isDir = dirTagOrSize == "<DIR>";
            uint64_t fileSize = 0;
            if (!isDir)
            {
                std::string sizeStr(dirTagOrSize);
                replace(sizeStr, ",", "");
                replace(sizeStr, ".", "");
                if (sizeStr.empty() || !std::all_of(sizeStr.begin(), sizeStr.end(), isDigit))
                    throw SysError("Failed to parse file size.");
                fileSize = stringTo<uint64_t>(sizeStr);
            }

            const std::string_view itemName = parser.readRange([](char) { return true; }); //throw SysError

            NativeEntry entry;
            if (isDir)
                entry.type = ItemType::folder;
            entry.itemName = isVirtualDirectory(itemName) ? std::string(itemName) : decodeName(itemName); //throw SysError
            entry.fileSize = fileSize;
            entry.modTime  = *modTime;
            output.push_back(entry);
        }
        catch (const SysError& e)
        {
            throw SysError("Unexpected FTP response. (" + std::string(line) + ") " + e.toString());
        }

    return output;
}


std::vector<NativeEntry> rfs::parseListListing(const std::string& buf, time_t utcTimeNow, const DecodeServerName& decodeName) //throw SysError
{
    if (!buf.empty() && isDigit(buf[0])) //lame test to distinguish Unix/Dos formats as internally used by libcurl
        return parseWindowsListing(buf, utcTimeNow, decodeName); //throw SysError
    return parseUnixListing(buf, utcTimeNow, decodeName);        //
}


FtpFeatures rfs::parseFeatResponse(const std::string& featResponse)
{
    FtpFeatures output; //FEAT command: https://tools.ietf.org/html/rfc2389#page-4
    const std::vector<std::string_view> lines = splitFtpResponse(featResponse);

    auto it = std::find_if(lines.begin(), lines.end(), [](std::string_view line) { return startsWith(line, "211-") || startsWith(line, "211 "); });
    if (it != lines.end())
        for (++it; it != lines.end(); ++it)
        {
            if (equalAsciiNoCase     (*it, "211 End") ||
                startsWithAsciiNoCase(*it, "211 End "))
                break;

            std::string line(*it);
            //support ProFTPD with "MultilineRFC2228 = on"
            if (startsWith(line, "211-"))
                line = ' ' + std::string(afterFirst(line, "-", IfNotFoundReturn::none));

            //"The presence of the MLST feature indicates that both MLST and MLSD are supported"
            if (equalAsciiNoCase     (line, " MLST")  ||
                startsWithAsciiNoCase(line, " MLST ") ||
                equalAsciiNoCase     (line, " MLSD"))
                output.mlsd = true;

            else if (equalAsciiNoCase(line, " UTF8") ||
                     equalAsciiNoCase(line, " UTF8 ON") ||
                     equalAsciiNoCase(line, " UTF-8"))
                output.utf8 = true;
        }
    return output;
}


std::string rfs::parsePwdResponse(const std::string& pwdResponse) //throw SysError
{
    for (const std::string_view line : splitFtpResponse(pwdResponse))
        if (startsWith(line, "257 "))
        {
            /*  257<space>[rubbish]"<directory-name>"<space><commentary>

                "embedded double-quotes should be escaped by double-quotes" https://tools.ietf.org/html/rfc959 */
            auto itBegin = std::find(line.begin(), line.end(), '"');
            if (itBegin != line.end())
                for (auto it = ++itBegin; it != line.end(); ++it)
                    if (*it == '"')
                    {
                        if (it + 1 != line.end() && it[1] == '"')
                            ++it; //skip double quote
                        else
                            return replaceCpy(std::string(itBegin, it), "\"\"", "\"");
                    }
            break;
        }
    throw SysError("Unexpected FTP response. (" + pwdResponse + ')');
}
