// *****************************************************************************
// * This file is part of the RemoteFs project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef BASE64_H_3390174523618847
#define BASE64_H_3390174523618847

#include <algorithm>
#include <cstdint>
#include <string>
#include <string_view>


namespace rfs
{
/*  https://en.wikipedia.org/wiki/Base64
    used to obfuscate passwords inside connection phrases

        stringEncodeBase64("Sample text") == "U2FtcGxlIHRleHQ="      */
std::string stringEncodeBase64(std::string_view str); //nothrow!
std::string stringDecodeBase64(std::string_view str); //nothrow! skips unknown characters






//------------------------- implementation -------------------------------
namespace impl
{
constexpr char ENCODING_MIME[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

inline
int decodeMimeChar(char c) //-1 if not part of the alphabet
{
    if ('A' <= c && c <= 'Z') return c - 'A';
    if ('a' <= c && c <= 'z') return c - 'a' + 26;
    if ('0' <= c && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}
}


inline
std::string stringEncodeBase64(std::string_view str)
{
    std::string output;
    output.reserve((str.size() + 2) / 3 * 4);

    for (size_t i = 0; i < str.size(); i += 3)
    {
        const size_t blockSize = std::min<size_t>(3, str.size() - i);

        uint32_t block = static_cast<unsigned char>(str[i]) << 16;
        if (blockSize > 1) block |= static_cast<unsigned char>(str[i + 1]) << 8;
        if (blockSize > 2) block |= static_cast<unsigned char>(str[i + 2]);

        output += impl::ENCODING_MIME[(block >> 18) & 0x3f];
        output += impl::ENCODING_MIME[(block >> 12) & 0x3f];
        output += blockSize > 1 ? impl::ENCODING_MIME[(block >> 6) & 0x3f] : '=';
        output += blockSize > 2 ? impl::ENCODING_MIME[block & 0x3f] : '=';
    }
    return output;
}


inline
std::string stringDecodeBase64(std::string_view str)
{
    std::string output;
    uint32_t buffer = 0;
    int bitCount = 0;

    for (const char c : str)
    {
        if (c == '=') //padding
            break;

        const int index = impl::decodeMimeChar(c);
        if (index < 0) //skip line breaks, blanks, etc.
            continue;

        buffer = (buffer << 6) | static_cast<uint32_t>(index);
        bitCount += 6;
        if (bitCount >= 8)
        {
            bitCount -= 8;
            output += static_cast<char>((buffer >> bitCount) & 0xff);
        }
    }
    return output;
}
}

#endif //BASE64_H_3390174523618847
