// *****************************************************************************
// * This file is part of the RemoteFs project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef STRING_TOOLS_H_2130948130957234598
#define STRING_TOOLS_H_2130948130957234598

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>


//UTF-8 string helpers: the rest of the world uses std::string
namespace rfs
{
inline bool isWhiteSpace(char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\v' || c == '\f'; }
inline bool isLineBreak (char c) { return c == '\r' || c == '\n'; }
inline bool isDigit     (char c) { return '0' <= c && c <= '9'; } //unlike std::isdigit: no locale, no UB for negative chars
inline bool isAsciiChar (char c) { return static_cast<unsigned char>(c) < 128; }
inline char asciiToLower(char c) { return 'A' <= c && c <= 'Z' ? static_cast<char>(c - 'A' + 'a') : c; }

inline bool isAsciiString(std::string_view str) { return std::all_of(str.begin(), str.end(), isAsciiChar); }

inline bool startsWith(std::string_view str, std::string_view prefix) { return str.substr(0, prefix.size()) == prefix; }
inline bool startsWith(std::string_view str, char prefix) { return !str.empty() && str.front() == prefix; }
inline bool endsWith  (std::string_view str, std::string_view postfix) { return str.size() >= postfix.size() && str.substr(str.size() - postfix.size()) == postfix; }
inline bool endsWith  (std::string_view str, char postfix) { return !str.empty() && str.back() == postfix; }
inline bool contains  (std::string_view str, std::string_view term) { return str.find(term) != std::string_view::npos; }
inline bool contains  (std::string_view str, char ch) { return str.find(ch) != std::string_view::npos; }

inline
bool equalAsciiNoCase(std::string_view lhs, std::string_view rhs)
{
    return lhs.size() == rhs.size() &&
           std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) { return asciiToLower(a) == asciiToLower(b); });
}

inline bool startsWithAsciiNoCase(std::string_view str, std::string_view prefix) { return equalAsciiNoCase(str.substr(0, prefix.size()), prefix); }


enum class IfNotFoundReturn
{
    all,
    none
};
std::string_view afterLast  (std::string_view str, std::string_view term, IfNotFoundReturn infr);
std::string_view beforeLast (std::string_view str, std::string_view term, IfNotFoundReturn infr);
std::string_view afterFirst (std::string_view str, std::string_view term, IfNotFoundReturn infr);
std::string_view beforeFirst(std::string_view str, std::string_view term, IfNotFoundReturn infr);

template <class Function>
void split(std::string_view str, char delimiter, Function onStringPart);

std::string_view trimCpy(std::string_view str);
void trim(std::string& str);

void replace   (std::string& str, std::string_view oldTerm, std::string_view newTerm);
std::string replaceCpy(std::string str, std::string_view oldTerm, std::string_view newTerm);

template <class S, class Num> S numberTo(const Num& number);
template <class Num> Num stringTo(std::string_view str); //returns 0 on error like std::atoi

inline std::string_view makeStringView(std::string_view::const_iterator first, std::string_view::const_iterator last) { return std::string_view(first, last); }






//######################## implementation ########################
inline
std::string_view afterLast(std::string_view str, std::string_view term, IfNotFoundReturn infr)
{
    const size_t pos = str.rfind(term);
    if (pos == std::string_view::npos)
        return infr == IfNotFoundReturn::all ? str : std::string_view();
    return str.substr(pos + term.size());
}


inline
std::string_view beforeLast(std::string_view str, std::string_view term, IfNotFoundReturn infr)
{
    const size_t pos = str.rfind(term);
    if (pos == std::string_view::npos)
        return infr == IfNotFoundReturn::all ? str : std::string_view();
    return str.substr(0, pos);
}


inline
std::string_view afterFirst(std::string_view str, std::string_view term, IfNotFoundReturn infr)
{
    const size_t pos = str.find(term);
    if (pos == std::string_view::npos)
        return infr == IfNotFoundReturn::all ? str : std::string_view();
    return str.substr(pos + term.size());
}


inline
std::string_view beforeFirst(std::string_view str, std::string_view term, IfNotFoundReturn infr)
{
    const size_t pos = str.find(term);
    if (pos == std::string_view::npos)
        return infr == IfNotFoundReturn::all ? str : std::string_view();
    return str.substr(0, pos);
}


template <class Function> inline
void split(std::string_view str, char delimiter, Function onStringPart)
{
    for (;;)
    {
        const size_t pos = str.find(delimiter);
        if (pos == std::string_view::npos)
            return onStringPart(str);

        onStringPart(str.substr(0, pos));
        str.remove_prefix(pos + 1);
    }
}


inline
std::string_view trimCpy(std::string_view str)
{
    auto itFirst = std::find_if_not(str.begin(), str.end(), isWhiteSpace);
    auto itLast  = std::find_if_not(str.rbegin(), std::make_reverse_iterator(itFirst), isWhiteSpace).base();
    return makeStringView(itFirst, itLast);
}


inline
void trim(std::string& str)
{
    str = std::string(trimCpy(str));
}


inline
void replace(std::string& str, std::string_view oldTerm, std::string_view newTerm)
{
    if (oldTerm.empty())
        return;

    for (size_t pos = str.find(oldTerm); pos != std::string::npos; pos = str.find(oldTerm, pos + newTerm.size()))
        str.replace(pos, oldTerm.size(), newTerm);
}


inline
std::string replaceCpy(std::string str, std::string_view oldTerm, std::string_view newTerm)
{
    replace(str, oldTerm, newTerm);
    return str;
}


template <class S, class Num> inline
S numberTo(const Num& number)
{
    static_assert(std::is_integral_v<Num>);
    static_assert(std::is_same_v<S, std::string>);
    return std::to_string(number);
}


template <class Num> inline
Num stringTo(std::string_view str)
{
    static_assert(std::is_integral_v<Num>);
    str = trimCpy(str);
    if (startsWith(str, '+'))
        str.remove_prefix(1);

    Num number = 0;
    if (const auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), number);
        ec != std::errc())
        return 0;
    return number;
}
}

#endif //STRING_TOOLS_H_2130948130957234598
