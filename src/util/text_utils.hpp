#ifndef DOCSHIELD_UTIL_TEXT_UTILS_HPP
#define DOCSHIELD_UTIL_TEXT_UTILS_HPP

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>

/**
 * @file text_utils.hpp
 * @brief Case folding and trimming helpers shared by the rules, the sanitizer
 *        and the highlighter.
 *
 * Folding is ASCII-only and byte-wise. UTF-8 continuation bytes are never in
 * the ASCII range, so a folded comparison never matches across a multi-byte
 * character boundary and every match offset is also an offset into the
 * original text.
 */

namespace docshield {
namespace util {
namespace text {

inline char foldChar(char c)
{
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

inline std::string toLower(const std::string &in)
{
    std::string out(in);
    std::transform(out.begin(), out.end(), out.begin(), foldChar);
    return out;
}

inline std::string toUpper(const std::string &in)
{
    std::string out(in);
    std::transform(out.begin(), out.end(), out.begin(), [](char c) {
        return (c >= 'a' && c <= 'z') ? static_cast<char>(c - 'a' + 'A') : c;
    });
    return out;
}

inline bool isSpace(char c)
{
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

/**
 * @brief Return a copy of @p s without leading/trailing whitespace.
 */
inline std::string trimmed(const std::string &s)
{
    size_t begin = 0;
    while (begin < s.size() && isSpace(s[begin])) {
        ++begin;
    }
    size_t end = s.size();
    while (end > begin && isSpace(s[end - 1])) {
        --end;
    }
    return s.substr(begin, end - begin);
}

inline bool isBlank(const std::string &s)
{
    return std::all_of(s.begin(), s.end(), isSpace);
}

/**
 * @brief True if @p needle occurs in @p haystack at @p pos, ignoring ASCII case.
 */
inline bool matchesAtIgnoreCase(const std::string &haystack, size_t pos, const std::string &needle)
{
    if (needle.empty() || pos + needle.size() > haystack.size()) {
        return false;
    }
    for (size_t i = 0; i < needle.size(); ++i) {
        if (foldChar(haystack[pos + i]) != foldChar(needle[i])) {
            return false;
        }
    }
    return true;
}

/**
 * @brief Case-insensitive substring search.
 * @return Offset of the first occurrence at or after @p from, or npos.
 */
inline size_t findIgnoreCase(const std::string &haystack, const std::string &needle, size_t from = 0)
{
    if (needle.empty() || needle.size() > haystack.size()) {
        return std::string::npos;
    }
    for (size_t pos = from; pos + needle.size() <= haystack.size(); ++pos) {
        if (matchesAtIgnoreCase(haystack, pos, needle)) {
            return pos;
        }
    }
    return std::string::npos;
}

inline bool containsIgnoreCase(const std::string &haystack, const std::string &needle)
{
    return findIgnoreCase(haystack, needle) != std::string::npos;
}

inline bool equalsIgnoreCase(const std::string &a, const std::string &b)
{
    return a.size() == b.size() && matchesAtIgnoreCase(a, 0, b);
}

/**
 * @brief Append a Unicode code point to @p out as UTF-8.
 */
inline void appendUtf8(std::string &out, uint32_t cp)
{
    if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
        cp = 0xFFFD;
    }
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

} // namespace text
} // namespace util
} // namespace docshield

#endif // DOCSHIELD_UTIL_TEXT_UTILS_HPP
