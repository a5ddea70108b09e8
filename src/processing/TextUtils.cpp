#include "TextUtils.hpp"
#include <utf8proc.h>

#include <utility>

namespace greekeval::processing
{

namespace
{

constexpr char32_t REPLACEMENT_CHAR = U'\uFFFD';

utf8proc_category_t categoryOf(char32_t cp)
{
    return utf8proc_category(static_cast<utf8proc_int32_t>(cp));
}

} // namespace

std::u32string utf8ToUtf32(const std::string& utf8_str)
{
    std::u32string result;
    if (utf8_str.empty())
        return result;

    const utf8proc_uint8_t* str = reinterpret_cast<const utf8proc_uint8_t*>(utf8_str.data());
    utf8proc_ssize_t len = static_cast<utf8proc_ssize_t>(utf8_str.size());

    result.reserve(utf8_str.size());
    utf8proc_ssize_t pos = 0;
    while (pos < len)
    {
        utf8proc_int32_t codepoint;
        utf8proc_ssize_t bytes = utf8proc_iterate(str + pos, len - pos, &codepoint);
        if (bytes <= 0)
        {
            result.push_back(REPLACEMENT_CHAR);
            ++pos;
            continue;
        }
        result.push_back(static_cast<char32_t>(codepoint));
        pos += bytes;
    }
    return result;
}

std::string utf32ToUtf8(const std::u32string& utf32_str)
{
    std::string result;
    result.reserve(utf32_str.size() * 2);
    for (char32_t cp : utf32_str)
    {
        utf8proc_uint8_t buffer[4];
        utf8proc_ssize_t bytes = utf8proc_encode_char(static_cast<utf8proc_int32_t>(cp), buffer);
        if (bytes > 0)
        {
            result.append(reinterpret_cast<const char*>(buffer), static_cast<size_t>(bytes));
        }
    }
    return result;
}

bool isGreekChar(char32_t cp)
{
    return (cp >= U'\u0370' && cp <= U'\u03FF') || (cp >= U'\u1F00' && cp <= U'\u1FFF');
}

bool isDiacriticChar(char32_t cp)
{
    switch (cp)
    {
    case U'\u03AC': // ά
    case U'\u03AD': // έ
    case U'\u03AE': // ή
    case U'\u03AF': // ί
    case U'\u03CC': // ό
    case U'\u03CD': // ύ
    case U'\u03CE': // ώ
    case U'\u0390': // ΐ
    case U'\u03B0': // ΰ
        return true;
    default:
        return false;
    }
}

bool isWhitespace(char32_t cp)
{
    if ((cp >= 0x09 && cp <= 0x0D) || (cp >= 0x1C && cp <= 0x20) || cp == 0x85)
        return true;

    switch (categoryOf(cp))
    {
    case UTF8PROC_CATEGORY_ZS:
    case UTF8PROC_CATEGORY_ZL:
    case UTF8PROC_CATEGORY_ZP:
        return true;
    default:
        return false;
    }
}

bool isDigit(char32_t cp)
{
    return categoryOf(cp) == UTF8PROC_CATEGORY_ND;
}

bool isLetter(char32_t cp)
{
    switch (categoryOf(cp))
    {
    case UTF8PROC_CATEGORY_LU:
    case UTF8PROC_CATEGORY_LL:
    case UTF8PROC_CATEGORY_LT:
    case UTF8PROC_CATEGORY_LM:
    case UTF8PROC_CATEGORY_LO:
        return true;
    default:
        return false;
    }
}

bool isCombiningMark(char32_t cp)
{
    switch (categoryOf(cp))
    {
    case UTF8PROC_CATEGORY_MN:
    case UTF8PROC_CATEGORY_MC:
    case UTF8PROC_CATEGORY_ME:
        return true;
    default:
        return false;
    }
}

std::vector<std::u32string> splitWords(const std::u32string& text)
{
    std::vector<std::u32string> words;
    std::u32string current;
    for (char32_t cp : text)
    {
        if (isWhitespace(cp))
        {
            if (!current.empty())
            {
                words.push_back(std::move(current));
                current.clear();
            }
            continue;
        }
        current.push_back(cp);
    }
    if (!current.empty())
    {
        words.push_back(std::move(current));
    }
    return words;
}

std::u32string removeWhitespace(const std::u32string& text)
{
    std::u32string out;
    out.reserve(text.size());
    for (char32_t cp : text)
    {
        if (!isWhitespace(cp))
            out.push_back(cp);
    }
    return out;
}

std::u32string filterGreek(const std::u32string& text)
{
    std::u32string out;
    out.reserve(text.size());
    for (char32_t cp : text)
    {
        if (isGreekChar(cp))
            out.push_back(cp);
    }
    return out;
}

std::size_t countDiacritics(const std::u32string& word)
{
    std::size_t count = 0;
    for (char32_t cp : word)
    {
        if (isDiacriticChar(cp))
            ++count;
    }
    return count;
}

} // namespace greekeval::processing
