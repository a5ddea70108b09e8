#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace greekeval::processing
{

/// UTF-8 to UTF-32 conversion. Undecodable bytes become U+FFFD.
std::u32string utf8ToUtf32(const std::string& utf8_str);

/// UTF-32 to UTF-8 conversion
std::string utf32ToUtf8(const std::u32string& utf32_str);

/// Greek and Coptic (U+0370-U+03FF) or Greek Extended (U+1F00-U+1FFF)
bool isGreekChar(char32_t cp);

/// One of the precomposed monotonic accented vowels άέήίόύώΐΰ
bool isDiacriticChar(char32_t cp);

/// Unicode White_Space (ASCII controls, NEL, Zs/Zl/Zp)
bool isWhitespace(char32_t cp);

/// General category Nd
bool isDigit(char32_t cp);

/// General category L*
bool isLetter(char32_t cp);

/// General category Mn, Mc or Me
bool isCombiningMark(char32_t cp);

/// Splits on runs of whitespace; never yields empty tokens
std::vector<std::u32string> splitWords(const std::u32string& text);

/// Drops every whitespace code point
std::u32string removeWhitespace(const std::u32string& text);

/// Keeps only Greek-script code points
std::u32string filterGreek(const std::u32string& text);

/// Number of isDiacriticChar code points in a word
std::size_t countDiacritics(const std::u32string& word);

/// Combining marks that appear on Greek letters after NFD
constexpr char32_t COMBINING_GRAVE = U'\u0300';        // varia
constexpr char32_t COMBINING_ACUTE = U'\u0301';        // tonos / oxeia
constexpr char32_t COMBINING_MACRON = U'\u0304';
constexpr char32_t COMBINING_BREVE = U'\u0306';
constexpr char32_t COMBINING_DIAERESIS = U'\u0308';    // dialytika
constexpr char32_t COMBINING_PSILI = U'\u0313';        // smooth breathing
constexpr char32_t COMBINING_DASIA = U'\u0314';        // rough breathing
constexpr char32_t COMBINING_PERISPOMENI = U'\u0342';  // circumflex
constexpr char32_t COMBINING_YPOGEGRAMMENI = U'\u0345'; // iota subscript

} // namespace greekeval::processing
