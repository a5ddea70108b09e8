#include "GreekTextNormalizer.hpp"
#include "TextUtils.hpp"

#include <cstdlib>

#include <utf8proc.h>
#include <plog/Log.h>

namespace greekeval::processing
{

namespace
{

constexpr char32_t CAPITAL_SIGMA = U'\u03A3';
constexpr char32_t SMALL_SIGMA = U'\u03C3';
constexpr char32_t FINAL_SIGMA = U'\u03C2';
constexpr char32_t IOTA_DIALYTIKA_TONOS = U'\u0390';
constexpr char32_t UPSILON_DIALYTIKA_TONOS = U'\u03B0';
constexpr char32_t IOTA_DIALYTIKA = U'\u03CA';
constexpr char32_t UPSILON_DIALYTIKA = U'\u03CB';

std::string mapUtf8(const std::string& text, utf8proc_option_t options, const char* stage)
{
    if (text.empty())
        return text;

    utf8proc_uint8_t* mapped = nullptr;
    utf8proc_ssize_t length = utf8proc_map(reinterpret_cast<const utf8proc_uint8_t*>(text.data()),
                                           static_cast<utf8proc_ssize_t>(text.size()), &mapped, options);

    if (length < 0 || !mapped)
    {
        PLOG_WARNING << stage << " failed (" << utf8proc_errmsg(length) << "), keeping text unchanged";
        return text;
    }

    std::string result(reinterpret_cast<char*>(mapped), static_cast<size_t>(length));
    std::free(mapped);
    return result;
}

std::string decomposeNfd(const std::string& text)
{
    return mapUtf8(text, static_cast<utf8proc_option_t>(UTF8PROC_STABLE | UTF8PROC_DECOMPOSE), "NFD decomposition");
}

// Word-final test for capital sigma; combining marks are skipped in both directions
bool endsWord(const std::u32string& text, size_t index)
{
    size_t prev = index;
    bool has_letter_before = false;
    while (prev > 0)
    {
        --prev;
        if (isCombiningMark(text[prev]))
            continue;
        has_letter_before = isLetter(text[prev]);
        break;
    }
    if (!has_letter_before)
        return false;

    for (size_t next = index + 1; next < text.size(); ++next)
    {
        if (isCombiningMark(text[next]))
            continue;
        return !isLetter(text[next]);
    }
    return true;
}

void applyGreekFolds(std::u32string& text)
{
    for (auto& cp : text)
    {
        switch (cp)
        {
        case FINAL_SIGMA:
            cp = SMALL_SIGMA;
            break;
        case IOTA_DIALYTIKA_TONOS:
            cp = IOTA_DIALYTIKA;
            break;
        case UPSILON_DIALYTIKA_TONOS:
            cp = UPSILON_DIALYTIKA;
            break;
        default:
            break;
        }
    }
}

std::u32string replacePunctuation(const std::u32string& text, bool keep_digits)
{
    std::u32string out;
    out.reserve(text.size());
    for (char32_t cp : text)
    {
        if (isGreekChar(cp) || isWhitespace(cp) || (keep_digits && isDigit(cp)))
        {
            out.push_back(cp);
        }
        else
        {
            out.push_back(U' ');
        }
    }
    return out;
}

std::u32string collapseWhitespace(const std::u32string& text)
{
    std::u32string out;
    out.reserve(text.size());
    bool pending_space = false;
    for (char32_t cp : text)
    {
        if (isWhitespace(cp))
        {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space)
        {
            out.push_back(U' ');
            pending_space = false;
        }
        out.push_back(cp);
    }
    return out;
}

} // namespace

std::string GreekTextNormalizer::composeNfc(const std::string& text) const
{
    return mapUtf8(text, static_cast<utf8proc_option_t>(UTF8PROC_STABLE | UTF8PROC_COMPOSE), "NFC normalization");
}

std::u32string GreekTextNormalizer::lowercase(const std::u32string& text) const
{
    std::u32string out = text;
    for (size_t i = 0; i < out.size(); ++i)
    {
        if (out[i] == CAPITAL_SIGMA)
        {
            out[i] = endsWord(out, i) ? FINAL_SIGMA : SMALL_SIGMA;
            continue;
        }
        out[i] = static_cast<char32_t>(utf8proc_tolower(static_cast<utf8proc_int32_t>(out[i])));
    }
    return out;
}

std::string GreekTextNormalizer::foldPolytonic(const std::string& text) const
{
    if (text.empty())
        return text;

    const std::u32string decomposed = utf8ToUtf32(decomposeNfd(text));

    std::u32string folded;
    folded.reserve(decomposed.size());

    bool greek_base = false;
    bool has_tonos = false;
    for (char32_t cp : decomposed)
    {
        if (!isCombiningMark(cp))
        {
            greek_base = isGreekChar(cp);
            has_tonos = false;
            folded.push_back(cp);
            continue;
        }

        if (!greek_base)
        {
            folded.push_back(cp);
            continue;
        }

        switch (cp)
        {
        case COMBINING_GRAVE:
        case COMBINING_ACUTE:
        case COMBINING_PERISPOMENI:
            // Monotonic spelling carries at most one tonos per letter
            if (!has_tonos)
            {
                folded.push_back(COMBINING_ACUTE);
                has_tonos = true;
            }
            break;
        case COMBINING_PSILI:
        case COMBINING_DASIA:
        case COMBINING_YPOGEGRAMMENI:
        case COMBINING_MACRON:
        case COMBINING_BREVE:
            break;
        default:
            folded.push_back(cp);
            break;
        }
    }

    return composeNfc(utf32ToUtf8(folded));
}

std::string GreekTextNormalizer::normalize(const std::string& text, const NormalizationConfig& config) const
{
    if (text.empty())
        return std::string();

    std::string current = composeNfc(text);

    if (config.lowercase)
    {
        // Lowercase letters can compose where their capitals did not
        current = composeNfc(utf32ToUtf8(lowercase(utf8ToUtf32(current))));
    }

    if (config.normalize_diacritics)
    {
        current = foldPolytonic(current);
    }

    std::u32string cps = utf8ToUtf32(current);

    if (config.greek_specific)
    {
        applyGreekFolds(cps);
    }

    if (config.remove_punctuation)
    {
        cps = replacePunctuation(cps, config.normalize_numbers);
    }

    if (config.normalize_whitespace)
    {
        cps = collapseWhitespace(cps);
    }

    return utf32ToUtf8(cps);
}

std::string GreekTextNormalizer::removeDiacritics(const std::string& text) const
{
    if (text.empty())
        return std::string();

    const std::u32string decomposed = utf8ToUtf32(decomposeNfd(text));

    std::u32string bare;
    bare.reserve(decomposed.size());

    bool greek_base = false;
    for (char32_t cp : decomposed)
    {
        if (!isCombiningMark(cp))
        {
            greek_base = isGreekChar(cp);
            bare.push_back(cp);
        }
        else if (!greek_base)
        {
            bare.push_back(cp);
        }
    }

    return composeNfc(utf32ToUtf8(bare));
}

} // namespace greekeval::processing
