#include "processing/OrthographyDetector.hpp"
#include "processing/TextUtils.hpp"

#include <string>

namespace greekeval::processing
{

namespace
{

bool isPolytonicBlock(char32_t cp)
{
    return cp >= U'\u1F00' && cp <= U'\u1FFF';
}

bool isMonotonicTonosVowel(char32_t cp)
{
    if (isDiacriticChar(cp))
        return true;

    switch (cp)
    {
    case U'\u0386': // Ά
    case U'\u0388': // Έ
    case U'\u0389': // Ή
    case U'\u038A': // Ί
    case U'\u038C': // Ό
    case U'\u038E': // Ύ
    case U'\u038F': // Ώ
        return true;
    default:
        return false;
    }
}

bool isPolytonicCombiningMark(char32_t cp)
{
    switch (cp)
    {
    case COMBINING_GRAVE:
    case COMBINING_PSILI:
    case COMBINING_DASIA:
    case COMBINING_PERISPOMENI:
    case COMBINING_YPOGEGRAMMENI:
        return true;
    default:
        return false;
    }
}

} // namespace

Orthography DetectOrthography(std::string_view text)
{
    bool has_monotonic = false;
    bool has_polytonic = false;

    // Accent state of the current Greek letter, including any marks that follow it
    bool greek_base = false;
    bool letter_acute = false;
    bool letter_polytonic = false;

    auto settleLetter = [&]() {
        if (letter_polytonic)
            has_polytonic = true;
        else if (letter_acute)
            has_monotonic = true;
        letter_acute = false;
        letter_polytonic = false;
    };

    const std::u32string cps = utf8ToUtf32(std::string(text));
    for (char32_t cp : cps)
    {
        if (isCombiningMark(cp))
        {
            // An acute stacked with any polytonic mark is an oxeia
            if (greek_base)
            {
                if (cp == COMBINING_ACUTE)
                    letter_acute = true;
                else if (isPolytonicCombiningMark(cp))
                    letter_polytonic = true;
            }
            continue;
        }

        settleLetter();
        if (has_monotonic && has_polytonic)
            return Orthography::Mixed;

        greek_base = isGreekChar(cp);
        if (isPolytonicBlock(cp))
            letter_polytonic = true;
        else if (isMonotonicTonosVowel(cp))
            letter_acute = true;
    }
    settleLetter();

    if (has_monotonic && has_polytonic)
        return Orthography::Mixed;
    if (has_polytonic)
        return Orthography::Polytonic;

    return Orthography::Monotonic;
}

std::string toString(Orthography orthography)
{
    switch (orthography)
    {
    case Orthography::Monotonic:
        return "monotonic";
    case Orthography::Polytonic:
        return "polytonic";
    case Orthography::Mixed:
        return "mixed";
    default:
        return "monotonic";
    }
}

std::optional<Orthography> orthographyFromString(std::string_view name)
{
    if (name == "monotonic")
        return Orthography::Monotonic;
    if (name == "polytonic")
        return Orthography::Polytonic;
    if (name == "mixed")
        return Orthography::Mixed;
    return std::nullopt;
}

} // namespace greekeval::processing
