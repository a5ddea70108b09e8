#include "metrics/DiacriticAligner.hpp"
#include "metrics/EditDistance.hpp"
#include "processing/TextUtils.hpp"

#include <algorithm>
#include <vector>

#include <plog/Log.h>

namespace greekeval::metrics
{

using processing::countDiacritics;
using processing::isDiacriticChar;
using processing::splitWords;
using processing::utf32ToUtf8;
using processing::utf8ToUtf32;

namespace
{

double percentage(std::size_t part, std::size_t whole)
{
    if (whole == 0)
        return 100.0;
    return static_cast<double>(part) / static_cast<double>(whole) * 100.0;
}

} // namespace

DiacriticAligner::DiacriticAligner(const processing::ITextNormalizer& normalizer)
    : normalizer_(normalizer)
{
}

DiacriticStats DiacriticAligner::analyze(const std::string& reference, const std::string& hypothesis,
                                         const processing::NormalizationConfig& config) const
{
    const auto ref_words = splitWords(utf8ToUtf32(normalizer_.normalize(reference, config)));
    const auto hyp_words = splitWords(utf8ToUtf32(normalizer_.normalize(hypothesis, config)));

    DiacriticStats stats;

    // Nothing to compare against: no diacritic can be scored either way
    if (ref_words.empty() || hyp_words.empty())
        return stats;

    for (const auto& pair : levenshteinAlign(ref_words, hyp_words))
    {
        if (!pair.ref_index || !pair.hyp_index)
        {
            // Whole word dropped or inserted
            if (pair.ref_index)
                stats.total_diacritics += countDiacritics(ref_words[*pair.ref_index]);
            continue;
        }

        const std::u32string& ref_word = ref_words[*pair.ref_index];
        const std::u32string& hyp_word = hyp_words[*pair.hyp_index];

        const std::string ref_base = normalizer_.removeDiacritics(utf32ToUtf8(ref_word));
        const std::string hyp_base = normalizer_.removeDiacritics(utf32ToUtf8(hyp_word));

        if (ref_base != hyp_base)
        {
            // A different word; its accents count against the total only
            stats.total_diacritics += countDiacritics(ref_word);
            continue;
        }

        const std::size_t common = std::min(ref_word.size(), hyp_word.size());
        for (std::size_t i = 0; i < common; ++i)
        {
            if (isDiacriticChar(ref_word[i]))
            {
                ++stats.total_diacritics;
                if (ref_word[i] == hyp_word[i])
                    ++stats.correct_diacritics;
                else
                    ++stats.missed_diacritics;
            }
            else if (isDiacriticChar(hyp_word[i]))
            {
                ++stats.extra_diacritics;
            }
        }
    }

    stats.accuracy = percentage(stats.correct_diacritics, stats.total_diacritics);
    stats.recall = stats.accuracy;
    stats.precision = percentage(stats.correct_diacritics, stats.correct_diacritics + stats.extra_diacritics);

    PLOG_DEBUG << "Diacritics: total=" << stats.total_diacritics << " correct=" << stats.correct_diacritics
               << " missed=" << stats.missed_diacritics << " extra=" << stats.extra_diacritics;

    return stats;
}

} // namespace greekeval::metrics
