#pragma once

#include "processing/ITextNormalizer.hpp"
#include "processing/NormalizationConfig.hpp"

#include <cstddef>
#include <string>

namespace greekeval::metrics
{

struct DiacriticStats
{
    std::size_t total_diacritics = 0;   // accented vowels in the reference
    std::size_t correct_diacritics = 0;
    std::size_t missed_diacritics = 0;
    std::size_t extra_diacritics = 0;   // accents the hypothesis adds where the reference has none
    double accuracy = 100.0;
    double precision = 100.0;
    double recall = 100.0;

    bool operator==(const DiacriticStats&) const = default;
};

/**
 * @brief Scores tonos placement between a reference and a hypothesis transcript.
 *
 * Words are paired by a minimum-cost word alignment. Pairs whose bare forms
 * (all accents stripped) agree are compared position by position; pairs that
 * are different words, and unpaired reference words, only add their accents to
 * the total. With no accents in the reference every percentage is 100.
 *
 * Example:
 * @code
 * GreekTextNormalizer normalizer;
 * DiacriticAligner aligner(normalizer);
 * auto stats = aligner.analyze("πώς είστε", "πως είστε", {});
 * // stats.total_diacritics == 2, stats.correct_diacritics == 1
 * @endcode
 */
class DiacriticAligner
{
public:
    // The normalizer must outlive the aligner
    explicit DiacriticAligner(const processing::ITextNormalizer& normalizer);

    [[nodiscard]] DiacriticStats analyze(const std::string& reference, const std::string& hypothesis,
                                         const processing::NormalizationConfig& config) const;

private:
    const processing::ITextNormalizer& normalizer_;
};

} // namespace greekeval::metrics
