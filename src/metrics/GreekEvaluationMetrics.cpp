#include "metrics/GreekEvaluationMetrics.hpp"
#include "metrics/EditDistance.hpp"
#include "processing/GreekTextNormalizer.hpp"
#include "processing/OrthographyDetector.hpp"
#include "processing/TextUtils.hpp"

#include <algorithm>
#include <cmath>
#include <utility>
#include <vector>

#include <plog/Log.h>

namespace greekeval::metrics
{

using processing::filterGreek;
using processing::removeWhitespace;
using processing::splitWords;
using processing::utf8ToUtf32;

namespace
{

// One normalized text cut into the token streams the metrics run on
struct TokenizedText
{
    std::string normalized;
    std::vector<std::u32string> words;
    std::u32string chars;
};

TokenizedText tokenize(const processing::ITextNormalizer& normalizer, const std::string& text,
                       const processing::NormalizationConfig& config)
{
    TokenizedText out;
    out.normalized = normalizer.normalize(text, config);
    const std::u32string cps = utf8ToUtf32(out.normalized);
    out.words = splitWords(cps);
    out.chars = removeWhitespace(cps);
    return out;
}

double greekCharAccuracy(const std::u32string& reference, const std::u32string& hypothesis)
{
    const std::u32string ref_greek = filterGreek(reference);
    const std::u32string hyp_greek = filterGreek(hypothesis);

    if (ref_greek.empty())
        return hyp_greek.empty() ? 100.0 : 0.0;

    const std::size_t distance = levenshteinDistance(ref_greek, hyp_greek);
    const double error = static_cast<double>(distance) / static_cast<double>(ref_greek.size()) * 100.0;
    return std::max(0.0, 100.0 - error);
}

} // namespace

GreekEvaluationMetrics::GreekEvaluationMetrics(double rate_cap)
    : rate_cap_(rate_cap)
    , normalizer_(std::make_unique<processing::GreekTextNormalizer>())
    , aligner_(*normalizer_)
{
    if (!std::isfinite(rate_cap_) || rate_cap_ <= 0.0)
    {
        PLOG_WARNING << "Invalid rate cap " << rate_cap_ << ", using " << kDefaultRateCap;
        rate_cap_ = kDefaultRateCap;
    }
}

GreekEvaluationMetrics::~GreekEvaluationMetrics() = default;

double GreekEvaluationMetrics::errorRate(const std::string& reference, const std::string& hypothesis,
                                         std::size_t reference_tokens, std::size_t hypothesis_tokens,
                                         std::size_t distance) const
{
    if (reference.empty())
        return hypothesis.empty() ? 0.0 : 100.0;
    if (hypothesis.empty())
        return 100.0;

    // Reference normalized away entirely (punctuation only, whitespace only)
    if (reference_tokens == 0)
        return hypothesis_tokens == 0 ? 0.0 : 100.0;

    const double rate = static_cast<double>(distance) / static_cast<double>(reference_tokens) * 100.0;
    return std::min(rate, rate_cap_);
}

double GreekEvaluationMetrics::calculateWer(const std::string& reference, const std::string& hypothesis,
                                            const processing::NormalizationConfig& config) const
{
    if (reference.empty() || hypothesis.empty())
        return errorRate(reference, hypothesis, 0, 0, 0);

    const TokenizedText ref = tokenize(*normalizer_, reference, config);
    const TokenizedText hyp = tokenize(*normalizer_, hypothesis, config);
    return errorRate(reference, hypothesis, ref.words.size(), hyp.words.size(),
                     levenshteinDistance(ref.words, hyp.words));
}

double GreekEvaluationMetrics::calculateCer(const std::string& reference, const std::string& hypothesis,
                                            const processing::NormalizationConfig& config) const
{
    if (reference.empty() || hypothesis.empty())
        return errorRate(reference, hypothesis, 0, 0, 0);

    const TokenizedText ref = tokenize(*normalizer_, reference, config);
    const TokenizedText hyp = tokenize(*normalizer_, hypothesis, config);
    return errorRate(reference, hypothesis, ref.chars.size(), hyp.chars.size(),
                     levenshteinDistance(ref.chars, hyp.chars));
}

MetricsRecord GreekEvaluationMetrics::evaluate(const std::string& reference, const std::string& hypothesis,
                                               const processing::NormalizationConfig& config) const
{
    TokenizedText ref = tokenize(*normalizer_, reference, config);
    TokenizedText hyp = tokenize(*normalizer_, hypothesis, config);

    MetricsRecord record;

    record.word_operations = levenshteinDetailed(ref.words, hyp.words);
    record.word_edit_distance = record.word_operations.distance;
    record.char_edit_distance = levenshteinDistance(ref.chars, hyp.chars);

    record.reference_word_count = ref.words.size();
    record.hypothesis_word_count = hyp.words.size();
    record.reference_char_count = ref.chars.size();
    record.hypothesis_char_count = hyp.chars.size();

    record.wer = errorRate(reference, hypothesis, ref.words.size(), hyp.words.size(), record.word_edit_distance);
    record.cer = errorRate(reference, hypothesis, ref.chars.size(), hyp.chars.size(), record.char_edit_distance);
    record.word_accuracy = 100.0 - record.wer;
    record.char_accuracy = 100.0 - record.cer;

    record.diacritics = aligner_.analyze(reference, hypothesis, config);
    record.diacritic_errors = 100.0 - record.diacritics.accuracy;

    record.greek_char_accuracy = greekCharAccuracy(ref.chars, hyp.chars);

    const std::size_t longest = std::max(ref.words.size(), hyp.words.size());
    record.normalized_edit_distance =
        longest > 0 ? static_cast<double>(record.word_edit_distance) / static_cast<double>(longest) * 100.0 : 0.0;
    record.word_information_preserved = 100.0 - record.normalized_edit_distance;

    record.orthography = processing::DetectOrthography(reference);

    record.reference_normalized = std::move(ref.normalized);
    record.hypothesis_normalized = std::move(hyp.normalized);

    PLOG_DEBUG << "Evaluated " << record.reference_word_count << " reference words: WER=" << record.wer
               << " CER=" << record.cer << " orthography=" << processing::toString(record.orthography);

    return record;
}

} // namespace greekeval::metrics
