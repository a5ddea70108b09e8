#pragma once

#include "metrics/DiacriticAligner.hpp"
#include "metrics/MetricsRecord.hpp"
#include "processing/ITextNormalizer.hpp"
#include "processing/NormalizationConfig.hpp"

#include <memory>
#include <string>

namespace greekeval::metrics
{

// Upper clamp for WER and CER; insertion-heavy hypotheses can exceed 100%
constexpr double kDefaultRateCap = 200.0;

/**
 * @brief Entry point of the evaluation engine.
 *
 * Turns a (reference, hypothesis) pair into a MetricsRecord: WER and CER with
 * word-level operation counts, diacritic accuracy, Greek-character accuracy and
 * the orthography of the reference. Every input pair yields a record; empty
 * texts map to the fixed conventions below instead of errors.
 *
 * - reference and hypothesis empty: WER = CER = 0
 * - exactly one of them empty: WER = CER = 100
 * - otherwise rate = distance / reference tokens * 100, clamped to rateCap()
 *
 * calculateWer and calculateCer share the normalization and distance code of
 * evaluate, so they always agree with the record's wer and cer.
 *
 * Example:
 * @code
 * GreekEvaluationMetrics metrics;
 * MetricsRecord record = metrics.evaluate("Καλησπέρα, πώς είστε;", "καλησπέρα πως είστε");
 * @endcode
 */
class GreekEvaluationMetrics
{
public:
    // A cap that is not a positive finite number falls back to kDefaultRateCap
    explicit GreekEvaluationMetrics(double rate_cap = kDefaultRateCap);
    ~GreekEvaluationMetrics();

    GreekEvaluationMetrics(GreekEvaluationMetrics&&) noexcept = default;
    GreekEvaluationMetrics& operator=(GreekEvaluationMetrics&&) noexcept = delete;

    [[nodiscard]] MetricsRecord evaluate(const std::string& reference, const std::string& hypothesis,
                                         const processing::NormalizationConfig& config = {}) const;

    [[nodiscard]] double calculateWer(const std::string& reference, const std::string& hypothesis,
                                      const processing::NormalizationConfig& config = {}) const;

    [[nodiscard]] double calculateCer(const std::string& reference, const std::string& hypothesis,
                                      const processing::NormalizationConfig& config = {}) const;

    double rateCap() const { return rate_cap_; }

private:
    double rate_cap_;
    std::unique_ptr<processing::ITextNormalizer> normalizer_;
    DiacriticAligner aligner_;

    double errorRate(const std::string& reference, const std::string& hypothesis, std::size_t reference_tokens,
                     std::size_t hypothesis_tokens, std::size_t distance) const;
};

} // namespace greekeval::metrics
