#pragma once

#include "ITextNormalizer.hpp"

#include <string>

namespace greekeval::processing
{

/**
 * @brief Canonicalizes Greek transcripts before WER/CER scoring.
 *
 * Pipeline, each step gated by NormalizationConfig:
 * - Unicode NFC (always), so precomposed and decomposed accents compare equal
 * - lowercase, with capital sigma becoming ς at the end of a word
 * - polytonic fold: oxeia, varia and perispomeni become a single tonos;
 *   breathings, iota subscript, macron and breve are dropped
 * - Greek folds: ς -> σ, ΐ -> ϊ, ΰ -> ϋ
 * - everything except Greek letters, whitespace and (optionally) digits becomes a space
 * - whitespace runs collapse to one space, ends trimmed
 *
 * normalize(normalize(x)) == normalize(x) for every config.
 * Stateless; safe to share between threads.
 */
class GreekTextNormalizer : public ITextNormalizer
{
public:
    GreekTextNormalizer() = default;
    ~GreekTextNormalizer() override = default;

    [[nodiscard]] std::string normalize(const std::string& text, const NormalizationConfig& config) const override;
    [[nodiscard]] std::string removeDiacritics(const std::string& text) const override;

    // Individual stages, exposed for callers that build their own pipeline
    [[nodiscard]] std::string composeNfc(const std::string& text) const;
    [[nodiscard]] std::string foldPolytonic(const std::string& text) const;
    [[nodiscard]] std::u32string lowercase(const std::u32string& text) const;
};

} // namespace greekeval::processing
