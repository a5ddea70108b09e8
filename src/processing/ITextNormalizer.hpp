#pragma once

#include "NormalizationConfig.hpp"

#include <string>

namespace greekeval::processing
{

class ITextNormalizer
{
public:
    virtual ~ITextNormalizer() = default;

    // Full normalization pipeline selected by config. Empty input yields empty output.
    [[nodiscard]] virtual std::string normalize(const std::string& text, const NormalizationConfig& config) const = 0;

    // Strips accents and dialytika from Greek letters, leaving the bare base form
    [[nodiscard]] virtual std::string removeDiacritics(const std::string& text) const = 0;
};

} // namespace greekeval::processing
