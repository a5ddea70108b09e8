#pragma once

namespace greekeval::processing
{

// Switches for GreekTextNormalizer. Built once per evaluation session and
// passed by const reference; nothing mutates it during evaluation.
struct NormalizationConfig
{
    bool lowercase = true;
    bool remove_punctuation = true;
    bool normalize_diacritics = true; // Fold polytonic accents to monotonic tonos
    bool normalize_numbers = true;    // Keep digits when stripping punctuation
    bool normalize_whitespace = true;
    bool greek_specific = true;       // ς -> σ, ΐ -> ϊ, ΰ -> ϋ

    bool operator==(const NormalizationConfig&) const = default;
};

} // namespace greekeval::processing
