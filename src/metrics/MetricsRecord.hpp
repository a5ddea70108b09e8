#pragma once

#include "metrics/DiacriticAligner.hpp"
#include "metrics/EditDistance.hpp"
#include "processing/OrthographyDetector.hpp"

#include <cstddef>
#include <string>

namespace greekeval::metrics
{

/**
 * @brief Result of one reference/hypothesis comparison.
 *
 * Rates and accuracies are percentages kept at full precision; rounding is a
 * presentation concern left to MetricsSerializer. wer and cer are clamped to
 * the facade's rate cap, so word_accuracy and char_accuracy may be negative.
 */
struct MetricsRecord
{
    double wer = 0.0;
    double cer = 0.0;
    double word_accuracy = 100.0;
    double char_accuracy = 100.0;

    EditOperationCounts word_operations;
    DiacriticStats diacritics;
    double diacritic_errors = 0.0;
    double greek_char_accuracy = 100.0;

    std::size_t reference_word_count = 0;
    std::size_t hypothesis_word_count = 0;
    std::size_t reference_char_count = 0; // code points, whitespace excluded
    std::size_t hypothesis_char_count = 0;

    std::size_t word_edit_distance = 0;
    std::size_t char_edit_distance = 0;
    double normalized_edit_distance = 0.0; // word distance over the longer word sequence
    double word_information_preserved = 100.0;

    std::string reference_normalized;
    std::string hypothesis_normalized;

    processing::Orthography orthography = processing::Orthography::Monotonic;

    bool operator==(const MetricsRecord&) const = default;
};

} // namespace greekeval::metrics
