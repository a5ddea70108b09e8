#pragma once

#include "metrics/GreekEvaluationMetrics.hpp"
#include "processing/NormalizationConfig.hpp"
#include "utils/LogManager.hpp"

#include <string>
#include <string_view>

#include <toml++/toml.h>

namespace greekeval::config
{

// Everything a host needs to set up an evaluation session
struct EvaluationSettings
{
    processing::NormalizationConfig normalization;
    double rate_cap = metrics::kDefaultRateCap;
    utils::LogManager::Settings logging;
};

/**
 * @brief Reads EvaluationSettings from a TOML document.
 *
 * Recognized tables:
 * @code
 * [normalization]
 * lowercase = true
 * remove_punctuation = true
 * normalize_diacritics = true
 * normalize_numbers = true
 * normalize_whitespace = true
 * greek_specific = true
 *
 * [metrics]
 * rate_cap = 200.0
 *
 * [logging]
 * level = 4            # plog severity, 0 (none) .. 6 (verbose)
 * file = "logs/greekeval.log"
 * append = true
 * console = false
 * max_file_size = 10485760
 * backup_count = 3
 * @endcode
 *
 * Absent keys keep their defaults. Out-of-range values are reported as
 * configuration warnings and ignored. A missing file or a TOML syntax error
 * fails the whole load and leaves the output untouched.
 */
class EvaluationConfigLoader
{
public:
    EvaluationConfigLoader() = default;
    ~EvaluationConfigLoader() = default;

    bool load(const std::string& path, EvaluationSettings& outSettings);
    bool parse(std::string_view content, EvaluationSettings& outSettings, std::string_view sourcePath = "");
    bool save(const std::string& path, const EvaluationSettings& settings);

    static void apply(const toml::table& root, EvaluationSettings& settings);
    static toml::table serialize(const EvaluationSettings& settings);

    const char* lastError() const { return last_error_.c_str(); }

private:
    std::string last_error_;
};

} // namespace greekeval::config
