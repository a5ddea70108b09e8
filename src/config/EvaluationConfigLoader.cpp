#include "config/EvaluationConfigLoader.hpp"
#include "utils/ErrorReporter.hpp"

#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>

#include <plog/Log.h>

namespace fs = std::filesystem;

namespace greekeval::config
{

using utils::ErrorCategory;
using utils::ErrorReporter;

namespace
{

void readFlag(const toml::table& table, std::string_view key, bool& target)
{
    const toml::node* node = table.get(key);
    if (!node)
        return;

    if (auto v = node->value<bool>())
    {
        target = *v;
        return;
    }

    ErrorReporter::ReportWarning(ErrorCategory::Configuration, "Ignoring non-boolean normalization flag",
                                 "normalization." + std::string(key));
}

// Non-negative integer setting; anything else is reported and skipped
void readSize(const toml::table& table, std::string_view key, size_t& target)
{
    const toml::node* node = table.get(key);
    if (!node)
        return;

    auto v = node->value<int64_t>();
    if (!v || *v < 0)
    {
        ErrorReporter::ReportWarning(ErrorCategory::Configuration, "Ignoring invalid logging size",
                                     "logging." + std::string(key) + " must be a non-negative integer");
        return;
    }
    target = static_cast<size_t>(*v);
}

void applyNormalization(const toml::table& t, processing::NormalizationConfig& config)
{
    readFlag(t, "lowercase", config.lowercase);
    readFlag(t, "remove_punctuation", config.remove_punctuation);
    readFlag(t, "normalize_diacritics", config.normalize_diacritics);
    readFlag(t, "normalize_numbers", config.normalize_numbers);
    readFlag(t, "normalize_whitespace", config.normalize_whitespace);
    readFlag(t, "greek_specific", config.greek_specific);
}

void applyMetrics(const toml::table& t, EvaluationSettings& settings)
{
    const toml::node* node = t.get("rate_cap");
    if (!node)
        return;

    auto v = node->value<double>();
    if (!v || !std::isfinite(*v) || *v <= 0.0)
    {
        ErrorReporter::ReportWarning(ErrorCategory::Configuration, "Ignoring invalid rate cap",
                                     "metrics.rate_cap must be a positive number");
        return;
    }
    settings.rate_cap = *v;
}

void applyLogging(const toml::table& t, utils::LogManager::Settings& logging)
{
    if (const toml::node* node = t.get("level"))
    {
        auto v = node->value<int64_t>();
        if (v && *v >= plog::none && *v <= plog::verbose)
        {
            logging.level = static_cast<plog::Severity>(*v);
        }
        else
        {
            ErrorReporter::ReportWarning(ErrorCategory::Configuration, "Ignoring invalid log level",
                                         "logging.level must be between 0 (none) and 6 (verbose)");
        }
    }

    if (auto v = t["file"].value<std::string>())
    {
        if (v->empty())
        {
            ErrorReporter::ReportWarning(ErrorCategory::Configuration, "Ignoring empty log file path", "logging.file");
        }
        else
        {
            logging.file = *v;
            logging.directory = fs::path(*v).parent_path().string();
        }
    }

    if (auto v = t["append"].value<bool>())
        logging.append = *v;
    if (auto v = t["console"].value<bool>())
        logging.console = *v;

    readSize(t, "max_file_size", logging.max_file_size);
    readSize(t, "backup_count", logging.backup_count);
}

} // namespace

void EvaluationConfigLoader::apply(const toml::table& root, EvaluationSettings& settings)
{
    if (auto* normalization = root["normalization"].as_table())
        applyNormalization(*normalization, settings.normalization);

    if (auto* metrics = root["metrics"].as_table())
        applyMetrics(*metrics, settings);

    if (auto* logging = root["logging"].as_table())
        applyLogging(*logging, settings.logging);
}

toml::table EvaluationConfigLoader::serialize(const EvaluationSettings& settings)
{
    const auto& n = settings.normalization;
    toml::table normalization{
        { "lowercase", n.lowercase },
        { "remove_punctuation", n.remove_punctuation },
        { "normalize_diacritics", n.normalize_diacritics },
        { "normalize_numbers", n.normalize_numbers },
        { "normalize_whitespace", n.normalize_whitespace },
        { "greek_specific", n.greek_specific },
    };

    toml::table metrics{
        { "rate_cap", settings.rate_cap },
    };

    const auto& l = settings.logging;
    toml::table logging{
        { "level", static_cast<int64_t>(l.level) },
        { "file", l.file },
        { "append", l.append },
        { "console", l.console },
        { "max_file_size", static_cast<int64_t>(l.max_file_size) },
        { "backup_count", static_cast<int64_t>(l.backup_count) },
    };

    toml::table root;
    root.insert_or_assign("normalization", std::move(normalization));
    root.insert_or_assign("metrics", std::move(metrics));
    root.insert_or_assign("logging", std::move(logging));
    return root;
}

bool EvaluationConfigLoader::parse(std::string_view content, EvaluationSettings& outSettings,
                                   std::string_view sourcePath)
{
    last_error_.clear();

    try
    {
        const toml::table root = toml::parse(content, sourcePath);

        EvaluationSettings settings = outSettings;
        apply(root, settings);
        outSettings = settings;
        return true;
    }
    catch (const toml::parse_error& pe)
    {
        last_error_ = std::string("config parse error: ") + std::string(pe.description());
        PLOG_WARNING << last_error_;

        std::string error_details;
        if (pe.source().begin.line > 0)
        {
            error_details =
                "Error at line " + std::to_string(pe.source().begin.line) + ": " + std::string(pe.description());
        }
        else
        {
            error_details = std::string(pe.description());
        }

        ErrorReporter::ReportError(ErrorCategory::Configuration, "Evaluation settings have errors",
                                   error_details + "\nFile: " + std::string(sourcePath));
        return false;
    }
}

bool EvaluationConfigLoader::load(const std::string& path, EvaluationSettings& outSettings)
{
    last_error_.clear();

    std::ifstream ifs(path, std::ios::binary);
    if (!ifs)
    {
        last_error_ = "Failed to open settings file: " + path;
        ErrorReporter::ReportError(ErrorCategory::Configuration, "Evaluation settings file not found", path);
        return false;
    }

    std::stringstream buffer;
    buffer << ifs.rdbuf();

    if (!parse(buffer.str(), outSettings, path))
        return false;

    PLOG_INFO << "Loaded evaluation settings from " << path;
    return true;
}

bool EvaluationConfigLoader::save(const std::string& path, const EvaluationSettings& settings)
{
    last_error_.clear();

    std::string tmp = path + ".tmp";
    std::ofstream ofs(tmp, std::ios::binary);
    if (!ofs)
    {
        last_error_ = "Failed to open temp file for writing";
        ErrorReporter::ReportError(ErrorCategory::Configuration, "Failed to save evaluation settings",
                                   "Could not create temporary file for writing: " + tmp);
        return false;
    }
    ofs << serialize(settings);
    ofs.flush();
    ofs.close();

    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec)
    {
        last_error_ = std::string("Failed to rename: ") + ec.message();
        ErrorReporter::ReportError(ErrorCategory::Configuration, "Failed to save evaluation settings",
                                   "Could not rename temporary file: " + ec.message());
        return false;
    }

    PLOG_INFO << "Saved evaluation settings to " << path;
    return true;
}

} // namespace greekeval::config
