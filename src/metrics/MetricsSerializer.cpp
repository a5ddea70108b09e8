#include "metrics/MetricsSerializer.hpp"
#include "utils/ErrorReporter.hpp"

#include <cmath>
#include <utility>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace greekeval::metrics
{

using utils::ErrorCategory;
using utils::ErrorReporter;

namespace
{

// Keys parse() insists on. Any other field may be absent and then falls back
// to zero, an empty string or a value derived from these keys.
constexpr const char* kRequiredKeys[] = {
    "wer",
    "cer",
    "word_accuracy",
    "char_accuracy",
    "word_operations",
    "diacritics",
    "greek_char_accuracy",
    "reference_word_count",
    "hypothesis_word_count",
    "orthography",
};

json operationsToJson(const EditOperationCounts& ops)
{
    return json{
        { "substitutions", ops.substitutions },
        { "deletions", ops.deletions },
        { "insertions", ops.insertions },
        { "distance", ops.distance },
    };
}

json diacriticsToJson(const DiacriticStats& stats)
{
    return json{
        { "total_diacritics", stats.total_diacritics },
        { "correct_diacritics", stats.correct_diacritics },
        { "missed_diacritics", stats.missed_diacritics },
        { "extra_diacritics", stats.extra_diacritics },
        { "accuracy", MetricsSerializer::roundPercentage(stats.accuracy) },
        { "precision", MetricsSerializer::roundPercentage(stats.precision) },
        { "recall", MetricsSerializer::roundPercentage(stats.recall) },
    };
}

EditOperationCounts operationsFromJson(const json& j)
{
    EditOperationCounts ops;
    ops.substitutions = j.value("substitutions", std::size_t{ 0 });
    ops.deletions = j.value("deletions", std::size_t{ 0 });
    ops.insertions = j.value("insertions", std::size_t{ 0 });
    ops.distance = j.value("distance", ops.substitutions + ops.deletions + ops.insertions);
    return ops;
}

DiacriticStats diacriticsFromJson(const json& j)
{
    DiacriticStats stats;
    stats.total_diacritics = j.value("total_diacritics", std::size_t{ 0 });
    stats.correct_diacritics = j.value("correct_diacritics", std::size_t{ 0 });
    stats.missed_diacritics = j.value("missed_diacritics", std::size_t{ 0 });
    stats.extra_diacritics = j.value("extra_diacritics", std::size_t{ 0 });
    stats.accuracy = j.value("accuracy", 100.0);
    stats.precision = j.value("precision", 100.0);
    stats.recall = j.value("recall", stats.accuracy);
    return stats;
}

} // namespace

double MetricsSerializer::roundPercentage(double value) { return std::round(value * 100.0) / 100.0; }

json MetricsSerializer::toJson(const MetricsRecord& record)
{
    return json{
        { "wer", roundPercentage(record.wer) },
        { "cer", roundPercentage(record.cer) },
        { "word_accuracy", roundPercentage(record.word_accuracy) },
        { "char_accuracy", roundPercentage(record.char_accuracy) },
        { "word_operations", operationsToJson(record.word_operations) },
        { "diacritics", diacriticsToJson(record.diacritics) },
        { "diacritic_errors", roundPercentage(record.diacritic_errors) },
        { "greek_char_accuracy", roundPercentage(record.greek_char_accuracy) },
        { "reference_word_count", record.reference_word_count },
        { "hypothesis_word_count", record.hypothesis_word_count },
        { "reference_char_count", record.reference_char_count },
        { "hypothesis_char_count", record.hypothesis_char_count },
        { "word_edit_distance", record.word_edit_distance },
        { "char_edit_distance", record.char_edit_distance },
        { "normalized_edit_distance", roundPercentage(record.normalized_edit_distance) },
        { "word_information_preserved", roundPercentage(record.word_information_preserved) },
        { "reference_normalized", record.reference_normalized },
        { "hypothesis_normalized", record.hypothesis_normalized },
        { "orthography", processing::toString(record.orthography) },
    };
}

std::string MetricsSerializer::toJsonString(const MetricsRecord& record, int indent)
{
    // Normalized Greek text stays readable UTF-8 rather than \u escapes
    return toJson(record).dump(indent, ' ', false, json::error_handler_t::replace);
}

bool MetricsSerializer::parse(const std::string& jsonContent, MetricsRecord& outRecord, std::string& outError)
{
    try
    {
        const json recordJson = json::parse(jsonContent);

        if (!recordJson.is_object())
        {
            outError = "Metrics record must be a JSON object";
            ErrorReporter::ReportError(ErrorCategory::Serialization, outError);
            return false;
        }

        for (const char* key : kRequiredKeys)
        {
            if (!recordJson.contains(key))
            {
                outError = std::string("Metrics record missing '") + key + "' field";
                ErrorReporter::ReportError(ErrorCategory::Serialization, outError);
                return false;
            }
        }

        const std::string orthography_name = recordJson.at("orthography").get<std::string>();
        const auto orthography = processing::orthographyFromString(orthography_name);
        if (!orthography)
        {
            outError = "Unknown orthography '" + orthography_name + "'";
            ErrorReporter::ReportError(ErrorCategory::Serialization, outError);
            return false;
        }

        MetricsRecord record;
        record.wer = recordJson.at("wer").get<double>();
        record.cer = recordJson.at("cer").get<double>();
        record.word_accuracy = recordJson.at("word_accuracy").get<double>();
        record.char_accuracy = recordJson.at("char_accuracy").get<double>();
        record.word_operations = operationsFromJson(recordJson.at("word_operations"));
        record.diacritics = diacriticsFromJson(recordJson.at("diacritics"));
        record.diacritic_errors = recordJson.value("diacritic_errors", 100.0 - record.diacritics.accuracy);
        record.greek_char_accuracy = recordJson.at("greek_char_accuracy").get<double>();
        record.reference_word_count = recordJson.at("reference_word_count").get<std::size_t>();
        record.hypothesis_word_count = recordJson.at("hypothesis_word_count").get<std::size_t>();
        record.reference_char_count = recordJson.value("reference_char_count", std::size_t{ 0 });
        record.hypothesis_char_count = recordJson.value("hypothesis_char_count", std::size_t{ 0 });
        record.word_edit_distance = recordJson.value("word_edit_distance", record.word_operations.distance);
        record.char_edit_distance = recordJson.value("char_edit_distance", std::size_t{ 0 });
        record.normalized_edit_distance = recordJson.value("normalized_edit_distance", 0.0);
        record.word_information_preserved =
            recordJson.value("word_information_preserved", 100.0 - record.normalized_edit_distance);
        record.reference_normalized = recordJson.value("reference_normalized", std::string());
        record.hypothesis_normalized = recordJson.value("hypothesis_normalized", std::string());
        record.orthography = *orthography;

        outRecord = std::move(record);
        return true;
    }
    catch (const json::exception& e)
    {
        outError = std::string("JSON parse error: ") + e.what();
        ErrorReporter::ReportError(ErrorCategory::Serialization, "Failed to parse metrics record", e.what());
        return false;
    }
}

} // namespace greekeval::metrics
