#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "metrics/GreekEvaluationMetrics.hpp"
#include "metrics/MetricsSerializer.hpp"
#include "utils/ErrorReporter.hpp"
#include <nlohmann/json.hpp>
#include <string>

using namespace greekeval::metrics;
using greekeval::processing::Orthography;
using greekeval::utils::ErrorCategory;
using greekeval::utils::ErrorReporter;
using Catch::Matchers::WithinAbs;

TEST_CASE("MetricsSerializer - keys mirror the record fields", "[serializer]")
{
    GreekEvaluationMetrics metrics;
    MetricsRecord record = metrics.evaluate("Καλησπέρα, πώς είστε σήμερα;", "Καλησπέρα, πως είστε σήμερα;");

    nlohmann::json j = MetricsSerializer::toJson(record);

    REQUIRE(j["wer"].get<double>() == 25.0);
    REQUIRE(j["word_accuracy"].get<double>() == 75.0);
    REQUIRE(j["word_operations"]["substitutions"].get<size_t>() == 1);
    REQUIRE(j["word_operations"]["distance"].get<size_t>() == 1);
    REQUIRE(j["diacritics"]["missed_diacritics"].get<size_t>() == 1);
    REQUIRE(j["diacritics"]["total_diacritics"].get<size_t>() == 4);
    REQUIRE(j["reference_word_count"].get<size_t>() == 4);
    REQUIRE(j["reference_normalized"].get<std::string>() == "καλησπέρα πώσ είστε σήμερα");
    REQUIRE(j["orthography"].get<std::string>() == "monotonic");
}

TEST_CASE("MetricsSerializer - percentages are rounded to two decimals", "[serializer]")
{
    MetricsRecord record;
    record.cer = 100.0 / 23.0;
    record.char_accuracy = 100.0 - record.cer;
    record.diacritics.accuracy = 200.0 / 3.0;

    nlohmann::json j = MetricsSerializer::toJson(record);

    REQUIRE_THAT(j["cer"].get<double>(), WithinAbs(4.35, 1e-9));
    REQUIRE_THAT(j["char_accuracy"].get<double>(), WithinAbs(95.65, 1e-9));
    REQUIRE_THAT(j["diacritics"]["accuracy"].get<double>(), WithinAbs(66.67, 1e-9));

    REQUIRE(MetricsSerializer::roundPercentage(12.344) == 12.34);
    REQUIRE(MetricsSerializer::roundPercentage(-100.0) == -100.0);
}

TEST_CASE("MetricsSerializer - parse reads back a serialized record", "[serializer]")
{
    GreekEvaluationMetrics metrics;
    MetricsRecord record = metrics.evaluate("Ἐν ἀρχῇ ἦν ὁ λόγος", "Εν αρχή ην ο λόγος");

    std::string text = MetricsSerializer::toJsonString(record);
    MetricsRecord parsed;
    std::string error;

    REQUIRE(MetricsSerializer::parse(text, parsed, error));
    REQUIRE(error.empty());
    REQUIRE(parsed.orthography == Orthography::Polytonic);
    REQUIRE(parsed.word_operations == record.word_operations);
    REQUIRE(parsed.diacritics.missed_diacritics == record.diacritics.missed_diacritics);
    REQUIRE(parsed.reference_normalized == record.reference_normalized);
    REQUIRE_THAT(parsed.wer, WithinAbs(record.wer, 0.005));
    REQUIRE_THAT(parsed.diacritics.accuracy, WithinAbs(record.diacritics.accuracy, 0.005));
}

TEST_CASE("MetricsSerializer - parse fills optional fields from required ones", "[serializer]")
{
    MetricsRecord source;
    source.word_operations = EditOperationCounts{ 1, 0, 0, 1 };
    source.diacritics.accuracy = 75.0;

    nlohmann::json j = MetricsSerializer::toJson(source);
    for (const char* key : { "diacritic_errors", "word_edit_distance", "char_edit_distance", "reference_normalized" })
    {
        j.erase(key);
    }

    MetricsRecord parsed;
    std::string error;
    REQUIRE(MetricsSerializer::parse(j.dump(), parsed, error));
    REQUIRE(parsed.diacritic_errors == 25.0);
    REQUIRE(parsed.word_edit_distance == 1);
    REQUIRE(parsed.char_edit_distance == 0);
    REQUIRE(parsed.reference_normalized.empty());
}

TEST_CASE("MetricsSerializer - compact output is a single line", "[serializer]")
{
    std::string text = MetricsSerializer::toJsonString(MetricsRecord{}, -1);
    REQUIRE(text.find('\n') == std::string::npos);
    REQUIRE(text.front() == '{');
}

TEST_CASE("MetricsSerializer - parse rejects bad input", "[serializer]")
{
    ErrorReporter::ClearErrors();

    MetricsRecord record;
    record.wer = 42.0;
    std::string error;

    SECTION("Malformed JSON")
    {
        REQUIRE_FALSE(MetricsSerializer::parse("{ not json", record, error));
        REQUIRE(error.find("JSON parse error") != std::string::npos);
    }

    SECTION("Not an object")
    {
        REQUIRE_FALSE(MetricsSerializer::parse("[1, 2, 3]", record, error));
    }

    SECTION("Missing metric")
    {
        nlohmann::json j = MetricsSerializer::toJson(MetricsRecord{});
        j.erase("cer");
        REQUIRE_FALSE(MetricsSerializer::parse(j.dump(), record, error));
        REQUIRE(error.find("'cer'") != std::string::npos);
    }

    SECTION("Unknown orthography")
    {
        nlohmann::json j = MetricsSerializer::toJson(MetricsRecord{});
        j["orthography"] = "katharevousa";
        REQUIRE_FALSE(MetricsSerializer::parse(j.dump(), record, error));
    }

    SECTION("Wrong value type")
    {
        nlohmann::json j = MetricsSerializer::toJson(MetricsRecord{});
        j["wer"] = "high";
        REQUIRE_FALSE(MetricsSerializer::parse(j.dump(), record, error));
    }

    // Failed parses leave the output untouched and land in the error queue
    REQUIRE(record.wer == 42.0);
    REQUIRE(ErrorReporter::HasPendingErrors());
    REQUIRE(ErrorReporter::GetLastError().category == ErrorCategory::Serialization);
    ErrorReporter::ClearErrors();
}
