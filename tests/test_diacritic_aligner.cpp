#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "metrics/DiacriticAligner.hpp"
#include "processing/GreekTextNormalizer.hpp"

using greekeval::metrics::DiacriticAligner;
using greekeval::metrics::DiacriticStats;
using greekeval::processing::GreekTextNormalizer;
using greekeval::processing::NormalizationConfig;
using Catch::Matchers::WithinAbs;

TEST_CASE("DiacriticAligner - missing tonos on one word", "[diacritics]")
{
    GreekTextNormalizer normalizer;
    DiacriticAligner aligner(normalizer);

    DiacriticStats stats = aligner.analyze("Καλησπέρα, πώς είστε σήμερα;", "Καλησπέρα, πως είστε σήμερα;", {});

    REQUIRE(stats.total_diacritics == 4);
    REQUIRE(stats.correct_diacritics == 3);
    REQUIRE(stats.missed_diacritics == 1);
    REQUIRE(stats.extra_diacritics == 0);
    REQUIRE_THAT(stats.accuracy, WithinAbs(75.0, 0.001));
    REQUIRE_THAT(stats.recall, WithinAbs(75.0, 0.001));
    REQUIRE_THAT(stats.precision, WithinAbs(100.0, 0.001));
}

TEST_CASE("DiacriticAligner - identical texts score perfectly", "[diacritics]")
{
    GreekTextNormalizer normalizer;
    DiacriticAligner aligner(normalizer);

    DiacriticStats stats = aligner.analyze("καλησπέρα σε όλους", "καλησπέρα σε όλους", {});

    REQUIRE(stats.total_diacritics == 2);
    REQUIRE(stats.correct_diacritics == 2);
    REQUIRE(stats.missed_diacritics == 0);
    REQUIRE(stats.extra_diacritics == 0);
    REQUIRE_THAT(stats.accuracy, WithinAbs(100.0, 0.001));
}

TEST_CASE("DiacriticAligner - accent added by the hypothesis is extra", "[diacritics]")
{
    GreekTextNormalizer normalizer;
    DiacriticAligner aligner(normalizer);

    DiacriticStats stats = aligner.analyze("πως", "πώς", {});

    REQUIRE(stats.total_diacritics == 0);
    REQUIRE(stats.extra_diacritics == 1);
    REQUIRE_THAT(stats.accuracy, WithinAbs(100.0, 0.001));
    REQUIRE_THAT(stats.precision, WithinAbs(0.0, 0.001));
}

TEST_CASE("DiacriticAligner - a different word only adds to the total", "[diacritics]")
{
    GreekTextNormalizer normalizer;
    DiacriticAligner aligner(normalizer);

    DiacriticStats stats = aligner.analyze("σήμερα", "αύριο", {});

    REQUIRE(stats.total_diacritics == 1);
    REQUIRE(stats.correct_diacritics == 0);
    REQUIRE(stats.missed_diacritics == 0);
    REQUIRE(stats.extra_diacritics == 0);
    REQUIRE_THAT(stats.accuracy, WithinAbs(0.0, 0.001));
}

TEST_CASE("DiacriticAligner - deleted reference words count their accents", "[diacritics]")
{
    GreekTextNormalizer normalizer;
    DiacriticAligner aligner(normalizer);

    DiacriticStats stats = aligner.analyze("καλή μέρα", "καλή", {});

    REQUIRE(stats.total_diacritics == 2);
    REQUIRE(stats.correct_diacritics == 1);
    REQUIRE_THAT(stats.accuracy, WithinAbs(50.0, 0.001));
}

TEST_CASE("DiacriticAligner - empty input has nothing to get wrong", "[diacritics]")
{
    GreekTextNormalizer normalizer;
    DiacriticAligner aligner(normalizer);

    SECTION("Both empty")
    {
        DiacriticStats stats = aligner.analyze("", "", {});
        REQUIRE(stats == DiacriticStats{});
    }

    SECTION("Only the hypothesis has words")
    {
        DiacriticStats stats = aligner.analyze("", "καλή μέρα", {});
        REQUIRE(stats.total_diacritics == 0);
        REQUIRE(stats.extra_diacritics == 0);
        REQUIRE_THAT(stats.accuracy, WithinAbs(100.0, 0.001));
        REQUIRE_THAT(stats.precision, WithinAbs(100.0, 0.001));
    }

    SECTION("Only the reference has words")
    {
        DiacriticStats stats = aligner.analyze("καλή μέρα", "", {});
        REQUIRE(stats.total_diacritics == 0);
        REQUIRE_THAT(stats.accuracy, WithinAbs(100.0, 0.001));
    }

    SECTION("Hypothesis normalizes to no words")
    {
        DiacriticStats stats = aligner.analyze("καλή μέρα", "?!", {});
        REQUIRE(stats == DiacriticStats{});
    }
}

TEST_CASE("DiacriticAligner - polytonic reference against monotonic hypothesis", "[diacritics]")
{
    GreekTextNormalizer normalizer;
    DiacriticAligner aligner(normalizer);

    SECTION("Folded polytonic accents match their monotonic spelling")
    {
        DiacriticStats stats = aligner.analyze("τῶν", "τών", {});
        REQUIRE(stats.total_diacritics == 1);
        REQUIRE(stats.correct_diacritics == 1);
    }

    SECTION("A dropped accent in a polytonic sentence is missed")
    {
        DiacriticStats stats = aligner.analyze("Ἐν ἀρχῇ ἦν ὁ λόγος", "εν αρχή ην ο λόγος", {});
        REQUIRE(stats.total_diacritics == 3);
        REQUIRE(stats.correct_diacritics == 2);
        REQUIRE(stats.missed_diacritics == 1);
        REQUIRE_THAT(stats.accuracy, WithinAbs(66.67, 0.01));
    }

    SECTION("Without folding the perispomeni is not a tonos")
    {
        NormalizationConfig config;
        config.normalize_diacritics = false;

        DiacriticStats stats = aligner.analyze("τῶν", "τών", config);
        REQUIRE(stats.total_diacritics == 0);
        REQUIRE(stats.extra_diacritics == 1);
    }
}
