#include <catch2/catch_test_macros.hpp>
#include "metrics/EditDistance.hpp"
#include <string>
#include <utility>
#include <vector>

using namespace greekeval::metrics;

using Words = std::vector<std::string>;

namespace
{

const std::vector<std::pair<Words, Words>>& samplePairs()
{
    static const std::vector<std::pair<Words, Words>> pairs = {
        { {}, {} },
        { { "α" }, {} },
        { {}, { "α", "β" } },
        { { "καλησπέρα", "πώσ", "είστε", "σήμερα" }, { "καλησπέρα", "πωσ", "είστε", "σήμερα" } },
        { { "α", "β", "γ" }, { "α", "γ" } },
        { { "α", "γ" }, { "α", "β", "γ" } },
        { { "x", "y" }, { "y", "x" } },
        { { "ο", "σκύλοσ", "τρέχει" }, { "ο", "σκύλοσ", "δεν", "τρέχει", "γρήγορα" } },
        { { "ένα", "δύο", "τρία", "τέσσερα", "πέντε" }, { "δύο", "τρία", "έξι" } },
        { { "a", "a", "a" }, { "a" } },
        { { "a", "b", "c", "d" }, { "e", "f" } },
    };
    return pairs;
}

} // namespace

TEST_CASE("EditDistance - classic character distances", "[edit_distance]")
{
    REQUIRE(levenshteinDistance(std::string("kitten"), std::string("sitting")) == 3);
    REQUIRE(levenshteinDistance(std::string("flaw"), std::string("lawn")) == 2);
    REQUIRE(levenshteinDistance(std::string(""), std::string("abc")) == 3);
    REQUIRE(levenshteinDistance(std::string("abc"), std::string("")) == 3);
    REQUIRE(levenshteinDistance(std::string("same"), std::string("same")) == 0);
    REQUIRE(levenshteinDistance(std::u32string(U"πώσ"), std::u32string(U"πωσ")) == 1);
}

TEST_CASE("EditDistance - word sequences compare whole tokens", "[edit_distance]")
{
    Words ref = { "καλησπέρα", "πώσ", "είστε", "σήμερα" };
    Words hyp = { "καλησπέρα", "πωσ", "είστε", "σήμερα" };
    REQUIRE(levenshteinDistance(ref, hyp) == 1);
}

TEST_CASE("EditDistance - detailed counts attribute each operation", "[edit_distance]")
{
    SECTION("Substitutions")
    {
        auto ops = levenshteinDetailed(std::string("kitten"), std::string("sitting"));
        REQUIRE(ops.substitutions == 2);
        REQUIRE(ops.insertions == 1);
        REQUIRE(ops.deletions == 0);
        REQUIRE(ops.distance == 3);
    }

    SECTION("Missing reference word is a deletion")
    {
        auto ops = levenshteinDetailed(Words{ "α", "β", "γ" }, Words{ "α", "γ" });
        REQUIRE(ops == EditOperationCounts{ 0, 1, 0, 1 });
    }

    SECTION("Extra hypothesis word is an insertion")
    {
        auto ops = levenshteinDetailed(Words{ "α", "γ" }, Words{ "α", "β", "γ" });
        REQUIRE(ops == EditOperationCounts{ 0, 0, 1, 1 });
    }

    SECTION("Empty hypothesis deletes everything")
    {
        auto ops = levenshteinDetailed(Words{ "α", "β", "γ" }, Words{});
        REQUIRE(ops == EditOperationCounts{ 0, 3, 0, 3 });
    }

    SECTION("Empty reference inserts everything")
    {
        auto ops = levenshteinDetailed(Words{}, Words{ "α", "β" });
        REQUIRE(ops == EditOperationCounts{ 0, 0, 2, 2 });
    }

    SECTION("Ties prefer substitution over deletion and insertion")
    {
        auto ops = levenshteinDetailed(Words{ "x", "y" }, Words{ "y", "x" });
        REQUIRE(ops == EditOperationCounts{ 2, 0, 0, 2 });
    }
}

TEST_CASE("EditDistance - detailed distance matches plain distance", "[edit_distance]")
{
    for (const auto& [ref, hyp] : samplePairs())
    {
        const auto ops = levenshteinDetailed(ref, hyp);
        const auto distance = levenshteinDistance(ref, hyp);
        REQUIRE(ops.distance == distance);
        REQUIRE(ops.substitutions + ops.deletions + ops.insertions == distance);
    }
}

TEST_CASE("EditDistance - distance is symmetric", "[edit_distance]")
{
    for (const auto& [ref, hyp] : samplePairs())
    {
        REQUIRE(levenshteinDistance(ref, hyp) == levenshteinDistance(hyp, ref));
    }
}

TEST_CASE("EditDistance - alignment pairs matching words and marks gaps", "[edit_distance]")
{
    auto alignment = levenshteinAlign(Words{ "α", "β", "γ" }, Words{ "α", "γ" });

    WordAlignment expected = {
        { 0, 0 },
        { 1, std::nullopt },
        { 2, 1 },
    };
    REQUIRE(alignment == expected);

    REQUIRE(levenshteinAlign(Words{}, Words{}).empty());
}

TEST_CASE("EditDistance - alignment covers every index exactly once", "[edit_distance]")
{
    for (const auto& [ref, hyp] : samplePairs())
    {
        const auto alignment = levenshteinAlign(ref, hyp);

        std::vector<size_t> ref_seen;
        std::vector<size_t> hyp_seen;
        size_t cost = 0;
        for (const auto& pair : alignment)
        {
            REQUIRE((pair.ref_index || pair.hyp_index));
            if (pair.ref_index)
                ref_seen.push_back(*pair.ref_index);
            if (pair.hyp_index)
                hyp_seen.push_back(*pair.hyp_index);

            if (!pair.ref_index || !pair.hyp_index || ref[*pair.ref_index] != hyp[*pair.hyp_index])
                ++cost;
        }

        REQUIRE(ref_seen.size() == ref.size());
        REQUIRE(hyp_seen.size() == hyp.size());
        for (size_t i = 0; i < ref_seen.size(); ++i)
            REQUIRE(ref_seen[i] == i);
        for (size_t j = 0; j < hyp_seen.size(); ++j)
            REQUIRE(hyp_seen[j] == j);

        // The path is optimal
        REQUIRE(cost == levenshteinDistance(ref, hyp));
    }
}
