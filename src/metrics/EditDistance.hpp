#pragma once

#include <algorithm>
#include <cstddef>
#include <numeric>
#include <optional>
#include <vector>

namespace greekeval::metrics
{

/**
 * @brief Operation breakdown of one optimal unit-cost edit path.
 *
 * distance == substitutions + deletions + insertions always holds.
 * Deletions are reference tokens missing from the hypothesis, insertions are
 * hypothesis tokens absent from the reference.
 */
struct EditOperationCounts
{
    std::size_t substitutions = 0;
    std::size_t deletions = 0;
    std::size_t insertions = 0;
    std::size_t distance = 0;

    bool operator==(const EditOperationCounts&) const = default;
};

// One step of an alignment. An empty side marks an insertion (no ref_index)
// or a deletion (no hyp_index).
struct AlignmentPair
{
    std::optional<std::size_t> ref_index;
    std::optional<std::size_t> hyp_index;

    bool operator==(const AlignmentPair&) const = default;
};

using WordAlignment = std::vector<AlignmentPair>;

namespace detail
{

// Full (|a|+1) x (|b|+1) Levenshtein cost matrix, row-major
class CostTable
{
public:
    template <typename Sequence>
    CostTable(const Sequence& a, const Sequence& b)
        : rows_(a.size() + 1)
        , cols_(b.size() + 1)
        , cells_(rows_ * cols_, 0)
    {
        for (std::size_t i = 0; i < rows_; ++i)
            at(i, 0) = i;
        for (std::size_t j = 0; j < cols_; ++j)
            at(0, j) = j;

        for (std::size_t i = 1; i < rows_; ++i)
        {
            for (std::size_t j = 1; j < cols_; ++j)
            {
                const std::size_t cost = (a[i - 1] == b[j - 1]) ? 0 : 1;
                at(i, j) = std::min({ at(i - 1, j - 1) + cost, at(i - 1, j) + 1, at(i, j - 1) + 1 });
            }
        }
    }

    std::size_t& at(std::size_t i, std::size_t j) { return cells_[i * cols_ + j]; }
    std::size_t at(std::size_t i, std::size_t j) const { return cells_[i * cols_ + j]; }

private:
    std::size_t rows_;
    std::size_t cols_;
    std::vector<std::size_t> cells_;
};

} // namespace detail

/**
 * @brief Unit-cost Levenshtein distance between two token sequences.
 *
 * Works on any random-access sequence whose elements compare with ==
 * (std::u32string for characters, std::vector<std::u32string> for words).
 * Keeps a single row sized by the shorter input.
 */
template <typename Sequence>
std::size_t levenshteinDistance(const Sequence& a, const Sequence& b)
{
    const bool a_longer = a.size() >= b.size();
    const Sequence& longer = a_longer ? a : b;
    const Sequence& shorter = a_longer ? b : a;

    if (shorter.size() == 0)
        return longer.size();

    std::vector<std::size_t> row(shorter.size() + 1);
    std::iota(row.begin(), row.end(), std::size_t{ 0 });

    for (std::size_t i = 1; i <= longer.size(); ++i)
    {
        std::size_t diagonal = row[0];
        row[0] = i;
        for (std::size_t j = 1; j <= shorter.size(); ++j)
        {
            const std::size_t above = row[j];
            const std::size_t cost = (longer[i - 1] == shorter[j - 1]) ? 0 : 1;
            row[j] = std::min({ diagonal + cost, above + 1, row[j - 1] + 1 });
            diagonal = above;
        }
    }

    return row.back();
}

/**
 * @brief Levenshtein distance with substitutions, deletions and insertions attributed.
 *
 * Every cell inherits the counts of the predecessor that produced its minimum
 * cost. Ties resolve match > substitution > deletion > insertion, so the split
 * between deletions and insertions is stable across runs.
 */
template <typename Sequence>
EditOperationCounts levenshteinDetailed(const Sequence& ref, const Sequence& hyp)
{
    const std::size_t rows = ref.size() + 1;
    const std::size_t cols = hyp.size() + 1;

    std::vector<std::size_t> cost(rows * cols, 0);
    std::vector<EditOperationCounts> ops(rows * cols);
    auto index = [cols](std::size_t i, std::size_t j) { return i * cols + j; };

    for (std::size_t i = 1; i < rows; ++i)
    {
        cost[index(i, 0)] = i;
        ops[index(i, 0)].deletions = i;
        ops[index(i, 0)].distance = i;
    }
    for (std::size_t j = 1; j < cols; ++j)
    {
        cost[index(0, j)] = j;
        ops[index(0, j)].insertions = j;
        ops[index(0, j)].distance = j;
    }

    for (std::size_t i = 1; i < rows; ++i)
    {
        for (std::size_t j = 1; j < cols; ++j)
        {
            const std::size_t here = index(i, j);
            const std::size_t diag = index(i - 1, j - 1);

            if (ref[i - 1] == hyp[j - 1])
            {
                cost[here] = cost[diag];
                ops[here] = ops[diag];
                continue;
            }

            const std::size_t up = index(i - 1, j);
            const std::size_t left = index(i, j - 1);
            const std::size_t substitution = cost[diag] + 1;
            const std::size_t deletion = cost[up] + 1;
            const std::size_t insertion = cost[left] + 1;

            if (substitution <= deletion && substitution <= insertion)
            {
                cost[here] = substitution;
                ops[here] = ops[diag];
                ++ops[here].substitutions;
            }
            else if (deletion <= insertion)
            {
                cost[here] = deletion;
                ops[here] = ops[up];
                ++ops[here].deletions;
            }
            else
            {
                cost[here] = insertion;
                ops[here] = ops[left];
                ++ops[here].insertions;
            }
            ops[here].distance = cost[here];
        }
    }

    return ops[index(rows - 1, cols - 1)];
}

/**
 * @brief Minimum-cost alignment of two token sequences.
 *
 * Backtracks from (|ref|, |hyp|) with the same tie-break order as
 * levenshteinDetailed. Every reference and hypothesis index appears exactly
 * once, in increasing order.
 */
template <typename Sequence>
WordAlignment levenshteinAlign(const Sequence& ref, const Sequence& hyp)
{
    const detail::CostTable table(ref, hyp);

    WordAlignment alignment;
    alignment.reserve(ref.size() + hyp.size());

    std::size_t i = ref.size();
    std::size_t j = hyp.size();
    while (i > 0 || j > 0)
    {
        if (i > 0 && j > 0)
        {
            const std::size_t cost = (ref[i - 1] == hyp[j - 1]) ? 0 : 1;
            if (table.at(i, j) == table.at(i - 1, j - 1) + cost)
            {
                alignment.push_back({ i - 1, j - 1 });
                --i;
                --j;
                continue;
            }
        }

        if (i > 0 && table.at(i, j) == table.at(i - 1, j) + 1)
        {
            alignment.push_back({ i - 1, std::nullopt });
            --i;
        }
        else
        {
            alignment.push_back({ std::nullopt, j - 1 });
            --j;
        }
    }

    std::reverse(alignment.begin(), alignment.end());
    return alignment;
}

} // namespace greekeval::metrics
