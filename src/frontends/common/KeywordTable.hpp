//===----------------------------------------------------------------------===//
//
// Part of the Xpresso project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/common/KeywordTable.hpp
// Purpose: Compile-time word tables with binary-search lookup.
//
// Key Features:
//   - Sorted std::array tables checked with static_assert
//   - Case-sensitive matching (X-presso distinguishes `Date` from `date`)
//
//===----------------------------------------------------------------------===//
#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>

namespace xpresso::frontends::common::keyword_table
{

/// @brief A word entry mapping a lexeme to a classification value.
template <typename Kind>
struct KeywordEntry
{
    std::string_view lexeme;
    Kind kind;
};

/// @brief True when @p table is strictly increasing by lexeme.
template <typename Kind, std::size_t N>
[[nodiscard]] constexpr bool isKeywordTableSorted(const std::array<KeywordEntry<Kind>, N> &table)
{
    for (std::size_t i = 1; i < N; ++i)
    {
        if (!(table[i - 1].lexeme < table[i].lexeme))
            return false;
    }
    return true;
}

/// @brief True when @p table of plain words is strictly increasing.
template <std::size_t N>
[[nodiscard]] constexpr bool isWordListSorted(const std::array<std::string_view, N> &table)
{
    for (std::size_t i = 1; i < N; ++i)
    {
        if (!(table[i - 1] < table[i]))
            return false;
    }
    return true;
}

/// @brief Binary search lookup in a sorted table.
template <typename Kind, std::size_t N>
[[nodiscard]] std::optional<Kind> lookupKeywordBinary(const std::array<KeywordEntry<Kind>, N> &table,
                                                      std::string_view lexeme)
{
    auto first = table.begin();
    auto last = table.end();

    while (first < last)
    {
        auto mid = first + (last - first) / 2;
        if (mid->lexeme == lexeme)
            return mid->kind;
        if (mid->lexeme < lexeme)
            first = mid + 1;
        else
            last = mid;
    }

    return std::nullopt;
}

/// @brief Membership test in a sorted list of words.
template <std::size_t N>
[[nodiscard]] bool containsWord(const std::array<std::string_view, N> &table, std::string_view word)
{
    std::size_t lo = 0;
    std::size_t hi = N;
    while (lo < hi)
    {
        std::size_t mid = lo + (hi - lo) / 2;
        if (table[mid] == word)
            return true;
        if (table[mid] < word)
            lo = mid + 1;
        else
            hi = mid;
    }
    return false;
}

} // namespace xpresso::frontends::common::keyword_table
