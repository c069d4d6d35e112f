////////////////////////////////////////////////////////////////////////////////
/// Sorted unique sequence foundations for code_point_set.
///
/// Contents:
///   - sorted_unique_t            (sorted-input hint tag)
///   - detail::sort_unique        (pdqsort + dedup, truncating in place)
///   - detail::is_sorted_unique   (precondition check for the hint tag)
///   - detail::merge_unique       (concatenate + sort_unique of several ranges)
///
/// Use, modification and distribution is subject to the
/// Boost Software License, Version 1.0.
/// (See accompanying file LICENSE_1_0.txt or copy at
/// http://www.boost.org/LICENSE_1_0.txt)
///
/// For more information, see http://www.boost.org
///
////////////////////////////////////////////////////////////////////////////////
//------------------------------------------------------------------------------
#pragma once

#include <boost/sort/pdqsort/pdqsort.hpp>

#include <algorithm>
#include <concepts>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <numeric>
#include <span>
#include <vector>
//------------------------------------------------------------------------------
namespace jis
{
//------------------------------------------------------------------------------

//==============================================================================
// Sorted-input hint tag
//==============================================================================
struct sorted_unique_t { explicit sorted_unique_t() = default; };

inline constexpr sorted_unique_t sorted_unique{};


namespace detail
{
    //==========================================================================
    // sort_unique: sort (branchless pdqsort: keys are trivially comparable
    // integers) then drop adjacent duplicates and shrink to the new size
    //==========================================================================
    template <typename T>
    void sort_unique( std::vector<T> & values ) noexcept
    {
        boost::sort::pdqsort_branchless( values.begin(), values.end(), std::less<T>{} );
        auto const new_end{ std::unique( values.begin(), values.end() ) };
        values.erase( new_end, values.end() );
    }

    template <typename T>
    [[ nodiscard, gnu::pure ]] bool is_sorted_unique( std::span<T const> const values ) noexcept
    {
        return std::adjacent_find( values.begin(), values.end(), std::greater_equal<T>{} ) == values.end();
    }

    //==========================================================================
    // merge_unique: union of several unsorted (table) ranges in one pass:
    // reserve the total, append everything, sort_unique once
    //==========================================================================
    template <typename T>
    [[ nodiscard ]] std::vector<T> merge_unique( std::initializer_list<std::span<T const>> const ranges )
    {
        std::vector<T> merged;
        merged.reserve
        (
            std::accumulate
            (
                ranges.begin(), ranges.end(), std::size_t{ 0 },
                []( std::size_t const sum, std::span<T const> const range ) noexcept { return sum + range.size(); }
            )
        );
        for ( auto const range : ranges )
            merged.insert( merged.end(), range.begin(), range.end() );
        sort_unique( merged );
        return merged;
    }
} // namespace detail

//------------------------------------------------------------------------------
} // namespace jis
//------------------------------------------------------------------------------
