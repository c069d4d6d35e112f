////////////////////////////////////////////////////////////////////////////////
/// jis::code_point_set
///
/// An immutable set of code points with membership tests over text,
/// exclusion diagnostics, validation and set algebra.
///
/// Storage: a sorted, duplicate-free contiguous sequence (the flat sorted set
/// layout) plus, optionally (config::ascii_bitmap), a 128 bit ASCII membership
/// mask derived from it. Consequences:
///   - equality and hashing operate directly on the canonical (sorted)
///     sequence, independent of construction order and input duplicates
///   - set algebra is a linear merge producing an already canonical sequence
///   - iteration order is ascending (deterministic, but not a promise)
///
/// Text operations accept every type utf::code_points() accepts (UTF-8,
/// UTF-16 and UTF-32 string views, strings and literals) and scan it exactly
/// once, left to right, one decoded character at a time. Positions are
/// character indices: a code point outside the BMP counts as one character
/// in every encoding.
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

#include <jis/code_point.hpp>
#include <jis/config.hpp>
#include <jis/containers/sorted_unique.hpp>
#include <jis/utf/decode.hpp>
#include <jis/validation_error.hpp>

#include <boost/assert.hpp>

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <iosfwd>
#include <optional>
#include <span>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace jis
{
//------------------------------------------------------------------------------

/// A rejected character together with its character index.
struct excluded_code_point
{
    code_point  value;
    std::size_t position;

    friend constexpr bool operator==( excluded_code_point const &, excluded_code_point const & ) noexcept = default;
}; // struct excluded_code_point

std::ostream & operator<<( std::ostream &, excluded_code_point const & );


////////////////////////////////////////////////////////////////////////////////
// \class code_point_set
////////////////////////////////////////////////////////////////////////////////

class code_point_set
{
public:
    //--------------------------------------------------------------------------
    // Member types
    //--------------------------------------------------------------------------
    using value_type      = code_point;
    using size_type       = std::size_t;
    using difference_type = std::ptrdiff_t;
    using storage_type    = std::vector<code_point>;
    using const_reference = code_point const &;
    using reference       = const_reference;
    using const_iterator  = storage_type::const_iterator;
    using iterator        = const_iterator; // set iterators are always const

    //--------------------------------------------------------------------------
    // Construction
    //--------------------------------------------------------------------------
    code_point_set() noexcept = default;

    /// Any order, duplicates allowed.
    explicit code_point_set( std::span<code_point const> values );
    explicit code_point_set( storage_type values ) noexcept;
             code_point_set( std::initializer_list<code_point> values );

    /// Adopts an already sorted and duplicate-free sequence.
    code_point_set( sorted_unique_t, storage_type values ) noexcept;

    /// The set of all (distinct) characters of text.
    template <utf::text Text>
    [[ nodiscard ]] static code_point_set from_string( Text const & text )
    {
        storage_type values;
        for ( auto const cp : utf::code_points( text ) )
            values.push_back( cp );
        return code_point_set( std::move( values ) );
    }

    //--------------------------------------------------------------------------
    // Iterators & capacity
    //--------------------------------------------------------------------------
    [[ nodiscard ]] const_iterator begin() const noexcept { return storage_.begin(); }
    [[ nodiscard ]] const_iterator end  () const noexcept { return storage_.end  (); }

    [[ nodiscard ]] size_type size () const noexcept { return storage_.size (); }
    [[ nodiscard ]] bool      empty() const noexcept { return storage_.empty(); }

    [[ nodiscard ]] std::span<code_point const> code_points() const noexcept { return storage_; }
    [[ nodiscard ]] storage_type                to_vector  () const          { return storage_; }

    //--------------------------------------------------------------------------
    // Membership
    //--------------------------------------------------------------------------
    [[ nodiscard ]] bool contains( code_point const cp ) const noexcept
    {
        if constexpr ( config::ascii_bitmap )
        {
            if ( is_ascii( cp ) ) [[ likely ]]
                return ( ascii_mask_[ cp / 64 ] >> ( cp % 64 ) ) & 1;
        }
        return std::binary_search( storage_.begin(), storage_.end(), cp );
    }

    /// True iff every character of text is a member (vacuously true for
    /// empty text).
    template <utf::text Text>
    [[ nodiscard ]] bool contains( Text const & text ) const noexcept
    {
        for ( auto const cp : utf::code_points( text ) )
        {
            if ( !contains( cp ) )
                return false;
        }
        return true;
    }

    //--------------------------------------------------------------------------
    // Exclusion diagnostics
    //--------------------------------------------------------------------------
    template <utf::text Text>
    [[ nodiscard ]] std::optional<excluded_code_point> first_excluded_with_position( Text const & text ) const noexcept
    {
        std::size_t position{ 0 };
        for ( auto const cp : utf::code_points( text ) )
        {
            if ( !contains( cp ) )
                return excluded_code_point{ cp, position };
            ++position;
        }
        return std::nullopt;
    }

    template <utf::text Text>
    [[ nodiscard ]] std::optional<code_point> first_excluded( Text const & text ) const noexcept
    {
        if ( auto const excluded{ first_excluded_with_position( text ) } )
            return excluded->value;
        return std::nullopt;
    }

    /// Every distinct excluded code point, in order of first occurrence.
    template <utf::text Text>
    [[ nodiscard ]] storage_type all_excluded( Text const & text ) const
    {
        storage_type                   excluded;
        std::unordered_set<code_point> seen;
        for ( auto const cp : utf::code_points( text ) )
        {
            if ( !contains( cp ) && seen.insert( cp ).second )
                excluded.push_back( cp );
        }
        return excluded;
    }

    //--------------------------------------------------------------------------
    // Validation
    //--------------------------------------------------------------------------
    template <utf::text Text>
    [[ nodiscard ]] validation_result validate( Text const & text ) const
    {
        if ( auto const excluded{ first_excluded_with_position( text ) } ) [[ unlikely ]]
            return std::unexpected( validation_error{ excluded->value, excluded->position } );
        return {};
    }

    /// As validate( text ) but a failure carries the given message.
    template <utf::text Text>
    [[ nodiscard ]] validation_result validate( Text const & text, std::string message ) const
    {
        if ( auto const excluded{ first_excluded_with_position( text ) } ) [[ unlikely ]]
            return std::unexpected( validation_error::with_message( excluded->value, excluded->position, std::move( message ) ) );
        return {};
    }

    //--------------------------------------------------------------------------
    // Set algebra (operands are never modified)
    //--------------------------------------------------------------------------
    [[ nodiscard ]] code_point_set set_union               ( code_point_set const & other ) const;
    [[ nodiscard ]] code_point_set set_intersection        ( code_point_set const & other ) const;
    [[ nodiscard ]] code_point_set set_difference          ( code_point_set const & other ) const;
    [[ nodiscard ]] code_point_set set_symmetric_difference( code_point_set const & other ) const;

    [[ nodiscard ]] bool is_subset_of  ( code_point_set const & other ) const noexcept;
    [[ nodiscard ]] bool is_superset_of( code_point_set const & other ) const noexcept { return other.is_subset_of( *this ); }

    [[ nodiscard ]] friend code_point_set operator|( code_point_set const & left, code_point_set const & right ) { return left.set_union               ( right ); }
    [[ nodiscard ]] friend code_point_set operator&( code_point_set const & left, code_point_set const & right ) { return left.set_intersection        ( right ); }
    [[ nodiscard ]] friend code_point_set operator-( code_point_set const & left, code_point_set const & right ) { return left.set_difference          ( right ); }
    [[ nodiscard ]] friend code_point_set operator^( code_point_set const & left, code_point_set const & right ) { return left.set_symmetric_difference( right ); }

    //--------------------------------------------------------------------------
    // Comparison & hashing
    //--------------------------------------------------------------------------
    friend bool operator==( code_point_set const & left, code_point_set const & right ) noexcept { return left.storage_ == right.storage_; }

    /// Over the sorted sequence: equal sets hash equal.
    [[ nodiscard ]] std::size_t hash() const noexcept;

    friend std::size_t hash_value( code_point_set const & set ) noexcept { return set.hash(); }

private:
    void build_ascii_mask() noexcept;

private:
    storage_type                 storage_;
    std::array<std::uint64_t, 2> ascii_mask_{};
}; // class code_point_set

/// "code_point_set(N items)"
std::ostream & operator<<( std::ostream &, code_point_set const & );

//------------------------------------------------------------------------------
} // namespace jis
//------------------------------------------------------------------------------

template <>
struct std::hash<jis::code_point_set>
{
    std::size_t operator()( jis::code_point_set const & set ) const noexcept { return set.hash(); }
};
//------------------------------------------------------------------------------
