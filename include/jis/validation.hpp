////////////////////////////////////////////////////////////////////////////////
/// jis multi-set membership
///
/// Every character of a text has to be a member of at least one of an
/// ordered list of sets (OR across sets, AND across characters).
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

#include <jis/code_point_set.hpp>
#include <jis/utf/decode.hpp>
#include <jis/validation_error.hpp>

#include <boost/assert.hpp>

#include <algorithm>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <optional>
#include <span>
//------------------------------------------------------------------------------
namespace jis
{
//------------------------------------------------------------------------------

using set_list     = std::span<code_point_set const * const>;
using set_ref_list = std::initializer_list<std::reference_wrapper<code_point_set const>>;

namespace detail
{
    [[ nodiscard ]] inline code_point_set const & deref( code_point_set const * const set ) noexcept
    {
        BOOST_ASSERT_MSG( set, "Null set in a set list" );
        return *set;
    }
    [[ nodiscard ]] inline code_point_set const & deref( std::reference_wrapper<code_point_set const> const set ) noexcept { return set.get(); }

    template <typename Sets>
    [[ nodiscard ]] bool covered( Sets const & sets, code_point const cp ) noexcept
    {
        return std::any_of( sets.begin(), sets.end(), [ cp ]( auto const set ) noexcept { return deref( set ).contains( cp ); } );
    }

    template <utf::text Text, typename Sets>
    [[ nodiscard ]] std::optional<excluded_code_point> first_uncovered( Text const & text, Sets const & sets ) noexcept
    {
        std::size_t position{ 0 };
        for ( auto const cp : utf::code_points( text ) )
        {
            if ( !covered( sets, cp ) )
                return excluded_code_point{ cp, position };
            ++position;
        }
        return std::nullopt;
    }

    template <utf::text Text, typename Sets>
    [[ nodiscard ]] bool contains_all_in_any( Text const & text, Sets const & sets ) noexcept
    {
        if ( sets.size() == 0 )
            return false;
        return !first_uncovered( text, sets );
    }

    template <utf::text Text, typename Sets>
    [[ nodiscard ]] validation_result validate_all_in_any( Text const & text, Sets const & sets )
    {
        if ( auto const uncovered{ first_uncovered( text, sets ) } ) [[ unlikely ]]
            return std::unexpected( validation_error{ uncovered->value, uncovered->position } );
        return {};
    }
} // namespace detail

/// False for an empty set list, even for empty text.
template <utf::text Text>
[[ nodiscard ]] bool contains_all_in_any( Text const & text, set_list const sets ) noexcept { return detail::contains_all_in_any( text, sets ); }
template <utf::text Text>
[[ nodiscard ]] bool contains_all_in_any( Text const & text, set_ref_list const sets ) noexcept { return detail::contains_all_in_any( text, sets ); }

/// Reports the first character no set contains. Empty text is valid for any
/// set list, including an empty one (non-empty text never is).
template <utf::text Text>
[[ nodiscard ]] validation_result validate_all_in_any( Text const & text, set_list const sets ) { return detail::validate_all_in_any( text, sets ); }
template <utf::text Text>
[[ nodiscard ]] validation_result validate_all_in_any( Text const & text, set_ref_list const sets ) { return detail::validate_all_in_any( text, sets ); }

//------------------------------------------------------------------------------
} // namespace jis
//------------------------------------------------------------------------------
