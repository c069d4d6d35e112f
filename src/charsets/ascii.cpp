////////////////////////////////////////////////////////////////////////////////
/// jis well-known ASCII sets
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
#include <jis/charsets/ascii.hpp>
#include <jis/detail/cached.hpp>
#include <jis/tables/tables.hpp>
//------------------------------------------------------------------------------
namespace jis::ascii
{
//------------------------------------------------------------------------------

code_point_set control  () { return code_point_set{ tables::ascii_control   }; }
code_point_set printable() { return code_point_set{ tables::ascii_printable }; }
code_point_set crlf     () { return code_point_set{ tables::ascii_crlf      }; }

code_point_set all()
{
    return { sorted_unique, detail::merge_unique<code_point>( { tables::ascii_control, tables::ascii_printable } ) };
}

code_point_set const & control_cached  () { return detail::cached<control  >(); }
code_point_set const & printable_cached() { return detail::cached<printable>(); }
code_point_set const & crlf_cached     () { return detail::cached<crlf     >(); }
code_point_set const & all_cached      () { return detail::cached<all      >(); }

//------------------------------------------------------------------------------
} // namespace jis::ascii
//------------------------------------------------------------------------------
