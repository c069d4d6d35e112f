////////////////////////////////////////////////////////////////////////////////
/// jis well-known ASCII sets
///
/// Every set comes as a factory (a new instance per call) and as a _cached()
/// accessor returning the same immutable instance on every call.
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
//------------------------------------------------------------------------------
namespace jis::ascii
{
//------------------------------------------------------------------------------

/// U+0000 - U+001F and U+007F
[[ nodiscard ]] code_point_set control  ();
/// U+0020 - U+007E
[[ nodiscard ]] code_point_set printable();
/// LF and CR
[[ nodiscard ]] code_point_set crlf     ();
/// U+0000 - U+007F
[[ nodiscard ]] code_point_set all      ();

[[ nodiscard ]] code_point_set const & control_cached  ();
[[ nodiscard ]] code_point_set const & printable_cached();
[[ nodiscard ]] code_point_set const & crlf_cached     ();
[[ nodiscard ]] code_point_set const & all_cached      ();

//------------------------------------------------------------------------------
} // namespace jis::ascii
//------------------------------------------------------------------------------
