////////////////////////////////////////////////////////////////////////////////
/// jis JIS X 0201 (single byte) sets
///
/// Each set is available as a factory (a new instance per call) and as a
/// _cached() accessor returning one shared immutable instance.
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
namespace jis::jisx0201
{
//------------------------------------------------------------------------------

/// Roman set: ASCII printable with U+00A5 for 0x5C and U+203E for 0x7E
[[ nodiscard ]] code_point_set latin_letters();
/// Half-width katakana U+FF61 - U+FF9F
[[ nodiscard ]] code_point_set katakana();
/// Union of the above
[[ nodiscard ]] code_point_set all();

[[ nodiscard ]] code_point_set const & latin_letters_cached();
[[ nodiscard ]] code_point_set const & katakana_cached();
[[ nodiscard ]] code_point_set const & all_cached();

//------------------------------------------------------------------------------
} // namespace jis::jisx0201
//------------------------------------------------------------------------------
