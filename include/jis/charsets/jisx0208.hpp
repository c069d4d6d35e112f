////////////////////////////////////////////////////////////////////////////////
/// jis JIS X 0208 non-kanji sets (rows 1 - 8)
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
namespace jis::jisx0208
{
//------------------------------------------------------------------------------

/// Rows 1 - 2: punctuation, symbols
[[ nodiscard ]] code_point_set special_chars();
/// Row 3: full-width digits and Latin letters
[[ nodiscard ]] code_point_set latin_letters();
/// Row 4
[[ nodiscard ]] code_point_set hiragana();
/// Row 5
[[ nodiscard ]] code_point_set katakana();
/// Row 6
[[ nodiscard ]] code_point_set greek_letters();
/// Row 7
[[ nodiscard ]] code_point_set cyrillic_letters();
/// Row 8
[[ nodiscard ]] code_point_set box_drawing_chars();
/// Union of the above
[[ nodiscard ]] code_point_set all();

[[ nodiscard ]] code_point_set const & special_chars_cached();
[[ nodiscard ]] code_point_set const & latin_letters_cached();
[[ nodiscard ]] code_point_set const & hiragana_cached();
[[ nodiscard ]] code_point_set const & katakana_cached();
[[ nodiscard ]] code_point_set const & greek_letters_cached();
[[ nodiscard ]] code_point_set const & cyrillic_letters_cached();
[[ nodiscard ]] code_point_set const & box_drawing_chars_cached();
[[ nodiscard ]] code_point_set const & all_cached();

//------------------------------------------------------------------------------
} // namespace jis::jisx0208
//------------------------------------------------------------------------------
