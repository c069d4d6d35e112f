////////////////////////////////////////////////////////////////////////////////
/// jis JIS X 0213 kanji set (levels 1 - 4, including planes beyond the BMP)
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
namespace jis::jisx0213_kanji
{
//------------------------------------------------------------------------------

[[ nodiscard ]] code_point_set         all       ();
[[ nodiscard ]] code_point_set const & all_cached();

//------------------------------------------------------------------------------
} // namespace jis::jisx0213_kanji
//------------------------------------------------------------------------------
