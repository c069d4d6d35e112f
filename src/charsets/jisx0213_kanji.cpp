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
#include <jis/charsets/jisx0213_kanji.hpp>
#include <jis/detail/cached.hpp>
#include <jis/tables/tables.hpp>
//------------------------------------------------------------------------------
namespace jis::jisx0213_kanji
{
//------------------------------------------------------------------------------

code_point_set         all       () { return code_point_set{ tables::jisx0213_kanji }; }
code_point_set const & all_cached() { return detail::cached<all>(); }

//------------------------------------------------------------------------------
} // namespace jis::jisx0213_kanji
//------------------------------------------------------------------------------
