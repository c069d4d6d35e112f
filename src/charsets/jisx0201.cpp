////////////////////////////////////////////////////////////////////////////////
/// jis JIS X 0201 (single byte) sets
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
#include <jis/charsets/jisx0201.hpp>
#include <jis/detail/cached.hpp>
#include <jis/tables/tables.hpp>
//------------------------------------------------------------------------------
namespace jis::jisx0201
{
//------------------------------------------------------------------------------

code_point_set latin_letters() { return code_point_set{ tables::jisx0201_latin_letters }; }
code_point_set katakana     () { return code_point_set{ tables::jisx0201_katakana      }; }

code_point_set all()
{
    return
    {
        sorted_unique,
        detail::merge_unique<code_point>
        ({
            tables::jisx0201_latin_letters,
            tables::jisx0201_katakana
        })
    };
}

code_point_set const & latin_letters_cached() { return detail::cached<latin_letters>(); }
code_point_set const & katakana_cached     () { return detail::cached<katakana     >(); }
code_point_set const & all_cached          () { return detail::cached<all          >(); }

//------------------------------------------------------------------------------
} // namespace jis::jisx0201
//------------------------------------------------------------------------------
