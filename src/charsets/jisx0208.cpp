////////////////////////////////////////////////////////////////////////////////
/// jis JIS X 0208 non-kanji sets (rows 1 - 8)
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
#include <jis/charsets/jisx0208.hpp>
#include <jis/detail/cached.hpp>
#include <jis/tables/tables.hpp>
//------------------------------------------------------------------------------
namespace jis::jisx0208
{
//------------------------------------------------------------------------------

code_point_set special_chars    () { return code_point_set{ tables::jisx0208_special_chars     }; }
code_point_set latin_letters    () { return code_point_set{ tables::jisx0208_latin_letters     }; }
code_point_set hiragana         () { return code_point_set{ tables::jisx0208_hiragana          }; }
code_point_set katakana         () { return code_point_set{ tables::jisx0208_katakana          }; }
code_point_set greek_letters    () { return code_point_set{ tables::jisx0208_greek_letters     }; }
code_point_set cyrillic_letters () { return code_point_set{ tables::jisx0208_cyrillic_letters  }; }
code_point_set box_drawing_chars() { return code_point_set{ tables::jisx0208_box_drawing_chars }; }

code_point_set all()
{
    return
    {
        sorted_unique,
        detail::merge_unique<code_point>
        ({
            tables::jisx0208_special_chars,
            tables::jisx0208_latin_letters,
            tables::jisx0208_hiragana,
            tables::jisx0208_katakana,
            tables::jisx0208_greek_letters,
            tables::jisx0208_cyrillic_letters,
            tables::jisx0208_box_drawing_chars
        })
    };
}

code_point_set const & special_chars_cached    () { return detail::cached<special_chars    >(); }
code_point_set const & latin_letters_cached    () { return detail::cached<latin_letters    >(); }
code_point_set const & hiragana_cached         () { return detail::cached<hiragana         >(); }
code_point_set const & katakana_cached         () { return detail::cached<katakana         >(); }
code_point_set const & greek_letters_cached    () { return detail::cached<greek_letters    >(); }
code_point_set const & cyrillic_letters_cached () { return detail::cached<cyrillic_letters >(); }
code_point_set const & box_drawing_chars_cached() { return detail::cached<box_drawing_chars>(); }
code_point_set const & all_cached              () { return detail::cached<all              >(); }

//------------------------------------------------------------------------------
} // namespace jis::jisx0208
//------------------------------------------------------------------------------
