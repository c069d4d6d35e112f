////////////////////////////////////////////////////////////////////////////////
/// jis per-standard validators
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

#include <jis/charsets/ascii.hpp>
#include <jis/charsets/jisx0201.hpp>
#include <jis/charsets/jisx0208.hpp>
#include <jis/charsets/jisx0208_kanji.hpp>
#include <jis/charsets/jisx0213_kanji.hpp>
#include <jis/code_point_set.hpp>
#include <jis/validation.hpp>
#include <jis/validation_error.hpp>

#include <functional>
//------------------------------------------------------------------------------
namespace jis
{
//------------------------------------------------------------------------------

/// JIS X 0208 row 4 (full-width hiragana)
template <utf::text Text> [[ nodiscard ]] validation_result validate_hiragana      ( Text const & text ) { return jisx0208::hiragana_cached().validate( text ); }
/// JIS X 0208 row 5 (full-width katakana)
template <utf::text Text> [[ nodiscard ]] validation_result validate_katakana      ( Text const & text ) { return jisx0208::katakana_cached().validate( text ); }
/// JIS X 0208 rows 1 - 8
template <utf::text Text> [[ nodiscard ]] validation_result validate_jisx0208      ( Text const & text ) { return jisx0208::all_cached     ().validate( text ); }
template <utf::text Text> [[ nodiscard ]] validation_result validate_jisx0201      ( Text const & text ) { return jisx0201::all_cached     ().validate( text ); }
/// Half-width katakana only (U+FF61 - U+FF9F)
template <utf::text Text> [[ nodiscard ]] validation_result validate_jisx0201_katakana( Text const & text ) { return jisx0201::katakana_cached     ().validate( text ); }
template <utf::text Text> [[ nodiscard ]] validation_result validate_jisx0201_latin   ( Text const & text ) { return jisx0201::latin_letters_cached().validate( text ); }
template <utf::text Text> [[ nodiscard ]] validation_result validate_jisx0208_kanji( Text const & text ) { return jisx0208_kanji::all_cached().validate( text ); }
template <utf::text Text> [[ nodiscard ]] validation_result validate_jisx0213_kanji( Text const & text ) { return jisx0213_kanji::all_cached().validate( text ); }

/// Every character is hiragana or katakana.
template <utf::text Text>
[[ nodiscard ]] validation_result validate_japanese_kana( Text const & text )
{
    return validate_all_in_any( text, { std::cref( jisx0208::hiragana_cached() ), std::cref( jisx0208::katakana_cached() ) } );
}

/// Every character is hiragana, katakana or printable ASCII.
template <utf::text Text>
[[ nodiscard ]] validation_result validate_japanese_mixed( Text const & text )
{
    return validate_all_in_any
    (
        text,
        { std::cref( jisx0208::hiragana_cached() ), std::cref( jisx0208::katakana_cached() ), std::cref( ascii::printable_cached() ) }
    );
}

//------------------------------------------------------------------------------
} // namespace jis
//------------------------------------------------------------------------------
