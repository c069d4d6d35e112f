////////////////////////////////////////////////////////////////////////////////
/// jis constant code point tables
///
/// Flat, per-category lists of Unicode scalar values. The tables are plain
/// data: they may contain values in any order and carry no invariants beyond
/// being free of duplicates. code_point_set sorts on construction.
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

#include <jis/code_point.hpp>

#include <span>
//------------------------------------------------------------------------------
namespace jis::tables
{
//------------------------------------------------------------------------------

// ASCII
extern std::span<code_point const> const ascii_control;
extern std::span<code_point const> const ascii_printable;
extern std::span<code_point const> const ascii_crlf;

// JIS X 0201
extern std::span<code_point const> const jisx0201_latin_letters;
extern std::span<code_point const> const jisx0201_katakana;

// JIS X 0208 (non-kanji rows)
extern std::span<code_point const> const jisx0208_special_chars;
extern std::span<code_point const> const jisx0208_latin_letters;
extern std::span<code_point const> const jisx0208_hiragana;
extern std::span<code_point const> const jisx0208_katakana;
extern std::span<code_point const> const jisx0208_greek_letters;
extern std::span<code_point const> const jisx0208_cyrillic_letters;
extern std::span<code_point const> const jisx0208_box_drawing_chars;

// Kanji (ordered by JIS level, then row and cell)
extern std::span<code_point const> const jisx0208_kanji;
extern std::span<code_point const> const jisx0213_kanji;

//------------------------------------------------------------------------------
} // namespace jis::tables
//------------------------------------------------------------------------------
