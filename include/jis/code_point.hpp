////////////////////////////////////////////////////////////////////////////////
/// jis code point primitives
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

#include <cstdint>
//------------------------------------------------------------------------------
namespace jis
{
//------------------------------------------------------------------------------

/// A Unicode code point value. Sets and tables store arbitrary 32 bit values;
/// text decoding only ever produces scalar values (or U+FFFD).
using code_point = char32_t;

inline constexpr code_point replacement_character{ 0xFFFD };
inline constexpr code_point max_code_point       { 0x10FFFF };

inline constexpr code_point surrogate_first      { 0xD800 };
inline constexpr code_point high_surrogate_last  { 0xDBFF };
inline constexpr code_point low_surrogate_first  { 0xDC00 };
inline constexpr code_point surrogate_last       { 0xDFFF };

[[ nodiscard, gnu::const ]] constexpr bool is_surrogate( code_point const cp ) noexcept
{
    return ( cp >= surrogate_first ) && ( cp <= surrogate_last );
}

/// Any code point except high and low surrogates.
[[ nodiscard, gnu::const ]] constexpr bool is_scalar_value( code_point const cp ) noexcept
{
    return ( cp <= max_code_point ) && !is_surrogate( cp );
}

[[ nodiscard, gnu::const ]] constexpr bool is_ascii( code_point const cp ) noexcept { return cp < 0x80; }

//------------------------------------------------------------------------------
} // namespace jis
//------------------------------------------------------------------------------
