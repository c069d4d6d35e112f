////////////////////////////////////////////////////////////////////////////////
/// jis UTF-8 encoding
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

#include <string>
//------------------------------------------------------------------------------
namespace jis::utf
{
//------------------------------------------------------------------------------

/// Appends the UTF-8 form of cp to out. Values that are not scalar values
/// (surrogates, anything past U+10FFFF) are written as U+FFFD.
inline void encode_utf8( code_point cp, std::string & out )
{
    if ( !is_scalar_value( cp ) ) [[ unlikely ]]
        cp = replacement_character;

    if ( cp < 0x80 )
    {
        out.push_back( static_cast<char>( cp ) );
    }
    else
    if ( cp < 0x800 )
    {
        out.push_back( static_cast<char>( 0xC0 | ( cp >> 6 ) ) );
        out.push_back( static_cast<char>( 0x80 | ( cp & 0x3F ) ) );
    }
    else
    if ( cp < 0x10000 )
    {
        out.push_back( static_cast<char>( 0xE0 | ( cp >> 12 ) ) );
        out.push_back( static_cast<char>( 0x80 | ( ( cp >> 6 ) & 0x3F ) ) );
        out.push_back( static_cast<char>( 0x80 | ( cp & 0x3F ) ) );
    }
    else
    {
        out.push_back( static_cast<char>( 0xF0 | ( cp >> 18 ) ) );
        out.push_back( static_cast<char>( 0x80 | ( ( cp >> 12 ) & 0x3F ) ) );
        out.push_back( static_cast<char>( 0x80 | ( ( cp >> 6 ) & 0x3F ) ) );
        out.push_back( static_cast<char>( 0x80 | ( cp & 0x3F ) ) );
    }
}

[[ nodiscard ]] inline std::string encode_utf8( code_point const cp )
{
    std::string out;
    encode_utf8( cp, out );
    return out;
}

//------------------------------------------------------------------------------
} // namespace jis::utf
//------------------------------------------------------------------------------
