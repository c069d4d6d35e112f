////////////////////////////////////////////////////////////////////////////////
/// jis validation_error
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
#include <jis/validation_error.hpp>
#include <jis/utf/encode.hpp>

#include <boost/assert.hpp>

#include <array>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <ostream>
//------------------------------------------------------------------------------
namespace jis
{
//------------------------------------------------------------------------------

namespace
{
    // At least four upper case hex digits (U+0041, U+1F600).
    void append_code_point_label( code_point const cp, std::string & out )
    {
        std::array<char, 8> digits;
        [[ maybe_unused ]] auto const [ end, ec ]{ std::to_chars( digits.data(), digits.data() + digits.size(), static_cast<std::uint32_t>( cp ), 16 ) };
        BOOST_ASSERT( ec == std::errc{} );
        auto const length{ static_cast<std::size_t>( end - digits.data() ) };

        out += "U+";
        if ( length < 4 )
            out.append( 4 - length, '0' );
        for ( auto digit{ digits.data() }; digit != end; ++digit )
            out.push_back( static_cast<char>( std::toupper( static_cast<unsigned char>( *digit ) ) ) );
    }
} // anonymous namespace

std::string default_message( code_point const character, std::size_t const position )
{
    std::string message{ "invalid character '" };
    utf::encode_utf8( character, message );
    message += "' (";
    append_code_point_label( character, message );
    message += ") at position ";
    message += std::to_string( position );
    return message;
}

validation_error::validation_error( code_point const cp, std::size_t const pos )
    : validation_error{ cp, pos, default_message( cp, pos ) }
{}

validation_error validation_error::with_message( code_point const cp, std::size_t const pos, std::string message ) noexcept
{
    return validation_error{ cp, pos, std::move( message ) };
}

std::ostream & operator<<( std::ostream & os, validation_error const & error )
{
    return os << error.message;
}

//------------------------------------------------------------------------------
} // namespace jis
//------------------------------------------------------------------------------
