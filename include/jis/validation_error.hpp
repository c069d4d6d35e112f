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
#pragma once

#include <jis/code_point.hpp>

#include <cstddef>
#include <expected>
#include <iosfwd>
#include <string>
#include <utility>
//------------------------------------------------------------------------------
namespace jis
{
//------------------------------------------------------------------------------

/// The first character of a text that a validation rejected.
class validation_error
{
public:
    validation_error( code_point character, std::size_t position );

    /// Keeps character and position, replaces the default message.
    [[ nodiscard ]] static validation_error with_message( code_point character, std::size_t position, std::string message ) noexcept;

    code_point  character; // offending code point
    std::size_t position ; // zero-based character (not code unit) index
    std::string message  ; // UTF-8

    friend bool operator==( validation_error const &, validation_error const & ) = default;

private:
    validation_error( code_point const cp, std::size_t const pos, std::string && msg ) noexcept
        : character{ cp }, position{ pos }, message{ std::move( msg ) } {}
}; // class validation_error

/// "invalid character 'X' (U+XXXX) at position N", X being the UTF-8 form of
/// the character or U+FFFD for values that are not Unicode scalar values.
[[ nodiscard ]] std::string default_message( code_point character, std::size_t position );

std::ostream & operator<<( std::ostream &, validation_error const & );

using validation_result = std::expected<void, validation_error>;

//------------------------------------------------------------------------------
} // namespace jis
//------------------------------------------------------------------------------
