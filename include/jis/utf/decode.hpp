////////////////////////////////////////////////////////////////////////////////
/// jis UTF decoding
///
/// Lazily decodes UTF-8 (char, char8_t), UTF-16 (char16_t) and UTF-32
/// (char32_t) text into code points.
///
/// Ill-formed input never stops decoding:
///   - UTF-8: every maximal subpart of an ill-formed sequence (Unicode 15,
///     3.9 "U+FFFD Substitution of Maximal Subparts") decodes to one
///     U+FFFD. This covers invalid lead bytes, stray continuation bytes,
///     truncated, overlong and surrogate encodings and values past U+10FFFF.
///   - UTF-16: an unpaired surrogate decodes to one U+FFFD.
///   - UTF-32: code units are passed through unchanged.
/// Each decoded code point (replacement or not) occupies one character
/// position.
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

#include <boost/assert.hpp>

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <ranges>
#include <string_view>
#include <type_traits>
//------------------------------------------------------------------------------
namespace jis::utf
{
//------------------------------------------------------------------------------

template <typename CharT>
concept code_unit =
    std::same_as<CharT, char    > ||
    std::same_as<CharT, char8_t > ||
    std::same_as<CharT, char16_t> ||
    std::same_as<CharT, char32_t>;

struct decoded
{
    code_point   value;
    std::uint8_t length; // consumed code units (>= 1)
};

namespace detail
{
    template <typename CharT>
    [[ nodiscard ]] constexpr decoded decode_utf8( CharT const * const units, std::size_t const available ) noexcept
    {
        BOOST_ASSERT( available > 0 );
        auto const lead{ static_cast<std::uint8_t>( units[ 0 ] ) };
        if ( lead < 0x80 ) [[ likely ]]
            return { lead, 1 };

        // Table 3-7 "Well-Formed UTF-8 Byte Sequences": the accepted range of
        // the second byte depends on the lead byte, all further bytes are
        // plain continuation bytes.
        std::uint8_t trailing{ 0 };
        code_point   value   { 0 };
        std::uint8_t lower{ 0x80 };
        std::uint8_t upper{ 0xBF };
        if ( lead >= 0xC2 && lead <= 0xDF )
        {
            trailing = 1;
            value    = lead & 0x1F;
        }
        else
        if ( lead >= 0xE0 && lead <= 0xEF )
        {
            trailing = 2;
            value    = lead & 0x0F;
            if      ( lead == 0xE0 ) lower = 0xA0; // overlong
            else if ( lead == 0xED ) upper = 0x9F; // surrogates
        }
        else
        if ( lead >= 0xF0 && lead <= 0xF4 )
        {
            trailing = 3;
            value    = lead & 0x07;
            if      ( lead == 0xF0 ) lower = 0x90; // overlong
            else if ( lead == 0xF4 ) upper = 0x8F; // > U+10FFFF
        }
        else
        {
            return { replacement_character, 1 };
        }

        std::uint8_t length{ 1 };
        for ( ; length <= trailing; ++length )
        {
            if ( length >= available )
                return { replacement_character, length };
            auto const unit{ static_cast<std::uint8_t>( units[ length ] ) };
            if ( ( unit < lower ) || ( unit > upper ) )
                return { replacement_character, length };
            lower = 0x80;
            upper = 0xBF;
            value = ( value << 6 ) | ( unit & 0x3F );
        }
        return { value, length };
    }

    [[ nodiscard ]] constexpr decoded decode_utf16( char16_t const * const units, std::size_t const available ) noexcept
    {
        BOOST_ASSERT( available > 0 );
        code_point const first{ units[ 0 ] };
        if ( !is_surrogate( first ) ) [[ likely ]]
            return { first, 1 };
        if ( ( first <= high_surrogate_last ) && ( available > 1 ) )
        {
            code_point const second{ units[ 1 ] };
            if ( ( second >= low_surrogate_first ) && ( second <= surrogate_last ) )
                return { 0x10000 + ( ( first - surrogate_first ) << 10 ) + ( second - low_surrogate_first ), 2 };
        }
        return { replacement_character, 1 };
    }
} // namespace detail

template <code_unit CharT>
[[ nodiscard ]] constexpr decoded decode( CharT const * const units, std::size_t const available ) noexcept
{
    if constexpr ( sizeof( CharT ) == 1 )
    {
        return detail::decode_utf8( units, available );
    }
    else
    if constexpr ( sizeof( CharT ) == 2 )
    {
        return detail::decode_utf16( units, available );
    }
    else
    {
        return { units[ 0 ], 1 };
    }
}


////////////////////////////////////////////////////////////////////////////////
// \class code_point_iterator
//
// Forward iterator decoding one code point per increment. Equality compares
// code unit positions so an iterator at the end of the text compares equal to
// the view's end().
////////////////////////////////////////////////////////////////////////////////

template <code_unit CharT>
class code_point_iterator
{
public:
    using value_type        = code_point;
    using difference_type   = std::ptrdiff_t;
    using reference         = code_point;
    using iterator_category = std::input_iterator_tag; // prvalue reference
    using iterator_concept  = std::forward_iterator_tag;

    constexpr code_point_iterator() noexcept = default;
    constexpr code_point_iterator( CharT const * const position, CharT const * const end ) noexcept
        : position_{ position }, end_{ end }
    {
        decode_current();
    }

    [[ nodiscard ]] constexpr code_point operator*() const noexcept
    {
        BOOST_ASSERT_MSG( position_ != end_, "Dereferencing an end code_point_iterator" );
        return current_.value;
    }

    /// Code units of the current code point.
    [[ nodiscard ]] constexpr std::basic_string_view<CharT> units() const noexcept { return { position_, current_.length }; }

    constexpr code_point_iterator & operator++() noexcept
    {
        BOOST_ASSERT( position_ != end_ );
        position_ += current_.length;
        decode_current();
        return *this;
    }
    constexpr code_point_iterator operator++( int ) noexcept { auto current{ *this }; operator++(); return current; }

    friend constexpr bool operator==( code_point_iterator const & left, code_point_iterator const & right ) noexcept { return left.position_ == right.position_; }

private:
    constexpr void decode_current() noexcept
    {
        if ( position_ != end_ )
            current_ = decode( position_, static_cast<std::size_t>( end_ - position_ ) );
        else
            current_ = { 0, 0 };
    }

private:
    CharT const * position_{ nullptr };
    CharT const * end_     { nullptr };
    decoded       current_ { 0, 0 };
}; // class code_point_iterator


////////////////////////////////////////////////////////////////////////////////
// \class code_point_view
////////////////////////////////////////////////////////////////////////////////

template <code_unit CharT>
class code_point_view : public std::ranges::view_interface<code_point_view<CharT>>
{
public:
    using iterator = code_point_iterator<CharT>;

    constexpr code_point_view() noexcept = default;
    constexpr explicit code_point_view( std::basic_string_view<CharT> const text ) noexcept : text_{ text } {}

    [[ nodiscard ]] constexpr iterator begin() const noexcept { return { text_.data(), text_.data() + text_.size() }; }
    [[ nodiscard ]] constexpr iterator end  () const noexcept { return { text_.data() + text_.size(), text_.data() + text_.size() }; }

    [[ nodiscard ]] constexpr std::basic_string_view<CharT> code_units() const noexcept { return text_; }

private:
    std::basic_string_view<CharT> text_;
}; // class code_point_view


[[ nodiscard ]] constexpr code_point_view<char    > code_points( std::string_view    const text ) noexcept { return code_point_view<char    >{ text }; }
[[ nodiscard ]] constexpr code_point_view<char8_t > code_points( std::u8string_view  const text ) noexcept { return code_point_view<char8_t >{ text }; }
[[ nodiscard ]] constexpr code_point_view<char16_t> code_points( std::u16string_view const text ) noexcept { return code_point_view<char16_t>{ text }; }
[[ nodiscard ]] constexpr code_point_view<char32_t> code_points( std::u32string_view const text ) noexcept { return code_point_view<char32_t>{ text }; }

/// Character arrays (string literals) keep their full extent, embedded NULs
/// included. Only a single terminating NUL is excluded.
template <code_unit CharT, std::size_t N>
[[ nodiscard ]] constexpr code_point_view<CharT> code_points( CharT const ( & text )[ N ] ) noexcept
{
    auto const size{ ( N > 0 && text[ N - 1 ] == CharT{} ) ? N - 1 : N };
    return code_point_view<CharT>{ std::basic_string_view<CharT>{ text, size } };
}

/// Anything code_points() accepts: string views, strings and string literals
/// of any of the four code unit types.
template <typename T>
concept text = requires( T const & t ) { utf::code_points( t ); };

/// Number of characters (decoded code points) in text.
template <text Text>
[[ nodiscard ]] constexpr std::size_t length( Text const & text ) noexcept
{
    return static_cast<std::size_t>( std::ranges::distance( utf::code_points( text ) ) );
}

//------------------------------------------------------------------------------
} // namespace jis::utf
//------------------------------------------------------------------------------

namespace std::ranges
{
    template <jis::utf::code_unit CharT>
    inline constexpr bool enable_borrowed_range<jis::utf::code_point_view<CharT>>{ true };
} // namespace std::ranges
//------------------------------------------------------------------------------
