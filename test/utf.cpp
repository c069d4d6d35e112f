////////////////////////////////////////////////////////////////////////////////
/// jis::utf decoding and encoding test suite
////////////////////////////////////////////////////////////////////////////////

#include <jis/utf/decode.hpp>
#include <jis/utf/encode.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <iterator>
#include <ranges>
#include <string>
#include <string_view>
#include <vector>

using namespace std::string_view_literals;

using jis::code_point;
using jis::replacement_character;

namespace
{
    template <typename Text>
    std::vector<code_point> decode_all( Text const & text )
    {
        std::vector<code_point> result;
        for ( auto const cp : jis::utf::code_points( text ) )
            result.push_back( cp );
        return result;
    }

    using cps = std::vector<code_point>;

    constexpr auto ufffd{ replacement_character };
}

static_assert( std::ranges::forward_range<jis::utf::code_point_view<char    >> );
static_assert( std::ranges::forward_range<jis::utf::code_point_view<char16_t>> );
static_assert( std::ranges::borrowed_range<jis::utf::code_point_view<char8_t>> );
static_assert( jis::utf::text<std::string> );
static_assert( jis::utf::text<char const *> );
static_assert( jis::utf::text<std::u16string_view> );
static_assert( !jis::utf::text<int> );

//==============================================================================
// UTF-8: Well-formed
//==============================================================================

TEST( utf8, ascii )
{
    EXPECT_EQ( decode_all( "Az~"sv ), ( cps{ U'A', U'z', U'~' } ) );
}

TEST( utf8, multi_byte )
{
    // 2, 3 and 4 byte forms
    EXPECT_EQ( decode_all( "é あ 😀"sv ), ( cps{ 0xE9, U' ', 0x3042, U' ', 0x1F600 } ) );
    EXPECT_EQ( decode_all( u8"𠀋"sv ), cps{ 0x2000B } );
}

TEST( utf8, boundaries )
{
    EXPECT_EQ( decode_all( "\x7F"sv             ), cps{ 0x7F     } );
    EXPECT_EQ( decode_all( "\xC2\x80"sv         ), cps{ 0x80     } );
    EXPECT_EQ( decode_all( "\xDF\xBF"sv         ), cps{ 0x7FF    } );
    EXPECT_EQ( decode_all( "\xE0\xA0\x80"sv     ), cps{ 0x800    } );
    EXPECT_EQ( decode_all( "\xED\x9F\xBF"sv     ), cps{ 0xD7FF   } );
    EXPECT_EQ( decode_all( "\xEE\x80\x80"sv     ), cps{ 0xE000   } );
    EXPECT_EQ( decode_all( "\xEF\xBF\xBF"sv     ), cps{ 0xFFFF   } );
    EXPECT_EQ( decode_all( "\xF0\x90\x80\x80"sv ), cps{ 0x10000  } );
    EXPECT_EQ( decode_all( "\xF4\x8F\xBF\xBF"sv ), cps{ 0x10FFFF } );
}

TEST( utf8, string_literal_extent )
{
    // only the terminating NUL of a literal is dropped
    EXPECT_EQ( decode_all( "a\0b" ), ( cps{ U'a', 0x00, U'b' } ) );
    EXPECT_EQ( decode_all( u"\0" ), cps{ 0x00 } );
    EXPECT_EQ( jis::utf::length( "Hello\0World" ), 11 );
    EXPECT_EQ( jis::utf::length( "" ), 0 );

    char const unterminated[]{ 'a', 'b' };
    EXPECT_EQ( decode_all( unterminated ), ( cps{ U'a', U'b' } ) );
}

TEST( utf8, empty )
{
    EXPECT_TRUE( decode_all( ""sv ).empty() );
    EXPECT_EQ( jis::utf::length( ""sv ), 0 );
}

//==============================================================================
// UTF-8: ill-formed input, one U+FFFD per maximal subpart
//==============================================================================

TEST( utf8, stray_continuation_bytes )
{
    EXPECT_EQ( decode_all( "a\x80\xBF" "b"sv ), ( cps{ U'a', ufffd, ufffd, U'b' } ) );
}

TEST( utf8, invalid_lead_bytes )
{
    EXPECT_EQ( decode_all( "\xC0\xC1\xF5\xFF"sv ), ( cps{ ufffd, ufffd, ufffd, ufffd } ) );
}

TEST( utf8, overlong_forms )
{
    // C0 80: invalid lead then stray continuation
    EXPECT_EQ( decode_all( "\xC0\x80"sv ), ( cps{ ufffd, ufffd } ) );
    // E0 80 80: E0 requires A0..BF next
    EXPECT_EQ( decode_all( "\xE0\x80\x80"sv ), ( cps{ ufffd, ufffd, ufffd } ) );
    // F0 80 80 80: F0 requires 90..BF next
    EXPECT_EQ( decode_all( "\xF0\x80\x80\x80"sv ), ( cps{ ufffd, ufffd, ufffd, ufffd } ) );
}

TEST( utf8, encoded_surrogates )
{
    EXPECT_EQ( decode_all( "\xED\xA0\x80"sv ), ( cps{ ufffd, ufffd, ufffd } ) );
}

TEST( utf8, beyond_max_code_point )
{
    EXPECT_EQ( decode_all( "\xF4\x90\x80\x80"sv ), ( cps{ ufffd, ufffd, ufffd, ufffd } ) );
}

TEST( utf8, truncated_sequences )
{
    // a truncated but otherwise valid prefix is a single maximal subpart
    EXPECT_EQ( decode_all( "\xE3\x81"sv ), cps{ ufffd } );
    EXPECT_EQ( decode_all( "\xE3\x81" "a"sv ), ( cps{ ufffd, U'a' } ) );
    EXPECT_EQ( decode_all( "\xF0\x9F\x98"sv ), cps{ ufffd } );
    EXPECT_EQ( decode_all( "a\xC3"sv ), ( cps{ U'a', ufffd } ) );
}

TEST( utf8, length_counts_replacements )
{
    EXPECT_EQ( jis::utf::length( "あ\x80い"sv ), 3 );
    EXPECT_EQ( jis::utf::length( "😀😀"sv ), 2 );
}

//==============================================================================
// UTF-16
//==============================================================================

TEST( utf16, surrogate_pairs )
{
    EXPECT_EQ( decode_all( u"a𠀋😀"sv ), ( cps{ U'a', 0x2000B, 0x1F600 } ) );
    EXPECT_EQ( jis::utf::length( u"𠀋あい"sv ), 3 );
}

TEST( utf16, unpaired_surrogates )
{
    std::u16string const lone_high{ u'a', char16_t( 0xD83D ), u'b' };
    std::u16string const lone_low { char16_t( 0xDE00 ), u'b' };
    std::u16string const reversed { char16_t( 0xDE00 ), char16_t( 0xD83D ) };
    std::u16string const trailing { u'a', char16_t( 0xD83D ) };
    EXPECT_EQ( decode_all( lone_high ), ( cps{ U'a', ufffd, U'b' } ) );
    EXPECT_EQ( decode_all( lone_low  ), ( cps{ ufffd, U'b' } ) );
    EXPECT_EQ( decode_all( reversed  ), ( cps{ ufffd, ufffd } ) );
    EXPECT_EQ( decode_all( trailing  ), ( cps{ U'a', ufffd } ) );
}

//==============================================================================
// UTF-32
//==============================================================================

TEST( utf32, passthrough )
{
    std::u32string const text{ U'a', char32_t( 0xD800 ), char32_t( 0x110000 ) };
    EXPECT_EQ( decode_all( text ), ( cps{ U'a', 0xD800, 0x110000 } ) );
}

//==============================================================================
// Iterator
//==============================================================================

TEST( code_point_iterator, units )
{
    auto const view{ jis::utf::code_points( "aあ"sv ) };
    auto it{ view.begin() };
    EXPECT_EQ( it.units(), "a"sv );
    ++it;
    EXPECT_EQ( it.units(), "あ"sv );
    ++it;
    EXPECT_EQ( it, view.end() );
}

TEST( code_point_iterator, multi_pass )
{
    auto const view{ jis::utf::code_points( u"あい"sv ) };
    auto const first{ view.begin() };
    auto       copy { first };
    ++copy;
    EXPECT_EQ( *first, 0x3042 );
    EXPECT_EQ( *copy , 0x3044 );
    EXPECT_EQ( std::ranges::distance( view ), 2 );
}

//==============================================================================
// Encoding
//==============================================================================

TEST( utf8_encode, scalar_values )
{
    EXPECT_EQ( jis::utf::encode_utf8( U'A'    ), "A"  );
    EXPECT_EQ( jis::utf::encode_utf8( 0xE9    ), "é"  );
    EXPECT_EQ( jis::utf::encode_utf8( 0x3042  ), "あ" );
    EXPECT_EQ( jis::utf::encode_utf8( 0x2000B ), "𠀋" );
    EXPECT_EQ( jis::utf::encode_utf8( 0x10FFFF ), "\xF4\x8F\xBF\xBF" );
}

TEST( utf8_encode, non_scalar_values )
{
    EXPECT_EQ( jis::utf::encode_utf8( 0xD800   ), "\xEF\xBF\xBD" );
    EXPECT_EQ( jis::utf::encode_utf8( 0x110000 ), "\xEF\xBF\xBD" );
}

TEST( utf8_encode, appends )
{
    std::string out{ "x" };
    jis::utf::encode_utf8( 0x3042, out );
    jis::utf::encode_utf8( U'y', out );
    EXPECT_EQ( out, "xあy" );
}

TEST( utf8_encode, decodes_back )
{
    for ( code_point const cp : { 0x00, 0x7F, 0x80, 0x7FF, 0x800, 0xFFFF, 0x10000, 0x10FFFF } )
        EXPECT_EQ( decode_all( jis::utf::encode_utf8( cp ) ), cps{ cp } ) << static_cast<std::uint32_t>( cp );
}

TEST( scalar_value, classification )
{
    EXPECT_TRUE ( jis::is_scalar_value( 0x0000   ) );
    EXPECT_TRUE ( jis::is_scalar_value( 0xD7FF   ) );
    EXPECT_FALSE( jis::is_scalar_value( 0xD800   ) );
    EXPECT_FALSE( jis::is_scalar_value( 0xDFFF   ) );
    EXPECT_TRUE ( jis::is_scalar_value( 0xE000   ) );
    EXPECT_TRUE ( jis::is_scalar_value( 0x10FFFF ) );
    EXPECT_FALSE( jis::is_scalar_value( 0x110000 ) );
}
