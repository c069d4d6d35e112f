////////////////////////////////////////////////////////////////////////////////
/// jis::code_point_set test suite
////////////////////////////////////////////////////////////////////////////////

#include <jis/code_point_set.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <functional>
#include <span>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

using namespace std::string_view_literals;

using jis::code_point;
using jis::code_point_set;
using jis::excluded_code_point;

//==============================================================================
// Fixtures
//==============================================================================

namespace
{
    // あ い
    code_point_set hiragana_ai() { return { 0x3042, 0x3044 }; }
    // あ い う
    code_point_set hiragana_aiu() { return { 0x3042, 0x3044, 0x3046 }; }
}

//==============================================================================
// code_point_set: Construction
//==============================================================================

TEST( code_point_set, default_construction )
{
    code_point_set const s;
    EXPECT_TRUE( s.empty() );
    EXPECT_EQ( s.size(), 0 );
    EXPECT_EQ( s.begin(), s.end() );
}

TEST( code_point_set, duplicates_are_collapsed )
{
    code_point_set const s{ 0x3042, 0x3044, 0x3042 };
    EXPECT_EQ( s.size(), 2 );
    EXPECT_TRUE( s.contains( "あ" ) );
    EXPECT_TRUE( s.contains( "い" ) );
}

TEST( code_point_set, unsorted_vector_construction )
{
    std::vector<code_point> values{ 0x3046, 0x0041, 0x3042, 0x0041, 0x1F600 };
    code_point_set const s( std::move( values ) );
    EXPECT_EQ( s.size(), 4 );
    auto const cps{ s.code_points() };
    EXPECT_TRUE( std::is_sorted( cps.begin(), cps.end() ) );
    EXPECT_EQ( cps.front(), 0x0041 );
    EXPECT_EQ( cps.back (), 0x1F600 );
}

TEST( code_point_set, span_construction )
{
    code_point const values[]{ 0x30A2, 0x30A4, 0x30A2 };
    code_point_set const s( std::span<code_point const>{ values } );
    EXPECT_EQ( s.size(), 2 );
    EXPECT_TRUE( s.contains( U'ア' ) );
    EXPECT_TRUE( s.contains( U'イ' ) );
}

TEST( code_point_set, sorted_unique_construction )
{
    std::vector<code_point> values{ 0x0A, 0x0D, 0x3042 };
    code_point_set const s( jis::sorted_unique, std::move( values ) );
    EXPECT_EQ( s.size(), 3 );
    EXPECT_TRUE( s.contains( code_point{ 0x0D } ) );
    EXPECT_TRUE( s.contains( code_point{ 0x3042 } ) );
}

TEST( code_point_set, construction_order_is_irrelevant )
{
    code_point_set const forward { 0x41, 0x3042, 0x1F600 };
    code_point_set const backward{ 0x1F600, 0x3042, 0x41, 0x3042 };
    EXPECT_EQ( forward, backward );
}

TEST( code_point_set, from_string )
{
    auto const s{ code_point_set::from_string( "あいあ" ) };
    EXPECT_EQ( s.size(), 2 );
    EXPECT_EQ( s, hiragana_ai() );
}

TEST( code_point_set, from_string_supplementary_plane )
{
    // U+2000B is one character (a surrogate pair in UTF-16)
    auto const utf8 { code_point_set::from_string( "𠀋あ" ) };
    auto const utf16{ code_point_set::from_string( u"𠀋あ" ) };
    EXPECT_EQ( utf8.size(), 2 );
    EXPECT_EQ( utf8, utf16 );
    EXPECT_TRUE( utf8.contains( code_point{ 0x2000B } ) );
}

TEST( code_point_set, from_empty_string )
{
    EXPECT_TRUE( code_point_set::from_string( ""sv ).empty() );
}

//==============================================================================
// code_point_set: Membership
//==============================================================================

TEST( code_point_set, contains_text )
{
    auto const s{ hiragana_ai() };
    EXPECT_TRUE ( s.contains( "あ" ) );
    EXPECT_TRUE ( s.contains( "い" ) );
    EXPECT_TRUE ( s.contains( "あい" ) );
    EXPECT_FALSE( s.contains( "う" ) );
    EXPECT_FALSE( s.contains( "あいう" ) );
}

TEST( code_point_set, empty_text_is_always_contained )
{
    EXPECT_TRUE( hiragana_ai()   .contains( "" ) );
    EXPECT_TRUE( code_point_set{}.contains( "" ) );
}

TEST( code_point_set, empty_set_contains_no_character )
{
    code_point_set const s;
    EXPECT_FALSE( s.contains( "a" ) );
    EXPECT_FALSE( s.contains( code_point{ 0 } ) );
}

TEST( code_point_set, contains_single_code_point )
{
    auto const s{ hiragana_ai() };
    EXPECT_TRUE ( s.contains( U'あ' ) );
    EXPECT_FALSE( s.contains( U'う' ) );
    EXPECT_FALSE( s.contains( U'a' ) );
}

TEST( code_point_set, contains_ascii_boundaries )
{
    // exercises both the ASCII mask and the sorted search
    code_point_set const s{ 0x00, 0x3F, 0x40, 0x7F, 0x80 };
    for ( code_point const cp : { 0x00, 0x3F, 0x40, 0x7F, 0x80 } )
        EXPECT_TRUE( s.contains( cp ) ) << static_cast<std::uint32_t>( cp );
    for ( code_point const cp : { 0x01, 0x3E, 0x41, 0x7E, 0x81 } )
        EXPECT_FALSE( s.contains( cp ) ) << static_cast<std::uint32_t>( cp );
}

TEST( code_point_set, contains_supplementary_plane )
{
    code_point_set const s{ 0x2000B, 0x3042, 0x3044 };
    EXPECT_TRUE ( s.contains( "𠀋" ) );
    EXPECT_TRUE ( s.contains( "𠀋あい" ) );
    EXPECT_TRUE ( s.contains( u"𠀋あい" ) );
    EXPECT_TRUE ( s.contains( U"𠀋あい" ) );
    EXPECT_FALSE( s.contains( "𠀋あいう" ) );
}

TEST( code_point_set, contains_is_encoding_independent )
{
    auto const s{ hiragana_aiu() };
    EXPECT_TRUE ( s.contains( "あいう"   ) );
    EXPECT_TRUE ( s.contains( u8"あいう" ) );
    EXPECT_TRUE ( s.contains( u"あいう"  ) );
    EXPECT_TRUE ( s.contains( U"あいう"  ) );
    EXPECT_FALSE( s.contains( u"あいうa" ) );
    EXPECT_TRUE ( s.contains( std::string{ "あい" } ) );
    EXPECT_TRUE ( s.contains( std::u16string{ u"うあ" } ) );
}

TEST( code_point_set, embedded_nul_is_a_character )
{
    code_point_set const s{ 0x41 };
    EXPECT_FALSE( s.contains( "A\0A"sv ) );
    EXPECT_TRUE ( code_point_set( { 0x00, 0x41 } ).contains( "A\0A"sv ) );
}

TEST( code_point_set, string_literal_keeps_embedded_nul )
{
    code_point_set const s{ U'a', U'b' };
    EXPECT_FALSE( s.contains( "a\0b" ) );
    EXPECT_FALSE( s.contains( u"a\0b" ) );
    EXPECT_EQ( s.all_excluded( "a\0b" ), std::vector<code_point>{ 0x00 } );
    auto const excluded{ s.first_excluded_with_position( U"ab\0" ) };
    ASSERT_TRUE( excluded.has_value() );
    EXPECT_EQ( excluded->value   , 0x00 );
    EXPECT_EQ( excluded->position, 2 );
    EXPECT_EQ( code_point_set::from_string( "a\0b" ).size(), 3 );
}

TEST( code_point_set, large_text )
{
    std::string text;
    for ( int i{ 0 }; i < 1000; ++i )
        text += "あい";
    auto const s{ hiragana_ai() };
    EXPECT_TRUE( s.contains( text ) );
    text += "う";
    EXPECT_FALSE( s.contains( text ) );
    EXPECT_EQ( s.first_excluded_with_position( text ), ( excluded_code_point{ 0x3046, 2000 } ) );
}

//==============================================================================
// code_point_set: Exclusion diagnostics
//==============================================================================

TEST( code_point_set, first_excluded )
{
    auto const s{ hiragana_ai() };
    EXPECT_FALSE( s.first_excluded( "あい" ).has_value() );
    EXPECT_FALSE( s.first_excluded( "" ).has_value() );
    EXPECT_EQ( s.first_excluded( "あいうえ" ), code_point{ 0x3046 } );
}

TEST( code_point_set, first_excluded_with_position )
{
    auto const s{ hiragana_ai() };
    EXPECT_FALSE( s.first_excluded_with_position( "あい" ).has_value() );
    EXPECT_EQ( s.first_excluded_with_position( "あいう" ), ( excluded_code_point{ 0x3046, 2 } ) );
    EXPECT_EQ( s.first_excluded_with_position( "xあ" ), ( excluded_code_point{ U'x', 0 } ) );
}

TEST( code_point_set, position_counts_characters_not_code_units )
{
    code_point_set const s{ 0x2000B, 0x3042 };
    // U+2000B: 4 UTF-8 bytes, 2 UTF-16 units, still one character
    EXPECT_EQ( s.first_excluded_with_position(  "𠀋あ𠀋x" ), ( excluded_code_point{ U'x', 3 } ) );
    EXPECT_EQ( s.first_excluded_with_position( u"𠀋あ𠀋x" ), ( excluded_code_point{ U'x', 3 } ) );
    EXPECT_EQ( s.first_excluded_with_position( U"𠀋あ𠀋x" ), ( excluded_code_point{ U'x', 3 } ) );
}

TEST( code_point_set, all_excluded_in_first_occurrence_order )
{
    auto const s{ hiragana_ai() };
    EXPECT_EQ( s.all_excluded( "えあうえいう" ), ( std::vector<code_point>{ 0x3048, 0x3046 } ) );
    EXPECT_TRUE( s.all_excluded( "あい" ).empty() );
    EXPECT_TRUE( s.all_excluded( "" ).empty() );
}

TEST( code_point_set, all_excluded_supplementary_plane )
{
    code_point_set const s{ 0x2000B, 0x3042, 0x3044 };
    EXPECT_EQ( s.all_excluded( "𠀋あいう" ), std::vector<code_point>{ 0x3046 } );
}

TEST( code_point_set, diagnostics_agree_with_contains )
{
    auto const s{ hiragana_ai() };
    for ( auto const text : { "あい"sv, "あいう"sv, ""sv, "abc"sv, "いあいあ"sv } )
    {
        EXPECT_EQ( s.contains( text ), !s.first_excluded( text ).has_value() ) << text;
        EXPECT_EQ( s.contains( text ), s.all_excluded( text ).empty() ) << text;
        if ( auto const excluded{ s.first_excluded( text ) } )
            EXPECT_EQ( s.all_excluded( text ).front(), *excluded ) << text;
    }
}

//==============================================================================
// code_point_set: Ill-formed input
//==============================================================================

TEST( code_point_set, ill_formed_utf8_is_excluded_as_replacement_character )
{
    auto const s{ hiragana_ai() };
    // stray continuation byte between two members
    auto const text{ "あ\x80い"sv };
    EXPECT_FALSE( s.contains( text ) );
    EXPECT_EQ( s.first_excluded_with_position( text ), ( excluded_code_point{ jis::replacement_character, 1 } ) );
}

TEST( code_point_set, ill_formed_utf8_can_be_accepted_explicitly )
{
    code_point_set const s{ 0x41, jis::replacement_character };
    EXPECT_TRUE( s.contains( "A\xFF\xC0" "A"sv ) );
}

TEST( code_point_set, unpaired_utf16_surrogate )
{
    auto const s{ hiragana_ai() };
    std::u16string const text{ u'あ', char16_t( 0xD840 ), u'い' };
    EXPECT_EQ( s.first_excluded_with_position( text ), ( excluded_code_point{ jis::replacement_character, 1 } ) );
}

//==============================================================================
// code_point_set: Introspection, equality & hashing
//==============================================================================

TEST( code_point_set, iteration_is_ascending )
{
    code_point_set const s{ 0x3046, 0x3042, 0x3044 };
    std::vector<code_point> const iterated( s.begin(), s.end() );
    EXPECT_EQ( iterated, ( std::vector<code_point>{ 0x3042, 0x3044, 0x3046 } ) );
    EXPECT_EQ( s.to_vector(), iterated );
}

TEST( code_point_set, to_vector_is_a_copy )
{
    auto const s{ hiragana_ai() };
    auto values{ s.to_vector() };
    values.push_back( 0x3046 );
    EXPECT_EQ( s.size(), 2 );
}

TEST( code_point_set, equality )
{
    code_point_set const s1{ 0x3042, 0x3044 };
    code_point_set const s2{ 0x3044, 0x3042 };
    code_point_set const s3{ 0x3042, 0x3046 };
    EXPECT_EQ( s1, s2 );
    EXPECT_NE( s1, s3 );
    EXPECT_NE( s1, code_point_set{} );
}

TEST( code_point_set, equal_sets_hash_equal )
{
    code_point_set const s1{ 0x3042, 0x3044, 0x2000B };
    code_point_set const s2{ 0x2000B, 0x3044, 0x3042, 0x3044 };
    EXPECT_EQ( std::hash<code_point_set>{}( s1 ), std::hash<code_point_set>{}( s2 ) );
    EXPECT_EQ( hash_value( s1 ), hash_value( s2 ) );

    std::unordered_set<code_point_set> sets{ s1 };
    EXPECT_TRUE( sets.contains( s2 ) );
    EXPECT_FALSE( sets.contains( hiragana_aiu() ) );
}

TEST( code_point_set, stream_output )
{
    std::ostringstream os;
    os << hiragana_aiu();
    EXPECT_EQ( os.str(), "code_point_set(3 items)" );

    std::ostringstream empty;
    empty << code_point_set{};
    EXPECT_EQ( empty.str(), "code_point_set(0 items)" );
}

TEST( code_point_set, excluded_code_point_stream_output )
{
    std::ostringstream os;
    os << excluded_code_point{ 0x41, 7 };
    EXPECT_EQ( os.str(), "U+0041 at position 7" );
}

TEST( code_point_set, copies_are_independent_values )
{
    auto const original{ hiragana_ai() };
    auto       copy    { original };
    copy = hiragana_aiu();
    EXPECT_EQ( original.size(), 2 );
    EXPECT_EQ( copy    .size(), 3 );
}
