////////////////////////////////////////////////////////////////////////////////
/// jis validation test suite: validate, validation_error, multi-set
/// membership and the per-standard validators
////////////////////////////////////////////////////////////////////////////////

#include <jis/jis.hpp>

#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <string_view>
#include <vector>

using namespace std::string_view_literals;

using jis::code_point;
using jis::code_point_set;
using jis::validation_error;

namespace
{
    code_point_set const hiragana{ 0x3042, 0x3044, 0x3046 }; // あいう
    code_point_set const katakana{ 0x30A2, 0x30A4, 0x30A6 }; // アイウ
}

//==============================================================================
// validate: single set
//==============================================================================

TEST( validate, success )
{
    EXPECT_TRUE( hiragana.validate( "あいう" ).has_value() );
    EXPECT_TRUE( hiragana.validate( "" ).has_value() );
}

TEST( validate, failure_reports_first_excluded_character )
{
    code_point_set const ai{ 0x3042, 0x3044 };
    auto const result{ ai.validate( "あいう" ) };
    ASSERT_FALSE( result.has_value() );
    EXPECT_EQ( result.error().character, 0x3046 );
    EXPECT_EQ( result.error().position , 2 );
    EXPECT_EQ( result.error().message  , "invalid character 'う' (U+3046) at position 2" );
}

TEST( validate, failure_on_first_of_several )
{
    auto const result{ hiragana.validate( "あxいy" ) };
    ASSERT_FALSE( result.has_value() );
    EXPECT_EQ( result.error(), validation_error( U'x', 1 ) );
}

TEST( validate, agrees_with_contains )
{
    for ( auto const text : { "あいう"sv, "あいうえ"sv, ""sv, "x"sv } )
    {
        auto const result{ hiragana.validate( text ) };
        EXPECT_EQ( result.has_value(), hiragana.contains( text ) ) << text;
        if ( !result )
        {
            auto const excluded{ hiragana.first_excluded_with_position( text ) };
            ASSERT_TRUE( excluded.has_value() );
            EXPECT_EQ( result.error().character, excluded->value    );
            EXPECT_EQ( result.error().position , excluded->position );
        }
    }
}

TEST( validate, embedded_nul_in_string_literal )
{
    auto const result{ jis::ascii::printable_cached().validate( "Hello\0World" ) };
    ASSERT_FALSE( result.has_value() );
    EXPECT_EQ( result.error().character, 0x00 );
    EXPECT_EQ( result.error().position , 5 );
    EXPECT_FALSE( jis::ascii::printable_cached().contains( "Hello\0World" ) );
}

TEST( validate, utf16_and_utf32_input )
{
    auto const utf16{ hiragana.validate( u"あいx" ) };
    auto const utf32{ hiragana.validate( U"あいx" ) };
    ASSERT_FALSE( utf16.has_value() );
    ASSERT_FALSE( utf32.has_value() );
    EXPECT_EQ( utf16.error(), utf32.error() );
    EXPECT_EQ( utf16.error().position, 2 );
}

TEST( validate, custom_message )
{
    code_point_set const s{ 0x3042 };
    auto const result{ s.validate( "あA", "custom msg" ) };
    ASSERT_FALSE( result.has_value() );
    EXPECT_EQ( result.error().message  , "custom msg" );
    EXPECT_EQ( result.error().character, 0x41 );
    EXPECT_EQ( result.error().position , 1 );

    EXPECT_TRUE( s.validate( "あ", "unused" ).has_value() );
}

//==============================================================================
// validation_error
//==============================================================================

TEST( validation_error, default_message )
{
    EXPECT_EQ( validation_error( U'A', 0 ).message, "invalid character 'A' (U+0041) at position 0" );
    EXPECT_EQ( validation_error( 0x3046, 2 ).message, "invalid character 'う' (U+3046) at position 2" );
    EXPECT_EQ( validation_error( 0x1F600, 15 ).message, "invalid character '😀' (U+1F600) at position 15" );
}

TEST( validation_error, message_for_non_scalar_values )
{
    // rendered as U+FFFD, the numeric label keeps the actual value
    EXPECT_EQ( validation_error( 0xD800, 1 ).message, "invalid character '�' (U+D800) at position 1" );
    EXPECT_EQ( validation_error( 0x110000, 0 ).message, "invalid character '�' (U+110000) at position 0" );
}

TEST( validation_error, with_message )
{
    auto const error{ validation_error::with_message( 0x3046, 3, "not hiragana" ) };
    EXPECT_EQ( error.character, 0x3046 );
    EXPECT_EQ( error.position , 3 );
    EXPECT_EQ( error.message  , "not hiragana" );
    EXPECT_NE( error, validation_error( 0x3046, 3 ) );
}

TEST( validation_error, stream_output )
{
    std::ostringstream os;
    os << validation_error( U'x', 4 );
    EXPECT_EQ( os.str(), "invalid character 'x' (U+0078) at position 4" );
}

//==============================================================================
// contains_all_in_any
//==============================================================================

TEST( contains_all_in_any, mixed_sets )
{
    EXPECT_TRUE ( jis::contains_all_in_any( "あア", { hiragana, katakana } ) );
    EXPECT_TRUE ( jis::contains_all_in_any( "アあイい", { hiragana, katakana } ) );
    EXPECT_FALSE( jis::contains_all_in_any( "xyz", { hiragana, katakana } ) );
    EXPECT_FALSE( jis::contains_all_in_any( "あxア", { hiragana, katakana } ) );
}

TEST( contains_all_in_any, single_set )
{
    EXPECT_TRUE ( jis::contains_all_in_any( "あい", { hiragana } ) );
    EXPECT_TRUE ( jis::contains_all_in_any( "アイ", { katakana } ) );
    EXPECT_FALSE( jis::contains_all_in_any( "アイ", { hiragana } ) );
}

TEST( contains_all_in_any, empty_set_list_is_always_false )
{
    std::vector<code_point_set const *> const none;
    EXPECT_FALSE( jis::contains_all_in_any( "any", none ) );
    EXPECT_FALSE( jis::contains_all_in_any( "", none ) );
}

TEST( contains_all_in_any, empty_text )
{
    code_point_set const ascii{ U'A', U'B' };
    EXPECT_TRUE( jis::contains_all_in_any( "", { hiragana, katakana, ascii } ) );
}

TEST( contains_all_in_any, pointer_list )
{
    std::vector<code_point_set const *> const sets{ &hiragana, &katakana };
    EXPECT_TRUE ( jis::contains_all_in_any( u"あア", sets ) );
    EXPECT_FALSE( jis::contains_all_in_any( u"あア!", sets ) );
}

TEST( contains_all_in_any, empty_sets_in_the_list )
{
    code_point_set const empty;
    EXPECT_FALSE( jis::contains_all_in_any( "あ", { empty } ) );
    EXPECT_TRUE ( jis::contains_all_in_any( "あ", { empty, hiragana } ) );
}

//==============================================================================
// validate_all_in_any
//==============================================================================

TEST( validate_all_in_any, success )
{
    EXPECT_TRUE( jis::validate_all_in_any( "あア", { hiragana, katakana } ).has_value() );
    EXPECT_TRUE( jis::validate_all_in_any( "あい", { hiragana } ).has_value() );
    EXPECT_TRUE( jis::validate_all_in_any( "", { hiragana } ).has_value() );
}

TEST( validate_all_in_any, reports_first_uncovered_character )
{
    auto const result{ jis::validate_all_in_any( "あxア", { hiragana, katakana } ) };
    ASSERT_FALSE( result.has_value() );
    EXPECT_EQ( result.error().character, U'x' );
    EXPECT_EQ( result.error().position , 1 );
}

TEST( validate_all_in_any, three_sets )
{
    code_point_set const ascii{ U'A' };
    EXPECT_TRUE( jis::validate_all_in_any( "あアA", { hiragana, katakana, ascii } ).has_value() );

    auto const result{ jis::validate_all_in_any( "あアAπ", { hiragana, katakana, ascii } ) };
    ASSERT_FALSE( result.has_value() );
    EXPECT_EQ( result.error().character, 0x03C0 );
    EXPECT_EQ( result.error().position , 3 );
}

TEST( validate_all_in_any, empty_set_list )
{
    std::vector<code_point_set const *> const none;
    auto const result{ jis::validate_all_in_any( "a", none ) };
    ASSERT_FALSE( result.has_value() );
    EXPECT_EQ( result.error(), validation_error( U'a', 0 ) );

    // vacuously valid text
    EXPECT_TRUE( jis::validate_all_in_any( "", none ).has_value() );
}

TEST( validate_all_in_any, embedded_nul_in_string_literal )
{
    EXPECT_FALSE( jis::contains_all_in_any( "\0", { hiragana } ) );
    auto const result{ jis::validate_all_in_any( "あ\0ア", { hiragana, katakana } ) };
    ASSERT_FALSE( result.has_value() );
    EXPECT_EQ( result.error(), validation_error( 0x00, 1 ) );
}

TEST( validate_all_in_any, agrees_with_contains_all_in_any )
{
    std::vector<code_point_set const *> const sets{ &hiragana, &katakana };
    for ( auto const text : { "あア"sv, "xyz"sv, "アいウ"sv, "ア!"sv, ""sv } )
        EXPECT_EQ( jis::validate_all_in_any( text, sets ).has_value(), jis::contains_all_in_any( text, sets ) ) << text;
}

//==============================================================================
// Per-standard validators
//==============================================================================

TEST( validators, hiragana_and_katakana )
{
    EXPECT_TRUE ( jis::validate_hiragana( "ひらがな" ).has_value() );
    EXPECT_FALSE( jis::validate_hiragana( "カタカナ" ).has_value() );
    EXPECT_TRUE ( jis::validate_katakana( "カタカナ" ).has_value() );

    auto const result{ jis::validate_katakana( "カタカナabc" ) };
    ASSERT_FALSE( result.has_value() );
    EXPECT_EQ( result.error().character, U'a' );
    EXPECT_EQ( result.error().position , 4 );
}

TEST( validators, jisx0208 )
{
    EXPECT_TRUE ( jis::validate_jisx0208( "ひらがなカタカナＡＢＣαβγ─│" ).has_value() );
    EXPECT_FALSE( jis::validate_jisx0208( "ABC" ).has_value() );
}

TEST( validators, jisx0201 )
{
    EXPECT_TRUE ( jis::validate_jisx0201( "Hello ｱｲｳ ¥100" ).has_value() );
    EXPECT_FALSE( jis::validate_jisx0201( "あ" ).has_value() );
}

TEST( validators, kanji )
{
    EXPECT_TRUE ( jis::validate_jisx0208_kanji( "亜愛安以伊位一乙王黄" ).has_value() );
    EXPECT_FALSE( jis::validate_jisx0208_kanji( "亜ABC愛" ).has_value() );
    EXPECT_TRUE ( jis::validate_jisx0213_kanji( "堯槇遙瑤凜熙" ).has_value() );

    auto const result{ jis::validate_jisx0213_kanji( "亜A愛" ) };
    ASSERT_FALSE( result.has_value() );
    EXPECT_EQ( result.error().position, 1 );
}

TEST( validators, japanese_kana )
{
    EXPECT_TRUE ( jis::validate_japanese_kana( "あいアイ" ).has_value() );
    auto const result{ jis::validate_japanese_kana( "あいHello" ) };
    ASSERT_FALSE( result.has_value() );
    EXPECT_EQ( result.error(), validation_error( U'H', 2 ) );
}

TEST( validators, japanese_mixed )
{
    EXPECT_TRUE ( jis::validate_japanese_mixed( "こんにちはHello" ).has_value() );
    EXPECT_TRUE ( jis::validate_japanese_mixed( u"カタカナ ひらがな 123!" ).has_value() );
    auto const result{ jis::validate_japanese_mixed( "漢字" ) };
    ASSERT_FALSE( result.has_value() );
    EXPECT_EQ( result.error(), validation_error( 0x6F22, 0 ) );
    EXPECT_FALSE( jis::validate_japanese_mixed( "あ\n" ).has_value() );
}

TEST( validators, jisx0201_katakana )
{
    EXPECT_TRUE ( jis::validate_jisx0201_katakana( "ｱｲｳｴｵ" ).has_value() );
    auto const result{ jis::validate_jisx0201_katakana( "アイウエオ" ) };
    ASSERT_FALSE( result.has_value() );
    EXPECT_EQ( result.error(), validation_error( 0x30A2, 0 ) );
}

TEST( validators, jisx0201_latin )
{
    EXPECT_TRUE ( jis::validate_jisx0201_latin( "Hello¥" ).has_value() );
    EXPECT_FALSE( jis::validate_jisx0201_latin( "こんにちは" ).has_value() );
    auto const result{ jis::validate_jisx0201_latin( "C:\\" ) };
    ASSERT_FALSE( result.has_value() );
    EXPECT_EQ( result.error(), validation_error( U'\\', 2 ) );
}

TEST( validators, combined_with_ascii )
{
    // A typical form field: kana, kanji and ASCII
    auto const & ascii{ jis::ascii::printable_cached() };
    auto const & kanji{ jis::jisx0208_kanji::all_cached() };
    auto const & kana { jis::jisx0208::hiragana_cached() };
    EXPECT_TRUE ( jis::validate_all_in_any( "東京 tokyo とうきょう", { ascii, kanji, kana } ).has_value() );
    EXPECT_FALSE( jis::validate_all_in_any( "東京\t", { ascii, kanji, kana } ).has_value() );
}
