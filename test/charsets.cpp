////////////////////////////////////////////////////////////////////////////////
/// jis named character sets test suite
////////////////////////////////////////////////////////////////////////////////

#include <jis/charsets/ascii.hpp>
#include <jis/charsets/jisx0201.hpp>
#include <jis/charsets/jisx0208.hpp>
#include <jis/charsets/jisx0208_kanji.hpp>
#include <jis/charsets/jisx0213_kanji.hpp>
#include <jis/tables/tables.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <future>
#include <vector>

using jis::code_point;
using jis::code_point_set;

//==============================================================================
// ASCII
//==============================================================================

TEST( ascii, control )
{
    auto const & s{ jis::ascii::control_cached() };
    EXPECT_EQ( s.size(), 33 );
    EXPECT_TRUE ( s.contains( "\n\r\t" ) );
    EXPECT_TRUE ( s.contains( code_point{ 0x00 } ) );
    EXPECT_TRUE ( s.contains( code_point{ 0x7F } ) );
    EXPECT_FALSE( s.contains( "a\n\r\t" ) );
    EXPECT_FALSE( s.contains( "あ" ) );
}

TEST( ascii, printable )
{
    auto const & s{ jis::ascii::printable_cached() };
    EXPECT_EQ( s.size(), 95 );
    EXPECT_TRUE ( s.contains( "Hello World 123!@#" ) );
    EXPECT_TRUE ( s.contains( "Hello~" ) );
    EXPECT_TRUE ( s.contains( "\\100" ) );
    EXPECT_FALSE( s.contains( "\n" ) );
    EXPECT_FALSE( s.contains( "あ" ) );
}

TEST( ascii, crlf )
{
    auto const & s{ jis::ascii::crlf_cached() };
    EXPECT_EQ( s.size(), 2 );
    EXPECT_TRUE ( s.contains( "\r\n" ) );
    EXPECT_FALSE( s.contains( "\r\n\t" ) );
    EXPECT_FALSE( s.contains( "a" ) );
}

TEST( ascii, all )
{
    auto const & s{ jis::ascii::all_cached() };
    EXPECT_EQ( s.size(), 128 );
    EXPECT_TRUE ( s.contains( "Hello\n\r123" ) );
    EXPECT_FALSE( s.contains( "あ" ) );
    EXPECT_FALSE( s.contains( code_point{ 0x80 } ) );
    EXPECT_EQ( s, jis::ascii::control() | jis::ascii::printable() );
}

TEST( ascii, cached_instances_have_stable_identity )
{
    EXPECT_EQ( &jis::ascii::control_cached  (), &jis::ascii::control_cached  () );
    EXPECT_EQ( &jis::ascii::printable_cached(), &jis::ascii::printable_cached() );
    EXPECT_EQ( &jis::ascii::crlf_cached     (), &jis::ascii::crlf_cached     () );
    EXPECT_EQ( &jis::ascii::all_cached      (), &jis::ascii::all_cached      () );
    EXPECT_NE( static_cast<void const *>( &jis::ascii::control_cached() ), static_cast<void const *>( &jis::ascii::printable_cached() ) );
}

TEST( ascii, cached_equals_fresh )
{
    EXPECT_EQ( jis::ascii::control_cached  (), jis::ascii::control  () );
    EXPECT_EQ( jis::ascii::printable_cached(), jis::ascii::printable() );
    EXPECT_EQ( jis::ascii::crlf_cached     (), jis::ascii::crlf     () );
    EXPECT_EQ( jis::ascii::all_cached      (), jis::ascii::all      () );
}

TEST( cached, concurrent_first_access )
{
    std::vector<std::future<code_point_set const *>> accesses;
    for ( int i{ 0 }; i < 8; ++i )
        accesses.push_back( std::async( std::launch::async, []{ return &jis::jisx0208::special_chars_cached(); } ) );
    auto const * const expected{ &jis::jisx0208::special_chars_cached() };
    for ( auto & access : accesses )
        EXPECT_EQ( access.get(), expected );
    EXPECT_EQ( expected->size(), 147 );
}

//==============================================================================
// JIS X 0201
//==============================================================================

TEST( jisx0201, katakana )
{
    auto const & s{ jis::jisx0201::katakana_cached() };
    EXPECT_EQ( s.size(), 63 );
    EXPECT_TRUE ( s.contains( "ｱｲｳｴｵ" ) );
    EXPECT_TRUE ( s.contains( "｡｢｣､･" ) );
    EXPECT_TRUE ( s.contains( "｡｢｣､･ｦｧｨｩｪｫｬｭｮｯｰｱｲｳｴｵｶｷｸｹｺｻｼｽｾｿﾀﾁﾂﾃﾄﾅﾆﾇﾈﾉﾊﾋﾌﾍﾎﾏﾐﾑﾒﾓﾔﾕﾖﾗﾘﾙﾚﾛﾜﾝﾞﾟ" ) );
    EXPECT_FALSE( s.contains( "アイウ" ) );
}

TEST( jisx0201, latin_letters )
{
    auto const & s{ jis::jisx0201::latin_letters_cached() };
    EXPECT_EQ( s.size(), 95 );
    EXPECT_TRUE ( s.contains( "Hello" ) );
    EXPECT_TRUE ( s.contains( "¥100" ) );
    EXPECT_TRUE ( s.contains( "‾" ) );
    // 0x5C and 0x7E are YEN SIGN and OVERLINE in the Roman set
    EXPECT_FALSE( s.contains( "\\" ) );
    EXPECT_FALSE( s.contains( "~" ) );
}

TEST( jisx0201, all )
{
    auto const & s{ jis::jisx0201::all_cached() };
    EXPECT_EQ( s.size(), 158 );
    EXPECT_TRUE( s.contains( "ｱｲｳ ABC ¥" ) );
    EXPECT_TRUE( jis::jisx0201::katakana().is_subset_of( s ) );
    EXPECT_TRUE( jis::jisx0201::latin_letters().is_subset_of( s ) );
    EXPECT_EQ( &s, &jis::jisx0201::all_cached() );
}

//==============================================================================
// JIS X 0208 (non-kanji)
//==============================================================================

TEST( jisx0208, table_sizes )
{
    EXPECT_EQ( jis::jisx0208::special_chars    ().size(), 147 );
    EXPECT_EQ( jis::jisx0208::latin_letters    ().size(),  62 );
    EXPECT_EQ( jis::jisx0208::hiragana         ().size(),  83 );
    EXPECT_EQ( jis::jisx0208::katakana         ().size(),  86 );
    EXPECT_EQ( jis::jisx0208::greek_letters    ().size(),  48 );
    EXPECT_EQ( jis::jisx0208::cyrillic_letters ().size(),  66 );
    EXPECT_EQ( jis::jisx0208::box_drawing_chars().size(),  32 );
    EXPECT_EQ( jis::jisx0208::all              ().size(), 524 );
}

TEST( jisx0208, hiragana )
{
    auto const & s{ jis::jisx0208::hiragana_cached() };
    EXPECT_TRUE ( s.contains( "あいうえお" ) );
    EXPECT_TRUE ( s.contains( "がぎぐげご" ) );
    EXPECT_TRUE ( s.contains( "ぁん" ) );
    EXPECT_FALSE( s.contains( "ア" ) );
}

TEST( jisx0208, katakana )
{
    auto const & s{ jis::jisx0208::katakana_cached() };
    EXPECT_TRUE ( s.contains( "アイウエオ" ) );
    EXPECT_TRUE ( s.contains( "ガギグゲゴ" ) );
    EXPECT_TRUE ( s.contains( "ヴヵヶ" ) );
    EXPECT_FALSE( s.contains( "ｱ" ) );
}

TEST( jisx0208, latin_letters )
{
    auto const & s{ jis::jisx0208::latin_letters_cached() };
    EXPECT_TRUE ( s.contains( "ＡＢＣＤＥＦＧ" ) );
    EXPECT_TRUE ( s.contains( "ａｂｃｄｅｆｇ" ) );
    EXPECT_TRUE ( s.contains( "０１２３４５６７８９" ) );
    EXPECT_FALSE( s.contains( "ABC" ) );
}

TEST( jisx0208, greek_and_cyrillic )
{
    auto const & greek   { jis::jisx0208::greek_letters_cached() };
    auto const & cyrillic{ jis::jisx0208::cyrillic_letters_cached() };
    EXPECT_TRUE ( greek.contains( "ΑΒΓΔΕΖΗΘΙΚΛΜΝΞΟΠΡΣΤΥΦΧΨΩ" ) );
    EXPECT_TRUE ( greek.contains( "αβγδεζηθικλμνξοπρστυφχψω" ) );
    EXPECT_FALSE( greek.contains( "ABC" ) );
    EXPECT_TRUE ( cyrillic.contains( "АБВГДЕЁЖЗИЙКЛМНОПРСТУФХЦЧШЩЪЫЬЭЮЯ" ) );
    EXPECT_TRUE ( cyrillic.contains( "абвгдеёжзийклмнопрстуфхцчшщъыьэюя" ) );
    EXPECT_FALSE( cyrillic.contains( "ABC" ) );
}

TEST( jisx0208, special_chars_and_box_drawing )
{
    EXPECT_TRUE( jis::jisx0208::special_chars_cached    ().contains( "　、。・ー〜" ) );
    EXPECT_TRUE( jis::jisx0208::box_drawing_chars_cached().contains( "─│┌┐┘└├┬┤┴┼" ) );
}

TEST( jisx0208, rows_are_disjoint )
{
    code_point_set const rows[]
    {
        jis::jisx0208::special_chars(), jis::jisx0208::latin_letters(), jis::jisx0208::hiragana(),
        jis::jisx0208::katakana(), jis::jisx0208::greek_letters(), jis::jisx0208::cyrillic_letters(),
        jis::jisx0208::box_drawing_chars()
    };
    for ( auto const & row : rows )
    {
        EXPECT_TRUE( row.is_subset_of( jis::jisx0208::all_cached() ) );
        for ( auto const & other : rows )
        {
            if ( &row != &other )
                EXPECT_TRUE( ( row & other ).empty() );
        }
    }
}

//==============================================================================
// Kanji
//==============================================================================

TEST( jisx0208_kanji, all )
{
    auto const & s{ jis::jisx0208_kanji::all_cached() };
    EXPECT_EQ( s.size(), 6355 );
    EXPECT_EQ( s.size(), jis::tables::jisx0208_kanji.size() );
    EXPECT_TRUE ( s.contains( "亜愛安以伊位一乙王黄" ) );
    EXPECT_FALSE( s.contains( "ABC123" ) );
    EXPECT_FALSE( s.contains( "亜ABC愛" ) );
    EXPECT_EQ( &s, &jis::jisx0208_kanji::all_cached() );
}

TEST( jisx0213_kanji, all )
{
    auto const & s{ jis::jisx0213_kanji::all_cached() };
    EXPECT_EQ( s.size(), 10050 );
    EXPECT_TRUE ( s.contains( "亜愛安以伊位一乙王黄" ) );
    EXPECT_TRUE ( s.contains( "堯槇遙瑤凜熙" ) );
    EXPECT_FALSE( s.contains( "亜A愛" ) );
    EXPECT_FALSE( s.contains( "123" ) );
}

TEST( jisx0213_kanji, supplementary_plane )
{
    auto const & s{ jis::jisx0213_kanji::all_cached() };
    EXPECT_TRUE( s.contains( code_point{ 0x2000B } ) );
    EXPECT_TRUE( s.contains( "𠀋𠮟" ) );
    EXPECT_TRUE( s.contains( u"𠀋𠮟" ) );
    EXPECT_GT( std::count_if( s.begin(), s.end(), []( code_point const cp ) { return cp > 0xFFFF; } ), 0 );
}

TEST( jisx0213_kanji, extends_jisx0208_kanji )
{
    EXPECT_TRUE( jis::jisx0208_kanji::all_cached().is_subset_of( jis::jisx0213_kanji::all_cached() ) );
}

TEST( kanji, disjoint_from_kana )
{
    EXPECT_TRUE( ( jis::jisx0213_kanji::all_cached() & jis::jisx0208::all_cached() ).empty() );
}
