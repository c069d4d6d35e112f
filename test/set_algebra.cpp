////////////////////////////////////////////////////////////////////////////////
/// jis::code_point_set set algebra test suite
////////////////////////////////////////////////////////////////////////////////

#include <jis/code_point_set.hpp>

#include <gtest/gtest.h>

#include <vector>

using jis::code_point;
using jis::code_point_set;

//==============================================================================
// Fixtures: あい / いう
//==============================================================================

namespace
{
    code_point_set const a_i{ 0x3042, 0x3044 };
    code_point_set const i_u{ 0x3044, 0x3046 };
    code_point_set const empty;
}

//==============================================================================
// set_algebra: Basic operations
//==============================================================================

TEST( set_algebra, union_of_sets )
{
    auto const u{ a_i.set_union( i_u ) };
    EXPECT_EQ( u.size(), 3 );
    EXPECT_TRUE( u.contains( "あいう" ) );
    EXPECT_EQ( u, a_i | i_u );
}

TEST( set_algebra, intersection )
{
    auto const i{ a_i.set_intersection( i_u ) };
    EXPECT_EQ( i.size(), 1 );
    EXPECT_TRUE ( i.contains( "い" ) );
    EXPECT_FALSE( i.contains( "あ" ) );
    EXPECT_FALSE( i.contains( "う" ) );
    EXPECT_EQ( i, a_i & i_u );
}

TEST( set_algebra, difference )
{
    auto const d{ a_i.set_difference( i_u ) };
    EXPECT_EQ( d.size(), 1 );
    EXPECT_TRUE ( d.contains( "あ" ) );
    EXPECT_FALSE( d.contains( "い" ) );
    EXPECT_EQ( d, a_i - i_u );
    EXPECT_EQ( i_u - a_i, code_point_set{ 0x3046 } );
}

TEST( set_algebra, symmetric_difference )
{
    auto const sd{ a_i.set_symmetric_difference( i_u ) };
    EXPECT_EQ( sd.size(), 2 );
    EXPECT_TRUE ( sd.contains( "あ" ) );
    EXPECT_TRUE ( sd.contains( "う" ) );
    EXPECT_FALSE( sd.contains( "い" ) );
    EXPECT_EQ( sd, a_i ^ i_u );
}

TEST( set_algebra, operands_are_not_modified )
{
    auto const before{ a_i.to_vector() };
    [[ maybe_unused ]] auto const u { a_i | i_u };
    [[ maybe_unused ]] auto const i { a_i & i_u };
    [[ maybe_unused ]] auto const d { a_i - i_u };
    [[ maybe_unused ]] auto const sd{ a_i ^ i_u };
    EXPECT_EQ( a_i.to_vector(), before );
    EXPECT_EQ( i_u.size(), 2 );
}

TEST( set_algebra, results_are_usable_sets )
{
    // the results of set algebra have to answer ASCII membership correctly too
    code_point_set const letters{ U'a', U'b', U'c' };
    code_point_set const digits { U'1', U'2', 0x3042 };
    auto const both{ letters | digits };
    EXPECT_TRUE ( both.contains( "abc12あ" ) );
    EXPECT_FALSE( both.contains( "d" ) );
    EXPECT_TRUE ( ( both - digits ).contains( "cab" ) );
    EXPECT_FALSE( ( both - digits ).contains( "1" ) );
}

//==============================================================================
// set_algebra: Empty operands
//==============================================================================

TEST( set_algebra, with_empty_set )
{
    EXPECT_TRUE( a_i.set_intersection( empty ).empty() );
    EXPECT_TRUE( empty.set_intersection( a_i ).empty() );

    EXPECT_EQ( a_i.set_union( empty ), a_i );
    EXPECT_EQ( empty.set_union( a_i ), a_i );

    EXPECT_EQ( a_i.set_difference( empty ), a_i );
    EXPECT_TRUE( empty.set_difference( a_i ).empty() );

    EXPECT_EQ( a_i ^ empty, a_i );
}

//==============================================================================
// set_algebra: Laws
//==============================================================================

TEST( set_algebra, commutativity )
{
    EXPECT_EQ( a_i | i_u, i_u | a_i );
    EXPECT_EQ( a_i & i_u, i_u & a_i );
    EXPECT_EQ( a_i ^ i_u, i_u ^ a_i );
}

TEST( set_algebra, identities )
{
    EXPECT_EQ( a_i | a_i, a_i );
    EXPECT_EQ( a_i & a_i, a_i );
    EXPECT_TRUE( ( a_i - a_i ).empty() );
    EXPECT_TRUE( ( a_i ^ a_i ).empty() );
}

TEST( set_algebra, symmetric_difference_decomposition )
{
    EXPECT_EQ( a_i ^ i_u, ( a_i - i_u ) | ( i_u - a_i ) );
    EXPECT_EQ( a_i ^ i_u, ( a_i | i_u ) - ( a_i & i_u ) );
}

TEST( set_algebra, supplementary_plane_members )
{
    code_point_set const left { 0x2000B, 0x20B9F, 0x3042 };
    code_point_set const right{ 0x20B9F, 0x3044 };
    EXPECT_EQ( left & right, code_point_set{ 0x20B9F } );
    EXPECT_EQ( ( left | right ).size(), 4 );
    EXPECT_TRUE( ( left - right ).contains( "𠀋あ" ) );
}

//==============================================================================
// set_algebra: Subset / superset
//==============================================================================

TEST( set_algebra, subset )
{
    code_point_set const a{ 0x3042 };
    EXPECT_TRUE ( a  .is_subset_of( a_i ) );
    EXPECT_FALSE( a_i.is_subset_of( a   ) );
    EXPECT_TRUE ( a_i.is_superset_of( a   ) );
    EXPECT_FALSE( a  .is_superset_of( a_i ) );
}

TEST( set_algebra, subset_is_inclusive )
{
    EXPECT_TRUE( a_i.is_subset_of  ( a_i ) );
    EXPECT_TRUE( a_i.is_superset_of( a_i ) );
}

TEST( set_algebra, empty_set_is_subset_of_everything )
{
    EXPECT_TRUE ( empty.is_subset_of( a_i   ) );
    EXPECT_TRUE ( empty.is_subset_of( empty ) );
    EXPECT_FALSE( a_i  .is_subset_of( empty ) );
    EXPECT_TRUE ( a_i  .is_superset_of( empty ) );
}

TEST( set_algebra, overlapping_sets_are_not_subsets )
{
    EXPECT_FALSE( a_i.is_subset_of  ( i_u ) );
    EXPECT_FALSE( a_i.is_superset_of( i_u ) );
}

TEST( set_algebra, results_relate_to_operands )
{
    EXPECT_TRUE( a_i.is_subset_of( a_i | i_u ) );
    EXPECT_TRUE( i_u.is_subset_of( a_i | i_u ) );
    EXPECT_TRUE( ( a_i & i_u ).is_subset_of( a_i ) );
    EXPECT_TRUE( ( a_i - i_u ).is_subset_of( a_i ) );
    EXPECT_TRUE( ( ( a_i - i_u ) & i_u ).empty() );
}
