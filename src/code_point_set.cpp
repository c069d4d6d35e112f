////////////////////////////////////////////////////////////////////////////////
/// jis::code_point_set
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
#include <jis/code_point_set.hpp>

#include <boost/container_hash/hash.hpp>

#include <iomanip>
#include <iterator>
#include <ostream>
//------------------------------------------------------------------------------
namespace jis
{
//------------------------------------------------------------------------------

code_point_set::code_point_set( std::span<code_point const> const values )
    : code_point_set{ storage_type( values.begin(), values.end() ) }
{}

code_point_set::code_point_set( std::initializer_list<code_point> const values )
    : code_point_set{ storage_type( values ) }
{}

code_point_set::code_point_set( storage_type values ) noexcept
    : storage_{ std::move( values ) }
{
    detail::sort_unique( storage_ );
    build_ascii_mask();
}

code_point_set::code_point_set( sorted_unique_t, storage_type values ) noexcept
    : storage_{ std::move( values ) }
{
    BOOST_ASSERT_MSG( detail::is_sorted_unique<code_point>( storage_ ), "Input not sorted or not unique" );
    build_ascii_mask();
}

void code_point_set::build_ascii_mask() noexcept
{
    if constexpr ( config::ascii_bitmap )
    {
        // the sorted storage starts with the ASCII members (if any)
        for ( auto const cp : storage_ )
        {
            if ( !is_ascii( cp ) )
                break;
            ascii_mask_[ cp / 64 ] |= std::uint64_t{ 1 } << ( cp % 64 );
        }
    }
}


//==============================================================================
// Set algebra: linear merges of the two sorted sequences, the output is
// sorted and unique by construction
//==============================================================================

code_point_set code_point_set::set_union( code_point_set const & other ) const
{
    storage_type result;
    result.reserve( size() + other.size() );
    std::set_union( begin(), end(), other.begin(), other.end(), std::back_inserter( result ) );
    return { sorted_unique, std::move( result ) };
}

code_point_set code_point_set::set_intersection( code_point_set const & other ) const
{
    storage_type result;
    result.reserve( std::min( size(), other.size() ) );
    std::set_intersection( begin(), end(), other.begin(), other.end(), std::back_inserter( result ) );
    return { sorted_unique, std::move( result ) };
}

code_point_set code_point_set::set_difference( code_point_set const & other ) const
{
    storage_type result;
    result.reserve( size() );
    std::set_difference( begin(), end(), other.begin(), other.end(), std::back_inserter( result ) );
    return { sorted_unique, std::move( result ) };
}

code_point_set code_point_set::set_symmetric_difference( code_point_set const & other ) const
{
    storage_type result;
    result.reserve( size() + other.size() );
    std::set_symmetric_difference( begin(), end(), other.begin(), other.end(), std::back_inserter( result ) );
    return { sorted_unique, std::move( result ) };
}

bool code_point_set::is_subset_of( code_point_set const & other ) const noexcept
{
    return ( size() <= other.size() ) && std::includes( other.begin(), other.end(), begin(), end() );
}


std::size_t code_point_set::hash() const noexcept
{
    return boost::hash_range( storage_.begin(), storage_.end() );
}

std::ostream & operator<<( std::ostream & os, code_point_set const & set )
{
    return os << "code_point_set(" << set.size() << " items)";
}

std::ostream & operator<<( std::ostream & os, excluded_code_point const & excluded )
{
    auto const flags{ os.flags() };
    auto const fill { os.fill ( '0' ) };
    os << "U+" << std::hex << std::uppercase << std::setw( 4 ) << static_cast<std::uint32_t>( excluded.value );
    os.flags( flags );
    os.fill ( fill  );
    return os << " at position " << excluded.position;
}

//------------------------------------------------------------------------------
} // namespace jis
//------------------------------------------------------------------------------
