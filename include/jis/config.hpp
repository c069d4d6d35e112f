////////////////////////////////////////////////////////////////////////////////
/// jis compile-time configuration
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

#include <boost/config.hpp>

#ifndef JIS_ASCII_BITMAP
#   define JIS_ASCII_BITMAP 1
#endif
//------------------------------------------------------------------------------
namespace jis::config
{
//------------------------------------------------------------------------------

// Membership of U+0000 - U+007F is answered from a 128 bit mask built at
// construction (vs. binary search over the sorted storage like every other
// code point). Most validated text is predominantly ASCII.
inline constexpr bool ascii_bitmap{ JIS_ASCII_BITMAP != 0 };

//------------------------------------------------------------------------------
} // namespace jis::config
//------------------------------------------------------------------------------
