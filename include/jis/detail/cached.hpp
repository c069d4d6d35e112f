////////////////////////////////////////////////////////////////////////////////
/// jis lazily built, process wide set instances
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

#include <jis/code_point_set.hpp>
//------------------------------------------------------------------------------
namespace jis::detail
{
//------------------------------------------------------------------------------

// One immutable instance per factory, built on first use (concurrent first
// callers block until the single construction completes).
template <code_point_set ( & make )()>
[[ nodiscard ]] code_point_set const & cached()
{
    static code_point_set const instance{ make() };
    return instance;
}

//------------------------------------------------------------------------------
} // namespace jis::detail
//------------------------------------------------------------------------------
