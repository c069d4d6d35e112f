////////////////////////////////////////////////////////////////////////////////
/// jis: Japanese (JIS) character set membership and validation
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

#include <jis/charsets/ascii.hpp>
#include <jis/charsets/jisx0201.hpp>
#include <jis/charsets/jisx0208.hpp>
#include <jis/charsets/jisx0208_kanji.hpp>
#include <jis/charsets/jisx0213_kanji.hpp>
#include <jis/code_point_set.hpp>
#include <jis/utf/decode.hpp>
#include <jis/utf/encode.hpp>
#include <jis/validation.hpp>
#include <jis/validation_error.hpp>
#include <jis/validators.hpp>
//------------------------------------------------------------------------------
