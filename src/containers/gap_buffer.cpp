////////////////////////////////////////////////////////////////////////////////
///
/// Copyright (c) Domagoj Saric.
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
#include <gapbuf/containers/gap_buffer.hpp>

#include <fmt/format.h>

#include <new>
#include <stdexcept>
//------------------------------------------------------------------------------
namespace gapbuf
{
//------------------------------------------------------------------------------

namespace detail
{
    [[ noreturn, gnu::cold ]] void throw_out_of_range( char const * const operation, std::size_t const index, std::size_t const size )
    {
        throw std::out_of_range( fmt::format( "gap_buffer::{}: index {} out of bounds for size {}", operation, index, size ) );
    }
    [[ noreturn, gnu::cold ]] void throw_bad_alloc() { throw std::bad_alloc(); }
} // namespace detail

//------------------------------------------------------------------------------
} // namespace gapbuf
//------------------------------------------------------------------------------
