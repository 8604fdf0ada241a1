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
#pragma once

#include "gap_buffer.hpp"

#include <fmt/format.h>

#include <iterator>
#include <string>
#include <string_view>
//------------------------------------------------------------------------------
namespace gapbuf
{
//------------------------------------------------------------------------------

// Renders the logical sequence, the gap (if any) shown as '[...]' at its
// position, e.g. "[1, 2, [...], 3]".
template <typename T, typename Allocator, gap_buffer_options options>
std::string gap_buffer<T, Allocator, options>::debug_string() const
{
    std::string rendering{ "[" };
    auto const out{ std::back_inserter( rendering ) };
    bool first{ true };
    auto const separate
    {
        [&]
        {
            if ( !first )
                rendering += ", ";
            first = false;
        }
    };

    for ( size_type i{ 0 }; i < gap_start_; ++i )
    {
        separate();
        fmt::format_to( out, "{}", p_buffer_[ i ] );
    }
    if ( gap_size_ )
    {
        separate();
        rendering += "[...]";
    }
    for ( auto i{ gap_start_ + gap_size_ }; i < capacity_; ++i )
    {
        separate();
        fmt::format_to( out, "{}", p_buffer_[ i ] );
    }
    rendering += ']';
    return rendering;
}

template <typename T, typename Allocator, gap_buffer_options options>
void gap_buffer<T, Allocator, options>::print() const
{
    fmt::print( "{}\n", debug_string() );
}

//------------------------------------------------------------------------------
} // namespace gapbuf
//------------------------------------------------------------------------------

template <typename T, typename Allocator, gapbuf::gap_buffer_options options>
struct fmt::formatter<gapbuf::gap_buffer<T, Allocator, options>> : fmt::formatter<std::string_view>
{
    auto format( gapbuf::gap_buffer<T, Allocator, options> const & buffer, fmt::format_context & ctx ) const
    {
        return fmt::formatter<std::string_view>::format( buffer.debug_string(), ctx );
    }
};
