////////////////////////////////////////////////////////////////////////////////
/// Allocation layer for gap_buffer
///
/// A CRT (malloc/realloc/free) backed allocator that, in addition to the
/// standard Allocator requirements, offers realloc based growth and the
/// Boost.Container 'version 2' allocation_command interface (in-place
/// expansion, shrinking) - plus concepts that let containers detect these
/// capabilities on arbitrary (user supplied) allocators.
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

#include <gapbuf/align.hpp>

#include <boost/assert.hpp>
#include <boost/container/detail/allocation_type.hpp>
#include <boost/container/detail/version_type.hpp>

#include <algorithm>
#include <concepts>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <memory>
#include <tuple>
#include <type_traits>
#include <utility>

#ifdef __linux__
#include <malloc.h>
#elif defined( __APPLE__ )
#include <malloc/malloc.h>
#endif
//------------------------------------------------------------------------------
namespace gapbuf
{
//------------------------------------------------------------------------------

namespace detail
{
    [[ noreturn, gnu::cold ]] void throw_bad_alloc();

    // https://www.gnu.org/software/libc/manual/html_node/Aligned-Memory-Blocks.html
    inline std::uint8_t constexpr guaranteed_alignment{ 16 }; // all known x64 and arm64 platforms

    [[ gnu::pure ]] inline std::size_t crt_alloc_size( void const * const address ) noexcept
    {
        // https://lemire.me/blog/2017/09/15/how-fast-are-malloc_size-and-malloc_usable_size-in-c
#   if defined( _MSC_VER )
        return _msize( const_cast<void *>( address ) );
#   elif defined( __linux__ )
        return ::malloc_usable_size( const_cast<void *>( address ) );
#   elif defined( __APPLE__ )
        return ::malloc_size( address );
#   else
        static_assert( false, "no malloc size implementation" );
#   endif
    }
    template <std::uint8_t alignment>
    std::size_t crt_aligned_alloc_size( void const * const address ) noexcept
    {
#   if defined( _MSC_VER )
        if constexpr ( alignment > guaranteed_alignment )
            return _aligned_msize( const_cast<void *>( address ), alignment, 0 );
#   endif
        return crt_alloc_size( address );
    }

    [[ gnu::cold ]]
    inline void * crt_realloc( void * const existing_allocation_address, std::size_t const new_size )
    {
        auto const new_allocation{ std::realloc( existing_allocation_address, new_size ) };
        if ( ( new_allocation == nullptr ) && ( new_size != 0 ) ) [[ unlikely ]]
            throw_bad_alloc();
        return new_allocation;
    }

    [[ gnu::cold ]]
    inline void * crt_aligned_realloc( void * const existing_allocation_address, std::size_t const existing_allocation_size, std::size_t const new_size, std::uint8_t const alignment )
    {
        BOOST_ASSERT( alignment > guaranteed_alignment );
#   if defined( _MSC_VER )
        std::ignore = existing_allocation_size;
        auto const new_allocation{ ::_aligned_realloc( existing_allocation_address, new_size, alignment ) };
#   else
        // No aligned realloc: the new block is obtained first so that a failure
        // leaves the original one intact and owned by the caller.
        // "On Linux (and other systems), posix_memalign() does not modify
        // memptr on failure."
        void * new_allocation{ nullptr };
        if ( posix_memalign( &new_allocation, alignment, new_size ) != 0 ) [[ unlikely ]]
            new_allocation = nullptr;
        if ( new_allocation && existing_allocation_address )
        {
            std::memcpy( new_allocation, existing_allocation_address, std::min( existing_allocation_size, new_size ) );
            std::free( existing_allocation_address );
        }
        BOOST_ASSERT( existing_allocation_address || !existing_allocation_size );
        BOOST_ASSERT( !new_allocation || is_aligned( new_allocation, alignment ) );
#   endif
        if ( ( new_allocation == nullptr ) && ( new_size != 0 ) ) [[ unlikely ]]
            throw_bad_alloc();
        return new_allocation;
    } // crt_aligned_realloc()

    template <std::uint8_t alignment>
    void * crt_realloc( void * const existing_allocation_address, std::size_t const existing_allocation_size, std::size_t const new_size )
    {
        if constexpr ( alignment > guaranteed_alignment )
            return crt_aligned_realloc( existing_allocation_address, existing_allocation_size, new_size, alignment );
        else
            return crt_realloc( existing_allocation_address, new_size );
    }

    inline void crt_aligned_free( void * const allocation ) noexcept
    {
#   if defined( _MSC_VER )
        ::_aligned_free( allocation );
#   else
        std::free( allocation );
#   endif
    }
} // namespace detail

////////////////////////////////////////////////////////////////////////////////
/// Allocator capabilities a container can take advantage of
////////////////////////////////////////////////////////////////////////////////

// realloc-like growth: the block may move (bitwise) - usable only for
// is_trivially_moveable element types
template <typename A>
concept reallocating_allocator = requires( A & al, typename std::allocator_traits<A>::pointer const p, typename std::allocator_traits<A>::size_type const sz )
{
    { al.grow_to( p, sz, sz ) } -> std::convertible_to<typename std::allocator_traits<A>::pointer>;
};

// Boost.Container 'version 2' allocators (expand_fwd, shrink_in_place...)
// https://www.open-std.org/jtc1/sc22/wg21/docs/papers/2006/n2045.html
template <typename A>
concept expanding_allocator = requires { requires A::version::value >= 2; } && requires
(
    A & al,
    typename std::allocator_traits<A>::size_type const limit_size,
    typename std::allocator_traits<A>::size_type     & prefer_in_recvd_out_size,
    typename std::allocator_traits<A>::pointer       & reuse
)
{
    { al.allocation_command( boost::container::expand_fwd, limit_size, prefer_in_recvd_out_size, reuse ) } -> std::convertible_to<typename std::allocator_traits<A>::pointer>;
};


////////////////////////////////////////////////////////////////////////////////
/// The default, global, allocation strategy
////////////////////////////////////////////////////////////////////////////////

template <typename T, typename sz_t = std::size_t, std::uint8_t alignment = alignof( T )>
struct crt_aligned_allocator
{
    using value_type      = T;
    using       pointer   = T *;
    using const_pointer   = T const *;
    using       reference = T &;
    using const_reference = T const &;
    using       size_type = sz_t;
    using difference_type = std::make_signed_t<size_type>;

    using is_always_equal                        = std::true_type;
    using propagate_on_container_move_assignment = std::true_type;
    using propagate_on_container_swap            = std::true_type;

    using allocation_commands = boost::container::allocation_type;
    using version = boost::container::dtl::version_type<crt_aligned_allocator, 2>;

    template <class U> struct rebind { using other = crt_aligned_allocator<U, sz_t, alignment>; };

    constexpr crt_aligned_allocator() noexcept = default;
    template <typename U>
    constexpr crt_aligned_allocator( crt_aligned_allocator<U, sz_t, alignment> const & ) noexcept {}

    //!Allocates memory for an array of count elements.
    //!Throws bad_alloc if there is no enough memory
    [[ nodiscard, gnu::malloc ]]
    static pointer allocate( size_type const count, [[ maybe_unused ]] void const * const hint = nullptr )
    {
        if ( count > max_size() ) [[ unlikely ]]
            detail::throw_bad_alloc();
        auto const byte_size{ static_cast<std::size_t>( count ) * sizeof( T ) };
        void * new_allocation{ nullptr };
        if constexpr ( alignment > detail::guaranteed_alignment )
        {
#       if defined( _MSC_VER )
            new_allocation = ::_aligned_malloc( byte_size, alignment );
#       else
            if ( posix_memalign( &new_allocation, alignment, byte_size ) != 0 )
                new_allocation = nullptr;
#       endif
        }
        else
        {
            new_allocation = std::malloc( byte_size );
        }

        if ( !new_allocation && byte_size ) [[ unlikely ]]
            detail::throw_bad_alloc();
        return static_cast<pointer>( new_allocation );
    }

    //!Deallocates previously allocated memory.
    //!Never throws
    static void deallocate( pointer const ptr, [[ maybe_unused ]] size_type const size = 0 ) noexcept
    {
        if constexpr ( alignment > detail::guaranteed_alignment )
            detail::crt_aligned_free( ptr );
        else
            std::free( ptr );
    }

    //! Grows (possibly relocating, bitwise) an existing allocation.
    //! Throws bad_alloc (leaving the existing allocation intact) on failure.
    [[ nodiscard ]] static pointer grow_to( pointer const current_address, size_type const current_size, size_type const target_size )
    {
        BOOST_ASSERT( target_size >= current_size );
        if ( target_size > max_size() ) [[ unlikely ]]
            detail::throw_bad_alloc();
        return static_cast<pointer>
        (
            detail::crt_realloc<alignment>( current_address, current_size * sizeof( T ), target_size * sizeof( T ) )
        );
    }

    //!Returns the maximum number of elements that could be allocated.
    //!Never throws
    [[ gnu::const ]] static constexpr size_type max_size() noexcept { return static_cast<size_type>( std::numeric_limits<size_type>::max() / sizeof( T ) ); }

    //!An advanced function that offers in-place expansion, shrink to fit and
    //!new allocation capabilities. Memory allocated with this function can
    //!only be deallocated with deallocate().
    // https://www.open-std.org/jtc1/sc22/wg21/docs/papers/2006/n2045.html
    [[ nodiscard ]] static pointer allocation_command
    (
        allocation_commands const command,
        [[ maybe_unused ]]
        size_type           const limit_size,
        size_type & prefer_in_recvd_out_size,
        pointer   & reuse
    )
    {
        namespace bc = boost::container;

        BOOST_ASSERT_MSG( !( command & bc::zero_memory ), "Unimplemented command" );
        BOOST_ASSERT_MSG( !( command & bc::expand_bwd  ), "Unimplemented command" );
        BOOST_ASSERT_MSG( !( ( command & bc::shrink_in_place ) && ( command & ( bc::allocate_new | bc::expand_fwd ) ) ), "Conflicting commands" );

        auto const preferred_size{ prefer_in_recvd_out_size };

        if ( reuse && ( command & bc::expand_fwd ) )
        {
#       ifdef _MSC_VER
            // no try_realloc for others so this cannot be safely implemented
            if constexpr ( alignment <= detail::guaranteed_alignment )
            {
                if ( ::_expand( reuse, static_cast<std::size_t>( preferred_size ) * sizeof( T ) ) )
                {
                    prefer_in_recvd_out_size = size( reuse );
                    return reuse;
                }
            }
#       endif
        }
        else
        if ( reuse && ( command & ( bc::shrink_in_place | bc::try_shrink_in_place ) ) )
        {
            BOOST_ASSERT( preferred_size <= size( reuse ) );
            auto const new_address{ static_cast<pointer>( std::realloc( reuse, static_cast<std::size_t>( preferred_size ) * sizeof( T ) ) ) };
            BOOST_ASSERT_MSG( new_address == reuse, "Shrinking moved the block" );
            prefer_in_recvd_out_size = size( new_address );
            return new_address;
        }

        if ( command & bc::allocate_new )
        {
            auto const new_address{ allocate( preferred_size ) }; // throws
            reuse                    = nullptr;
            prefer_in_recvd_out_size = preferred_size;
            return new_address;
        }

        if ( !( command & bc::nothrow_allocation ) )
            detail::throw_bad_alloc();

        return nullptr;
    }

    //!Returns the maximum number of objects the previously allocated memory
    //!pointed by p can hold.
    [[ nodiscard, gnu::pure ]] static size_type size( const_pointer const p ) noexcept
    {
        return static_cast<size_type>( detail::crt_aligned_alloc_size<alignment>( p ) / sizeof( T ) );
    }

    friend constexpr bool operator==( crt_aligned_allocator const &, crt_aligned_allocator const & ) noexcept { return true; }
}; // struct crt_aligned_allocator

//------------------------------------------------------------------------------
} // namespace gapbuf
//------------------------------------------------------------------------------
