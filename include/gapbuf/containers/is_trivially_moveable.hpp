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

#include <cstddef>
#include <type_traits>
//------------------------------------------------------------------------------
namespace std
{
#if defined( _LIBCPP_VERSION )
inline namespace __1 {
#endif
    template <typename T, size_t size> struct array;
    template <class T1, class T2> struct pair;
#if defined( _LIBCPP_VERSION )
} // namespace __1
#endif
} // namespace std
//------------------------------------------------------------------------------
namespace gapbuf
{
//------------------------------------------------------------------------------

// template <typename T>
// bool is_trivially_moveable;
//
// gap_buffer relocates whole runs of elements whenever the gap moves or the
// backing region grows. For types where 'picking up' an object and 'dropping'
// it at a different address is a valid way to move it (i.e. its this pointer
// can change w/o violating any of its invariants) the runs are relocated with
// a single memmove (or the region is grown with realloc) - otherwise every
// element has to be move constructed into its new slot and the source
// destroyed.
// The trait leans toward P2786 'trivial relocatability' but optimistically
// also accepts types with trivial move construction or assignment. Users can
// specialize it (or add a static is_trivially_moveable member) for types
// where the OOBE is wrong.
// https://www.open-std.org/jtc1/sc22/wg21/docs/papers/2024/p1144r12.html std::is_trivially_relocatable
// https://www.open-std.org/jtc1/sc22/wg21/docs/papers/2024/p2786r11.html Trivial Relocatability
// https://quuxplusone.github.io/blog/2019/02/20/p1144-what-types-are-relocatable

// allowed/expected to be user-specialized for custom types
template <typename T>
bool constexpr is_trivially_moveable
{
#ifdef __clang__
    __is_trivially_relocatable( T ) ||
#endif
#if defined( __cpp_lib_trivially_relocatable /*P1144*/ ) || defined( __cpp_trivial_relocatability /*P2786*/ )
    std::is_trivially_relocatable<T> ||
#endif
    std::is_trivially_copyable_v<T> || // implies trivial destructibility https://eel.is/c++draft/class.prop#1
    std::is_trivially_move_assignable_v<T> ||
    std::is_trivially_move_constructible_v<T>
}; // is_trivially_moveable

template <typename T>
requires requires{ T::is_trivially_moveable; }
bool constexpr is_trivially_moveable<T>{ T::is_trivially_moveable };

template <typename T1, typename T2>
bool constexpr is_trivially_moveable<std::pair<T1, T2>>{ is_trivially_moveable<T1> && is_trivially_moveable<T2> };
template <typename T, std::size_t size>
bool constexpr is_trivially_moveable<std::array<T, size>>{ is_trivially_moveable<T> };

//------------------------------------------------------------------------------
} // namespace gapbuf
//------------------------------------------------------------------------------
