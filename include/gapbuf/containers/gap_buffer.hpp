////////////////////////////////////////////////////////////////////////////////
/// Gap buffer
///
/// A single contiguous allocation split into a left and a right run of live
/// elements with an uninitialized 'gap' in between. Insertions and erasures
/// happen at the gap, which is relocated to the edit position first - at a
/// cost proportional to the distance moved rather than to the size of the
/// buffer - making clustered edits (the typical text editor workload) cheap.
/// The allocator is a template parameter and is owned by the buffer;
/// allocators offering in-place expansion (Boost.Container version 2
/// allocation_command) or realloc-style growth (crt_aligned_allocator) are
/// detected and used.
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

#include <gapbuf/containers/allocator.hpp>
#include <gapbuf/containers/is_trivially_moveable.hpp>

#include <boost/assert.hpp>
#include <boost/config.hpp>
#include <boost/container/detail/allocation_type.hpp>

#include <algorithm>
#include <concepts>
#include <cstdint>
#include <cstring>
#include <initializer_list>
#include <iterator>
#include <limits>
#include <memory>
#include <ranges>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace gapbuf
{
//------------------------------------------------------------------------------

namespace detail
{
    [[ noreturn, gnu::cold ]] void throw_out_of_range( char const * operation, std::size_t index, std::size_t size );
} // namespace detail

struct gap_buffer_options
{
    std::uint8_t  growth_factor        { 2    };
    std::uint32_t min_non_zero_capacity{ 0    }; // 0 -> element size dependent default
    bool          try_expand_in_place  { true }; // with allocators that support allocation_command( expand_fwd )
}; // struct gap_buffer_options


template <typename T, typename Allocator = crt_aligned_allocator<T>, gap_buffer_options options = {}>
class [[ nodiscard ]] gap_buffer
{
private:
    using al_traits = std::allocator_traits<Allocator>;

    static_assert( std::is_same_v<typename al_traits::value_type, T>, "Allocator::value_type must be T" );
    static_assert( std::is_same_v<typename al_traits::pointer   , T *>, "Fancy pointers are not supported" );
    // relocation (gap moves and growth) must not fail half way through
    static_assert( is_trivially_moveable<T> || std::is_nothrow_move_constructible_v<T>, "T must be trivially moveable or nothrow move constructible" );
    static_assert( options.growth_factor >= 1 );

public:
    using value_type      = T;
    using allocator_type  = Allocator;
    using size_type       = typename al_traits::size_type;
    using difference_type = typename al_traits::difference_type;
    using       reference = value_type       &;
    using const_reference = value_type const &;
    using       pointer   = value_type       *;
    using const_pointer   = value_type const *;

    // Smallest non-zero capacity ever allocated: amortizes allocation calls
    // for small elements while bounding the waste for large ones.
    static size_type constexpr min_non_zero_capacity
    {
        options.min_non_zero_capacity ? size_type( options.min_non_zero_capacity ) :
        ( sizeof( T ) == 1    ) ? size_type( 8 ) :
        ( sizeof( T ) <= 1024 ) ? size_type( 4 ) :
                                  size_type( 1 )
    };

    gap_buffer() noexcept( std::is_nothrow_default_constructible_v<Allocator> ) requires std::default_initializable<Allocator> : allocator_{} {}
    explicit gap_buffer( allocator_type const & allocator ) noexcept : allocator_{ allocator } {}

    //! Takes over the elements of a packed array (one allocation, elements
    //! moved in in order).
    template <typename VectorAllocator>
    explicit gap_buffer( std::vector<T, VectorAllocator> && packed, allocator_type const & allocator = allocator_type() )
        : gap_buffer( allocator )
    {
        append_range( std::ranges::subrange( std::make_move_iterator( packed.begin() ), std::make_move_iterator( packed.end() ) ) );
    }

    gap_buffer( std::initializer_list<value_type> const values, allocator_type const & allocator = allocator_type() )
        : gap_buffer( allocator )
    {
        append_range( values );
    }

    gap_buffer( gap_buffer const & other ) requires std::copy_constructible<T>
        : gap_buffer( al_traits::select_on_container_copy_construction( other.allocator_ ) )
    {
        copy_layout_from( other );
    }

    gap_buffer( gap_buffer && other ) noexcept
        :
        allocator_{ std::move( other.allocator_ ) },
        p_buffer_ { other.p_buffer_  },
        capacity_ { other.capacity_  },
        gap_start_{ other.gap_start_ },
        gap_size_ { other.gap_size_  }
    {
        other.mark_freed();
    }

    gap_buffer & operator=( gap_buffer const & other ) requires std::copy_constructible<T>
    {
        if ( &other != this )
        {
            destroy_and_free();
            if constexpr ( al_traits::propagate_on_container_copy_assignment::value )
                allocator_ = other.allocator_;
            copy_layout_from( other );
        }
        return *this;
    }

    gap_buffer & operator=( gap_buffer && other ) noexcept( al_traits::propagate_on_container_move_assignment::value || al_traits::is_always_equal::value )
    {
        if ( &other == this )
            return *this;
        destroy_and_free();
        if constexpr ( al_traits::propagate_on_container_move_assignment::value )
        {
            allocator_ = std::move( other.allocator_ );
            steal( other );
        }
        else
        if constexpr ( al_traits::is_always_equal::value )
        {
            steal( other );
        }
        else
        {
            if ( allocator_ == other.allocator_ )
            {
                steal( other );
            }
            else
            {
                // the storage cannot change hands: move the elements one by one
                reserve_gap( other.size() );
                for ( size_type i{ 0 }; i < other.size(); ++i )
                    emplace_back( std::move( other[ i ] ) );
                other.clear();
            }
        }
        return *this;
    }

    ~gap_buffer() noexcept { destroy_and_free(); }

    [[ nodiscard, gnu::pure ]] size_type size        () const noexcept { return capacity_ - gap_size_; }
    [[ nodiscard, gnu::pure ]] size_type capacity    () const noexcept { return capacity_; }
    [[ nodiscard, gnu::pure ]] bool      empty       () const noexcept { return BOOST_UNLIKELY( size() == 0 ); }
    [[ nodiscard, gnu::pure ]] size_type gap_position() const noexcept { return gap_start_; }
    [[ nodiscard, gnu::pure ]] size_type gap_size    () const noexcept { return gap_size_; }

    [[ nodiscard ]] static constexpr size_type max_size() noexcept { return static_cast<size_type>( std::numeric_limits<size_type>::max() / sizeof( value_type ) ); }

    [[ nodiscard ]] allocator_type get_allocator() const noexcept { return allocator_; }

    //! <b>Effects</b>: Returns a pointer to the element at the logical
    //!   position index or nullptr if index >= size().
    //!
    //! <b>Throws</b>: Nothing.
    //!
    //! <b>Complexity</b>: Constant.
    [[ nodiscard ]] pointer get( size_type const index ) noexcept
    {
        if ( index >= size() )
            return nullptr;
        return &p_buffer_[ physical_index( index ) ];
    }
    [[ nodiscard ]] const_pointer get( size_type const index ) const noexcept { return const_cast<gap_buffer &>( *this ).get( index ); }

    //! <b>Requires</b>: size() > index.
    [[ nodiscard ]] reference operator[]( size_type const index ) noexcept
    {
        BOOST_ASSERT_MSG( index < size(), "Index out of bounds" );
        return p_buffer_[ physical_index( index ) ];
    }
    [[ nodiscard ]] const_reference operator[]( size_type const index ) const noexcept { return const_cast<gap_buffer &>( *this )[ index ]; }

    //! <b>Throws</b>: std::out_of_range if index >= size()
    [[ nodiscard ]] reference at( size_type const index )
    {
        if ( index >= size() ) [[ unlikely ]]
            detail::throw_out_of_range( "at", index, size() );
        return (*this)[ index ];
    }
    [[ nodiscard ]] const_reference at( size_type const index ) const { return const_cast<gap_buffer &>( *this ).at( index ); }

    //! <b>Effects</b>: Moves the gap to the logical position, relocating the
    //!   elements between the current and the new gap position across the gap.
    //!
    //! <b>Throws</b>: std::out_of_range if position > size().
    //!
    //! <b>Complexity</b>: Linear to the distance between the current and the
    //!   new gap position.
    void move_gap_to( size_type const position )
    {
        if ( position > size() ) [[ unlikely ]]
            detail::throw_out_of_range( "move_gap_to", position, size() );
        do_move_gap_to( position );
    }

    //! <b>Effects</b>: Ensures gap_size() >= min_gap growing the storage (to
    //!   max( growth_factor * capacity(), size() + min_gap, min_non_zero_capacity ))
    //!   if required. The left run stays in place, the right run is moved to
    //!   the end of the new storage (i.e. all the new slots become part of the
    //!   gap).
    //!
    //! <b>Throws</b>: If memory allocation throws (leaving the buffer unchanged).
    void reserve_gap( size_type const min_gap )
    {
        if ( gap_size_ >= min_gap ) [[ likely ]]
            return;
        grow( min_gap );
    }

    //! <b>Requires</b>: the arguments do not refer to elements of *this.
    //!
    //! <b>Effects</b>: Constructs a new element at the logical position
    //!   (as the last element of the left run).
    //!
    //! <b>Returns</b>: A reference to the created object.
    //!
    //! <b>Throws</b>: std::out_of_range if position > size(), or if memory
    //!   allocation or the in-place constructor throws.
    //!
    //! <b>Complexity</b>: Linear to the distance the gap has to be moved,
    //!   amortized constant for clustered edits.
    template <typename... Args>
    reference emplace( size_type const position, Args &&... args )
    {
        if ( position > size() ) [[ unlikely ]]
            detail::throw_out_of_range( "insert", position, size() );
        do_move_gap_to( position );
        reserve_gap( 1 );
        auto & inserted{ *std::construct_at( &p_buffer_[ gap_start_ ], std::forward<Args>( args )... ) };
        ++gap_start_;
        --gap_size_;
        return inserted;
    }

    reference insert( size_type const position, value_type value ) { return emplace( position, std::move( value ) ); }

    template <typename... Args>
    reference emplace_back( Args &&... args ) { return emplace( size(), std::forward<Args>( args )... ); }

    void push_back( value_type value ) { emplace_back( std::move( value ) ); }

    //! <b>Effects</b>: Removes the element at the logical position (the gap
    //!   is moved to position and widened by one slot).
    //!
    //! <b>Returns</b>: The removed element (ownership passes to the caller,
    //!   discarding the result destroys it).
    //!
    //! <b>Throws</b>: std::out_of_range if position >= size().
    value_type erase( size_type const position )
    {
        if ( position >= size() ) [[ unlikely ]]
            detail::throw_out_of_range( "erase", position, size() );
        do_move_gap_to( position );
        auto & slot{ p_buffer_[ gap_start_ + gap_size_ ] };
        value_type removed( std::move( slot ) );
        std::destroy_at( &slot );
        ++gap_size_;
        return removed;
    }

    //! <b>Effects</b>: Destroys all the elements, the whole storage becomes
    //!   the gap (capacity is retained).
    void clear() noexcept
    {
        destroy_runs();
        gap_start_ = 0;
        gap_size_  = capacity_;
    }

    template <std::ranges::input_range Rng>
    void append_range( Rng && values )
    {
        do_move_gap_to( size() );
        if constexpr ( std::ranges::sized_range<Rng> )
            reserve_gap( static_cast<size_type>( std::ranges::size( values ) ) );
        // elements are moved only where the range yields rvalues (e.g. move iterators)
        for ( auto && value : values )
            emplace_back( std::forward<decltype( value )>( value ) );
    }

    //! <b>Effects</b>: Copies the elements, in logical order, into a packed
    //!   array.
    [[ nodiscard ]] std::vector<T> to_vector() const & requires std::copy_constructible<T>
    {
        std::vector<T> packed;
        packed.reserve( size() );
        packed.insert( packed.end(), p_buffer_, p_buffer_ + gap_start_ );
        packed.insert( packed.end(), right_run_begin(), p_buffer_ + capacity_ );
        return packed;
    }
    //! <b>Effects</b>: Moves the elements, in logical order, into a packed
    //!   array leaving the buffer empty (the storage is retained).
    [[ nodiscard ]] std::vector<T> to_vector() &&
    {
        std::vector<T> packed;
        packed.reserve( size() );
        packed.insert( packed.end(), std::make_move_iterator( p_buffer_         ), std::make_move_iterator( p_buffer_ + gap_start_ ) );
        packed.insert( packed.end(), std::make_move_iterator( right_run_begin() ), std::make_move_iterator( p_buffer_ + capacity_  ) );
        clear();
        return packed;
    }

    void swap( gap_buffer & other ) noexcept
    {
        if constexpr ( al_traits::propagate_on_container_swap::value )
        {
            using std::swap;
            swap( allocator_, other.allocator_ );
        }
        else
        {
            BOOST_ASSERT_MSG( al_traits::is_always_equal::value || ( allocator_ == other.allocator_ ), "Swapping buffers with unequal allocators" );
        }
        std::swap( p_buffer_ , other.p_buffer_  );
        std::swap( capacity_ , other.capacity_  );
        std::swap( gap_start_, other.gap_start_ );
        std::swap( gap_size_ , other.gap_size_  );
    }
    friend void swap( gap_buffer & left, gap_buffer & right ) noexcept { left.swap( right ); }

    //! Logical (element sequence) equality - the gap position and capacity
    //! are ignored.
    [[ nodiscard ]] friend bool operator==( gap_buffer const & left, gap_buffer const & right ) noexcept requires std::equality_comparable<T>
    {
        if ( left.size() != right.size() )
            return false;
        for ( size_type i{ 0 }; i < left.size(); ++i )
        {
            if ( !( left[ i ] == right[ i ] ) )
                return false;
        }
        return true;
    }

    // debugging aids (defined in gap_buffer_print.hpp)
    [[ nodiscard ]] std::string debug_string() const;
    void print() const;

private:
    [[ gnu::pure ]] size_type physical_index( size_type const index ) const noexcept { return ( index < gap_start_ ) ? index : index + gap_size_; }

    [[ gnu::pure ]] size_type right_run_size () const noexcept { return capacity_ - gap_start_ - gap_size_; }
    [[ gnu::pure ]] pointer   right_run_begin() const noexcept { return p_buffer_ + gap_start_ + gap_size_; }

    // Relocate count elements from source to (non-overlapping or higher
    // address) target, highest addresses first.
    static void relocate_backward( pointer const source, size_type const count, pointer const target ) noexcept
    {
        BOOST_ASSERT( target >= source );
        if constexpr ( is_trivially_moveable<T> )
        {
            // void pointer casts to silence -Wclass-memaccess for e.g. trivial_abi std::string
            std::memmove( static_cast<void *>( target ), static_cast<void const *>( source ), count * sizeof( T ) );
        }
        else
        {
            for ( auto i{ count }; i-- != 0; )
                relocate_at( source[ i ], target[ i ] );
        }
    }
    // lowest addresses first
    static void relocate_forward( pointer const source, size_type const count, pointer const target ) noexcept
    {
        if constexpr ( is_trivially_moveable<T> )
        {
            std::memmove( static_cast<void *>( target ), static_cast<void const *>( source ), count * sizeof( T ) );
        }
        else
        {
            for ( size_type i{ 0 }; i < count; ++i )
                relocate_at( source[ i ], target[ i ] );
        }
    }
    static void relocate_at( value_type & source, value_type & raw_target ) noexcept
    {
        std::construct_at( &raw_target, std::move( source ) );
        std::destroy_at( &source );
    }

    void do_move_gap_to( size_type const position ) noexcept
    {
        BOOST_ASSERT( position <= size() );
        if ( position == gap_start_ )
            return;
        if ( gap_size_ ) [[ likely ]]
        {
            if ( position < gap_start_ )
            {
                // [position, gap_start) -> [position + gap_size, gap_start + gap_size)
                relocate_backward( &p_buffer_[ position ], gap_start_ - position, &p_buffer_[ position + gap_size_ ] );
            }
            else
            {
                // [gap_start + gap_size, position + gap_size) -> [gap_start, position)
                relocate_forward( &p_buffer_[ gap_start_ + gap_size_ ], position - gap_start_, &p_buffer_[ gap_start_ ] );
            }
        }
        // else: the runs are adjacent, nothing to move
        gap_start_ = position;
    }

    [[ gnu::cold, gnu::noinline ]]
    void grow( size_type const min_gap )
    {
        auto const current_size{ size() };
        if ( min_gap > max_size() - current_size ) [[ unlikely ]]
            detail::throw_bad_alloc();
        auto const geometric_capacity
        {
            ( capacity_ > max_size() / options.growth_factor )
                ? max_size()
                : static_cast<size_type>( capacity_ * options.growth_factor )
        };
        auto const new_capacity{ std::max( { geometric_capacity, static_cast<size_type>( current_size + min_gap ), min_non_zero_capacity } ) };
        auto const right_size  { right_run_size() };
        BOOST_ASSERT( new_capacity > capacity_ );

        if constexpr ( expanding_allocator<Allocator> && options.try_expand_in_place )
        {
            if ( p_buffer_ && try_expand_in_place( new_capacity ) )
            {
                relocate_backward( &p_buffer_[ capacity_ - right_size ], right_size, &p_buffer_[ new_capacity - right_size ] );
                update_capacity( new_capacity );
                return;
            }
        }

        if constexpr ( reallocating_allocator<Allocator> && is_trivially_moveable<T> )
        {
            // the right run travels (bitwise) with the block, at its old offset
            p_buffer_ = allocator_.grow_to( p_buffer_, capacity_, new_capacity );
            relocate_backward( &p_buffer_[ capacity_ - right_size ], right_size, &p_buffer_[ new_capacity - right_size ] );
        }
        else
        {
            auto const new_buffer{ al_traits::allocate( allocator_, new_capacity ) };
            if ( p_buffer_ )
            {
                relocate_forward( p_buffer_        , gap_start_, new_buffer                                );
                relocate_forward( right_run_begin(), right_size, new_buffer + ( new_capacity - right_size ) );
                al_traits::deallocate( allocator_, p_buffer_, capacity_ );
            }
            p_buffer_ = new_buffer;
        }
        update_capacity( new_capacity );
    }

    bool try_expand_in_place( size_type const new_capacity ) noexcept
    {
        namespace bc = boost::container;
        auto received_size{ new_capacity };
        auto reuse        { p_buffer_ };
        auto const result
        {
            allocator_.allocation_command( bc::expand_fwd | bc::nothrow_allocation, new_capacity, received_size, reuse )
        };
        BOOST_ASSERT( !result || ( ( result == p_buffer_ ) && ( received_size >= new_capacity ) ) );
        return result != nullptr;
    }

    void update_capacity( size_type const new_capacity ) noexcept
    {
        gap_size_ = new_capacity - size();
        capacity_ = new_capacity;
        BOOST_ASSERT( gap_start_ + gap_size_ <= capacity_ );
    }

    void copy_layout_from( gap_buffer const & other )
    {
        BOOST_ASSERT( !p_buffer_ );
        if ( !other.capacity_ )
            return;
        p_buffer_  = al_traits::allocate( allocator_, other.capacity_ );
        capacity_  = other.capacity_;
        // build up (an always valid state) run by run
        gap_start_ = 0;
        gap_size_  = capacity_;
        std::uninitialized_copy_n( other.p_buffer_, other.gap_start_, p_buffer_ );
        gap_start_ = other.gap_start_;
        gap_size_  = capacity_ - gap_start_;
        auto const right_size{ other.right_run_size() };
        std::uninitialized_copy_n( other.right_run_begin(), right_size, p_buffer_ + ( capacity_ - right_size ) );
        gap_size_  = other.gap_size_;
    }

    void destroy_runs() noexcept
    {
        std::destroy_n( p_buffer_        , gap_start_       );
        std::destroy_n( right_run_begin(), right_run_size() );
    }

    void destroy_and_free() noexcept
    {
        if ( p_buffer_ )
        {
            destroy_runs();
            al_traits::deallocate( allocator_, p_buffer_, capacity_ );
        }
        mark_freed();
    }

    void steal( gap_buffer & other ) noexcept
    {
        BOOST_ASSERT( !p_buffer_ );
        p_buffer_  = other.p_buffer_;
        capacity_  = other.capacity_;
        gap_start_ = other.gap_start_;
        gap_size_  = other.gap_size_;
        other.mark_freed();
    }

    void mark_freed() noexcept
    {
        p_buffer_  = nullptr;
        capacity_  = 0;
        gap_start_ = 0;
        gap_size_  = 0;
    }

private:
    [[ no_unique_address ]] Allocator allocator_;

    pointer   p_buffer_ { nullptr };
    size_type capacity_ { 0 };
    size_type gap_start_{ 0 };
    size_type gap_size_ { 0 };
}; // class gap_buffer

template <typename T, typename Allocator, gap_buffer_options options>
bool constexpr is_trivially_moveable<gap_buffer<T, Allocator, options>>{ is_trivially_moveable<Allocator> };

//------------------------------------------------------------------------------
} // namespace gapbuf
//------------------------------------------------------------------------------
