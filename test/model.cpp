#include <gapbuf/containers/gap_buffer.hpp>

#include <fmt/format.h>

#include <gtest/gtest.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <random>
#include <string>
#include <vector>
//------------------------------------------------------------------------------
namespace gapbuf
{
//------------------------------------------------------------------------------

namespace
{
    template <typename Buffer, typename Make>
    void run_against_reference( std::uint32_t const seed, std::size_t const iterations, Make && make )
    {
        using value_type = typename Buffer::value_type;

        std::mt19937 rng{ seed };
        Buffer                  buffer;
        std::vector<value_type> reference;

        for ( std::size_t i{ 0 }; i < iterations; ++i )
        {
            auto const size{ reference.size() };
            // biased towards insertion so the buffer keeps growing
            switch ( std::uniform_int_distribution<int>{ 0, 9 }( rng ) )
            {
                case 0: case 1: case 2: case 3:
                {
                    auto const position{ std::uniform_int_distribution<std::size_t>{ 0, size }( rng ) };
                    auto const value   { static_cast<int>( i ) };
                    buffer.insert( position, make( value ) );
                    reference.insert( reference.begin() + static_cast<std::ptrdiff_t>( position ), make( value ) );
                    break;
                }
                case 4: case 5:
                    buffer.push_back( make( static_cast<int>( i ) ) );
                    reference.push_back( make( static_cast<int>( i ) ) );
                    break;
                case 6: case 7:
                    if ( size )
                    {
                        auto const position{ std::uniform_int_distribution<std::size_t>{ 0, size - 1 }( rng ) };
                        auto const removed { buffer.erase( position ) };
                        ASSERT_EQ( removed, reference[ position ] ) << "erase at " << position;
                        reference.erase( reference.begin() + static_cast<std::ptrdiff_t>( position ) );
                    }
                    break;
                case 8:
                    buffer.move_gap_to( std::uniform_int_distribution<std::size_t>{ 0, size }( rng ) );
                    break;
                case 9:
                    buffer.reserve_gap( std::uniform_int_distribution<std::size_t>{ 0, 16 }( rng ) );
                    break;
            }

            ASSERT_EQ( buffer.size(), reference.size() );
            ASSERT_GE( buffer.capacity(), buffer.size() );
            ASSERT_EQ( buffer.get( reference.size() ), nullptr );
        }

        for ( std::size_t i{ 0 }; i < reference.size(); ++i )
        {
            ASSERT_NE( buffer.get( i ), nullptr );
            EXPECT_EQ( *buffer.get( i ), reference[ i ] ) << "index " << i;
        }
        EXPECT_EQ( buffer.to_vector(), reference );
    }
} // anonymous namespace

TEST( gap_buffer_model_test, trivial )
{
    auto const seed{ std::random_device{}() };
    fmt::print( "Seed {}\n", seed );
    run_against_reference<gap_buffer<int>>( seed, 20000, []( int const value ) { return value; } );
}

TEST( gap_buffer_model_test, bytes )
{
    auto const seed{ std::random_device{}() };
    fmt::print( "Seed {}\n", seed );
    run_against_reference<gap_buffer<std::uint8_t>>( seed, 20000, []( int const value ) { return static_cast<std::uint8_t>( value ); } );
}

TEST( gap_buffer_model_test, non_trivial )
{
    auto const seed{ std::random_device{}() };
    fmt::print( "Seed {}\n", seed );
    // long enough to defeat the small string optimization
    run_against_reference<gap_buffer<std::string, std::allocator<std::string>>>
    (
        seed, 5000, []( int const value ) { return fmt::format( "{:032}", value ); }
    );
}

//------------------------------------------------------------------------------
} // namespace gapbuf
//------------------------------------------------------------------------------
