////////////////////////////////////////////////////////////////////////////////
/// delayq::reciprocal_scale unit tests
////////////////////////////////////////////////////////////////////////////////

#include <delayq/reciprocal_scale.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <limits>
#include <random>
#include <utility>
//------------------------------------------------------------------------------
namespace delayq {
//------------------------------------------------------------------------------

static_assert( reciprocal_scale_u8 ( 255, 128 ) == 127 );
static_assert( reciprocal_scale_u16( 0xFFFF, 0x8000 ) == 0x7FFF );
static_assert( reciprocal_scale_u32( 0xFFFF'FFFF, 1000 ) == 999 );
static_assert( reciprocal_scale_u32( 0x8000'0000, 1000 ) == 500 );

TEST( reciprocal_scale, midpoint )
{
    EXPECT_EQ( reciprocal_scale_u8 (   255,   128 ),   127 );
    EXPECT_EQ( reciprocal_scale_u8 (   128,   200 ),   100 );
    EXPECT_EQ( reciprocal_scale_u16( 32768, 10000 ),  5000 );
    EXPECT_EQ( reciprocal_scale_u32( 0x4000'0000U, 4000U ), 1000U );
}

TEST( reciprocal_scale, zero )
{
    EXPECT_EQ( reciprocal_scale_u8 ( 0, 255 ), 0 );
    EXPECT_EQ( reciprocal_scale_u8 ( 255, 0 ), 0 );
    EXPECT_EQ( reciprocal_scale_u32( std::numeric_limits<std::uint32_t>::max(), 0U ), 0U );
}

// exhaustive over the whole 8 bit domain
TEST( reciprocal_scale, u8_bounded_and_monotonic )
{
    for ( unsigned factor{ 1 }; factor <= 0xFF; ++factor )
    {
        std::uint8_t previous{ 0 };
        for ( unsigned value{ 0 }; value <= 0xFF; ++value )
        {
            auto const scaled{ reciprocal_scale_u8( static_cast<std::uint8_t>( value ), static_cast<std::uint8_t>( factor ) ) };
            ASSERT_LT( scaled, factor );
            ASSERT_GE( scaled, previous );
            previous = scaled;
        }
    }
}

TEST( reciprocal_scale, u16_bounded_and_monotonic )
{
    for ( std::uint32_t const factor : { 1U, 2U, 3U, 255U, 256U, 1000U, 0x7FFFU, 0xFFFFU } )
    {
        std::uint16_t previous{ 0 };
        for ( std::uint32_t value{ 0 }; value <= 0xFFFF; ++value )
        {
            auto const scaled{ reciprocal_scale_u16( static_cast<std::uint16_t>( value ), static_cast<std::uint16_t>( factor ) ) };
            ASSERT_LT( scaled, factor );
            ASSERT_GE( scaled, previous );
            previous = scaled;
        }
    }
}

TEST( reciprocal_scale, u32_bounded_and_monotonic )
{
    auto const   seed{ std::random_device{}() };
    std::mt19937 rng { seed };
    SCOPED_TRACE( seed );

    for ( int i{ 0 }; i < 100000; ++i )
    {
        auto const factor{ std::max<std::uint32_t>( static_cast<std::uint32_t>( rng() ), 1U ) };
        auto       a     { static_cast<std::uint32_t>( rng() ) };
        auto       b     { static_cast<std::uint32_t>( rng() ) };
        if ( b < a )
            std::swap( a, b );
        auto const scaled_a{ reciprocal_scale_u32( a, factor ) };
        auto const scaled_b{ reciprocal_scale_u32( b, factor ) };
        ASSERT_LT( scaled_b, factor );
        ASSERT_LE( scaled_a, scaled_b );
    }
    EXPECT_EQ( reciprocal_scale_u32( 0xFFFF'FFFFU, 0xFFFF'FFFFU ), 0xFFFF'FFFEU );
}

TEST( reciprocal_scale, generic_matches_named )
{
    EXPECT_EQ( reciprocal_scale( std::uint8_t { 200 }, std::uint8_t { 50 } ), reciprocal_scale_u8 ( 200, 50 ) );
    EXPECT_EQ( reciprocal_scale( std::uint16_t{ 999 }, std::uint16_t{ 77 } ), reciprocal_scale_u16( 999, 77 ) );
}

//------------------------------------------------------------------------------
} // namespace delayq
//------------------------------------------------------------------------------
