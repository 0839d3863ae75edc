////////////////////////////////////////////////////////////////////////////////
/// Fixed point 'reciprocal' scaling
///
/// Maps a (pseudo)random or hashed value uniformly distributed over the whole
/// range of its type into [ 0, ep_ro ) with a multiply and a shift instead of
/// a modulo, as the Linux kernel reciprocal_scale() does:
///   ( value * ep_ro ) >> width
/// with the product computed in an integer of twice the width.
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

#include <boost/integer.hpp>

#include <concepts>
#include <cstdint>
#include <limits>
//------------------------------------------------------------------------------
namespace delayq
{
//------------------------------------------------------------------------------

#ifdef _MSC_VER
#pragma warning( push )
#pragma warning( disable : 5030 ) // unknown attribute
#endif

template <std::unsigned_integral T>
requires( !std::same_as<T, bool> && std::numeric_limits<T>::digits <= 32 )
[[ using gnu: const, always_inline ]] constexpr T reciprocal_scale( T const value, T const ep_ro ) noexcept
{
    auto constexpr width{ std::numeric_limits<T>::digits };
    using double_width_t = typename boost::uint_t<2 * width>::least;
    return static_cast<T>( ( static_cast<double_width_t>( value ) * static_cast<double_width_t>( ep_ro ) ) >> width );
}

[[ using gnu: const, always_inline ]] constexpr std::uint8_t  reciprocal_scale_u8 ( std::uint8_t  const value, std::uint8_t  const ep_ro ) noexcept { return reciprocal_scale( value, ep_ro ); }
[[ using gnu: const, always_inline ]] constexpr std::uint16_t reciprocal_scale_u16( std::uint16_t const value, std::uint16_t const ep_ro ) noexcept { return reciprocal_scale( value, ep_ro ); }
[[ using gnu: const, always_inline ]] constexpr std::uint32_t reciprocal_scale_u32( std::uint32_t const value, std::uint32_t const ep_ro ) noexcept { return reciprocal_scale( value, ep_ro ); }

#ifdef _MSC_VER
#pragma warning( pop )
#endif

//------------------------------------------------------------------------------
} // namespace delayq
//------------------------------------------------------------------------------
