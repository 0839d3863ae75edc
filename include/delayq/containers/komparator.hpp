////////////////////////////////////////////////////////////////////////////////
/// Komparator: comparator wrapper for delayq ordered containers.
///
/// Containers inherit from Komparator to get zero-overhead comparator storage
/// plus the derived comparison helpers used on their hot paths.
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

#include "abi.hpp"
//------------------------------------------------------------------------------
namespace delayq
{
//------------------------------------------------------------------------------

/// Publicly inherits from Comparator for empty-base optimisation. Being an
/// aggregate (public base, no user-declared constructors, no data members)
/// Komparator<C>{ c } and Komparator<C>{} need no forwarding constructors.
///
/// The helpers read as relations between left and right:
/// le( a, b ) is a < b, leq( a, b ) is a <= b, geq( a, b ) is a >= b.
/// Only the strict-weak 'less' of the Comparator is ever invoked.
template <typename Comparator>
struct Komparator : Comparator
{
    [[ nodiscard ]] constexpr Comparator const & comp() const noexcept { return *this; }
    [[ nodiscard ]] constexpr Comparator       & comp()       noexcept { return *this; }

    [[ gnu::pure ]] constexpr bool le ( auto const & left, auto const & right ) const noexcept { return  comp()( left, right ); }
    [[ gnu::pure ]] constexpr bool leq( auto const & left, auto const & right ) const noexcept { return !comp()( right, left ); }
    [[ gnu::pure ]] constexpr bool geq( auto const & left, auto const & right ) const noexcept { return !comp()( left, right ); }
}; // struct Komparator

//------------------------------------------------------------------------------
} // namespace delayq
//------------------------------------------------------------------------------
