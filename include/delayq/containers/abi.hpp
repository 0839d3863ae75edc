////////////////////////////////////////////////////////////////////////////////
/// Argument passing traits and cold error paths shared by delayq containers.
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

#include <type_traits>
//------------------------------------------------------------------------------
namespace delayq
{
//------------------------------------------------------------------------------

#ifdef _MSC_VER
#pragma warning( push )
#pragma warning( disable : 5030 ) // unrecognized attribute
#endif

////////////////////////////////////////////////////////////////////////////////
// Keys are compared far more often than they are stored: timestamps and
// sequence numbers (the overwhelmingly common key types) should travel in
// registers while anything non-trivial is passed by const reference.
////////////////////////////////////////////////////////////////////////////////

template <typename T>
bool constexpr can_be_passed_in_reg
{
    std::is_trivially_copyable_v<T> &&
    ( sizeof( T ) <= 2 * sizeof( void * ) ) // assuming a sane ABI like SysV
}; // can_be_passed_in_reg

template <typename T>
using const_arg_t = std::conditional_t<can_be_passed_in_reg<T>, T const, T const &>;


namespace detail { [[ noreturn, gnu::cold ]] void throw_out_of_range( char const * msg ); }

#ifdef _MSC_VER
#pragma warning( pop )
#endif

//------------------------------------------------------------------------------
} // namespace delayq
//------------------------------------------------------------------------------
