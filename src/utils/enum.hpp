// Copyright (c) 2026 The Kitties Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef KITTIES_UTILS_ENUM_HPP_INCLUDED
#define KITTIES_UTILS_ENUM_HPP_INCLUDED

#include <optional>
#include <type_traits>

namespace utils {

template < typename E >
concept Enum = std::is_enum_v< E >;

// TODO C++23: remove and replace usages with std::to_underlying()
constexpr auto to_underlying( Enum auto e ) noexcept
{
   return static_cast< std::underlying_type_t< decltype( e ) > >( e );
}

// Converts a raw value back into E only if it lies within [E{0}, Last]
template < Enum E, E Last >
constexpr std::optional< E > enum_from_underlying( std::underlying_type_t< E > raw ) noexcept
{
   if ( raw > to_underlying( Last ) )
      return std::nullopt;
   return static_cast< E >( raw );
}

}   // namespace utils

#endif   // KITTIES_UTILS_ENUM_HPP_INCLUDED
