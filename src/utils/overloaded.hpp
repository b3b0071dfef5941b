// Copyright (c) 2026 The Kitties Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef KITTIES_UTILS_OVERLOADED_HPP_INCLUDED
#define KITTIES_UTILS_OVERLOADED_HPP_INCLUDED

namespace utils {

template < class... Ts >
struct overloaded : Ts... {
   using Ts::operator()...;
};

template < class... Ts >
overloaded( Ts... ) -> overloaded< Ts... >;

}   // namespace utils

#endif   // KITTIES_UTILS_OVERLOADED_HPP_INCLUDED
