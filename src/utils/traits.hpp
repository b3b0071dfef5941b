// Copyright (c) 2026 The Kitties Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef KITTIES_UTILS_TRAITS_HPP_INCLUDED
#define KITTIES_UTILS_TRAITS_HPP_INCLUDED

#include <type_traits>

namespace utils {

template < auto MemberPtr >
struct is_member_ptr : std::false_type {};

template < class C, class D, D C::*MemberPtr >
struct is_member_ptr< MemberPtr > : std::true_type {
   using class_type = C;
   using data_type = D;
};

}   // namespace utils

#endif   // KITTIES_UTILS_TRAITS_HPP_INCLUDED
