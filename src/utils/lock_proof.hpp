// Copyright (c) 2026 The Kitties Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef KITTIES_UTILS_LOCK_PROOF_HPP_INCLUDED
#define KITTIES_UTILS_LOCK_PROOF_HPP_INCLUDED

#include <cassert>
#include <mutex>
#include <shared_mutex>
#include <stdexcept>
#include <string>

#include "traits.hpp"

namespace utils {

template < class M >
concept mutex = requires( M &m ) {
   m.lock();
   m.unlock();
};

template < auto MutexMemberPtr >
concept mutex_member_ptr = is_member_ptr< MutexMemberPtr >::value && mutex< typename is_member_ptr< MutexMemberPtr >::data_type >;

namespace detail {

// Throws unless `lock` currently holds exactly the mutex designated by MutexMemberPtr within `c`
template < auto MutexMemberPtr, class Lock >
void check_lock_ownership( const typename is_member_ptr< MutexMemberPtr >::class_type &c, const Lock &lock, const char *proof_kind )
{
   assert( lock.owns_lock() );
   assert( lock.mutex() == &( c.*MutexMemberPtr ) );
   if ( !lock.owns_lock() )
      throw std::logic_error( std::string( proof_kind ) + ": supplied lock is not actually locked!" );
   if ( lock.mutex() != &( c.*MutexMemberPtr ) )
      throw std::logic_error( std::string( proof_kind ) + ": supplied lock does not actually lock the expected mutex object!" );
}

}   // namespace detail

// A token whose existence proves that the caller holds the exclusive lock of an object.
// Functions that must only run under that lock take one of these by value.
template < auto MutexMemberPtr >
   requires mutex_member_ptr< MutexMemberPtr >
class write_lock_proof {
   using class_type = typename is_member_ptr< MutexMemberPtr >::class_type;
   using mutex_type = typename is_member_ptr< MutexMemberPtr >::data_type;

public:
   // the lock parameter is a non-const reference so that temporary objects cannot be passed
   // ATTENTION: intentionally non-explicit
   write_lock_proof( class_type &c, std::unique_lock< mutex_type > &lock ) { detail::check_lock_ownership< MutexMemberPtr >( c, lock, "write_lock_proof" ); }
};

template < auto MutexMemberPtr >
   requires mutex_member_ptr< MutexMemberPtr >
class read_lock_proof {
   using class_type = typename is_member_ptr< MutexMemberPtr >::class_type;
   using mutex_type = typename is_member_ptr< MutexMemberPtr >::data_type;

public:
   // ATTENTION: all constructors are intentionally non-explicit

   read_lock_proof( const class_type &c, std::shared_lock< mutex_type > &lock ) { detail::check_lock_ownership< MutexMemberPtr >( c, lock, "read_lock_proof" ); }

   // an exclusive lock is good for reading as well
   read_lock_proof( const class_type &c, std::unique_lock< mutex_type > &lock ) { detail::check_lock_ownership< MutexMemberPtr >( c, lock, "read_lock_proof" ); }

   read_lock_proof( write_lock_proof< MutexMemberPtr > ) noexcept {}
};

}   // namespace utils

#endif   // KITTIES_UTILS_LOCK_PROOF_HPP_INCLUDED
