// Copyright (c) 2026 The Kitties Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef KITTIES_OWNERSHIP_INDEX_HPP_INCLUDED
#define KITTIES_OWNERSHIP_INDEX_HPP_INCLUDED

#include <algorithm>
#include <cstdint>
#include <ios>
#include <map>
#include <vector>

#include "identification.hpp"
#include "serialize.hpp"

namespace kitties {

// Per-account sequence of owned kitty ids, in the order they were acquired, never longer than max_owned().
// Not synchronized: the owner (the Registry) provides the locking.
class OwnershipIndex {
public:
   using sequence_type = std::vector< kitty_id_t >;

   explicit OwnershipIndex( std::uint32_t max_owned );

   // Throws std::ios_base::failure for sequences that are empty, too long or contain duplicates, and for owners listed twice
   template < typename Stream >
   OwnershipIndex( deserialize_type, Stream &is, std::uint32_t max_owned )
      : OwnershipIndex( max_owned )
   {
      const auto owners = is.read_element_count( 2 );
      for ( std::size_t i = 0; i < owners; ++i ) {
         account_id_t owner;
         is >> owner;
         const auto n = is.read_element_count( kitty_id_t::size_bytes );
         if ( !n || n > max_owned_ )
            throw std::ios_base::failure( "Serialized ownership sequence of " + owner + " has an invalid length" );
         if ( owned_.contains( owner ) )
            throw std::ios_base::failure( "Serialized ownership index lists " + owner + " twice" );
         auto &ids = owned_[ owner ];
         ids.reserve( n );
         for ( std::size_t j = 0; j < n; ++j ) {
            kitty_id_t id;
            is >> id;
            if ( std::ranges::find( ids, id ) != ids.end() )
               throw std::ios_base::failure( "Serialized ownership sequence of " + owner + " lists kitty " + id.GetHex() + " twice" );
            ids.push_back( id );
         }
      }
   }

   template < typename Stream >
   void Serialize( Stream &os ) const
   {
      os.write_compact_size( owned_.size() );
      for ( const auto &[ owner, ids ] : owned_ ) {
         os << owner;
         os.write_compact_size( ids.size() );
         for ( const auto &id : ids )
            os << id;
      }
   }

   // Appends `id` to the sequence of `owner`.
   // Throws Error( ExceedMaxOwned ) if the sequence is full, Error( DuplicateIdentifier ) if it already holds `id`; nothing changes then.
   void try_append( const account_id_t &owner, const kitty_id_t &id );

   // Removes `id` from the sequence of `owner`, keeping the order of the rest. Returns false if it wasn't there.
   bool remove( const account_id_t &owner, const kitty_id_t &id );

   [[nodiscard]] bool has_room_for( const account_id_t &owner ) const noexcept;

   // The sequence of `owner`, empty if they own nothing
   [[nodiscard]] const sequence_type &owned_by( const account_id_t &owner ) const noexcept;

   [[nodiscard]] std::uint32_t max_owned() const noexcept { return max_owned_; }
   [[nodiscard]] const std::map< account_id_t, sequence_type > &all() const noexcept { return owned_; }

   bool operator==( const OwnershipIndex &rhs ) const = default;

private:
   std::uint32_t max_owned_;
   std::map< account_id_t, sequence_type > owned_;   // accounts owning nothing have no entry
};

}   // namespace kitties

#endif   // KITTIES_OWNERSHIP_INDEX_HPP_INCLUDED
