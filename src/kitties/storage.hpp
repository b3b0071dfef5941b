// Copyright (c) 2026 The Kitties Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef KITTIES_STORAGE_HPP_INCLUDED
#define KITTIES_STORAGE_HPP_INCLUDED

#include <cstdint>
#include <string>

#include "asset_store.hpp"
#include "ownership_index.hpp"
#include "serialize.hpp"

namespace kitties {

/**
 * All persistent state of the kitty registry: the kitty count, the kitties and the ownership index.
 *
 * Consistency (see check_consistency()):
 *  - assets.count() == number of stored kitties
 *  - every id in the sequence of an account refers to a stored kitty owned by that account
 *  - every stored kitty appears in the sequence of its owner
 */
struct StorageContext {
   static constexpr std::uint32_t magic = 0x5354544b;   // "KTTS"
   static constexpr std::uint16_t version = 1;

   AssetStore assets;
   OwnershipIndex owned;

   explicit StorageContext( std::uint32_t max_owned )
      : owned( max_owned )
   {}

   // Throws std::ios_base::failure if the data is malformed and std::runtime_error if it is not consistent
   template < typename Stream >
   StorageContext( deserialize_type, Stream &is, std::uint32_t max_owned )
      : assets( read_header( is ), is )
      , owned( deserialize, is, max_owned )
   {
      check_consistency();
   }

   template < typename Stream >
   void Serialize( Stream &os ) const
   {
      os << magic << version << assets << owned;
   }

   // Throws std::runtime_error describing the first inconsistency found
   void check_consistency() const;

   bool operator==( const StorageContext &rhs ) const = default;

private:
   template < typename Stream >
   static deserialize_type read_header( Stream &is )
   {
      std::uint32_t m;
      std::uint16_t v;
      is >> m >> v;
      if ( m != magic )
         throw std::ios_base::failure( "Not a kitty storage snapshot" );
      if ( v != version )
         throw std::ios_base::failure( "Unsupported kitty storage snapshot version " + std::to_string( v ) );
      return deserialize;
   }
};

}   // namespace kitties

#endif   // KITTIES_STORAGE_HPP_INCLUDED
