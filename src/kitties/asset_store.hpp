// Copyright (c) 2026 The Kitties Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef KITTIES_ASSET_STORE_HPP_INCLUDED
#define KITTIES_ASSET_STORE_HPP_INCLUDED

#include <cstdint>
#include <optional>
#include <unordered_map>

#include "kitty.hpp"
#include "serialize.hpp"

namespace kitties {

// The kitties by id, together with the count of kitties ever created.
// Not synchronized: the owner (the Registry) provides the locking.
class AssetStore {
public:
   using map_type = std::unordered_map< kitty_id_t, Kitty >;

   AssetStore() = default;

   template < typename Stream >
   AssetStore( deserialize_type, Stream &is )
   {
      is >> count_;
      const auto n = is.read_element_count( kitty_id_t::size_bytes );
      kitties_.reserve( n );
      for ( std::size_t i = 0; i < n; ++i ) {
         kitty_id_t id;
         is >> id;
         if ( !kitties_.emplace( id, Kitty( deserialize, is ) ).second )
            throw std::ios_base::failure( "Serialized asset store contains kitty " + id.GetHex() + " twice" );
      }
   }

   template < typename Stream >
   void Serialize( Stream &os ) const
   {
      os << count_;
      os.write_compact_size( kitties_.size() );
      for ( const auto &[ id, kitty ] : kitties_ )
         os << id << kitty;
   }

   [[nodiscard]] std::uint64_t count() const noexcept { return count_; }

   [[nodiscard]] std::optional< Kitty > get( const kitty_id_t &id ) const;
   [[nodiscard]] const Kitty *find( const kitty_id_t &id ) const noexcept;
   [[nodiscard]] Kitty *find( const kitty_id_t &id ) noexcept;
   [[nodiscard]] bool contains( const kitty_id_t &id ) const noexcept { return kitties_.contains( id ); }

   // Throws Error( DuplicateIdentifier ) if a kitty with the same id is already stored, leaving the store intact
   void insert( const kitty_id_t &id, Kitty kitty );

   // Returns count() + 1 without changing anything. Throws Error( CounterOverflow ) if count() is at its maximum.
   [[nodiscard]] std::uint64_t increment_count() const;

   void set_count( std::uint64_t count ) noexcept { count_ = count; }

   [[nodiscard]] const map_type &kitties() const noexcept { return kitties_; }

   bool operator==( const AssetStore &rhs ) const = default;

private:
   map_type kitties_;
   std::uint64_t count_ = 0;
};

}   // namespace kitties

#endif   // KITTIES_ASSET_STORE_HPP_INCLUDED
