// Copyright (c) 2026 The Kitties Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <limits>

#include "asset_store.hpp"
#include "errors.hpp"

namespace kitties {

std::optional< Kitty > AssetStore::get( const kitty_id_t &id ) const
{
   if ( const auto *k = find( id ) )
      return *k;
   return std::nullopt;
}

const Kitty *AssetStore::find( const kitty_id_t &id ) const noexcept
{
   const auto it = kitties_.find( id );
   return it == kitties_.end() ? nullptr : &it->second;
}

Kitty *AssetStore::find( const kitty_id_t &id ) noexcept
{
   const auto it = kitties_.find( id );
   return it == kitties_.end() ? nullptr : &it->second;
}

void AssetStore::insert( const kitty_id_t &id, Kitty kitty )
{
   const auto [ it, inserted ] = kitties_.try_emplace( id, std::move( kitty ) );
   if ( !inserted )
      throw Error( ErrorCode::DuplicateIdentifier, "A kitty with id " + id.GetHex() + " already exists" );
}

std::uint64_t AssetStore::increment_count() const
{
   if ( count_ == std::numeric_limits< std::uint64_t >::max() )
      throw Error( ErrorCode::CounterOverflow, "Kitty count overflow" );
   return count_ + 1;
}

}   // namespace kitties
