// Copyright (c) 2026 The Kitties Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <algorithm>
#include <stdexcept>

#include <boost/format.hpp>

#include "errors.hpp"
#include "ownership_index.hpp"

namespace kitties {

OwnershipIndex::OwnershipIndex( const std::uint32_t max_owned )
   : max_owned_( max_owned )
{
   if ( !max_owned )
      throw std::invalid_argument( "OwnershipIndex: max_owned must be positive" );
}

void OwnershipIndex::try_append( const account_id_t &owner, const kitty_id_t &id )
{
   const auto it = owned_.find( owner );
   if ( it != owned_.end() ) {
      auto &ids = it->second;
      if ( ids.size() >= max_owned_ )
         throw Error( ErrorCode::ExceedMaxOwned, str( boost::format( "Account %1% already owns the maximum of %2% kitties" ) % owner % max_owned_ ) );
      if ( std::ranges::find( ids, id ) != ids.end() )
         throw Error( ErrorCode::DuplicateIdentifier, str( boost::format( "Account %1% already owns kitty %2%" ) % owner % id.GetHex() ) );
      ids.push_back( id );
   }
   else
      owned_.emplace( owner, sequence_type{ id } );
}

bool OwnershipIndex::remove( const account_id_t &owner, const kitty_id_t &id )
{
   const auto it = owned_.find( owner );
   if ( it == owned_.end() )
      return false;
   auto &ids = it->second;
   const auto id_it = std::ranges::find( ids, id );
   if ( id_it == ids.end() )
      return false;
   ids.erase( id_it );
   if ( ids.empty() )
      owned_.erase( it );
   return true;
}

bool OwnershipIndex::has_room_for( const account_id_t &owner ) const noexcept
{
   return owned_by( owner ).size() < max_owned_;
}

const OwnershipIndex::sequence_type &OwnershipIndex::owned_by( const account_id_t &owner ) const noexcept
{
   static const sequence_type none;
   const auto it = owned_.find( owner );
   return it == owned_.end() ? none : it->second;
}

}   // namespace kitties
