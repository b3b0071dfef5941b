// Copyright (c) 2026 The Kitties Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <stdexcept>

#include <boost/format.hpp>

#include "storage.hpp"

namespace kitties {

void StorageContext::check_consistency() const
{
   if ( assets.count() != assets.kitties().size() )
      throw std::runtime_error( str( boost::format( "Kitty count %1% differs from the number of stored kitties %2%" ) % assets.count() % assets.kitties().size() ) );

   std::size_t indexed = 0;
   for ( const auto &[ owner, ids ] : owned.all() ) {
      if ( ids.size() > owned.max_owned() )
         throw std::runtime_error( str( boost::format( "Account %1% owns %2% kitties, more than the maximum of %3%" ) % owner % ids.size() % owned.max_owned() ) );
      for ( const auto &id : ids ) {
         const Kitty *const k = assets.find( id );
         if ( !k )
            throw std::runtime_error( "Indexed kitty " + id.GetHex() + " of " + owner + " does not exist" );
         if ( k->owner() != owner )
            throw std::runtime_error( "Kitty " + id.GetHex() + " is indexed under " + owner + " but owned by " + k->owner() );
      }
      indexed += ids.size();
   }

   // Each indexed id exists and is owned by the account it's indexed under, and no sequence repeats an id.
   // Hence equal totals mean every kitty is indexed exactly once.
   if ( indexed != assets.kitties().size() )
      throw std::runtime_error( str( boost::format( "%1% kitties are indexed but %2% are stored" ) % indexed % assets.kitties().size() ) );
}

}   // namespace kitties
