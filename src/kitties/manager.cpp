// Copyright (c) 2026 The Kitties Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "../logging.h"

#include "errors.hpp"
#include "manager.hpp"

namespace kitties {

template < typename F >
auto Manager::dispatch( const char *const call_name, const Origin &origin, F &&call )
{
   try {
      const account_id_t sender = resolver_.ensure_signed( origin );
      return call( sender );
   }
   catch ( const Error &e ) {
      LogPrintf( "%s rejected with %s: %s\n", call_name, error_code_name( e.code() ), e.what() );
      throw;
   }
}

kitty_id_t Manager::create_kitty( const Origin &origin )
{
   return dispatch( "create_kitty", origin, [ this ]( const account_id_t &sender ) {
      const kitty_id_t id = registry_.mint( sender, std::nullopt, std::nullopt );
      LogPrintf( "A kitty is born with id %s\n", id.GetHex() );
      events_.notify( events::Created{ sender, id } );
      return id;
   } );
}

kitty_id_t Manager::breed_kitty( const Origin &origin, const kitty_id_t &parent1, const kitty_id_t &parent2 )
{
   return dispatch( "breed_kitty", origin, [ & ]( const account_id_t &sender ) {
      const kitty_id_t id = registry_.breed( sender, parent1, parent2 );
      LogPrintf( "A kitty is born with id %s, bred from %s and %s\n", id.GetHex(), parent1.GetHex(), parent2.GetHex() );
      events_.notify( events::Created{ sender, id } );
      return id;
   } );
}

void Manager::set_price( const Origin &origin, const kitty_id_t &id, const std::optional< balance_t > new_price )
{
   dispatch( "set_price", origin, [ & ]( const account_id_t &sender ) {
      registry_.set_price( sender, id, new_price );
      events_.notify( events::PriceSet{ sender, id, new_price } );
   } );
}

void Manager::transfer( const Origin &origin, const account_id_t &to, const kitty_id_t &id )
{
   dispatch( "transfer", origin, [ & ]( const account_id_t &sender ) {
      registry_.transfer( sender, to, id );
      events_.notify( events::Transferred{ sender, to, id } );
   } );
}

void Manager::buy_kitty( const Origin &origin, const kitty_id_t &id, const balance_t bid_price )
{
   dispatch( "buy_kitty", origin, [ & ]( const account_id_t &buyer ) {
      const account_id_t seller = registry_.buy( buyer, id, bid_price );
      events_.notify( events::Transferred{ seller, buyer, id } );
      events_.notify( events::Bought{ buyer, seller, id, bid_price } );
   } );
}

}   // namespace kitties
