// Copyright (c) 2026 The Kitties Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <mutex>
#include <stdexcept>

#include <boost/format.hpp>

#include "../logging.h"

#include "errors.hpp"
#include "registry.hpp"

namespace kitties {

namespace {

Params validated( Params p )
{
   p.validate();
   return p;
}

}   // namespace

Registry::Registry( Params params, const RandomnessSource &randomness, const HeightOracle &height, CurrencyLedger &currency )
   : params_( validated( std::move( params ) ) )
   , genetics_( randomness, height, params_ )
   , currency_( currency )
   , state_( params_.max_owned )
{}

kitty_id_t Registry::mint( const account_id_t &owner, const std::optional< dna_t > &dna, const std::optional< Gender > gender )
{
   std::unique_lock lock( mutex_ );
   return mint( owner, dna, gender, { *this, lock } );
}

kitty_id_t Registry::mint( const account_id_t &owner, const std::optional< dna_t > &dna, const std::optional< Gender > gender, write_lock_proof )
{
   const dna_t kitty_dna = dna ? *dna : genetics_.generate_dna();
   const Gender kitty_gender = gender ? *gender : genetics_.generate_gender();
   Kitty kitty( kitty_dna, std::nullopt, kitty_gender, owner );
   const kitty_id_t id = derive_kitty_id( kitty );

   // Reserve first, commit last: until insert() succeeds, the only change is the reserved ownership slot, which is undone on failure
   const std::uint64_t new_count = state_.assets.increment_count();   // may throw, nothing changed yet
   state_.owned.try_append( owner, id );   // may throw, nothing changed yet
   try {
      state_.assets.insert( id, std::move( kitty ) );
   }
   catch ( const Error & ) {
      state_.owned.remove( owner, id );
      throw;
   }
   state_.assets.set_count( new_count );

   LogPrint( "kitties", "Minted kitty %s for %s, dna %s, %s; %d kitties in existence\n", id.GetHex(), owner, dna_to_hex( kitty_dna ), to_string( kitty_gender ), new_count );
   return id;
}

kitty_id_t Registry::breed( const account_id_t &owner, const kitty_id_t &parent1, const kitty_id_t &parent2 )
{
   std::unique_lock lock( mutex_ );
   const write_lock_proof wlp{ *this, lock };
   const dna_t child_dna = genetics_.combine( state_.assets, parent1, parent2 );   // may throw
   return mint( owner, child_dna, std::nullopt, wlp );
}

bool Registry::is_owner( const kitty_id_t &id, const account_id_t &account ) const
{
   std::shared_lock lock( mutex_ );
   return existing_kitty( id, { *this, lock } ).owner() == account;
}

const Kitty &Registry::existing_kitty( const kitty_id_t &id, read_lock_proof ) const
{
   const Kitty *const k = state_.assets.find( id );
   if ( !k )
      throw Error( ErrorCode::AssetNotFound, "Kitty " + id.GetHex() + " not found" );
   return *k;
}

Kitty &Registry::owned_kitty( const kitty_id_t &id, const account_id_t &account, write_lock_proof )
{
   Kitty *const k = state_.assets.find( id );
   if ( !k )
      throw Error( ErrorCode::AssetNotFound, "Kitty " + id.GetHex() + " not found" );
   if ( k->owner() != account )
      throw Error( ErrorCode::NotOwner, "Kitty " + id.GetHex() + " is not owned by " + account );
   return *k;
}

void Registry::set_price( const account_id_t &sender, const kitty_id_t &id, const std::optional< balance_t > price )
{
   std::unique_lock lock( mutex_ );
   owned_kitty( id, sender, { *this, lock } ).price( price );
   if ( price )
      LogPrint( "kitties", "Kitty %s put up for sale at %d\n", id.GetHex(), *price );
   else
      LogPrint( "kitties", "Kitty %s taken off sale\n", id.GetHex() );
}

template < typename F >
void Registry::transfer_to( const kitty_id_t &id, Kitty &kitty, const account_id_t &to, F &&before_commit, write_lock_proof )
{
   const account_id_t from = kitty.owner();
   state_.owned.try_append( to, id );   // may throw, nothing changed yet
   try {
      before_commit();
   }
   catch ( ... ) {
      state_.owned.remove( to, id );
      throw;
   }
   state_.owned.remove( from, id );
   kitty.owner( to );
   kitty.price( std::nullopt );
   LogPrint( "kitties", "Kitty %s transferred from %s to %s\n", id.GetHex(), from, to );
}

void Registry::transfer( const account_id_t &sender, const account_id_t &to, const kitty_id_t &id )
{
   std::unique_lock lock( mutex_ );
   const write_lock_proof wlp{ *this, lock };
   Kitty &kitty = owned_kitty( id, sender, wlp );
   if ( to == sender )
      throw Error( ErrorCode::TransferToSelf, "Cannot transfer kitty " + id.GetHex() + " to its own owner" );
   transfer_to( id, kitty, to, [] {}, wlp );
}

account_id_t Registry::buy( const account_id_t &buyer, const kitty_id_t &id, const balance_t bid_price )
{
   std::unique_lock lock( mutex_ );
   const write_lock_proof wlp{ *this, lock };
   Kitty *const kitty = state_.assets.find( id );
   if ( !kitty )
      throw Error( ErrorCode::AssetNotFound, "Kitty " + id.GetHex() + " not found" );
   if ( kitty->owner() == buyer )
      throw Error( ErrorCode::BuyerIsOwner, "Buyer " + buyer + " already owns kitty " + id.GetHex() );
   if ( !kitty->price() )
      throw Error( ErrorCode::NotForSale, "Kitty " + id.GetHex() + " is not for sale" );
   if ( *kitty->price() > bid_price )
      throw Error( ErrorCode::BidPriceTooLow, str( boost::format( "Bid %1% is below the asking price %2%" ) % bid_price % *kitty->price() ) );
   if ( currency_.free_balance( buyer ) < bid_price )
      throw Error( ErrorCode::NotEnoughBalance, "Buyer " + buyer + " cannot afford the bid" );

   const account_id_t seller = kitty->owner();
   transfer_to( id, *kitty, buyer, [ & ] { currency_.transfer( buyer, seller, bid_price ); }, wlp );
   LogPrint( "kitties", "Kitty %s bought by %s from %s for %d\n", id.GetHex(), buyer, seller, bid_price );
   return seller;
}

std::optional< Kitty > Registry::get_kitty( const kitty_id_t &id ) const
{
   std::shared_lock lock( mutex_ );
   return state_.assets.get( id );
}

std::uint64_t Registry::kitty_count() const
{
   std::shared_lock lock( mutex_ );
   return state_.assets.count();
}

std::vector< kitty_id_t > Registry::kitties_owned( const account_id_t &owner ) const
{
   std::shared_lock lock( mutex_ );
   return state_.owned.owned_by( owner );
}

StorageContext Registry::snapshot() const
{
   std::shared_lock lock( mutex_ );
   return state_;
}

void Registry::restore( StorageContext state )
{
   if ( state.owned.max_owned() != params_.max_owned )
      throw std::invalid_argument( str( boost::format( "State built for max_owned %1% cannot be used with max_owned %2%" ) % state.owned.max_owned() %
                                        params_.max_owned ) );
   state.check_consistency();   // may throw
   std::unique_lock lock( mutex_ );
   state_ = std::move( state );
   LogPrintf( "Kitty registry restored: %d kitties owned by %d accounts\n", state_.assets.count(), state_.owned.all().size() );
}

}   // namespace kitties
