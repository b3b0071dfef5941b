// Copyright (c) 2026 The Kitties Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <limits>
#include <mutex>
#include <stdexcept>

#include <boost/format.hpp>

#include "../logging.h"

#include "balances.hpp"
#include "errors.hpp"

namespace kitties {

balance_t BalanceLedger::free_balance( const account_id_t &who ) const
{
   std::shared_lock lock( mutex_ );
   const auto it = balances_.find( who );
   return it == balances_.end() ? 0 : it->second;
}

void BalanceLedger::transfer( const account_id_t &from, const account_id_t &to, const balance_t amount )
{
   std::unique_lock lock( mutex_ );
   const auto from_it = balances_.find( from );
   const balance_t from_balance = from_it == balances_.end() ? 0 : from_it->second;
   if ( from_balance < amount )
      throw Error( ErrorCode::NotEnoughBalance,
                   str( boost::format( "Account %1% has %2% but needs %3%" ) % from % from_balance % amount ) );
   if ( from == to || !amount )
      return;

   const auto to_it = balances_.find( to );
   const balance_t to_balance = to_it == balances_.end() ? 0 : to_it->second;
   if ( to_balance > std::numeric_limits< balance_t >::max() - amount )
      throw std::overflow_error( "Balance of the receiving account would overflow" );

   // nothing below may throw other than from the map insertion, which happens first
   balances_[ to ] = to_balance + amount;
   if ( from_balance == amount )
      balances_.erase( from );
   else
      balances_[ from ] = from_balance - amount;
   LogPrint( "kitties", "Transferred %d from %s to %s\n", amount, from, to );
}

void BalanceLedger::deposit( const account_id_t &who, const balance_t amount )
{
   std::unique_lock lock( mutex_ );
   auto &balance = balances_[ who ];
   if ( balance > std::numeric_limits< balance_t >::max() - amount )
      throw std::overflow_error( "Balance would overflow" );
   balance += amount;
   if ( !balance )
      balances_.erase( who );
}

std::map< account_id_t, balance_t > BalanceLedger::balances() const
{
   std::shared_lock lock( mutex_ );
   return balances_;
}

}   // namespace kitties
