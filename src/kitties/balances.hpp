// Copyright (c) 2026 The Kitties Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef KITTIES_BALANCES_HPP_INCLUDED
#define KITTIES_BALANCES_HPP_INCLUDED

#include <map>
#include <shared_mutex>

#include "collaborators.hpp"
#include "serialize.hpp"

namespace kitties {

// In-memory free balances per account
class BalanceLedger final : public CurrencyLedger {
public:
   BalanceLedger() = default;

   template < typename Stream >
   BalanceLedger( deserialize_type, Stream &is )
   {
      const auto n = is.read_element_count( 1 + sizeof( balance_t ) );
      for ( std::size_t i = 0; i < n; ++i ) {
         account_id_t who;
         balance_t amount;
         is >> who >> amount;
         if ( !balances_.emplace( std::move( who ), amount ).second )
            throw std::ios_base::failure( "Serialized balances contain a duplicate account" );
      }
   }

   template < typename Stream >
   void Serialize( Stream &os ) const
   {
      std::shared_lock lock( mutex_ );
      os.write_compact_size( balances_.size() );
      for ( const auto &[ who, amount ] : balances_ )
         os << who << amount;
   }

   balance_t free_balance( const account_id_t &who ) const override;
   void transfer( const account_id_t &from, const account_id_t &to, balance_t amount ) override;

   // Credits newly issued funds to `who`. Throws std::overflow_error if the balance would overflow.
   void deposit( const account_id_t &who, balance_t amount );

   std::map< account_id_t, balance_t > balances() const;

private:
   mutable std::shared_mutex mutex_;
   std::map< account_id_t, balance_t > balances_;   // protected by mutex_, zero balances are not stored
};

}   // namespace kitties

#endif   // KITTIES_BALANCES_HPP_INCLUDED
