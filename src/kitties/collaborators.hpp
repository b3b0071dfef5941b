// Copyright (c) 2026 The Kitties Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef KITTIES_COLLABORATORS_HPP_INCLUDED
#define KITTIES_COLLABORATORS_HPP_INCLUDED

#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <utility>

#include "identification.hpp"

namespace kitties {

// Source of (weak, on-chain) randomness, domain-separated by a subject tag
class RandomnessSource {
public:
   virtual ~RandomnessSource() = default;

   // Returns the random output for `subject` and the block number since which it has been known
   std::pair< hash_t, block_number_t > random( std::span< const std::uint8_t > subject ) const { return compute_random( subject ); }

   std::pair< hash_t, block_number_t > random( std::string_view subject ) const
   {
      return compute_random( std::span( reinterpret_cast< const std::uint8_t * >( subject.data() ), subject.size() ) );
   }

private:
   virtual std::pair< hash_t, block_number_t > compute_random( std::span< const std::uint8_t > subject ) const = 0;
};

// Current block (sequence) number of the chain
class HeightOracle {
public:
   virtual ~HeightOracle() = default;

   virtual block_number_t block_number() const = 0;
};

// Balance transfer primitive used by purchases
class CurrencyLedger {
public:
   virtual ~CurrencyLedger() = default;

   virtual balance_t free_balance( const account_id_t &who ) const = 0;

   // Moves `amount` from `from` to `to`, all or nothing. Throws Error( NotEnoughBalance ) if `from` cannot afford it.
   virtual void transfer( const account_id_t &from, const account_id_t &to, balance_t amount ) = 0;
};

// Where a call comes from. Only a signed origin identifies an account.
class Origin {
public:
   static Origin signed_by( account_id_t who ) { return Origin( std::move( who ) ); }
   static Origin none() noexcept { return Origin(); }

   [[nodiscard]] const std::optional< account_id_t > &signer() const noexcept { return signer_; }

private:
   std::optional< account_id_t > signer_;

   Origin() = default;
   explicit Origin( account_id_t who )
      : signer_( std::move( who ) )
   {}
};

// Authenticated-caller resolver
class OriginResolver {
public:
   virtual ~OriginResolver() = default;

   // Returns the account the origin is signed by, throws Error( Unauthenticated ) otherwise
   virtual account_id_t ensure_signed( const Origin &origin ) const = 0;
};

class SignedOriginResolver final : public OriginResolver {
public:
   account_id_t ensure_signed( const Origin &origin ) const override;
};

}   // namespace kitties

#endif   // KITTIES_COLLABORATORS_HPP_INCLUDED
