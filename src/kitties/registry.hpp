// Copyright (c) 2026 The Kitties Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef KITTIES_REGISTRY_HPP_INCLUDED
#define KITTIES_REGISTRY_HPP_INCLUDED

#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <vector>

#include "../utils/lock_proof.hpp"

#include "collaborators.hpp"
#include "genetics.hpp"
#include "kitty.hpp"
#include "params.hpp"
#include "storage.hpp"

namespace kitties {

/**
 * The kitty lifecycle: creation (minting and breeding), price changes and changes of ownership.
 *
 * Every public operation either completes entirely or throws kitties::Error having changed nothing.
 * Readers never observe a partially applied operation: all of them run under mutex_.
 */
class Registry {
public:
   Registry( Params params, const RandomnessSource &randomness, const HeightOracle &height, CurrencyLedger &currency );

   // Creates a kitty owned by `owner`. DNA and gender are generated unless given.
   kitty_id_t mint( const account_id_t &owner, const std::optional< dna_t > &dna, std::optional< Gender > gender );

   // Creates a kitty owned by `owner` whose DNA is mixed from the two parents' DNA; its gender is random
   kitty_id_t breed( const account_id_t &owner, const kitty_id_t &parent1, const kitty_id_t &parent2 );

   // Throws Error( AssetNotFound ) if there is no such kitty
   bool is_owner( const kitty_id_t &id, const account_id_t &account ) const;

   // Only the owner may set the price; std::nullopt takes the kitty off sale
   void set_price( const account_id_t &sender, const kitty_id_t &id, std::optional< balance_t > price );

   // Gives a kitty owned by `sender` to `to`. The kitty is taken off sale.
   void transfer( const account_id_t &sender, const account_id_t &to, const kitty_id_t &id );

   // Pays `bid_price` to the owner of a kitty for sale and takes it over. Returns the seller.
   account_id_t buy( const account_id_t &buyer, const kitty_id_t &id, balance_t bid_price );

   std::optional< Kitty > get_kitty( const kitty_id_t &id ) const;
   std::uint64_t kitty_count() const;
   std::vector< kitty_id_t > kitties_owned( const account_id_t &owner ) const;

   StorageContext snapshot() const;

   // Replaces the whole state. Throws std::invalid_argument if `state` is built for a different max_owned, std::runtime_error if it is not consistent.
   void restore( StorageContext state );

   const Params &params() const noexcept { return params_; }

private:
   mutable std::shared_mutex mutex_;
   const Params params_;
   const GeneticsEngine genetics_;
   CurrencyLedger &currency_;
   StorageContext state_;   // protected by mutex_

   using read_lock_proof = utils::read_lock_proof< &Registry::mutex_ >;
   using write_lock_proof = utils::write_lock_proof< &Registry::mutex_ >;

   kitty_id_t mint( const account_id_t &owner, const std::optional< dna_t > &dna, std::optional< Gender > gender, write_lock_proof );

   // Throws Error( AssetNotFound ) if there is no such kitty
   const Kitty &existing_kitty( const kitty_id_t &id, read_lock_proof ) const;

   // The kitty with the given id, which must be owned by `account`
   Kitty &owned_kitty( const kitty_id_t &id, const account_id_t &account, write_lock_proof );

   // Moves the kitty to the sequence of `to` and makes `to` its owner, off sale.
   // `before_commit` runs after the receiver's slot has been reserved, its exception undoes the reservation.
   template < typename F >
   void transfer_to( const kitty_id_t &id, Kitty &kitty, const account_id_t &to, F &&before_commit, write_lock_proof );
};

}   // namespace kitties

#endif   // KITTIES_REGISTRY_HPP_INCLUDED
