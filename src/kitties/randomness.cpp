// Copyright (c) 2026 The Kitties Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <mutex>

#include "../logging.h"

#include "hashing.hpp"
#include "randomness.hpp"

namespace kitties {

void CollectiveFlipRandomness::note_block( const hash_t &block_hash )
{
   std::unique_lock lock( mutex_ );
   material_.push_back( block_hash );
   if ( material_.size() > random_material_len )
      material_.pop_front();
   ++block_number_;
   LogPrint( "genetics", "Noted block hash %s, now at block %d\n", block_hash.GetHex(), block_number_ );
}

block_number_t CollectiveFlipRandomness::block_number() const
{
   std::shared_lock lock( mutex_ );
   return block_number_;
}

std::pair< hash_t, block_number_t > CollectiveFlipRandomness::compute_random( const std::span< const std::uint8_t > subject ) const
{
   std::shared_lock lock( mutex_ );
   Hasher mix( Hasher::Algorithm::sha256 );
   for ( const auto &h : material_ ) {
      // each block hash contributes separately, salted with the subject
      Hasher salted( Hasher::Algorithm::sha256 );
      salted.write( subject ).write( h );
      mix.write( salted.finalize() );
   }
   if ( material_.empty() )
      mix.write( subject );
   const block_number_t known_since = block_number_ > random_material_len ? block_number_ - random_material_len : 0;
   return { hash_t( mix.finalize() ), known_since };
}

}   // namespace kitties
