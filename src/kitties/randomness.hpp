// Copyright (c) 2026 The Kitties Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef KITTIES_RANDOMNESS_HPP_INCLUDED
#define KITTIES_RANDOMNESS_HPP_INCLUDED

#include <deque>
#include <shared_mutex>

#include "collaborators.hpp"
#include "serialize.hpp"

namespace kitties {

/**
 * Randomness derived from the hashes of the most recent blocks, mixed with the subject.
 *
 * ATTENTION: this is NOT secure randomness. Whoever produces the blocks can influence the
 * output, and anyone can predict it for the current block. It is good enough for picking
 * kitty DNA and gender, nothing more.
 */
class CollectiveFlipRandomness final : public RandomnessSource, public HeightOracle {
public:
   static constexpr std::size_t random_material_len = 81;

   CollectiveFlipRandomness() = default;

   template < typename Stream >
   CollectiveFlipRandomness( deserialize_type, Stream &is )
   {
      is >> block_number_;
      const auto n = is.read_element_count( hash_t::size_bytes );
      if ( n > random_material_len )
         throw std::ios_base::failure( "Serialized randomness material too long" );
      for ( std::size_t i = 0; i < n; ++i )
         is >> material_.emplace_back();
   }

   template < typename Stream >
   void Serialize( Stream &os ) const
   {
      std::shared_lock lock( mutex_ );
      os << block_number_;
      os.write_compact_size( material_.size() );
      for ( const auto &h : material_ )
         os << h;
   }

   // Records the hash of the block just sealed and moves on to the next block number
   void note_block( const hash_t &block_hash );

   block_number_t block_number() const override;

private:
   mutable std::shared_mutex mutex_;
   // All below data members are protected by mutex_
   std::deque< hash_t > material_;   // oldest first
   block_number_t block_number_ = 0;

   std::pair< hash_t, block_number_t > compute_random( std::span< const std::uint8_t > subject ) const override;
};

}   // namespace kitties

#endif   // KITTIES_RANDOMNESS_HPP_INCLUDED
