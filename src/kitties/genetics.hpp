// Copyright (c) 2026 The Kitties Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef KITTIES_GENETICS_HPP_INCLUDED
#define KITTIES_GENETICS_HPP_INCLUDED

#include "asset_store.hpp"
#include "collaborators.hpp"
#include "kitty.hpp"
#include "params.hpp"

namespace kitties {

class GeneticsEngine {
public:
   GeneticsEngine( const RandomnessSource &randomness, const HeightOracle &height, const Params &params )
      : randomness_( randomness )
      , height_( height )
      , params_( params )
   {}

   // blake2_128( random( dna_subject ) || block number ). Two calls within the same block yield the same DNA.
   [[nodiscard]] dna_t generate_dna() const;

   // Parity of the first byte of random( gender_subject ): even -> Male, odd -> Female
   [[nodiscard]] Gender generate_gender() const;

   // Child DNA of the two stored kitties, mixed under a freshly generated mask.
   // Throws Error( AssetNotFound ) if either of them is not in `store`.
   [[nodiscard]] dna_t combine( const AssetStore &store, const kitty_id_t &parent1, const kitty_id_t &parent2 ) const;

   // Each bit of the result comes from dna1 where the mask bit is 1, from dna2 otherwise
   static constexpr dna_t mix( const dna_t &mask, const dna_t &dna1, const dna_t &dna2 ) noexcept
   {
      dna_t child{};
      for ( std::size_t i = 0; i < child.size(); ++i )
         child[ i ] = static_cast< std::uint8_t >( ( mask[ i ] & dna1[ i ] ) | ( ~mask[ i ] & dna2[ i ] ) );
      return child;
   }

private:
   const RandomnessSource &randomness_;
   const HeightOracle &height_;
   const Params &params_;
};

}   // namespace kitties

#endif   // KITTIES_GENETICS_HPP_INCLUDED
