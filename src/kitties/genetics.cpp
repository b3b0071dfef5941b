// Copyright (c) 2026 The Kitties Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "../logging.h"

#include "errors.hpp"
#include "genetics.hpp"
#include "hashing.hpp"

namespace kitties {

dna_t GeneticsEngine::generate_dna() const
{
   const auto [ random_output, known_since ] = randomness_.random( params_.dna_subject );
   const block_number_t block_number = height_.block_number();
   ByteStream payload;
   payload << random_output << block_number;
   const dna_t dna = blake2_128( payload.span() );
   LogPrint( "genetics", "Generated dna %s at block %d (randomness known since block %d)\n", dna_to_hex( dna ), block_number, known_since );
   return dna;
}

Gender GeneticsEngine::generate_gender() const
{
   const hash_t random_output = randomness_.random( params_.gender_subject ).first;
   return random_output.data()[ 0 ] % 2 == 0 ? Gender::Male : Gender::Female;
}

dna_t GeneticsEngine::combine( const AssetStore &store, const kitty_id_t &parent1, const kitty_id_t &parent2 ) const
{
   const Kitty *const kitty1 = store.find( parent1 );
   if ( !kitty1 )
      throw Error( ErrorCode::AssetNotFound, "Parent kitty " + parent1.GetHex() + " not found" );
   const Kitty *const kitty2 = store.find( parent2 );
   if ( !kitty2 )
      throw Error( ErrorCode::AssetNotFound, "Parent kitty " + parent2.GetHex() + " not found" );

   const dna_t child = mix( generate_dna(), kitty1->dna(), kitty2->dna() );
   LogPrint( "genetics",
             "Bred dna %s from %s (%s) and %s (%s)\n",
             dna_to_hex( child ),
             parent1.GetHex(),
             dna_to_hex( kitty1->dna() ),
             parent2.GetHex(),
             dna_to_hex( kitty2->dna() ) );
   return child;
}

}   // namespace kitties
