// Copyright (c) 2026 The Kitties Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "hashing.hpp"
#include "kitty.hpp"

namespace kitties {

std::string dna_to_hex( const dna_t &dna )
{
   return utils::blob< dna_length >( dna ).GetHex();
}

std::string_view to_string( const Gender g ) noexcept
{
   return g == Gender::Male ? "Male" : "Female";
}

std::ostream &operator<<( std::ostream &os, const Kitty &k )
{
   os << "Kitty(dna=" << dna_to_hex( k.dna() ) << ", price=";
   if ( k.price() )
      os << *k.price();
   else
      os << "none";
   return os << ", gender=" << k.gender() << ", owner=" << k.owner() << ')';
}

kitty_id_t derive_kitty_id( const Kitty &kitty )
{
   ByteStream s;
   s << kitty;
   return sha256( s.span() );
}

}   // namespace kitties
