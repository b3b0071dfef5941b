// Copyright (c) 2026 The Kitties Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef KITTIES_KITTY_HPP_INCLUDED
#define KITTIES_KITTY_HPP_INCLUDED

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include "../utils/enum.hpp"

#include "identification.hpp"
#include "serialize.hpp"

namespace kitties {

enum class Gender : std::uint8_t { Male = 0, Female = 1 };

// Even first DNA byte -> Male, odd -> Female
constexpr Gender gender_from_dna( const dna_t &dna ) noexcept
{
   return dna[ 0 ] % 2 == 0 ? Gender::Male : Gender::Female;
}

std::string_view to_string( Gender g ) noexcept;

inline std::ostream &operator<<( std::ostream &os, Gender g )
{
   return os << to_string( g );
}

class Kitty {
public:
   Kitty( const dna_t &dna, std::optional< balance_t > price, Gender gender, account_id_t owner )
      : dna_( dna )
      , price_( price )
      , gender_( gender )
      , owner_( std::move( owner ) )
   {}

   template < typename Stream >
   Kitty( deserialize_type, Stream &is )
   {
      std::uint8_t gender;
      is >> dna_ >> price_ >> gender >> owner_;
      const auto g = utils::enum_from_underlying< Gender, Gender::Female >( gender );
      if ( !g )
         throw std::ios_base::failure( "Serialized kitty gender value invalid: " + std::to_string( gender ) );
      gender_ = *g;
   }

   // Layout: dna (16 bytes), price (option tag + u64 LE), gender (1 byte), owner (compact size + bytes)
   template < typename Stream >
   void Serialize( Stream &os ) const
   {
      os << dna_ << price_ << utils::to_underlying( gender_ ) << owner_;
   }

   // getters
   [[nodiscard]] const dna_t &dna() const noexcept { return dna_; }
   [[nodiscard]] const std::optional< balance_t > &price() const noexcept { return price_; }
   [[nodiscard]] Gender gender() const noexcept { return gender_; }
   [[nodiscard]] const account_id_t &owner() const noexcept { return owner_; }

   // setters
   void price( std::optional< balance_t > price ) noexcept { price_ = price; }
   void owner( account_id_t owner ) { owner_ = std::move( owner ); }

   bool operator==( const Kitty &rhs ) const noexcept = default;

private:
   dna_t dna_;
   std::optional< balance_t > price_;
   Gender gender_ = Gender::Male;
   account_id_t owner_;
};

std::ostream &operator<<( std::ostream &os, const Kitty &k );

// The identifier of a kitty is the SHA-256 digest of its serialized content at the time of its creation.
// Structurally equal kitties therefore always share an identifier.
kitty_id_t derive_kitty_id( const Kitty &kitty );

}   // namespace kitties

#endif   // KITTIES_KITTY_HPP_INCLUDED
