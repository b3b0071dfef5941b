// Copyright (c) 2026 The Kitties Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <algorithm>
#include <stdexcept>

#include "hashing.hpp"

namespace kitties {

namespace {

const EVP_MD *get_md( Hasher::Algorithm algorithm ) noexcept
{
   switch ( algorithm ) {
      case Hasher::Algorithm::sha256:
         return EVP_sha256();
      case Hasher::Algorithm::blake2b512:
         return EVP_blake2b512();
   }
   return nullptr;
}

}   // namespace

Hasher::Hasher( const Algorithm algorithm )
   : ctx_( EVP_MD_CTX_new() )
{
   if ( !ctx_ )
      throw std::runtime_error( "Hasher: EVP_MD_CTX_new() failed" );
   const EVP_MD *md = get_md( algorithm );
   if ( !md || EVP_DigestInit_ex( ctx_, md, nullptr ) != 1 ) {
      EVP_MD_CTX_free( ctx_ );
      throw std::runtime_error( "Hasher: EVP_DigestInit_ex() failed" );
   }
}

Hasher::~Hasher()
{
   EVP_MD_CTX_free( ctx_ );
}

Hasher &Hasher::write( const std::span< const std::uint8_t > data )
{
   if ( finalized_ )
      throw std::logic_error( "Hasher: write() after finalize()" );
   if ( !data.empty() && EVP_DigestUpdate( ctx_, data.data(), data.size() ) != 1 )
      throw std::runtime_error( "Hasher: EVP_DigestUpdate() failed" );
   return *this;
}

Hasher &Hasher::write( const std::string_view data )
{
   return write( std::span( reinterpret_cast< const std::uint8_t * >( data.data() ), data.size() ) );
}

std::vector< std::uint8_t > Hasher::finalize()
{
   if ( finalized_ )
      throw std::logic_error( "Hasher: finalize() called twice" );
   std::vector< std::uint8_t > result( EVP_MD_CTX_size( ctx_ ) );
   unsigned int length = 0;
   if ( EVP_DigestFinal_ex( ctx_, result.data(), &length ) != 1 )
      throw std::runtime_error( "Hasher: EVP_DigestFinal_ex() failed" );
   finalized_ = true;
   result.resize( length );
   return result;
}

hash_t sha256( const std::span< const std::uint8_t > data )
{
   return hash_t( Hasher( Hasher::Algorithm::sha256 ).write( data ).finalize() );
}

dna_t blake2_128( const std::span< const std::uint8_t > data )
{
   const auto digest = Hasher( Hasher::Algorithm::blake2b512 ).write( data ).finalize();
   dna_t ret;
   std::copy_n( digest.begin(), ret.size(), ret.begin() );
   return ret;
}

}   // namespace kitties
