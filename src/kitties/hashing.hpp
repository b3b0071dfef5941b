// Copyright (c) 2026 The Kitties Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef KITTIES_HASHING_HPP_INCLUDED
#define KITTIES_HASHING_HPP_INCLUDED

#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

#include <openssl/evp.h>

#include "identification.hpp"

namespace kitties {

// Incremental digest over an OpenSSL EVP message digest context
class Hasher {
public:
   enum class Algorithm { sha256, blake2b512 };

   explicit Hasher( Algorithm algorithm );
   ~Hasher();

   Hasher( const Hasher & ) = delete;
   Hasher &operator=( const Hasher & ) = delete;

   Hasher &write( std::span< const std::uint8_t > data );
   Hasher &write( std::string_view data );

   // May be called only once
   std::vector< std::uint8_t > finalize();

private:
   EVP_MD_CTX *ctx_;
   bool finalized_ = false;
};

// 256-bit SHA-256 digest
hash_t sha256( std::span< const std::uint8_t > data );

// First 16 bytes of the BLAKE2b-512 digest, not BLAKE2b with a 16-byte output length
dna_t blake2_128( std::span< const std::uint8_t > data );

}   // namespace kitties

#endif   // KITTIES_HASHING_HPP_INCLUDED
