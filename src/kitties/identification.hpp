// Copyright (c) 2026 The Kitties Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef KITTIES_IDENTIFICATION_HPP_INCLUDED
#define KITTIES_IDENTIFICATION_HPP_INCLUDED

#include <array>
#include <cstdint>
#include <string>

#include "../utils/blob.hpp"

namespace kitties {

constexpr std::size_t dna_length = 16;

using dna_t = std::array< std::uint8_t, dna_length >;
using hash_t = utils::uint256;
using kitty_id_t = hash_t;   // content-derived, see derive_kitty_id()
using account_id_t = std::string;   // only non-empty ids are ever resolved from an origin
using balance_t = std::uint64_t;
using block_number_t = std::uint64_t;

std::string dna_to_hex( const dna_t &dna );

}   // namespace kitties

#endif   // KITTIES_IDENTIFICATION_HPP_INCLUDED
