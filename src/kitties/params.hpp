// Copyright (c) 2026 The Kitties Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef KITTIES_PARAMS_HPP_INCLUDED
#define KITTIES_PARAMS_HPP_INCLUDED

#include <cstdint>
#include <string>

class ArgsManager;

namespace kitties {

/**
 * Parameters the kitty registry is constructed with.
 */
struct Params {
   static constexpr std::uint32_t default_max_owned = 9999;

   /** The maximum number of kitties a single account can own. Must be positive. */
   std::uint32_t max_owned = default_max_owned;
   /** Randomness subject tags, keeping the DNA and gender draws independent of each other. */
   std::string dna_subject = "dna";
   std::string gender_subject = "gender";

   // Throws std::invalid_argument if any parameter is unusable
   void validate() const;
};

// Reads -maxowned, -dnasubject and -gendersubject; throws std::invalid_argument on bad values
Params params_from_args( const ArgsManager &args );

}   // namespace kitties

#endif   // KITTIES_PARAMS_HPP_INCLUDED
