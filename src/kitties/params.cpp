// Copyright (c) 2026 The Kitties Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <stdexcept>
#include <string>

#include <boost/lexical_cast.hpp>

#include "../args.h"

#include "params.hpp"

namespace kitties {

void Params::validate() const
{
   if ( !max_owned )
      throw std::invalid_argument( "max_owned must be positive" );
   if ( dna_subject.empty() || gender_subject.empty() )
      throw std::invalid_argument( "Randomness subjects must not be empty" );
   if ( dna_subject == gender_subject )
      throw std::invalid_argument( "DNA and gender randomness subjects must differ" );
}

Params params_from_args( const ArgsManager &args )
{
   Params p;
   if ( args.IsArgSet( "-maxowned" ) ) {
      const std::string value = args.GetArg( "-maxowned", "" );
      // lexical_cast would wrap a negative number around
      if ( value.empty() || value[ 0 ] == '-' )
         throw std::invalid_argument( "Invalid -maxowned value: " + value );
      try {
         p.max_owned = boost::lexical_cast< std::uint32_t >( value );
      }
      catch ( const boost::bad_lexical_cast & ) {
         throw std::invalid_argument( "Invalid -maxowned value: " + value );
      }
   }
   p.dna_subject = args.GetArg( "-dnasubject", p.dna_subject );
   p.gender_subject = args.GetArg( "-gendersubject", p.gender_subject );
   p.validate();
   return p;
}

}   // namespace kitties
