// Copyright (c) 2026 The Kitties Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "collaborators.hpp"
#include "errors.hpp"

namespace kitties {

account_id_t SignedOriginResolver::ensure_signed( const Origin &origin ) const
{
   if ( !origin.signer() )
      throw Error( ErrorCode::Unauthenticated, "Origin is not signed" );
   if ( origin.signer()->empty() )
      throw Error( ErrorCode::Unauthenticated, "Origin is signed by an empty account id" );
   return *origin.signer();
}

}   // namespace kitties
