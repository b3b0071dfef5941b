// Copyright (c) 2026 The Kitties Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef KITTIES_ERRORS_HPP_INCLUDED
#define KITTIES_ERRORS_HPP_INCLUDED

#include <stdexcept>
#include <string>
#include <string_view>

namespace kitties {

enum class ErrorCode {
   CounterOverflow,       // the global kitty count is at its numeric maximum
   ExceedMaxOwned,        // the account already owns Params::max_owned kitties
   AssetNotFound,         // no kitty with the given id
   DuplicateIdentifier,   // a kitty with the derived id already exists
   Unauthenticated,       // the origin could not be resolved to a signed account
   NotOwner,              // the kitty is not owned by the account acting on it
   TransferToSelf,
   BuyerIsOwner,
   NotForSale,
   BidPriceTooLow,
   NotEnoughBalance,
};

std::string_view error_code_name( ErrorCode code ) noexcept;

// Rejection of a kitty operation. Whatever the operation was, it had no effect.
class Error : public std::runtime_error {
public:
   Error( ErrorCode code, const std::string &what )
      : std::runtime_error( what )
      , code_( code )
   {}

   [[nodiscard]] ErrorCode code() const noexcept { return code_; }

private:
   ErrorCode code_;
};

}   // namespace kitties

#endif   // KITTIES_ERRORS_HPP_INCLUDED
