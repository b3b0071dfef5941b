// Copyright (c) 2026 The Kitties Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "errors.hpp"

namespace kitties {

std::string_view error_code_name( const ErrorCode code ) noexcept
{
   switch ( code ) {
      case ErrorCode::CounterOverflow:
         return "CounterOverflow";
      case ErrorCode::ExceedMaxOwned:
         return "ExceedMaxOwned";
      case ErrorCode::AssetNotFound:
         return "AssetNotFound";
      case ErrorCode::DuplicateIdentifier:
         return "DuplicateIdentifier";
      case ErrorCode::Unauthenticated:
         return "Unauthenticated";
      case ErrorCode::NotOwner:
         return "NotOwner";
      case ErrorCode::TransferToSelf:
         return "TransferToSelf";
      case ErrorCode::BuyerIsOwner:
         return "BuyerIsOwner";
      case ErrorCode::NotForSale:
         return "NotForSale";
      case ErrorCode::BidPriceTooLow:
         return "BidPriceTooLow";
      case ErrorCode::NotEnoughBalance:
         return "NotEnoughBalance";
   }
   return "Unknown";
}

}   // namespace kitties
