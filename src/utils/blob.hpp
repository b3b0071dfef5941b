// Copyright (c) 2026 The Kitties Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef KITTIES_UTILS_BLOB_HPP_INCLUDED
#define KITTIES_UTILS_BLOB_HPP_INCLUDED

#include <algorithm>
#include <array>
#include <compare>
#include <cstdint>
#include <cstring>
#include <functional>
#include <optional>
#include <ostream>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>

namespace utils {

/** Fixed-size opaque byte string, such as a digest or a content-derived identifier. */
template < std::size_t Bytes >
class blob {
public:
   static constexpr std::size_t size_bytes = Bytes;

   constexpr blob() noexcept = default;

   explicit blob( std::span< const std::uint8_t > bytes )
   {
      if ( bytes.size() != Bytes )
         throw std::invalid_argument( "blob: expected " + std::to_string( Bytes ) + " bytes, got " + std::to_string( bytes.size() ) );
      std::copy( bytes.begin(), bytes.end(), data_.begin() );
   }

   [[nodiscard]] bool IsNull() const noexcept
   {
      return std::all_of( data_.begin(), data_.end(), []( std::uint8_t b ) { return b == 0; } );
   }

   void SetNull() noexcept { data_.fill( 0 ); }

   [[nodiscard]] std::string GetHex() const
   {
      static constexpr char digits[] = "0123456789abcdef";
      std::string ret;
      ret.reserve( Bytes * 2 );
      for ( const auto b : data_ ) {
         ret.push_back( digits[ b >> 4 ] );
         ret.push_back( digits[ b & 0x0f ] );
      }
      return ret;
   }

   [[nodiscard]] std::string ToString() const { return GetHex(); }

   // Parses exactly 2 * Bytes hex digits, either case. Returns nullopt on anything else.
   static std::optional< blob > FromHex( std::string_view hex )
   {
      if ( hex.size() != Bytes * 2 )
         return std::nullopt;
      const auto nibble = []( char c ) -> int {
         if ( c >= '0' && c <= '9' )
            return c - '0';
         if ( c >= 'a' && c <= 'f' )
            return c - 'a' + 10;
         if ( c >= 'A' && c <= 'F' )
            return c - 'A' + 10;
         return -1;
      };
      blob ret;
      for ( std::size_t i = 0; i < Bytes; ++i ) {
         const int hi = nibble( hex[ 2 * i ] ), lo = nibble( hex[ 2 * i + 1 ] );
         if ( hi < 0 || lo < 0 )
            return std::nullopt;
         ret.data_[ i ] = static_cast< std::uint8_t >( ( hi << 4 ) | lo );
      }
      return ret;
   }

   std::uint8_t *begin() noexcept { return data_.data(); }
   std::uint8_t *end() noexcept { return data_.data() + Bytes; }
   const std::uint8_t *begin() const noexcept { return data_.data(); }
   const std::uint8_t *end() const noexcept { return data_.data() + Bytes; }
   std::uint8_t *data() noexcept { return data_.data(); }
   const std::uint8_t *data() const noexcept { return data_.data(); }
   static constexpr std::size_t size() noexcept { return Bytes; }

   // first 8 bytes, for use as a hash table key; the content is already a uniform digest
   [[nodiscard]] std::uint64_t GetCheapHash() const noexcept
   {
      static_assert( Bytes >= sizeof( std::uint64_t ) );
      std::uint64_t ret;
      std::memcpy( &ret, data_.data(), sizeof( ret ) );
      return ret;
   }

   auto operator<=>( const blob &rhs ) const noexcept = default;
   bool operator==( const blob &rhs ) const noexcept = default;

private:
   std::array< std::uint8_t, Bytes > data_{};
};

template < std::size_t Bytes >
std::ostream &operator<<( std::ostream &os, const blob< Bytes > &b )
{
   return os << b.GetHex();
}

using uint256 = blob< 32 >;

}   // namespace utils

template < std::size_t Bytes >
struct std::hash< utils::blob< Bytes > > {
   std::size_t operator()( const utils::blob< Bytes > &b ) const noexcept { return static_cast< std::size_t >( b.GetCheapHash() ); }
};

#endif   // KITTIES_UTILS_BLOB_HPP_INCLUDED
