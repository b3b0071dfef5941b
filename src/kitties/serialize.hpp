// Copyright (c) 2026 The Kitties Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef KITTIES_SERIALIZE_HPP_INCLUDED
#define KITTIES_SERIALIZE_HPP_INCLUDED

#include <algorithm>
#include <array>
#include <concepts>
#include <cstdint>
#include <ios>
#include <optional>
#include <span>
#include <string>
#include <type_traits>
#include <vector>

#include "../utils/blob.hpp"

namespace kitties {

/**
 * Tag used to select deserializing constructors, i.e. T( deserialize, stream ).
 */
struct deserialize_type {
   explicit deserialize_type() = default;
};
inline constexpr deserialize_type deserialize{};

/**
 * In-memory byte stream with the project's hand-written binary layout:
 *  - unsigned integers: fixed width, little-endian
 *  - bool / enum-like bytes: a single byte
 *  - std::array< uint8_t, N >, utils::blob< N >: N raw bytes, no length prefix
 *  - std::string, std::vector< uint8_t >: compact size (LEB128), then raw bytes
 *  - std::optional< T >: one tag byte (0 = absent, 1 = present), then T when present
 *  - class types: their Serialize( stream ) member / T( deserialize, stream ) constructor
 * Reading past the end or encountering a malformed value throws std::ios_base::failure.
 */
class ByteStream {
public:
   ByteStream() = default;
   explicit ByteStream( std::vector< std::uint8_t > data )
      : data_( std::move( data ) )
   {}

   void write( const std::uint8_t *p, std::size_t n ) { data_.insert( data_.end(), p, p + n ); }

   void read( std::uint8_t *p, std::size_t n )
   {
      if ( n > data_.size() - read_pos_ )
         throw std::ios_base::failure( "ByteStream::read(): end of data" );
      std::copy_n( data_.begin() + static_cast< std::ptrdiff_t >( read_pos_ ), n, p );
      read_pos_ += n;
   }

   void write_compact_size( std::uint64_t n )
   {
      do {
         std::uint8_t byte = n & 0x7f;
         n >>= 7;
         if ( n )
            byte |= 0x80;
         data_.push_back( byte );
      } while ( n );
   }

   std::uint64_t read_compact_size()
   {
      std::uint64_t ret = 0;
      for ( unsigned shift = 0;; shift += 7 ) {
         if ( shift > 63 )
            throw std::ios_base::failure( "ByteStream: compact size too large" );
         std::uint8_t byte;
         read( &byte, 1 );
         const std::uint64_t chunk = byte & 0x7f;
         if ( shift == 63 && chunk > 1 )
            throw std::ios_base::failure( "ByteStream: compact size too large" );
         ret |= chunk << shift;
         if ( !( byte & 0x80 ) ) {
            if ( shift && !byte )
               throw std::ios_base::failure( "ByteStream: non-canonical compact size" );
            return ret;
         }
      }
   }

   // Compact size that is about to be used as an element count of at least `element_size` bytes each
   std::size_t read_element_count( std::size_t element_size = 1 )
   {
      const auto n = read_compact_size();
      if ( n > remaining() / std::max< std::size_t >( element_size, 1 ) )
         throw std::ios_base::failure( "ByteStream: element count exceeds the remaining data" );
      return static_cast< std::size_t >( n );
   }

   [[nodiscard]] std::size_t remaining() const noexcept { return data_.size() - read_pos_; }
   [[nodiscard]] bool eof() const noexcept { return remaining() == 0; }
   [[nodiscard]] std::size_t size() const noexcept { return data_.size(); }
   [[nodiscard]] const std::vector< std::uint8_t > &data() const noexcept { return data_; }
   [[nodiscard]] std::span< const std::uint8_t > span() const noexcept { return data_; }

   // writing

   template < std::unsigned_integral T >
   ByteStream &operator<<( T v )
   {
      if constexpr ( std::is_same_v< T, bool > )
         data_.push_back( v ? 1 : 0 );
      else
         for ( std::size_t i = 0; i < sizeof( T ); ++i )
            data_.push_back( static_cast< std::uint8_t >( v >> ( 8 * i ) ) );
      return *this;
   }

   template < std::size_t N >
   ByteStream &operator<<( const std::array< std::uint8_t, N > &a )
   {
      write( a.data(), N );
      return *this;
   }

   template < std::size_t N >
   ByteStream &operator<<( const utils::blob< N > &b )
   {
      write( b.data(), N );
      return *this;
   }

   ByteStream &operator<<( const std::string &s )
   {
      write_compact_size( s.size() );
      write( reinterpret_cast< const std::uint8_t * >( s.data() ), s.size() );
      return *this;
   }

   template < typename T >
   ByteStream &operator<<( const std::optional< T > &o )
   {
      *this << static_cast< std::uint8_t >( o ? 1 : 0 );
      if ( o )
         *this << *o;
      return *this;
   }

   template < typename T >
      requires requires( const T &t, ByteStream &s ) { t.Serialize( s ); }
   ByteStream &operator<<( const T &t )
   {
      t.Serialize( *this );
      return *this;
   }

   // reading

   template < std::unsigned_integral T >
   ByteStream &operator>>( T &v )
   {
      if constexpr ( std::is_same_v< T, bool > ) {
         std::uint8_t b;
         read( &b, 1 );
         if ( b > 1 )
            throw std::ios_base::failure( "ByteStream: invalid boolean value" );
         v = b != 0;
      }
      else {
         std::uint8_t buf[ sizeof( T ) ];
         read( buf, sizeof( T ) );
         v = 0;
         for ( std::size_t i = 0; i < sizeof( T ); ++i )
            v |= static_cast< T >( buf[ i ] ) << ( 8 * i );
      }
      return *this;
   }

   template < std::size_t N >
   ByteStream &operator>>( std::array< std::uint8_t, N > &a )
   {
      read( a.data(), N );
      return *this;
   }

   template < std::size_t N >
   ByteStream &operator>>( utils::blob< N > &b )
   {
      read( b.data(), N );
      return *this;
   }

   ByteStream &operator>>( std::string &s )
   {
      const auto n = read_element_count();
      s.resize( n );
      read( reinterpret_cast< std::uint8_t * >( s.data() ), n );
      return *this;
   }

   template < typename T >
      requires std::is_default_constructible_v< T >
   ByteStream &operator>>( std::optional< T > &o )
   {
      std::uint8_t tag;
      *this >> tag;
      switch ( tag ) {
         case 0:
            o.reset();
            break;
         case 1: {
            T t;
            *this >> t;
            o = std::move( t );
            break;
         }
         default:
            throw std::ios_base::failure( "ByteStream: invalid option tag" );
      }
      return *this;
   }

private:
   std::vector< std::uint8_t > data_;
   std::size_t read_pos_ = 0;
};

}   // namespace kitties

#endif   // KITTIES_SERIALIZE_HPP_INCLUDED
