// Copyright (c) 2026 The Kitties Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <utility>

#include <boost/format.hpp>
#include <boost/lexical_cast.hpp>

#include "../logging.h"
#include "../utils/overloaded.hpp"

#include "events.hpp"

namespace kitties {

std::string describe( const Event &e )
{
   const auto price_str = []( const std::optional< balance_t > &p ) { return p ? boost::lexical_cast< std::string >( *p ) : std::string( "none" ); };
   return std::visit( utils::overloaded{ [ & ]( const events::Created &x ) {
                                            return str( boost::format( "Created(owner=%1%, kitty=%2%)" ) % x.owner % x.kitty_id.GetHex() );
                                         },
                                         [ & ]( const events::PriceSet &x ) {
                                            return str( boost::format( "PriceSet(owner=%1%, kitty=%2%, price=%3%)" ) % x.owner % x.kitty_id.GetHex() %
                                                        price_str( x.price ) );
                                         },
                                         [ & ]( const events::Transferred &x ) {
                                            return str( boost::format( "Transferred(from=%1%, to=%2%, kitty=%3%)" ) % x.from % x.to % x.kitty_id.GetHex() );
                                         },
                                         [ & ]( const events::Bought &x ) {
                                            return str( boost::format( "Bought(buyer=%1%, seller=%2%, kitty=%3%, price=%4%)" ) % x.buyer % x.seller %
                                                        x.kitty_id.GetHex() % x.price );
                                         } },
                      e );
}

void LoggingEventSink::process_event( const Event &e )
{
   LogPrint( "events", "event: %s\n", describe( e ) );
}

std::vector< Event > EventRecorder::events() const
{
   std::lock_guard lock( mutex_ );
   return events_;
}

std::vector< Event > EventRecorder::take_events()
{
   std::lock_guard lock( mutex_ );
   return std::exchange( events_, {} );
}

void EventRecorder::process_event( const Event &e )
{
   {
      std::lock_guard lock( mutex_ );
      events_.push_back( e );
   }
   if ( forward_to_ )
      forward_to_->notify( e );
}

}   // namespace kitties
