// Copyright (c) 2026 The Kitties Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef KITTIES_EVENTS_HPP_INCLUDED
#define KITTIES_EVENTS_HPP_INCLUDED

#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "identification.hpp"

namespace kitties {

namespace events {

// A new kitty was created. [owner, kitty_id]
struct Created {
   account_id_t owner;
   kitty_id_t kitty_id;
   bool operator==( const Created & ) const = default;
};

// A kitty's price was set or cleared. [owner, kitty_id, new_price]
struct PriceSet {
   account_id_t owner;
   kitty_id_t kitty_id;
   std::optional< balance_t > price;
   bool operator==( const PriceSet & ) const = default;
};

// A kitty changed hands. [from, to, kitty_id]
struct Transferred {
   account_id_t from;
   account_id_t to;
   kitty_id_t kitty_id;
   bool operator==( const Transferred & ) const = default;
};

// A kitty was bought. [buyer, seller, kitty_id, bid_price]
struct Bought {
   account_id_t buyer;
   account_id_t seller;
   kitty_id_t kitty_id;
   balance_t price;
   bool operator==( const Bought & ) const = default;
};

}   // namespace events

using Event = std::variant< events::Created, events::PriceSet, events::Transferred, events::Bought >;

std::string describe( const Event &e );

// Fire-and-forget receiver of events
class EventSink {
public:
   void notify( const Event &e ) { process_event( e ); }

protected:
   ~EventSink() = default;

private:
   virtual void process_event( const Event &e ) = 0;
};

// Writes every event into the debug log, category "events"
class LoggingEventSink final : public EventSink {
private:
   void process_event( const Event &e ) override;
};

// Keeps the events in the order they were notified, optionally forwarding them
class EventRecorder final : public EventSink {
public:
   EventRecorder() = default;
   explicit EventRecorder( EventSink &forward_to ) noexcept
      : forward_to_( &forward_to )
   {}

   std::vector< Event > events() const;
   std::vector< Event > take_events();

private:
   mutable std::mutex mutex_;
   std::vector< Event > events_;   // protected by mutex_
   EventSink *forward_to_ = nullptr;

   void process_event( const Event &e ) override;
};

}   // namespace kitties

#endif   // KITTIES_EVENTS_HPP_INCLUDED
