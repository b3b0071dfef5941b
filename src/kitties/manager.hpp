// Copyright (c) 2026 The Kitties Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef KITTIES_MANAGER_HPP_INCLUDED
#define KITTIES_MANAGER_HPP_INCLUDED

#include <optional>

#include "collaborators.hpp"
#include "events.hpp"
#include "registry.hpp"

namespace kitties {

// The callable surface: every call authenticates its origin, runs on the registry and announces what happened.
// A call that throws has changed nothing and announced nothing.
class Manager {
public:
   Manager( Registry &registry, const OriginResolver &resolver, EventSink &events ) noexcept
      : registry_( registry )
      , resolver_( resolver )
      , events_( events )
   {}

   kitty_id_t create_kitty( const Origin &origin );
   kitty_id_t breed_kitty( const Origin &origin, const kitty_id_t &parent1, const kitty_id_t &parent2 );
   void set_price( const Origin &origin, const kitty_id_t &id, std::optional< balance_t > new_price );
   void transfer( const Origin &origin, const account_id_t &to, const kitty_id_t &id );
   void buy_kitty( const Origin &origin, const kitty_id_t &id, balance_t bid_price );

   Registry &registry() noexcept { return registry_; }
   const Registry &registry() const noexcept { return registry_; }

private:
   Registry &registry_;
   const OriginResolver &resolver_;
   EventSink &events_;

   template < typename F >
   auto dispatch( const char *call_name, const Origin &origin, F &&call );
};

}   // namespace kitties

#endif   // KITTIES_MANAGER_HPP_INCLUDED
