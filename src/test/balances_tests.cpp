// Copyright (c) 2026 The Kitties Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "kitties/balances.hpp"

#include "test/test_kitties.h"

#include <limits>

#include <boost/test/unit_test.hpp>

using namespace kitties;

BOOST_FIXTURE_TEST_SUITE(balances_tests, BasicTestingSetup)

BOOST_AUTO_TEST_CASE(transfer_moves_funds)
{
    BalanceLedger ledger;
    BOOST_CHECK_EQUAL(ledger.free_balance("alice"), 0u);
    ledger.deposit("alice", 100);
    ledger.transfer("alice", "bob", 30);
    BOOST_CHECK_EQUAL(ledger.free_balance("alice"), 70u);
    BOOST_CHECK_EQUAL(ledger.free_balance("bob"), 30u);

    // spending everything removes the account
    ledger.transfer("alice", "bob", 70);
    BOOST_CHECK(ledger.balances() == (std::map<account_id_t, balance_t>{{"bob", 100}}));

    // to oneself or nothing at all
    ledger.transfer("bob", "bob", 100);
    ledger.transfer("carol", "bob", 0);
    BOOST_CHECK_EQUAL(ledger.free_balance("bob"), 100u);
    BOOST_CHECK(!ledger.balances().count("carol"));
}

BOOST_AUTO_TEST_CASE(transfer_failures_change_nothing)
{
    BalanceLedger ledger;
    ledger.deposit("alice", 10);
    ledger.deposit("bob", std::numeric_limits<balance_t>::max());

    BOOST_CHECK_EXCEPTION(ledger.transfer("alice", "carol", 11), Error, HasErrorCode(ErrorCode::NotEnoughBalance));
    BOOST_CHECK_THROW(ledger.transfer("alice", "bob", 1), std::overflow_error);
    BOOST_CHECK_EQUAL(ledger.free_balance("alice"), 10u);
    BOOST_CHECK_EQUAL(ledger.free_balance("bob"), std::numeric_limits<balance_t>::max());
    BOOST_CHECK_THROW(ledger.deposit("bob", 1), std::overflow_error);
}

BOOST_AUTO_TEST_CASE(serialization)
{
    BalanceLedger ledger;
    ledger.deposit("alice", 5);
    ledger.deposit("bob", 7);

    ByteStream s;
    s << ledger;
    const BalanceLedger decoded(deserialize, s);
    BOOST_CHECK(decoded.balances() == ledger.balances());

    ByteStream twice;
    twice.write_compact_size(2);
    twice << std::string("alice") << uint64_t{1} << std::string("alice") << uint64_t{2};
    BOOST_CHECK_THROW(BalanceLedger duplicated(deserialize, twice), std::ios_base::failure);
}

BOOST_AUTO_TEST_SUITE_END()
