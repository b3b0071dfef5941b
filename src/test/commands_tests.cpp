// Copyright (c) 2026 The Kitties Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "args.h"
#include "commands.h"

#include "test/test_kitties.h"

#include <stdexcept>
#include <string>
#include <vector>

#include <boost/test/unit_test.hpp>

using namespace kitties;

namespace {

/** The objects kitties-cli wires together, with the production randomness */
struct CommandTestingSetup : public BasicTestingSetup {
    CollectiveFlipRandomness randomness;
    BalanceLedger balances;
    Registry registry;
    SignedOriginResolver resolver;
    EventRecorder events;
    Manager manager;
    CommandProcessor processor;

    CommandTestingSetup()
        : registry(MakeParams(2), randomness, randomness, balances),
          manager(registry, resolver, events),
          processor(manager, randomness, balances)
    {
    }

    std::string Run(const std::string& strLine) { return processor.Execute(SplitCommandLine(strLine)); }
};

} // namespace

BOOST_FIXTURE_TEST_SUITE(commands_tests, CommandTestingSetup)

BOOST_AUTO_TEST_CASE(split_command_line)
{
    BOOST_CHECK(SplitCommandLine("  buy  bob\tabc   10 ") == (std::vector<std::string>{"buy", "bob", "abc", "10"}));
    BOOST_CHECK(SplitCommandLine("count") == std::vector<std::string>{"count"});
    BOOST_CHECK(SplitCommandLine("").empty());
    BOOST_CHECK(SplitCommandLine(" \t ").empty());
}

BOOST_AUTO_TEST_CASE(parse_amounts_and_ids)
{
    BOOST_CHECK_EQUAL(ParseAmount("42"), 42u);
    BOOST_CHECK_EQUAL(ParseAmount("18446744073709551615"), 18446744073709551615u);
    BOOST_CHECK_THROW(ParseAmount(""), std::invalid_argument);
    BOOST_CHECK_THROW(ParseAmount("-1"), std::invalid_argument);
    BOOST_CHECK_THROW(ParseAmount("5x"), std::invalid_argument);
    BOOST_CHECK_THROW(ParseAmount("18446744073709551616"), std::invalid_argument);

    const std::string strHex = FilledHash(0xab).GetHex();
    BOOST_CHECK_EQUAL(ParseKittyId(strHex), FilledHash(0xab));
    BOOST_CHECK_THROW(ParseKittyId(strHex.substr(1)), std::invalid_argument);
    BOOST_CHECK_THROW(ParseKittyId(std::string(64, 'g')), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(initial_balances)
{
    ArgsManager args;
    const char* argv[] = {"kitties-cli", "-balance=alice:100", "-balance=bob:7"};
    args.ParseParameters(3, argv);
    ApplyInitialBalances(args, balances);
    BOOST_CHECK_EQUAL(Run("balance alice"), "100");
    BOOST_CHECK_EQUAL(Run("balance bob"), "7");
    BOOST_CHECK_EQUAL(Run("balance carol"), "0");

    const char* argvNoAccount[] = {"kitties-cli", "-balance=:5"};
    args.ParseParameters(2, argvNoAccount);
    BOOST_CHECK_THROW(ApplyInitialBalances(args, balances), std::invalid_argument);

    const char* argvNoAmount[] = {"kitties-cli", "-balance=alice"};
    args.ParseParameters(2, argvNoAmount);
    BOOST_CHECK_THROW(ApplyInitialBalances(args, balances), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(create_and_query)
{
    BOOST_CHECK_EQUAL(Run("count"), "0");
    const std::string strId = Run("create alice");
    BOOST_CHECK_EQUAL(strId.size(), 64u);
    BOOST_CHECK_EQUAL(randomness.block_number(), 1u);
    BOOST_CHECK_EQUAL(events.take_events().size(), 1u);

    BOOST_CHECK_EQUAL(Run("count"), "1");
    BOOST_CHECK_EQUAL(Run("owned alice"), strId);
    BOOST_CHECK_EQUAL(Run("owned bob"), "");
    BOOST_CHECK_EQUAL(Run("isowner " + strId + " alice"), "true");
    BOOST_CHECK_EQUAL(Run("isowner " + strId + " bob"), "false");

    const std::string strShown = Run("show " + strId);
    BOOST_CHECK(strShown.find("owner=alice") != std::string::npos);
    BOOST_CHECK(strShown.find("price=none") != std::string::npos);

    // the block sealed after the first create changes the DNA of the second
    const std::string strId2 = Run("create alice");
    BOOST_CHECK(strId2 != strId);
    BOOST_CHECK_EQUAL(Run("owned alice"), strId + "\n" + strId2);
    BOOST_CHECK_EQUAL(randomness.block_number(), 2u);

    const std::string strChild = Run("breed bob " + strId + " " + strId2);
    BOOST_CHECK_EQUAL(Run("isowner " + strChild + " bob"), "true");
    BOOST_CHECK_EQUAL(Run("count"), "3");
}

BOOST_AUTO_TEST_CASE(price_and_trade)
{
    balances.deposit("bob", 100);
    const std::string strId = Run("create alice");

    BOOST_CHECK_EQUAL(Run("setprice alice " + strId + " 30"), "ok");
    BOOST_CHECK(Run("show " + strId).find("price=30") != std::string::npos);
    BOOST_CHECK_EQUAL(Run("buy bob " + strId + " 30"), "ok");
    BOOST_CHECK_EQUAL(Run("balance bob"), "70");
    BOOST_CHECK_EQUAL(Run("balance alice"), "30");
    BOOST_CHECK_EQUAL(Run("isowner " + strId + " bob"), "true");
    BOOST_CHECK_EQUAL(Run("owned alice"), "");

    BOOST_CHECK_EQUAL(Run("setprice bob " + strId + " 5"), "ok");
    // without a price the kitty is taken off the market
    BOOST_CHECK_EQUAL(Run("setprice bob " + strId), "ok");
    BOOST_CHECK(Run("show " + strId).find("price=none") != std::string::npos);

    BOOST_CHECK_EQUAL(Run("transfer bob carol " + strId), "ok");
    BOOST_CHECK_EQUAL(Run("owned carol"), strId);
}

BOOST_AUTO_TEST_CASE(newblock_advances)
{
    BOOST_CHECK_EQUAL(Run("newblock"), "1");
    BOOST_CHECK_EQUAL(Run("newblock"), "2");
}

BOOST_AUTO_TEST_CASE(malformed_commands)
{
    BOOST_CHECK_THROW(processor.Execute({}), std::invalid_argument);
    BOOST_CHECK_THROW(Run("adopt alice"), std::invalid_argument);
    BOOST_CHECK_THROW(Run("create"), std::invalid_argument);
    BOOST_CHECK_THROW(Run("count extra"), std::invalid_argument);
    BOOST_CHECK_THROW(Run("show nothex"), std::invalid_argument);
    BOOST_CHECK_THROW(Run("setprice alice " + FilledHash(1).GetHex() + " -3"), std::invalid_argument);
    BOOST_CHECK_EQUAL(randomness.block_number(), 0u);
    BOOST_CHECK_EQUAL(Run("count"), "0");
}

BOOST_AUTO_TEST_CASE(rejections_keep_their_error_code)
{
    const std::string strId = Run("create alice");
    const std::string strMissing = FilledHash(9).GetHex();
    const block_number_t nBlock = randomness.block_number();

    BOOST_CHECK_EXCEPTION(Run("show " + strMissing), Error, HasErrorCode(ErrorCode::AssetNotFound));
    BOOST_CHECK_EXCEPTION(Run("isowner " + strMissing + " alice"), Error, HasErrorCode(ErrorCode::AssetNotFound));
    BOOST_CHECK_EXCEPTION(Run("setprice bob " + strId + " 1"), Error, HasErrorCode(ErrorCode::NotOwner));
    BOOST_CHECK_EXCEPTION(Run("buy alice " + strId + " 1"), Error, HasErrorCode(ErrorCode::BuyerIsOwner));
    BOOST_CHECK_EXCEPTION(Run("buy bob " + strId + " 1"), Error, HasErrorCode(ErrorCode::NotForSale));

    Run("create alice");
    BOOST_CHECK_EXCEPTION(Run("create alice"), Error, HasErrorCode(ErrorCode::ExceedMaxOwned));

    // a rejected call does not seal a block
    BOOST_CHECK_EQUAL(randomness.block_number(), nBlock + 1);
    BOOST_CHECK_EQUAL(Run("count"), "2");
}

BOOST_AUTO_TEST_SUITE_END()
