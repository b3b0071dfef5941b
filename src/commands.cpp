// Copyright (c) 2026 The Kitties Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "commands.h"

#include "args.h"

#include "kitties/errors.hpp"
#include "kitties/hashing.hpp"
#include "kitties/registry.hpp"
#include "kitties/serialize.hpp"

#include <optional>
#include <sstream>
#include <stdexcept>

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/lexical_cast.hpp>

using namespace kitties;

kitty_id_t ParseKittyId(const std::string& str)
{
    const auto id = kitty_id_t::FromHex(str);
    if (!id)
        throw std::invalid_argument("Invalid kitty id: " + str);
    return *id;
}

balance_t ParseAmount(const std::string& str)
{
    // lexical_cast would wrap negative numbers around
    if (str.empty() || str[0] == '-')
        throw std::invalid_argument("Invalid amount: " + str);
    try {
        return boost::lexical_cast<balance_t>(str);
    } catch (const boost::bad_lexical_cast&) {
        throw std::invalid_argument("Invalid amount: " + str);
    }
}

std::vector<std::string> SplitCommandLine(const std::string& strLine)
{
    const std::string strTrimmed = boost::algorithm::trim_copy(strLine);
    std::vector<std::string> words;
    if (strTrimmed.empty())
        return words;
    boost::algorithm::split(words, strTrimmed, boost::algorithm::is_space(), boost::algorithm::token_compress_on);
    return words;
}

void ApplyInitialBalances(const ArgsManager& args, BalanceLedger& ledger)
{
    for (const std::string& strBalance : args.GetArgs("-balance")) {
        const size_t nColon = strBalance.rfind(':');
        if (nColon == std::string::npos || nColon == 0)
            throw std::invalid_argument("Invalid -balance value: " + strBalance);
        ledger.deposit(strBalance.substr(0, nColon), ParseAmount(strBalance.substr(nColon + 1)));
    }
}

std::string CommandProcessor::Execute(const std::vector<std::string>& args)
{
    if (args.empty())
        throw std::invalid_argument("Empty command");
    const std::string& strCommand = args.front();
    Registry& registry = manager.registry();

    if (strCommand == "create" && args.size() == 2) {
        const kitty_id_t id = manager.create_kitty(Origin::signed_by(args[1]));
        SealBlock(args);
        return id.GetHex();
    }
    if (strCommand == "breed" && args.size() == 4) {
        const kitty_id_t id = manager.breed_kitty(Origin::signed_by(args[1]), ParseKittyId(args[2]), ParseKittyId(args[3]));
        SealBlock(args);
        return id.GetHex();
    }
    if (strCommand == "setprice" && (args.size() == 3 || args.size() == 4)) {
        std::optional<balance_t> price;
        if (args.size() == 4)
            price = ParseAmount(args[3]);
        manager.set_price(Origin::signed_by(args[1]), ParseKittyId(args[2]), price);
        SealBlock(args);
        return "ok";
    }
    if (strCommand == "transfer" && args.size() == 4) {
        manager.transfer(Origin::signed_by(args[1]), args[2], ParseKittyId(args[3]));
        SealBlock(args);
        return "ok";
    }
    if (strCommand == "buy" && args.size() == 4) {
        manager.buy_kitty(Origin::signed_by(args[1]), ParseKittyId(args[2]), ParseAmount(args[3]));
        SealBlock(args);
        return "ok";
    }
    if (strCommand == "show" && args.size() == 2) {
        const kitty_id_t id = ParseKittyId(args[1]);
        const auto kitty = registry.get_kitty(id);
        if (!kitty)
            throw Error(ErrorCode::AssetNotFound, "Kitty " + id.GetHex() + " not found");
        std::ostringstream os;
        os << *kitty;
        return os.str();
    }
    if (strCommand == "owned" && args.size() == 2) {
        std::string strOut;
        for (const kitty_id_t& id : registry.kitties_owned(args[1]))
            strOut += (strOut.empty() ? "" : "\n") + id.GetHex();
        return strOut;
    }
    if (strCommand == "isowner" && args.size() == 3)
        return registry.is_owner(ParseKittyId(args[1]), args[2]) ? "true" : "false";
    if (strCommand == "count" && args.size() == 1)
        return std::to_string(registry.kitty_count());
    if (strCommand == "balance" && args.size() == 2)
        return std::to_string(balances.free_balance(args[1]));
    if (strCommand == "newblock" && args.size() == 1) {
        SealBlock(args);
        return std::to_string(randomness.block_number());
    }
    throw std::invalid_argument("Unknown command or wrong number of arguments: " + strCommand);
}

void CommandProcessor::SealBlock(const std::vector<std::string>& args)
{
    ByteStream block;
    block << randomness.block_number();
    for (const std::string& arg : args)
        block << arg;
    randomness.note_block(sha256(block.span()));
}
