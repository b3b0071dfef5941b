// Copyright (c) 2026 The Kitties Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * The text commands understood by kitties-cli.
 */
#ifndef KITTIES_COMMANDS_H
#define KITTIES_COMMANDS_H

#include "kitties/balances.hpp"
#include "kitties/identification.hpp"
#include "kitties/manager.hpp"
#include "kitties/randomness.hpp"

#include <string>
#include <vector>

class ArgsManager;

/** Parse a kitty id in hex. Throws std::invalid_argument. */
kitties::kitty_id_t ParseKittyId(const std::string& str);

/** Parse a non-negative amount with no trailing text. Throws std::invalid_argument. */
kitties::balance_t ParseAmount(const std::string& str);

/** Split a command line into words, ignoring surrounding and repeated whitespace */
std::vector<std::string> SplitCommandLine(const std::string& strLine);

/** Deposit every -balance=<acct>:<n> argument into the ledger */
void ApplyInitialBalances(const ArgsManager& args, kitties::BalanceLedger& ledger);

class CommandProcessor
{
public:
    CommandProcessor(kitties::Manager& manager, kitties::CollectiveFlipRandomness& randomness, const kitties::BalanceLedger& balances)
        : manager(manager), randomness(randomness), balances(balances) {}

    /**
     * Execute one command, returning its output.
     * Rejected calls throw kitties::Error; malformed commands throw std::invalid_argument.
     */
    std::string Execute(const std::vector<std::string>& args);

private:
    kitties::Manager& manager;
    kitties::CollectiveFlipRandomness& randomness;
    const kitties::BalanceLedger& balances;

    /** Each state changing command goes into a block of its own */
    void SealBlock(const std::vector<std::string>& args);
};

#endif // KITTIES_COMMANDS_H
