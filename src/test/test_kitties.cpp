// Copyright (c) 2011-2016 The Bitcoin Core developers
// Copyright (c) 2026 The Kitties Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#define BOOST_TEST_MODULE Kitties Test Suite

#include "test_kitties.h"

#include "logging.h"
#include "kitties/hashing.hpp"
#include "kitties/serialize.hpp"

#include <algorithm>

#include <boost/test/unit_test.hpp>

BasicTestingSetup::BasicTestingSetup()
{
    fPrintToDebugLog = false; // don't want to write to debug.log file
    fPrintToConsole = false;
    SetLogCategories({"1"}); // still exercise every LogPrint
}

BasicTestingSetup::~BasicTestingSetup()
{
    SetLogCategories({});
}

int TestRandomness::CallCount(const std::string& subject) const
{
    const auto it = mapCalls.find(subject);
    return it == mapCalls.end() ? 0 : it->second;
}

std::pair<kitties::hash_t, kitties::block_number_t> TestRandomness::compute_random(std::span<const uint8_t> subject) const
{
    const std::string strSubject(subject.begin(), subject.end());
    ++mapCalls[strSubject];
    auto& queue = queued[strSubject];
    if (!queue.empty()) {
        const kitties::hash_t output = queue.front();
        queue.pop_front();
        return {output, nBlockNumber};
    }
    kitties::ByteStream s;
    s << strSubject << nCalls++;
    return {kitties::sha256(s.span()), nBlockNumber};
}

kitties::hash_t FilledHash(uint8_t b)
{
    kitties::hash_t h;
    std::fill(h.begin(), h.end(), b);
    return h;
}

kitties::dna_t SequentialDna(uint8_t first)
{
    kitties::dna_t dna;
    for (size_t i = 0; i < dna.size(); ++i)
        dna[i] = static_cast<uint8_t>(first + i);
    return dna;
}

kitties::Params MakeParams(uint32_t nMaxOwned)
{
    kitties::Params params;
    params.max_owned = nMaxOwned;
    return params;
}

KittiesTestingSetup::KittiesTestingSetup(uint32_t nMaxOwned)
    : registry(MakeParams(nMaxOwned), randomness, randomness, balances),
      manager(registry, resolver, events)
{
}
