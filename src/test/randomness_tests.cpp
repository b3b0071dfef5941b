// Copyright (c) 2026 The Kitties Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "kitties/hashing.hpp"
#include "kitties/randomness.hpp"

#include "test/test_kitties.h"

#include <boost/test/unit_test.hpp>

using namespace kitties;

BOOST_FIXTURE_TEST_SUITE(randomness_tests, BasicTestingSetup)

BOOST_AUTO_TEST_CASE(without_block_hashes)
{
    CollectiveFlipRandomness randomness;
    BOOST_CHECK_EQUAL(randomness.block_number(), 0u);
    const auto [output, known_since] = randomness.random("dna");
    BOOST_CHECK_EQUAL(output, sha256(ByteStream(std::vector<uint8_t>{'d', 'n', 'a'}).span()));
    BOOST_CHECK_EQUAL(known_since, 0u);
}

BOOST_AUTO_TEST_CASE(mixes_every_block_hash_with_the_subject)
{
    CollectiveFlipRandomness randomness;
    randomness.note_block(FilledHash(1));
    randomness.note_block(FilledHash(2));
    BOOST_CHECK_EQUAL(randomness.block_number(), 2u);

    Hasher mix(Hasher::Algorithm::sha256);
    for (uint8_t b : {1, 2}) {
        Hasher salted(Hasher::Algorithm::sha256);
        salted.write(std::string_view("gender")).write(FilledHash(b));
        mix.write(salted.finalize());
    }
    BOOST_CHECK_EQUAL(randomness.random("gender").first, hash_t(mix.finalize()));

    // subjects separate the outputs
    BOOST_CHECK(randomness.random("gender").first != randomness.random("dna").first);
    // same block, same subject, same output
    BOOST_CHECK_EQUAL(randomness.random("dna").first, randomness.random("dna").first);

    const hash_t before = randomness.random("dna").first;
    randomness.note_block(FilledHash(3));
    BOOST_CHECK(randomness.random("dna").first != before);
}

BOOST_AUTO_TEST_CASE(keeps_the_most_recent_hashes)
{
    CollectiveFlipRandomness a, b;
    a.note_block(FilledHash(0xee));
    for (size_t i = 0; i < CollectiveFlipRandomness::random_material_len; ++i) {
        a.note_block(FilledHash(static_cast<uint8_t>(i)));
        b.note_block(FilledHash(static_cast<uint8_t>(i)));
    }
    BOOST_CHECK_EQUAL(a.block_number(), CollectiveFlipRandomness::random_material_len + 1);
    // the oldest hash has dropped out
    BOOST_CHECK_EQUAL(a.random("dna").first, b.random("dna").first);
    BOOST_CHECK_EQUAL(a.random("dna").second, 1u);
    BOOST_CHECK_EQUAL(b.random("dna").second, 0u);
}

BOOST_AUTO_TEST_CASE(serialization)
{
    CollectiveFlipRandomness randomness;
    randomness.note_block(FilledHash(5));
    randomness.note_block(FilledHash(6));

    ByteStream s;
    s << randomness;
    const CollectiveFlipRandomness decoded(deserialize, s);
    BOOST_CHECK_EQUAL(decoded.block_number(), 2u);
    BOOST_CHECK_EQUAL(decoded.random("dna").first, randomness.random("dna").first);

    ByteStream too_long;
    too_long << uint64_t{100};
    too_long.write_compact_size(CollectiveFlipRandomness::random_material_len + 1);
    for (size_t i = 0; i <= CollectiveFlipRandomness::random_material_len; ++i)
        too_long << FilledHash(1);
    BOOST_CHECK_THROW(CollectiveFlipRandomness r(deserialize, too_long), std::ios_base::failure);
}

BOOST_AUTO_TEST_SUITE_END()
