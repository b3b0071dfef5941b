// Copyright (c) 2026 The Kitties Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "kitties/kitty.hpp"
#include "kitties/serialize.hpp"

#include "test/test_kitties.h"

#include <boost/test/unit_test.hpp>

using namespace kitties;

BOOST_FIXTURE_TEST_SUITE(kitty_tests, BasicTestingSetup)

BOOST_AUTO_TEST_CASE(gender_follows_first_dna_byte_parity)
{
    for (int b = 0; b < 256; ++b) {
        dna_t dna = SequentialDna(0x55);
        dna[0] = static_cast<uint8_t>(b);
        BOOST_CHECK_EQUAL(gender_from_dna(dna), b % 2 == 0 ? Gender::Male : Gender::Female);
    }
    // only the first byte matters
    dna_t dna{};
    dna[1] = 1;
    dna[15] = 0xff;
    BOOST_CHECK_EQUAL(gender_from_dna(dna), Gender::Male);
}

BOOST_AUTO_TEST_CASE(serialized_layout)
{
    const Kitty kitty(SequentialDna(), balance_t{5}, Gender::Female, "alice");
    ByteStream s;
    s << kitty;
    BOOST_CHECK_EQUAL(utils::blob<32>(s.span()).GetHex(), "000102030405060708090a0b0c0d0e0f0105000000000000000105616c696365");

    const Kitty not_for_sale(SequentialDna(), std::nullopt, Gender::Male, "alice");
    ByteStream s2;
    s2 << not_for_sale;
    const std::vector<uint8_t> expected = {0, 1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12, 13, 14, 15, 0, 0, 5, 'a', 'l', 'i', 'c', 'e'};
    BOOST_CHECK_EQUAL_COLLECTIONS(s2.data().begin(), s2.data().end(), expected.begin(), expected.end());
}

BOOST_AUTO_TEST_CASE(deserialization)
{
    const Kitty kitty(SequentialDna(3), balance_t{1234567}, Gender::Female, "bob");
    ByteStream s;
    s << kitty;
    const Kitty decoded(deserialize, s);
    BOOST_CHECK(decoded == kitty);
    BOOST_CHECK(s.eof());

    // gender byte 2 is not a gender
    std::vector<uint8_t> bad_gender(16, 0);
    bad_gender.insert(bad_gender.end(), {0, 2, 1, 'x'});
    ByteStream s_gender(bad_gender);
    BOOST_CHECK_THROW(Kitty decoded(deserialize, s_gender), std::ios_base::failure);

    // option tag 7 is not an option
    std::vector<uint8_t> bad_tag(16, 0);
    bad_tag.insert(bad_tag.end(), {7, 0, 1, 'x'});
    ByteStream s_tag(bad_tag);
    BOOST_CHECK_THROW(Kitty decoded(deserialize, s_tag), std::ios_base::failure);

    // truncated owner
    std::vector<uint8_t> truncated(16, 0);
    truncated.insert(truncated.end(), {0, 1, 5, 'x'});
    ByteStream s_truncated(truncated);
    BOOST_CHECK_THROW(Kitty decoded(deserialize, s_truncated), std::ios_base::failure);
}

BOOST_AUTO_TEST_CASE(equality_covers_every_field)
{
    const Kitty base(SequentialDna(), std::nullopt, Gender::Male, "alice");
    BOOST_CHECK(base == Kitty(SequentialDna(), std::nullopt, Gender::Male, "alice"));
    BOOST_CHECK(!(base == Kitty(SequentialDna(1), std::nullopt, Gender::Male, "alice")));
    BOOST_CHECK(!(base == Kitty(SequentialDna(), balance_t{0}, Gender::Male, "alice")));
    BOOST_CHECK(!(base == Kitty(SequentialDna(), std::nullopt, Gender::Female, "alice")));
    BOOST_CHECK(!(base == Kitty(SequentialDna(), std::nullopt, Gender::Male, "alicf")));
}

BOOST_AUTO_TEST_CASE(identifier_is_sha256_of_content)
{
    const Kitty kitty(SequentialDna(), balance_t{5}, Gender::Female, "alice");
    BOOST_CHECK_EQUAL(derive_kitty_id(kitty).GetHex(), "6b9ee512285d7052ca4ccb671b6a5c7d257ce0ca07a4c43d08fdd8525ebaf199");

    const Kitty fresh(SequentialDna(), std::nullopt, Gender::Male, "alice");
    BOOST_CHECK_EQUAL(derive_kitty_id(fresh).GetHex(), "73e453801ea149b539af6ab6aa7918d7056d50d006287844cd0ea6a60edfa594");

    // structurally equal kitties share their identifier, any difference changes it
    BOOST_CHECK_EQUAL(derive_kitty_id(fresh), derive_kitty_id(Kitty(SequentialDna(), std::nullopt, Gender::Male, "alice")));
    BOOST_CHECK(derive_kitty_id(fresh) != derive_kitty_id(Kitty(SequentialDna(), std::nullopt, Gender::Male, "bob")));
    BOOST_CHECK(derive_kitty_id(fresh) != derive_kitty_id(Kitty(SequentialDna(), std::nullopt, Gender::Female, "alice")));
}

BOOST_AUTO_TEST_SUITE_END()
