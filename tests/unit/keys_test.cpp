// Copyright (c) 2026 The Rhiza developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "util.hpp"
#include "util/common/config.hpp"
#include "util/common/keys.hpp"
#include "util/common/random_source.hpp"

#include <gtest/gtest.h>
#include <stdexcept>

class keys_test : public ::testing::Test {
  protected:
    static auto to_buffer(const std::string& str) -> rhiza::buffer {
        auto buf = rhiza::buffer();
        buf.append(str.data(), str.size());
        return buf;
    }

    rhiza::test::secp_ptr m_secp{rhiza::test::make_secp()};
    rhiza::key_pair m_alice{rhiza::test::fixed_key(1, m_secp.get())};
    rhiza::key_pair m_bob{rhiza::test::fixed_key(2, m_secp.get())};
    rhiza::buffer m_msg{to_buffer("propagate me")};
};

TEST_F(keys_test, pubkey_is_deterministic) {
    auto again = rhiza::pubkey_from_privkey(m_alice.privkey(), m_secp.get());
    EXPECT_EQ(again, m_alice.pubkey());
    EXPECT_NE(m_alice.pubkey(), m_bob.pubkey());
}

TEST_F(keys_test, sign_and_verify) {
    auto sig = m_alice.sign(m_msg, m_secp.get());
    EXPECT_TRUE(
        rhiza::check_signature(m_alice.pubkey(), m_msg, sig, m_secp.get()));

    // signing carries no auxiliary randomness
    EXPECT_EQ(sig, m_alice.sign(m_msg, m_secp.get()));
}

TEST_F(keys_test, altered_message_fails) {
    auto sig = m_alice.sign(m_msg, m_secp.get());
    auto altered = to_buffer("propagate mf");
    EXPECT_FALSE(
        rhiza::check_signature(m_alice.pubkey(), altered, sig, m_secp.get()));
}

TEST_F(keys_test, other_key_fails) {
    auto sig = m_alice.sign(m_msg, m_secp.get());
    EXPECT_FALSE(
        rhiza::check_signature(m_bob.pubkey(), m_msg, sig, m_secp.get()));
}

TEST_F(keys_test, empty_message) {
    auto empty = rhiza::buffer();
    auto sig = m_bob.sign(empty, m_secp.get());
    EXPECT_TRUE(
        rhiza::check_signature(m_bob.pubkey(), empty, sig, m_secp.get()));
}

TEST_F(keys_test, unparsable_pubkey_fails) {
    auto sig = m_alice.sign(m_msg, m_secp.get());
    // x coordinate above the field size
    rhiza::pubkey_t bad{};
    bad.fill(0xff);
    EXPECT_FALSE(rhiza::check_signature(bad, m_msg, sig, m_secp.get()));
}

TEST_F(keys_test, privkey_validity) {
    EXPECT_TRUE(rhiza::is_valid_privkey(m_alice.privkey(), m_secp.get()));
    EXPECT_FALSE(rhiza::is_valid_privkey(rhiza::privkey_t{}, m_secp.get()));
}

TEST_F(keys_test, generate_from_random_source) {
    auto rnd = rhiza::random_source(rhiza::config::random_source);
    auto k0 = rhiza::key_pair::generate(rnd, m_secp.get());
    auto k1 = rhiza::key_pair::generate(rnd, m_secp.get());
    EXPECT_TRUE(rhiza::is_valid_privkey(k0.privkey(), m_secp.get()));
    EXPECT_FALSE(k0 == k1);
}

TEST_F(keys_test, seeded_random_source_is_reproducible) {
    auto seed = rhiza::hash_t{};
    seed[0] = 0x42;
    auto a = rhiza::random_source(seed);
    auto b = rhiza::random_source(seed);
    auto first = a.random_hash();
    EXPECT_EQ(first, b.random_hash());
    EXPECT_NE(first, a.random_hash());

    auto c = rhiza::random_source(seed);
    EXPECT_EQ(rhiza::key_pair::generate(c, m_secp.get()).privkey(), first);
}

TEST_F(keys_test, missing_entropy_source_throws) {
    EXPECT_THROW(rhiza::random_source("/nonexistent/rhiza-entropy"),
                 std::runtime_error);
}
