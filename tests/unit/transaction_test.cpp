// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Copyright (c) 2026 The Rhiza developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "dag/transaction/messages.hpp"
#include "dag/transaction/transaction.hpp"
#include "util.hpp"
#include "util/serialization/util.hpp"

#include <cstring>
#include <gtest/gtest.h>
#include <string>

class transaction_test : public ::testing::Test {
  protected:
    static auto parent(const std::string& first_byte) -> rhiza::hash_t {
        return rhiza::hash_from_hex(first_byte + std::string(62, '0'))
            .value();
    }

    void SetUp() override {
        m_parents = {parent("01"), parent("02")};
        m_transfer = rhiza::transaction::make_transfer(m_secp.get(),
                                                       m_alice,
                                                       m_bob.pubkey(),
                                                       250,
                                                       m_parents,
                                                       7,
                                                       1700000000000);
    }

    rhiza::test::secp_ptr m_secp{rhiza::test::make_secp()};
    rhiza::key_pair m_alice{rhiza::test::fixed_key(1, m_secp.get())};
    rhiza::key_pair m_bob{rhiza::test::fixed_key(2, m_secp.get())};
    rhiza::transaction::parents_t m_parents{};
    rhiza::transaction::signed_tx m_transfer;
};

TEST_F(transaction_test, payload_layout) {
    // type, two parents, two keys, amount, fee, timestamp, nonce, memo flag
    static constexpr size_t fixed_len = 1 + 4 * 32 + 4 * 8 + 1;
    EXPECT_EQ(rhiza::transaction::signing_bytes(m_transfer.m_payload).size(),
              fixed_len);

    auto reward = rhiza::transaction::make_relay_reward(m_secp.get(),
                                                        m_alice,
                                                        10,
                                                        m_parents,
                                                        1,
                                                        1);
    const auto memo_len = reward.m_payload.m_memo->size();
    EXPECT_EQ(rhiza::transaction::signing_bytes(reward.m_payload).size(),
              fixed_len + sizeof(uint64_t) + memo_len);

    auto bytes = rhiza::transaction::signing_bytes(m_transfer.m_payload);
    const auto* raw = bytes.data();
    EXPECT_EQ(raw[0],
              static_cast<uint8_t>(rhiza::transaction::tx_type::transfer));
    EXPECT_EQ(raw[1], 0x01);
    EXPECT_EQ(raw[1 + 32], 0x02);
    EXPECT_EQ(std::memcmp(raw + 1 + 64, m_alice.pubkey().data(), 32), 0);
    EXPECT_EQ(std::memcmp(raw + 1 + 96, m_bob.pubkey().data(), 32), 0);
}

TEST_F(transaction_test, id_is_digest_of_payload) {
    auto bytes = rhiza::transaction::signing_bytes(m_transfer.m_payload);
    auto expected = rhiza::hash_data(bytes.data(), bytes.size());
    EXPECT_EQ(m_transfer.m_id, expected);
    EXPECT_TRUE(rhiza::transaction::verify_id(m_transfer));
}

TEST_F(transaction_test, signature_verifies) {
    EXPECT_TRUE(
        rhiza::transaction::verify_signature(m_secp.get(), m_transfer));
}

TEST_F(transaction_test, tampered_payload_fails) {
    auto tampered = m_transfer;
    tampered.m_payload.m_amount = 251;
    EXPECT_FALSE(rhiza::transaction::verify_id(tampered));
    EXPECT_FALSE(
        rhiza::transaction::verify_signature(m_secp.get(), tampered));
}

TEST_F(transaction_test, nonce_changes_id) {
    auto other = rhiza::transaction::make_transfer(m_secp.get(),
                                                   m_alice,
                                                   m_bob.pubkey(),
                                                   250,
                                                   m_parents,
                                                   8,
                                                   1700000000000);
    EXPECT_NE(other.m_id, m_transfer.m_id);
}

TEST_F(transaction_test, genesis_shape) {
    auto genesis = rhiza::transaction::make_genesis(m_secp.get(), m_alice);
    EXPECT_EQ(genesis.m_payload.m_type, rhiza::transaction::tx_type::genesis);
    EXPECT_TRUE(rhiza::transaction::is_genesis_shaped(genesis.m_payload));
    EXPECT_EQ(genesis.m_payload.m_amount, 0UL);
    EXPECT_EQ(genesis.m_payload.m_sender, m_alice.pubkey());
    EXPECT_EQ(genesis.m_payload.m_recipient, m_alice.pubkey());
    EXPECT_TRUE(rhiza::transaction::verify_signature(m_secp.get(), genesis));
    EXPECT_FALSE(rhiza::transaction::is_genesis_shaped(m_transfer.m_payload));
}

TEST_F(transaction_test, founder_allocation_shape) {
    auto genesis = rhiza::transaction::make_genesis(m_secp.get(), m_alice);
    auto founder
        = rhiza::transaction::make_founder_allocation(m_secp.get(),
                                                      m_alice,
                                                      m_bob.pubkey(),
                                                      genesis.m_id);
    EXPECT_EQ(founder.m_payload.m_parents[0], genesis.m_id);
    EXPECT_EQ(founder.m_payload.m_parents[1], genesis.m_id);
    EXPECT_EQ(founder.m_payload.m_amount, rhiza::config::founder_allocation);
    EXPECT_EQ(founder.m_payload.m_amount,
              1'050'000UL * rhiza::config::units_per_coin);
    EXPECT_EQ(founder.m_payload.m_recipient, m_bob.pubkey());
}

TEST_F(transaction_test, signed_tx_roundtrip) {
    auto buf = rhiza::make_buffer(m_transfer);
    auto decoded = rhiza::from_buffer<rhiza::transaction::signed_tx>(buf);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded.value(), m_transfer);
}

TEST_F(transaction_test, truncated_signed_tx_fails) {
    auto buf = rhiza::make_buffer(m_transfer);
    auto truncated = rhiza::buffer();
    truncated.append(buf.data(), buf.size() - 1);
    auto decoded
        = rhiza::from_buffer<rhiza::transaction::signed_tx>(truncated);
    EXPECT_FALSE(decoded.has_value());
}

TEST_F(transaction_test, type_names) {
    EXPECT_EQ(rhiza::transaction::to_string(
                  rhiza::transaction::tx_type::relay_reward),
              "relay_reward");
    EXPECT_EQ(rhiza::transaction::to_string(
                  static_cast<rhiza::transaction::tx_type>(9)),
              "unknown");
}
