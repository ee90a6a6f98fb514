// Copyright (c) 2026 The Rhiza developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "dag/gossip/messages.hpp"
#include "util.hpp"
#include "util/serialization/util.hpp"

#include <array>
#include <gtest/gtest.h>

class gossip_test : public ::testing::Test {
  protected:
    void SetUp() override {
        m_genesis = rhiza::transaction::make_genesis(m_secp.get(), m_keys);
        m_transfer
            = rhiza::transaction::make_transfer(m_secp.get(),
                                                m_keys,
                                                m_keys.pubkey(),
                                                5,
                                                {m_genesis.m_id,
                                                 m_genesis.m_id},
                                                1,
                                                99);
    }

    static auto expect_error(rhiza::buffer& buf,
                             rhiza::gossip::gossip_error_code code)
        -> std::string {
        auto res = rhiza::gossip::decode(buf);
        const auto* err = std::get_if<rhiza::gossip::gossip_error>(&res);
        EXPECT_NE(err, nullptr);
        if(err == nullptr) {
            return {};
        }
        EXPECT_EQ(err->m_code, code);
        return err->m_cause;
    }

    static auto roundtrip(const rhiza::gossip::message& msg)
        -> rhiza::gossip::message {
        auto buf = rhiza::gossip::encode(msg);
        auto res = rhiza::gossip::decode(buf);
        EXPECT_TRUE(std::holds_alternative<rhiza::gossip::message>(res));
        return std::get<rhiza::gossip::message>(res);
    }

    rhiza::test::secp_ptr m_secp{rhiza::test::make_secp()};
    rhiza::key_pair m_keys{rhiza::test::fixed_key(7, m_secp.get())};
    rhiza::transaction::signed_tx m_genesis;
    rhiza::transaction::signed_tx m_transfer;
};

using rhiza::gossip::gossip_error_code;

TEST_F(gossip_test, every_variant_roundtrips) {
    auto proof = rhiza::consensus::make_relay_proof(m_secp.get(),
                                                    m_keys,
                                                    m_transfer.m_id,
                                                    2,
                                                    1234);
    auto messages = std::vector<rhiza::gossip::message>{
        rhiza::gossip::new_transaction{m_transfer},
        rhiza::gossip::relay_announce{proof},
        rhiza::gossip::sync_request{{m_genesis.m_id, m_transfer.m_id}},
        rhiza::gossip::sync_response{{m_genesis, m_transfer}},
        rhiza::gossip::tip_announce{{m_transfer.m_id}, 7},
        rhiza::gossip::ping{555},
        rhiza::gossip::pong{556}};
    for(const auto& msg : messages) {
        EXPECT_TRUE(roundtrip(msg) == msg) << rhiza::gossip::type_name(msg);
    }
}

TEST_F(gossip_test, tag_is_variant_index) {
    auto buf = rhiza::gossip::encode(rhiza::gossip::ping{1});
    ASSERT_EQ(buf.size(), 1UL + sizeof(uint64_t));
    EXPECT_EQ(buf.data()[0], 5);
    EXPECT_EQ(rhiza::gossip::type_name(rhiza::gossip::ping{1}), "Ping");
}

TEST_F(gossip_test, empty_frame) {
    auto buf = rhiza::buffer();
    EXPECT_EQ(expect_error(buf, gossip_error_code::deserialization_error),
              "empty frame");
}

TEST_F(gossip_test, unknown_tag) {
    auto buf = rhiza::buffer();
    const uint8_t tag = 7;
    buf.append(&tag, sizeof(tag));
    EXPECT_EQ(expect_error(buf, gossip_error_code::deserialization_error),
              "unknown message tag 7");
}

TEST_F(gossip_test, truncated_payload) {
    auto full = rhiza::gossip::encode(
        rhiza::gossip::new_transaction{m_transfer});
    auto buf = rhiza::buffer();
    buf.append(full.data(), full.size() - 3);
    EXPECT_EQ(expect_error(buf, gossip_error_code::deserialization_error),
              "malformed NewTransaction payload");
}

TEST_F(gossip_test, memo_must_be_utf8) {
    auto tx = m_transfer;
    tx.m_payload.m_memo = "\xff\xfe\xc0";
    auto buf = rhiza::gossip::encode(rhiza::gossip::new_transaction{tx});
    EXPECT_EQ(expect_error(buf, gossip_error_code::deserialization_error),
              "malformed NewTransaction payload");

    // the payload codec alone refuses it too
    auto payload = rhiza::make_buffer(tx.m_payload);
    EXPECT_FALSE(
        rhiza::from_buffer<rhiza::transaction::tx_payload>(payload)
            .has_value());
}

TEST_F(gossip_test, trailing_bytes) {
    auto buf = rhiza::gossip::encode(rhiza::gossip::pong{9});
    const auto extra = std::array<uint8_t, 2>{0, 0};
    buf.append(extra.data(), extra.size());
    EXPECT_EQ(expect_error(buf, gossip_error_code::deserialization_error),
              "2 trailing bytes after Pong");
}

TEST_F(gossip_test, unknown_transaction_type) {
    auto tx = m_transfer;
    tx.m_payload.m_type = static_cast<rhiza::transaction::tx_type>(200);
    auto buf = rhiza::gossip::encode(rhiza::gossip::sync_response{{tx}});
    auto cause = expect_error(buf, gossip_error_code::invalid_message);
    EXPECT_EQ(cause,
              "unknown transaction type 200 in " + rhiza::to_string(tx.m_id));
}

TEST_F(gossip_test, error_string) {
    auto err = rhiza::gossip::gossip_error{
        gossip_error_code::deserialization_error,
        "empty frame"};
    EXPECT_EQ(rhiza::gossip::to_string(err),
              "Deserialization error: empty frame");
}
