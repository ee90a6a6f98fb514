// Copyright (c) 2026 The Rhiza developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "dag/consensus/weight.hpp"
#include "dag/ledger/ledger.hpp"
#include "util.hpp"

#include <algorithm>
#include <gtest/gtest.h>

class ledger_test : public ::testing::Test {
  protected:
    void SetUp() override {
        m_genesis = rhiza::test::insert_genesis(m_ledger,
                                                m_secp.get(),
                                                m_alice);
    }

    /// Builds a transfer on explicit parents without inserting it.
    auto build(const rhiza::hash_t& p0, const rhiza::hash_t& p1)
        -> rhiza::transaction::signed_tx {
        return rhiza::transaction::make_transfer(m_secp.get(),
                                                 m_alice,
                                                 m_bob.pubkey(),
                                                 1,
                                                 {p0, p1},
                                                 m_nonce++,
                                                 0);
    }

    /// Builds and inserts a transfer one level below its deepest parent.
    auto add(const rhiza::hash_t& p0, const rhiza::hash_t& p1)
        -> rhiza::hash_t {
        auto tx = build(p0, p1);
        auto id = tx.m_id;
        auto depth = std::max(m_ledger.get(p0)->m_depth,
                              m_ledger.get(p1)->m_depth)
                   + 1;
        auto err = m_ledger.insert(rhiza::dag::vertex(std::move(tx), depth));
        EXPECT_FALSE(err.has_value());
        return id;
    }

    auto weight(const rhiza::hash_t& id) -> uint64_t {
        return m_ledger.get(id)->m_cumulative_weight;
    }

    void expect_weights_match_audit() {
        auto audited = rhiza::consensus::calculate_all_weights(m_ledger);
        ASSERT_EQ(audited.size(), m_ledger.size());
        for(const auto& [id, v] : m_ledger.vertices()) {
            EXPECT_EQ(v.m_cumulative_weight, audited.at(id));
        }
    }

    void expect_tips_have_no_children() {
        const auto& tips = m_ledger.tips();
        for(const auto& id : m_ledger.transaction_ids()) {
            const auto is_tip
                = std::find(tips.begin(), tips.end(), id) != tips.end();
            EXPECT_EQ(is_tip, m_ledger.children(id).empty());
        }
    }

    rhiza::test::secp_ptr m_secp{rhiza::test::make_secp()};
    rhiza::key_pair m_alice{rhiza::test::fixed_key(1, m_secp.get())};
    rhiza::key_pair m_bob{rhiza::test::fixed_key(2, m_secp.get())};
    rhiza::dag::ledger m_ledger;
    rhiza::hash_t m_genesis{};
    uint64_t m_nonce{1};
};

TEST_F(ledger_test, genesis_only) {
    EXPECT_EQ(m_ledger.size(), 1UL);
    EXPECT_EQ(weight(m_genesis), 1UL);
    EXPECT_FALSE(m_ledger.get(m_genesis)->m_final);
    EXPECT_EQ(m_ledger.tips(), std::vector<rhiza::hash_t>{m_genesis});
    EXPECT_EQ(m_ledger.genesis_id().value(), m_genesis);
    EXPECT_TRUE(m_ledger.children(m_genesis).empty());
}

TEST_F(ledger_test, duplicate_refused) {
    auto tx = build(m_genesis, m_genesis);
    ASSERT_FALSE(m_ledger.insert(rhiza::dag::vertex(tx, 1)).has_value());
    auto err = m_ledger.insert(rhiza::dag::vertex(tx, 1));
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->m_code,
              rhiza::dag::ledger_error_code::duplicate_transaction);
    EXPECT_EQ(m_ledger.size(), 2UL);
    EXPECT_EQ(weight(m_genesis), 2UL);
}

TEST_F(ledger_test, missing_parent_refused_without_mutation) {
    auto unknown = rhiza::hash_from_hex(
        "abababababababababababababababababababababababababababababababab").value();
    auto err = m_ledger.insert(rhiza::dag::vertex(build(m_genesis, unknown),
                                                  1));
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->m_code, rhiza::dag::ledger_error_code::missing_parent);
    EXPECT_EQ(err->m_parent.value(), unknown);

    EXPECT_EQ(m_ledger.size(), 1UL);
    EXPECT_EQ(m_ledger.tips(), std::vector<rhiza::hash_t>{m_genesis});
    EXPECT_TRUE(m_ledger.children(m_genesis).empty());
    EXPECT_EQ(weight(m_genesis), 1UL);
    EXPECT_EQ(m_ledger.get_balance(m_bob.pubkey()), 0UL);
}

TEST_F(ledger_test, second_genesis_refused) {
    auto other = rhiza::transaction::make_genesis(m_secp.get(), m_bob);
    auto err = m_ledger.insert(rhiza::dag::vertex(other, 0));
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->m_code,
              rhiza::dag::ledger_error_code::invalid_transaction);
    EXPECT_EQ(m_ledger.genesis_id().value(), m_genesis);
    EXPECT_EQ(m_ledger.size(), 1UL);
}

TEST_F(ledger_test, identical_parents_counted_once) {
    auto a = add(m_genesis, m_genesis);
    EXPECT_EQ(m_ledger.children(m_genesis), std::vector<rhiza::hash_t>{a});
    EXPECT_EQ(weight(m_genesis), 2UL);
    EXPECT_EQ(m_ledger.tips(), std::vector<rhiza::hash_t>{a});
}

TEST_F(ledger_test, diamond_weights) {
    auto a = add(m_genesis, m_genesis);
    auto b = add(m_genesis, m_genesis);
    EXPECT_EQ(m_ledger.tips(), (std::vector<rhiza::hash_t>{a, b}));

    auto c = add(a, b);
    EXPECT_EQ(weight(m_genesis), 4UL);
    EXPECT_EQ(weight(a), 2UL);
    EXPECT_EQ(weight(b), 2UL);
    EXPECT_EQ(weight(c), 1UL);
    EXPECT_EQ(m_ledger.tips(), std::vector<rhiza::hash_t>{c});
    EXPECT_EQ(m_ledger.children(m_genesis),
              (std::vector<rhiza::hash_t>{a, b}));
    expect_weights_match_audit();
    expect_tips_have_no_children();
}

TEST_F(ledger_test, weights_match_audit_on_wide_dag) {
    auto ids = std::vector<rhiza::hash_t>{m_genesis};
    for(size_t i = 0; i < 40; i++) {
        const auto& p0 = ids[(i * 7) % ids.size()];
        const auto& p1 = ids[(i * 3 + 1) % ids.size()];
        ids.push_back(add(p0, p1));
        expect_tips_have_no_children();
    }
    expect_weights_match_audit();
    EXPECT_EQ(weight(m_genesis), m_ledger.size());
}

TEST_F(ledger_test, finality_transition_is_permanent) {
    auto tip = m_genesis;
    for(uint64_t i = 1; i < rhiza::config::finality_threshold; i++) {
        EXPECT_FALSE(m_ledger.get(m_genesis)->m_final);
        tip = add(tip, tip);
        EXPECT_EQ(weight(m_genesis), i + 1);
    }
    EXPECT_TRUE(m_ledger.get(m_genesis)->m_final);

    for(size_t i = 0; i < 5; i++) {
        tip = add(tip, tip);
        EXPECT_TRUE(m_ledger.get(m_genesis)->m_final);
    }
}

TEST_F(ledger_test, insert_resets_supplied_weights) {
    auto v = rhiza::dag::vertex(build(m_genesis, m_genesis), 1);
    v.m_cumulative_weight = 50;
    v.m_final = true;
    auto id = v.id();
    ASSERT_FALSE(m_ledger.insert(std::move(v)).has_value());
    EXPECT_EQ(weight(id), 1UL);
    EXPECT_FALSE(m_ledger.get(id)->m_final);
}

TEST_F(ledger_test, select_parents) {
    auto parents = m_ledger.select_parents();
    EXPECT_EQ(parents[0], m_genesis);
    EXPECT_EQ(parents[1], m_genesis);

    auto a = add(m_genesis, m_genesis);
    auto b = add(m_genesis, m_genesis);
    parents = m_ledger.select_parents();
    EXPECT_EQ(parents[0], a);
    EXPECT_EQ(parents[1], b);

    // a deeper tip is preferred regardless of insertion order
    auto c = add(a, a);
    auto d = add(c, c);
    parents = m_ledger.select_parents();
    EXPECT_EQ(parents[0], d);
    EXPECT_EQ(parents[1], b);
    EXPECT_EQ(m_ledger.depth(), 3UL);
}

TEST_F(ledger_test, select_parents_on_empty_ledger) {
    auto empty = rhiza::dag::ledger();
    auto parents = empty.select_parents();
    EXPECT_TRUE(rhiza::is_zero(parents[0]));
    EXPECT_TRUE(rhiza::is_zero(parents[1]));
    EXPECT_TRUE(empty.empty());
}

TEST_F(ledger_test, balance_from_reward_and_transfer) {
    static constexpr uint64_t reward = 900;
    static constexpr uint64_t sent = 300;
    rhiza::test::insert_reward(m_ledger, m_secp.get(), m_bob, reward, 1);
    EXPECT_EQ(m_ledger.get_balance(m_bob.pubkey()), reward);

    auto tx = rhiza::transaction::make_transfer(m_secp.get(),
                                                m_bob,
                                                m_alice.pubkey(),
                                                sent,
                                                m_ledger.select_parents(),
                                                2);
    ASSERT_FALSE(
        m_ledger.insert(rhiza::dag::vertex(tx, m_ledger.depth() + 1))
            .has_value());
    EXPECT_EQ(m_ledger.get_balance(m_bob.pubkey()), reward - sent);
    EXPECT_EQ(m_ledger.get_balance(m_alice.pubkey()), sent);
}

TEST_F(ledger_test, balance_floors_at_zero) {
    // the ledger stores what it is given; overspending is the
    // validator's concern
    add(m_genesis, m_genesis);
    EXPECT_EQ(m_ledger.get_balance(m_alice.pubkey()), 0UL);
    EXPECT_EQ(m_ledger.get_balance(m_bob.pubkey()), 1UL);
}

TEST_F(ledger_test, balance_index_matches_scan) {
    rhiza::test::insert_reward(m_ledger, m_secp.get(), m_alice, 1000, 1);
    rhiza::test::insert_reward(m_ledger, m_secp.get(), m_bob, 700, 1);
    for(uint64_t i = 0; i < 6; i++) {
        const auto& from = (i % 2 == 0) ? m_alice : m_bob;
        const auto& to = (i % 2 == 0) ? m_bob : m_alice;
        auto tx = rhiza::transaction::make_transfer(m_secp.get(),
                                                    from,
                                                    to.pubkey(),
                                                    50 + i,
                                                    m_ledger.select_parents(),
                                                    10 + i);
        ASSERT_FALSE(
            m_ledger.insert(rhiza::dag::vertex(tx, m_ledger.depth() + 1))
                .has_value());
    }
    for(const auto& key : {m_alice.pubkey(), m_bob.pubkey()}) {
        EXPECT_EQ(m_ledger.get_balance(key), m_ledger.scan_balance(key));
    }
    EXPECT_EQ(m_ledger.get_balance(m_alice.pubkey())
                  + m_ledger.get_balance(m_bob.pubkey()),
              1700UL);
}

TEST_F(ledger_test, error_strings) {
    auto err = rhiza::dag::ledger_error{
        rhiza::dag::ledger_error_code::missing_parent,
        m_genesis};
    EXPECT_EQ(rhiza::dag::to_string(err),
              "Missing parent " + rhiza::to_string(m_genesis));
}
