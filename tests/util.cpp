// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Copyright (c) 2026 The Rhiza developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "util.hpp"

namespace rhiza::test {
    auto make_secp() -> secp_ptr {
        return secp_ptr{secp256k1_context_create(SECP256K1_CONTEXT_NONE),
                        &secp256k1_context_destroy};
    }

    auto fixed_key(uint8_t seed, secp256k1_context* ctx) -> key_pair {
        auto priv = privkey_t{};
        priv[0] = seed;
        priv[7] = 1;
        return key_pair(priv, ctx);
    }

    auto insert_genesis(dag::ledger& l,
                        secp256k1_context* ctx,
                        const key_pair& keys) -> hash_t {
        auto genesis = transaction::make_genesis(ctx, keys);
        auto id = genesis.m_id;
        auto err = l.insert(dag::vertex(std::move(genesis), 0));
        EXPECT_FALSE(err.has_value());
        return id;
    }

    auto insert_reward(dag::ledger& l,
                       secp256k1_context* ctx,
                       const key_pair& keys,
                       uint64_t amount,
                       uint64_t nonce) -> transaction::signed_tx {
        auto tx = transaction::make_relay_reward(ctx,
                                                 keys,
                                                 amount,
                                                 l.select_parents(),
                                                 nonce);
        auto err = l.insert(dag::vertex(tx, l.depth() + 1));
        EXPECT_FALSE(err.has_value());
        return tx;
    }

    void load_config(const std::string& config_file,
                     rhiza::config::options& opts) {
        auto opts_or_err = rhiza::config::load_options(config_file);
        ASSERT_TRUE(
            std::holds_alternative<rhiza::config::options>(opts_or_err));
        opts = std::get<rhiza::config::options>(opts_or_err);
    }
}
