// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Copyright (c) 2026 The Rhiza developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef RHIZA_TESTS_UTIL_H_
#define RHIZA_TESTS_UTIL_H_

#include "dag/ledger/ledger.hpp"
#include "dag/transaction/transaction.hpp"
#include "util/common/config.hpp"
#include "util/common/hash.hpp"
#include "util/common/keys.hpp"

#include <gtest/gtest.h>
#include <memory>
#include <secp256k1.h>

namespace rhiza::test {
    using secp_ptr = std::unique_ptr<secp256k1_context,
                                     decltype(&secp256k1_context_destroy)>;

    /// Creates a context usable for both signing and verification.
    auto make_secp() -> secp_ptr;

    /// Returns a deterministic key pair. Different seeds give different
    /// keys.
    /// \param seed value placed in the leading byte of the private key.
    /// \param ctx the secp context to use.
    auto fixed_key(uint8_t seed, secp256k1_context* ctx) -> key_pair;

    /// Inserts a genesis transaction signed by the given keys at depth
    /// zero.
    /// \return the genesis id.
    auto insert_genesis(dag::ledger& l,
                        secp256k1_context* ctx,
                        const key_pair& keys) -> hash_t;

    /// Builds a relay reward on the current tips, inserts it one level
    /// deeper than the ledger's depth and returns it. Fails the calling
    /// test if the ledger refuses it.
    auto insert_reward(dag::ledger& l,
                       secp256k1_context* ctx,
                       const key_pair& keys,
                       uint64_t amount,
                       uint64_t nonce) -> transaction::signed_tx;

    /// Loads options from a config file, failing the calling test on
    /// error.
    void load_config(const std::string& config_file,
                     rhiza::config::options& opts);
}

#endif // RHIZA_TESTS_UTIL_H_
