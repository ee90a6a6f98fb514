// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Copyright (c) 2026 The Rhiza developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef RHIZA_SRC_TRANSACTION_TRANSACTION_H_
#define RHIZA_SRC_TRANSACTION_TRANSACTION_H_

#include "util/common/buffer.hpp"
#include "util/common/config.hpp"
#include "util/common/hash.hpp"
#include "util/common/keys.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <string>

namespace rhiza::transaction {
    /// Kind of value movement a transaction performs.
    enum class tx_type : uint8_t {
        /// Moves amount plus fee from sender to recipient.
        transfer = 0,
        /// Root of the DAG. Zero parents, zero amount.
        genesis = 1,
        /// Self-issued relay reward. Sender and recipient are equal.
        relay_reward = 2,
        /// One-time allocation to the founder key, issued at genesis.
        founder_allocation = 3
    };

    /// Parent references of a transaction. Both zero for genesis, and
    /// possibly the same digest twice when only one tip exists.
    using parents_t = std::array<hash_t, config::parent_count>;

    /// \brief Signed content of a transaction.
    ///
    /// Everything here is covered by the transaction id and the sender's
    /// signature.
    /// \see \ref rhiza::operator<<(serializer&, const transaction::tx_payload&)
    struct tx_payload {
        tx_type m_type{tx_type::transfer};
        parents_t m_parents{};
        pubkey_t m_sender{};
        pubkey_t m_recipient{};
        /// Value moved, in units.
        uint64_t m_amount{0};
        /// Fee paid by the sender on top of the amount, in units.
        uint64_t m_fee{0};
        /// Creation time in milliseconds since the Unix epoch.
        uint64_t m_timestamp{0};
        uint64_t m_nonce{0};
        std::optional<std::string> m_memo;

        auto operator==(const tx_payload& rhs) const -> bool;
        auto operator!=(const tx_payload& rhs) const -> bool;
    };

    /// \brief A transaction as stored in the ledger and sent over gossip.
    ///
    /// Immutable once built. The id and signature are re-checked on every
    /// admission rather than trusted.
    struct signed_tx {
        /// Digest of the canonical payload encoding.
        hash_t m_id{};
        tx_payload m_payload;
        /// Sender's signature over the canonical payload encoding.
        signature_t m_signature{};

        auto operator==(const signed_tx& rhs) const -> bool;
        auto operator!=(const signed_tx& rhs) const -> bool;
    };

    /// Returns the canonical encoding of a payload, the bytes both the id
    /// and the signature are computed over.
    /// \param payload payload to encode.
    /// \return encoded payload.
    auto signing_bytes(const tx_payload& payload) -> buffer;

    /// Calculates the unique id of a payload.
    /// \param payload payload to hash.
    /// \return SHA256 of the canonical payload encoding.
    auto tx_id(const tx_payload& payload) -> hash_t;

    /// Computes the id of the payload and signs it.
    /// \param ctx secp256k1 context with which to sign.
    /// \param signer key pair of the payload's sender.
    /// \param payload payload to sign. Its sender should be the signer's
    ///                public key.
    /// \return the signed transaction.
    auto sign(secp256k1_context* ctx,
              const key_pair& signer,
              tx_payload payload) -> signed_tx;

    /// Checks that the stored id matches the payload.
    /// \param tx transaction to check.
    /// \return true if the id equals tx_id(tx.m_payload).
    auto verify_id(const signed_tx& tx) -> bool;

    /// Checks the signature against the payload's sender key.
    /// \param ctx secp256k1 context with which to verify.
    /// \param tx transaction to check.
    /// \return true if the signature is valid.
    auto verify_signature(secp256k1_context* ctx, const signed_tx& tx)
        -> bool;

    /// Returns true if both parents are the zero digest.
    auto is_genesis_shaped(const tx_payload& payload) -> bool;

    /// Returns the current wall-clock time in milliseconds since the Unix
    /// epoch.
    auto now_ms() -> uint64_t;

    /// Creates the genesis transaction: zero parents, zero amount,
    /// timestamp and nonce zero, sent by the genesis key to itself.
    /// \param ctx secp256k1 context with which to sign.
    /// \param genesis_keys key pair that signs genesis.
    /// \return the genesis transaction.
    auto make_genesis(secp256k1_context* ctx, const key_pair& genesis_keys)
        -> signed_tx;

    /// Creates the founder allocation. Both parents are the genesis id.
    /// \param ctx secp256k1 context with which to sign.
    /// \param genesis_keys key pair that signed genesis.
    /// \param founder recipient of the allocation.
    /// \param genesis_id id of the genesis transaction.
    /// \return the founder allocation transaction.
    auto make_founder_allocation(secp256k1_context* ctx,
                                 const key_pair& genesis_keys,
                                 const pubkey_t& founder,
                                 const hash_t& genesis_id) -> signed_tx;

    /// Creates a fee-less transfer.
    /// \param ctx secp256k1 context with which to sign.
    /// \param sender key pair of the sender.
    /// \param recipient public key receiving the amount.
    /// \param amount units to move.
    /// \param parents parent transactions, usually from
    ///                dag::ledger::select_parents.
    /// \param nonce sender-chosen uniqueness value.
    /// \param timestamp creation time in milliseconds.
    /// \return the signed transfer.
    auto make_transfer(secp256k1_context* ctx,
                       const key_pair& sender,
                       const pubkey_t& recipient,
                       uint64_t amount,
                       const parents_t& parents,
                       uint64_t nonce,
                       uint64_t timestamp = now_ms()) -> signed_tx;

    /// Creates a relay reward paid by the relayer to itself.
    auto make_relay_reward(secp256k1_context* ctx,
                           const key_pair& relayer,
                           uint64_t amount,
                           const parents_t& parents,
                           uint64_t nonce,
                           uint64_t timestamp = now_ms()) -> signed_tx;

    /// Returns a lower-case name for the transaction type.
    auto to_string(tx_type type) -> std::string;
}

#endif // RHIZA_SRC_TRANSACTION_TRANSACTION_H_
