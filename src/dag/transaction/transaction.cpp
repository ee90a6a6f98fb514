// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Copyright (c) 2026 The Rhiza developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "transaction.hpp"

#include "messages.hpp"
#include "util/serialization/util.hpp"

#include <chrono>
#include <tuple>

namespace rhiza::transaction {
    auto tx_payload::operator==(const tx_payload& rhs) const -> bool {
        return std::tie(m_type,
                        m_parents,
                        m_sender,
                        m_recipient,
                        m_amount,
                        m_fee,
                        m_timestamp,
                        m_nonce,
                        m_memo)
            == std::tie(rhs.m_type,
                        rhs.m_parents,
                        rhs.m_sender,
                        rhs.m_recipient,
                        rhs.m_amount,
                        rhs.m_fee,
                        rhs.m_timestamp,
                        rhs.m_nonce,
                        rhs.m_memo);
    }

    auto tx_payload::operator!=(const tx_payload& rhs) const -> bool {
        return !(*this == rhs);
    }

    auto signed_tx::operator==(const signed_tx& rhs) const -> bool {
        return m_id == rhs.m_id && m_payload == rhs.m_payload
            && m_signature == rhs.m_signature;
    }

    auto signed_tx::operator!=(const signed_tx& rhs) const -> bool {
        return !(*this == rhs);
    }

    auto signing_bytes(const tx_payload& payload) -> buffer {
        return rhiza::make_buffer(payload);
    }

    auto tx_id(const tx_payload& payload) -> hash_t {
        return hash_data(signing_bytes(payload));
    }

    auto sign(secp256k1_context* ctx,
              const key_pair& signer,
              tx_payload payload) -> signed_tx {
        auto ret = signed_tx();
        const auto buf = signing_bytes(payload);
        ret.m_signature = signer.sign(buf, ctx);
        ret.m_id = tx_id(payload);
        ret.m_payload = std::move(payload);
        return ret;
    }

    auto verify_id(const signed_tx& tx) -> bool {
        return tx_id(tx.m_payload) == tx.m_id;
    }

    auto verify_signature(secp256k1_context* ctx, const signed_tx& tx)
        -> bool {
        return check_signature(tx.m_payload.m_sender,
                               signing_bytes(tx.m_payload),
                               tx.m_signature,
                               ctx);
    }

    auto is_genesis_shaped(const tx_payload& payload) -> bool {
        return is_zero(payload.m_parents[0]) && is_zero(payload.m_parents[1]);
    }

    auto now_ms() -> uint64_t {
        const auto now = std::chrono::system_clock::now().time_since_epoch();
        return static_cast<uint64_t>(
            std::chrono::duration_cast<std::chrono::milliseconds>(now)
                .count());
    }

    auto make_genesis(secp256k1_context* ctx, const key_pair& genesis_keys)
        -> signed_tx {
        auto payload = tx_payload();
        payload.m_type = tx_type::genesis;
        payload.m_sender = genesis_keys.pubkey();
        payload.m_recipient = genesis_keys.pubkey();
        payload.m_memo = config::genesis_memo;
        return sign(ctx, genesis_keys, std::move(payload));
    }

    auto make_founder_allocation(secp256k1_context* ctx,
                                 const key_pair& genesis_keys,
                                 const pubkey_t& founder,
                                 const hash_t& genesis_id) -> signed_tx {
        auto payload = tx_payload();
        payload.m_type = tx_type::founder_allocation;
        payload.m_parents = {genesis_id, genesis_id};
        payload.m_sender = genesis_keys.pubkey();
        payload.m_recipient = founder;
        payload.m_amount = config::founder_allocation;
        payload.m_nonce = 1;
        payload.m_memo = config::founder_memo;
        return sign(ctx, genesis_keys, std::move(payload));
    }

    auto make_transfer(secp256k1_context* ctx,
                       const key_pair& sender,
                       const pubkey_t& recipient,
                       uint64_t amount,
                       const parents_t& parents,
                       uint64_t nonce,
                       uint64_t timestamp) -> signed_tx {
        auto payload = tx_payload();
        payload.m_type = tx_type::transfer;
        payload.m_parents = parents;
        payload.m_sender = sender.pubkey();
        payload.m_recipient = recipient;
        payload.m_amount = amount;
        payload.m_timestamp = timestamp;
        payload.m_nonce = nonce;
        return sign(ctx, sender, std::move(payload));
    }

    auto make_relay_reward(secp256k1_context* ctx,
                           const key_pair& relayer,
                           uint64_t amount,
                           const parents_t& parents,
                           uint64_t nonce,
                           uint64_t timestamp) -> signed_tx {
        auto payload = tx_payload();
        payload.m_type = tx_type::relay_reward;
        payload.m_parents = parents;
        payload.m_sender = relayer.pubkey();
        payload.m_recipient = relayer.pubkey();
        payload.m_amount = amount;
        payload.m_timestamp = timestamp;
        payload.m_nonce = nonce;
        payload.m_memo = "Relay reward";
        return sign(ctx, relayer, std::move(payload));
    }

    auto to_string(tx_type type) -> std::string {
        switch(type) {
            case tx_type::transfer:
                return "transfer";
            case tx_type::genesis:
                return "genesis";
            case tx_type::relay_reward:
                return "relay_reward";
            case tx_type::founder_allocation:
                return "founder_allocation";
        }
        return "unknown";
    }
}
