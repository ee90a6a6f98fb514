// Copyright (c) 2026 The Rhiza developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef RHIZA_SRC_CONSENSUS_RELAY_H_
#define RHIZA_SRC_CONSENSUS_RELAY_H_

#include "util/common/hashmap.hpp"
#include "util/common/keys.hpp"
#include "util/serialization/format.hpp"

#include <cstdint>

namespace rhiza::consensus {
    /// \brief Signed statement that a node forwarded a transaction.
    ///
    /// \see \ref rhiza::operator<<(serializer&, const consensus::relay_proof&)
    struct relay_proof {
        pubkey_t m_relayer{};
        hash_t m_tx_id{};
        /// Number of hops from the originating node.
        uint8_t m_hop_count{0};
        /// Time of the relay in milliseconds since the Unix epoch.
        uint64_t m_timestamp{0};
        signature_t m_signature{};

        auto operator==(const relay_proof& rhs) const -> bool;
    };

    /// Returns the bytes a relay proof signature covers: the ASCII tag
    /// "RELAY:", the transaction id, the hop count and the timestamp as
    /// 8 little-endian bytes.
    auto relay_signing_data(const hash_t& tx_id,
                            uint8_t hop_count,
                            uint64_t timestamp) -> buffer;

    /// Creates and signs a relay proof.
    /// \param ctx secp256k1 context with which to sign.
    /// \param relayer key pair of the relaying node.
    /// \param tx_id id of the relayed transaction.
    /// \param hop_count hops from the originating node.
    /// \param timestamp time of the relay in milliseconds.
    /// \return signed proof.
    auto make_relay_proof(secp256k1_context* ctx,
                          const key_pair& relayer,
                          const hash_t& tx_id,
                          uint8_t hop_count,
                          uint64_t timestamp) -> relay_proof;

    /// Checks a relay proof's signature against its relayer key.
    auto verify_relay_proof(secp256k1_context* ctx, const relay_proof& proof)
        -> bool;

    /// \brief Tracks relays per key and the rewards they earn.
    ///
    /// The reward for a relay depends only on how many relays the key has
    /// made, halving stepwise every config::relay_halving_interval relays.
    /// The total ever issued never exceeds config::max_supply. Once the cap
    /// would be exceeded relays still count but earn nothing.
    ///
    /// \warning Not thread-safe.
    class relay_tracker {
      public:
        relay_tracker() = default;

        /// Constructor. Resumes issuance after rewards were already paid
        /// out, for example when rebuilding state from a stored ledger.
        /// \param issued_rewards total rewards issued so far.
        explicit relay_tracker(uint64_t issued_rewards);

        /// Counts a relay by the given key and issues its reward.
        /// \param relayer key that relayed.
        /// \return reward issued, zero if the supply cap would be exceeded.
        auto record_relay(const pubkey_t& relayer) -> uint64_t;

        /// Returns what the next record_relay call for the key would
        /// return, without changing any state.
        [[nodiscard]] auto preview_reward(const pubkey_t& relayer) const
            -> uint64_t;

        /// Returns config::base_relay_reward / (1 + count /
        /// config::relay_halving_interval), using integer division.
        /// \param relay_count number of relays made by a key.
        /// \return reward in units.
        static auto calculate_reward(uint64_t relay_count) -> uint64_t;

        [[nodiscard]] auto get_relay_count(const pubkey_t& relayer) const
            -> uint64_t;

        /// Total relays counted across all keys.
        [[nodiscard]] auto total_relays() const -> uint64_t;

        /// Total rewards issued across all keys.
        [[nodiscard]] auto total_rewards() const -> uint64_t;

      private:
        [[nodiscard]] auto capped(uint64_t reward) const -> uint64_t;

        hash_map<uint64_t> m_counts;
        uint64_t m_total_relays{0};
        uint64_t m_total_rewards{0};
    };
}

namespace rhiza {
    /// \brief Serializes a relay proof.
    ///
    /// Serializes the relayer key, the transaction id, the hop count, the
    /// timestamp and then the signature.
    auto operator<<(serializer& packet, const consensus::relay_proof& proof)
        -> serializer&;

    /// Deserializes a relay proof.
    /// \see \ref rhiza::operator<<(serializer&, const consensus::relay_proof&)
    auto operator>>(serializer& packet, consensus::relay_proof& proof)
        -> serializer&;
}

#endif // RHIZA_SRC_CONSENSUS_RELAY_H_
