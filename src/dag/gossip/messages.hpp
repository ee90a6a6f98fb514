// Copyright (c) 2026 The Rhiza developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef RHIZA_SRC_GOSSIP_MESSAGES_H_
#define RHIZA_SRC_GOSSIP_MESSAGES_H_

#include "dag/consensus/relay.hpp"
#include "dag/transaction/messages.hpp"
#include "dag/transaction/transaction.hpp"

#include <string>
#include <variant>
#include <vector>

namespace rhiza::gossip {
    /// Announces a transaction to peers.
    struct new_transaction {
        transaction::signed_tx m_tx;

        auto operator==(const new_transaction& rhs) const -> bool;
    };

    /// Announces that a peer relayed a transaction.
    struct relay_announce {
        consensus::relay_proof m_proof;

        auto operator==(const relay_announce& rhs) const -> bool;
    };

    /// Asks a peer for transactions by id.
    struct sync_request {
        std::vector<hash_t> m_missing;

        auto operator==(const sync_request& rhs) const -> bool;
    };

    /// Answers a sync_request with the transactions the peer has.
    struct sync_response {
        std::vector<transaction::signed_tx> m_transactions;

        auto operator==(const sync_response& rhs) const -> bool;
    };

    /// Advertises a peer's current tips and ledger depth.
    struct tip_announce {
        std::vector<hash_t> m_tips;
        uint64_t m_depth{0};

        auto operator==(const tip_announce& rhs) const -> bool;
    };

    /// Liveness probe.
    struct ping {
        uint64_t m_timestamp{0};

        auto operator==(const ping& rhs) const -> bool;
    };

    /// Reply to a ping, echoing its timestamp.
    struct pong {
        uint64_t m_timestamp{0};

        auto operator==(const pong& rhs) const -> bool;
    };

    /// Any message exchanged between peers. The alternative index is the
    /// wire tag.
    using message = std::variant<new_transaction,
                                 relay_announce,
                                 sync_request,
                                 sync_response,
                                 tip_announce,
                                 ping,
                                 pong>;

    /// Reasons a gossip frame cannot be decoded.
    enum class gossip_error_code : uint8_t {
        /// The bytes do not form a message: unknown tag, truncated or
        /// malformed payload, or trailing bytes.
        deserialization_error,
        /// The bytes form a message whose content is invalid.
        invalid_message
    };

    /// Error returned by \ref decode.
    struct gossip_error {
        gossip_error_code m_code{};
        /// Description of the underlying cause.
        std::string m_cause;

        auto operator==(const gossip_error& rhs) const -> bool;
    };

    /// Encodes a message as its one-byte tag followed by its fields.
    /// \param msg message to encode.
    /// \return encoded frame.
    auto encode(const message& msg) -> buffer;

    /// \brief Decodes a gossip frame.
    ///
    /// The frame must hold exactly one message. Transactions inside the
    /// message must carry a known type tag.
    /// \param buf encoded frame.
    /// \return the message, or the reason decoding failed.
    auto decode(buffer& buf) -> std::variant<message, gossip_error>;

    /// Returns the name of the message's alternative, e.g. "NewTransaction".
    auto type_name(const message& msg) -> std::string;

    auto to_string(const gossip_error& err) -> std::string;
}

namespace rhiza {
    auto operator<<(serializer& packet, const gossip::new_transaction& msg)
        -> serializer&;
    auto operator>>(serializer& packet, gossip::new_transaction& msg)
        -> serializer&;

    auto operator<<(serializer& packet, const gossip::relay_announce& msg)
        -> serializer&;
    auto operator>>(serializer& packet, gossip::relay_announce& msg)
        -> serializer&;

    auto operator<<(serializer& packet, const gossip::sync_request& msg)
        -> serializer&;
    auto operator>>(serializer& packet, gossip::sync_request& msg)
        -> serializer&;

    auto operator<<(serializer& packet, const gossip::sync_response& msg)
        -> serializer&;
    auto operator>>(serializer& packet, gossip::sync_response& msg)
        -> serializer&;

    /// Serializes the tips followed by the depth.
    auto operator<<(serializer& packet, const gossip::tip_announce& msg)
        -> serializer&;
    auto operator>>(serializer& packet, gossip::tip_announce& msg)
        -> serializer&;

    auto operator<<(serializer& packet, const gossip::ping& msg)
        -> serializer&;
    auto operator>>(serializer& packet, gossip::ping& msg) -> serializer&;

    auto operator<<(serializer& packet, const gossip::pong& msg)
        -> serializer&;
    auto operator>>(serializer& packet, gossip::pong& msg) -> serializer&;
}

#endif // RHIZA_SRC_GOSSIP_MESSAGES_H_
