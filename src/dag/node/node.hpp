// Copyright (c) 2026 The Rhiza developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef RHIZA_SRC_NODE_NODE_H_
#define RHIZA_SRC_NODE_NODE_H_

#include "dag/consensus/finality.hpp"
#include "dag/consensus/relay.hpp"
#include "dag/gossip/messages.hpp"
#include "dag/ledger/ledger.hpp"
#include "dag/transaction/validation.hpp"
#include "util/common/config.hpp"
#include "util/common/logging.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <secp256k1.h>
#include <variant>

namespace rhiza::node {
    /// Node-level failures that are neither admission nor ledger errors.
    enum class node_error_code : uint8_t {
        /// No relay rewards have accrued since the last claim.
        no_reward_available
    };

    /// Any reason a node operation can fail.
    using node_error = std::variant<transaction::validation::tx_error,
                                    dag::ledger_error,
                                    node_error_code>;

    auto to_string(const node_error& err) -> std::string;

    /// \brief Single-writer context owning one node's ledger state.
    ///
    /// Owns the ledger, the relay tracker and the node's key pair. Every
    /// public method holds the node's mutex for exactly one logical
    /// operation, so admission checks and insertion happen atomically with
    /// respect to other callers. Readers that need a consistent view of
    /// several values use snapshot().
    class node {
      public:
        /// Constructor. Uses the configured private key, or generates one
        /// from config::random_source.
        /// \param opts node options.
        /// \param log log instance.
        /// \throws std::runtime_error if a key must be generated and the
        ///         entropy source cannot be read.
        /// \throws std::invalid_argument if the configured private key is
        ///         not a valid secp256k1 scalar.
        node(config::options opts, std::shared_ptr<logging::log> log);

        ~node() = default;

        node(const node&) = delete;
        auto operator=(const node&) -> node& = delete;
        node(node&&) = delete;
        auto operator=(node&&) -> node& = delete;

        /// \brief Creates genesis and, when a founder key is configured,
        ///        the founder allocation.
        ///
        /// Both are signed with the node's key and inserted directly,
        /// bypassing admission checks. Does nothing if the ledger is not
        /// empty.
        /// \return true if genesis was created.
        auto initialize_genesis() -> bool;

        /// Validates and inserts a transaction received from elsewhere,
        /// then counts a relay for this node.
        /// \param tx transaction to admit.
        /// \return std::nullopt on success, or why the transaction was
        ///         refused.
        auto process_transaction(const transaction::signed_tx& tx)
            -> std::optional<node_error>;

        /// Builds, signs and admits a transfer from this node's key.
        /// \param recipient receiving public key.
        /// \param amount units to send.
        /// \return the admitted transaction, or why it was refused.
        auto send(const pubkey_t& recipient, uint64_t amount)
            -> std::variant<transaction::signed_tx, node_error>;

        /// \brief Claims relay rewards accrued by processing transactions.
        ///
        /// Pays at most config::base_relay_reward per claim. Any remainder
        /// stays claimable.
        /// \return the admitted reward transaction, or why no reward was
        ///         paid.
        auto claim_relay_reward()
            -> std::variant<transaction::signed_tx, node_error>;

        /// Signs a relay proof for a transaction this node forwards.
        /// \param tx_id forwarded transaction.
        /// \param hop_count hops from the originating node.
        /// \return announcement to send to peers.
        auto announce_relay(const hash_t& tx_id, uint8_t hop_count)
            -> gossip::relay_announce;

        /// \brief Handles one decoded gossip message.
        ///
        /// Admits transactions from NewTransaction and SyncResponse,
        /// verifies RelayAnnounce proofs, answers SyncRequest and Ping.
        /// TipAnnounce and Pong are only logged.
        /// \param msg message from a peer.
        /// \return reply to send back, if any.
        auto handle_message(const gossip::message& msg)
            -> std::optional<gossip::message>;

        /// Returns the spendable balance of this node's key.
        [[nodiscard]] auto balance() const -> uint64_t;

        /// Returns the spendable balance of any key.
        [[nodiscard]] auto balance_of(const pubkey_t& key) const -> uint64_t;

        /// Returns this node's bech32 address.
        [[nodiscard]] auto address() const -> std::string;

        [[nodiscard]] auto pubkey() const -> const pubkey_t&;

        /// Returns the finality of a transaction.
        [[nodiscard]] auto finality(const hash_t& id) const
            -> consensus::finality_status;

        /// Returns the current tips and depth, ready to announce.
        [[nodiscard]] auto tip_announcement() const -> gossip::tip_announce;

        /// Returns rewards issued for this node's relays and not yet
        /// claimed.
        [[nodiscard]] auto unclaimed_rewards() const -> uint64_t;

        /// Returns the number of relays counted for this node.
        [[nodiscard]] auto relay_count() const -> uint64_t;

        /// Returns a copy of the ledger taken under the node's lock.
        [[nodiscard]] auto snapshot() const -> dag::ledger;

      private:
        auto admit(const transaction::signed_tx& tx)
            -> std::optional<node_error>;
        auto admit_and_relay(const transaction::signed_tx& tx)
            -> std::optional<node_error>;
        auto next_nonce() -> uint64_t;

        mutable std::mutex m_mut;
        config::options m_opts;
        std::shared_ptr<logging::log> m_log;

        std::unique_ptr<secp256k1_context,
                        decltype(&secp256k1_context_destroy)>
            m_secp{secp256k1_context_create(SECP256K1_CONTEXT_NONE),
                   &secp256k1_context_destroy};

        key_pair m_keys;
        dag::ledger m_ledger;
        consensus::relay_tracker m_relays;
        uint64_t m_unclaimed{0};
        uint64_t m_nonce{0};
    };
}

#endif // RHIZA_SRC_NODE_NODE_H_
