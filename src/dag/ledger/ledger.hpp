// Copyright (c) 2026 The Rhiza developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef RHIZA_SRC_LEDGER_LEDGER_H_
#define RHIZA_SRC_LEDGER_LEDGER_H_

#include "util/common/hashmap.hpp"
#include "vertex.hpp"

#include <optional>
#include <string>
#include <vector>

namespace rhiza::dag {
    /// Reasons the ledger can refuse a vertex.
    enum class ledger_error_code : uint8_t {
        /// A vertex with the same id is already stored.
        duplicate_transaction,
        /// A parent of the vertex is not stored.
        missing_parent,
        /// A second genesis-shaped vertex was offered.
        invalid_transaction
    };

    /// Error returned by \ref ledger::insert.
    struct ledger_error {
        ledger_error_code m_code{};
        /// The first absent parent, set for missing_parent.
        std::optional<hash_t> m_parent{};

        auto operator==(const ledger_error& rhs) const -> bool;
    };

    /// Returns a human readable description of a ledger error.
    auto to_string(const ledger_error& err) -> std::string;

    /// \brief Append-only DAG of transactions.
    ///
    /// Owns every vertex keyed by transaction id, the reverse adjacency
    /// from each vertex to its children, the set of tips and a per-key
    /// balance index. Vertices are never removed. Inserting a vertex
    /// increments the cumulative weight of each of its distinct ancestors
    /// exactly once and marks ancestors final when they reach
    /// config::finality_threshold.
    ///
    /// The ledger does not validate transactions. Callers run
    /// transaction::validation::check_tx first.
    ///
    /// \warning Not thread-safe. Use through node::node, which serializes
    ///          access, or from a single thread.
    class ledger {
      public:
        /// Map from transaction id to vertex.
        using vertex_map = hash_map<vertex>;

        /// Stores a vertex and updates tips, adjacency, balances and
        /// ancestor weights. A vertex whose two parents are both zero is
        /// treated as genesis. On failure nothing is modified.
        /// \param v vertex to insert.
        /// \return std::nullopt on success, or the reason the vertex was
        ///         refused.
        auto insert(vertex v) -> std::optional<ledger_error>;

        /// Returns a copy of the vertex with the given id.
        /// \param id transaction id.
        /// \return the vertex, or std::nullopt if not stored.
        [[nodiscard]] auto get(const hash_t& id) const
            -> std::optional<vertex>;

        /// Returns true if a vertex with the given id is stored.
        [[nodiscard]] auto contains(const hash_t& id) const -> bool;

        /// Returns the ids of the vertices that name the given vertex as a
        /// parent, in insertion order.
        [[nodiscard]] auto children(const hash_t& id) const
            -> std::vector<hash_t>;

        /// Returns the ids not yet referenced as a parent, oldest first.
        [[nodiscard]] auto tips() const -> const std::vector<hash_t>&;

        /// \brief Chooses two parents for a new transaction.
        ///
        /// Returns the zero pair when the ledger is empty and the single
        /// tip twice when only one exists. Otherwise returns the two tips
        /// with the greatest depth. Tips of equal depth are ordered by
        /// their position in tips(), oldest first.
        /// \return parent pair.
        [[nodiscard]] auto select_parents() const -> transaction::parents_t;

        /// \brief Returns the spendable balance of a key.
        ///
        /// Credits every amount received by the key and debits amount plus
        /// fee of every transaction the key sent to another key. A negative
        /// result is reported as zero. Served from the incremental index.
        /// \param key public key.
        /// \return balance in units.
        [[nodiscard]] auto get_balance(const pubkey_t& key) const
            -> uint64_t;

        /// Computes the same value as get_balance by scanning every stored
        /// transaction. Used to audit the index.
        [[nodiscard]] auto scan_balance(const pubkey_t& key) const
            -> uint64_t;

        /// Returns the greatest depth of any stored vertex, or zero when the
        /// ledger is empty.
        [[nodiscard]] auto depth() const -> uint64_t;

        /// Returns the number of stored vertices.
        [[nodiscard]] auto size() const -> size_t;

        [[nodiscard]] auto empty() const -> bool;

        /// Returns every stored id in insertion order.
        [[nodiscard]] auto transaction_ids() const
            -> const std::vector<hash_t>&;

        /// Returns the id of the genesis vertex, if one was inserted.
        [[nodiscard]] auto genesis_id() const -> std::optional<hash_t>;

        /// Returns all stored vertices.
        [[nodiscard]] auto vertices() const -> const vertex_map&;

      private:
        /// Running totals for one key. Additions saturate so the index
        /// and the scan agree even on inputs the validator would refuse.
        struct balance_entry {
            uint64_t m_credits{0};
            uint64_t m_debits{0};
        };

        void apply_balance(const transaction::tx_payload& payload);
        void propagate_weight(const vertex& v);

        static auto saturating_add(uint64_t a, uint64_t b) -> uint64_t;
        static auto net(const balance_entry& entry) -> uint64_t;

        vertex_map m_vertices;
        hash_map<std::vector<hash_t>> m_children;
        std::vector<hash_t> m_tips;
        std::vector<hash_t> m_order;
        hash_map<balance_entry> m_balances;
        std::optional<hash_t> m_genesis_id;
        uint64_t m_max_depth{0};
    };
}

#endif // RHIZA_SRC_LEDGER_LEDGER_H_
