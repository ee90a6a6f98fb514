// Copyright (c) 2026 The Rhiza developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef RHIZA_SRC_LEDGER_VERTEX_H_
#define RHIZA_SRC_LEDGER_VERTEX_H_

#include "dag/transaction/transaction.hpp"

#include <cstdint>

namespace rhiza::dag {
    /// \brief A transaction together with its position and confirmation
    ///        state in the DAG.
    ///
    /// Cumulative weight starts at one for the vertex itself and grows by
    /// one for every distinct descendant inserted later.
    struct vertex {
        vertex() = default;

        /// Constructor.
        /// \param tx transaction held by the vertex.
        /// \param depth insertion-order depth hint, used only when selecting
        ///              parents.
        vertex(transaction::signed_tx tx, uint64_t depth);

        transaction::signed_tx m_tx;
        /// One plus the number of distinct descendants.
        uint64_t m_cumulative_weight{1};
        /// Weight contributed by this vertex alone. Always one.
        uint64_t m_own_weight{1};
        /// Set once the cumulative weight reaches the finality threshold.
        /// Never cleared.
        bool m_final{false};
        uint64_t m_depth{0};

        /// Returns the id of the held transaction.
        [[nodiscard]] auto id() const -> const hash_t&;

        /// Returns the parents of the held transaction.
        [[nodiscard]] auto parents() const -> const transaction::parents_t&;

        auto operator==(const vertex& rhs) const -> bool;
    };
}

#endif // RHIZA_SRC_LEDGER_VERTEX_H_
