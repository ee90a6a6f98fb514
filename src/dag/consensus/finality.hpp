// Copyright (c) 2026 The Rhiza developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef RHIZA_SRC_CONSENSUS_FINALITY_H_
#define RHIZA_SRC_CONSENSUS_FINALITY_H_

#include "dag/ledger/ledger.hpp"

#include <string>

namespace rhiza::consensus {
    /// Confirmation stage of a transaction.
    enum class finality_state : uint8_t {
        /// Not in the ledger.
        unknown,
        /// Stored, with no descendants yet.
        pending,
        /// Has descendants but has not reached the threshold.
        confirming,
        /// Reached config::finality_threshold. Irreversible.
        final
    };

    /// Finality of one transaction. Weight and needed are only meaningful
    /// while confirming.
    struct finality_status {
        finality_state m_state{finality_state::unknown};
        uint64_t m_weight{0};
        uint64_t m_needed{0};

        auto operator==(const finality_status& rhs) const -> bool;
    };

    /// Returns true if the transaction is stored and its cumulative weight
    /// has reached the finality threshold.
    auto is_final(const dag::ledger& l, const hash_t& id) -> bool;

    /// Classifies a transaction by its cumulative weight.
    /// \param l ledger to inspect.
    /// \param id transaction id.
    /// \return the transaction's finality status.
    auto get_finality_status(const dag::ledger& l, const hash_t& id)
        -> finality_status;

    /// Returns the ids of every final transaction.
    auto get_final_transactions(const dag::ledger& l)
        -> hash_set;

    /// Renders the status as Unknown, Pending, Confirming (w/n) or Final.
    auto to_string(const finality_status& status) -> std::string;
}

#endif // RHIZA_SRC_CONSENSUS_FINALITY_H_
