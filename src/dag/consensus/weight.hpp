// Copyright (c) 2026 The Rhiza developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef RHIZA_SRC_CONSENSUS_WEIGHT_H_
#define RHIZA_SRC_CONSENSUS_WEIGHT_H_

#include "dag/ledger/ledger.hpp"


namespace rhiza::consensus {
    /// Map from transaction id to cumulative weight.
    using weight_map = hash_map<uint64_t>;

    /// \brief Recomputes every cumulative weight from scratch.
    ///
    /// Starts every vertex at one, then walks the ancestors of each vertex
    /// and increments each ancestor once per source vertex. Quadratic in the
    /// worst case. The result must equal the weights the ledger maintains
    /// incrementally.
    /// \param l ledger to audit.
    /// \return weight of every stored vertex.
    auto calculate_all_weights(const dag::ledger& l) -> weight_map;

    /// Returns weight / config::finality_threshold, capped at 1.0.
    auto confirmation_score(uint64_t weight) -> double;
}

#endif // RHIZA_SRC_CONSENSUS_WEIGHT_H_
