// Copyright (c) 2026 The Rhiza developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "vertex.hpp"

#include <tuple>
#include <utility>

namespace rhiza::dag {
    vertex::vertex(transaction::signed_tx tx, uint64_t depth)
        : m_tx(std::move(tx)),
          m_depth(depth) {}

    auto vertex::id() const -> const hash_t& {
        return m_tx.m_id;
    }

    auto vertex::parents() const -> const transaction::parents_t& {
        return m_tx.m_payload.m_parents;
    }

    auto vertex::operator==(const vertex& rhs) const -> bool {
        return std::tie(m_tx,
                        m_cumulative_weight,
                        m_own_weight,
                        m_final,
                        m_depth)
            == std::tie(rhs.m_tx,
                        rhs.m_cumulative_weight,
                        rhs.m_own_weight,
                        rhs.m_final,
                        rhs.m_depth);
    }
}
