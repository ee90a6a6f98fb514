// Copyright (c) 2026 The Rhiza developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "finality.hpp"

#include <tuple>

namespace rhiza::consensus {
    auto finality_status::operator==(const finality_status& rhs) const
        -> bool {
        return std::tie(m_state, m_weight, m_needed)
            == std::tie(rhs.m_state, rhs.m_weight, rhs.m_needed);
    }

    auto is_final(const dag::ledger& l, const hash_t& id) -> bool {
        const auto& vertices = l.vertices();
        auto it = vertices.find(id);
        if(it == vertices.end()) {
            return false;
        }
        return it->second.m_cumulative_weight >= config::finality_threshold;
    }

    auto get_finality_status(const dag::ledger& l, const hash_t& id)
        -> finality_status {
        const auto& vertices = l.vertices();
        auto it = vertices.find(id);
        if(it == vertices.end()) {
            return {finality_state::unknown, 0, 0};
        }

        const auto weight = it->second.m_cumulative_weight;
        if(weight >= config::finality_threshold) {
            return {finality_state::final, 0, 0};
        }
        if(weight > 1) {
            return {finality_state::confirming,
                    weight,
                    config::finality_threshold};
        }
        return {finality_state::pending, 0, 0};
    }

    auto get_final_transactions(const dag::ledger& l)
        -> hash_set {
        auto ret = hash_set();
        for(const auto& [id, v] : l.vertices()) {
            if(v.m_cumulative_weight >= config::finality_threshold) {
                ret.insert(id);
            }
        }
        return ret;
    }

    auto to_string(const finality_status& status) -> std::string {
        switch(status.m_state) {
            case finality_state::unknown:
                return "Unknown";
            case finality_state::pending:
                return "Pending";
            case finality_state::confirming:
                return "Confirming (" + std::to_string(status.m_weight) + "/"
                     + std::to_string(status.m_needed) + ")";
            case finality_state::final:
                return "Final";
        }
        return "Unknown";
    }
}
