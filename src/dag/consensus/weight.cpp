// Copyright (c) 2026 The Rhiza developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "weight.hpp"

#include <algorithm>
#include <vector>

namespace rhiza::consensus {
    auto calculate_all_weights(const dag::ledger& l) -> weight_map {
        const auto& vertices = l.vertices();
        auto weights = weight_map();
        weights.reserve(vertices.size());
        for(const auto& [id, v] : vertices) {
            weights.emplace(id, 1);
        }

        for(const auto& [id, v] : vertices) {
            auto visited = hash_set();
            auto pending = std::vector<hash_t>(v.parents().begin(),
                                               v.parents().end());
            while(!pending.empty()) {
                const auto cur = pending.back();
                pending.pop_back();
                if(is_zero(cur) || !visited.insert(cur).second) {
                    continue;
                }

                auto it = vertices.find(cur);
                if(it == vertices.end()) {
                    continue;
                }
                weights[cur]++;
                for(const auto& parent : it->second.parents()) {
                    pending.push_back(parent);
                }
            }
        }

        return weights;
    }

    auto confirmation_score(uint64_t weight) -> double {
        return std::min(static_cast<double>(weight)
                            / static_cast<double>(config::finality_threshold),
                        1.0);
    }
}
