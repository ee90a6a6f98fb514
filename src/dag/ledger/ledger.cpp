// Copyright (c) 2026 The Rhiza developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "ledger.hpp"

#include <algorithm>
#include <cassert>
#include <limits>

namespace rhiza::dag {
    auto ledger_error::operator==(const ledger_error& rhs) const -> bool {
        return m_code == rhs.m_code && m_parent == rhs.m_parent;
    }

    auto to_string(const ledger_error& err) -> std::string {
        switch(err.m_code) {
            case ledger_error_code::duplicate_transaction:
                return "Duplicate transaction";
            case ledger_error_code::missing_parent:
                return "Missing parent "
                     + (err.m_parent ? rhiza::to_string(*err.m_parent)
                                     : std::string("(unknown)"));
            case ledger_error_code::invalid_transaction:
                return "Invalid transaction: genesis already exists";
        }
        return "Unknown ledger error";
    }

    auto ledger::insert(vertex v) -> std::optional<ledger_error> {
        const auto id = v.id();
        if(m_vertices.find(id) != m_vertices.end()) {
            return ledger_error{ledger_error_code::duplicate_transaction,
                                std::nullopt};
        }

        const auto is_genesis
            = transaction::is_genesis_shaped(v.m_tx.m_payload);
        if(is_genesis) {
            if(m_genesis_id.has_value()) {
                return ledger_error{ledger_error_code::invalid_transaction,
                                    std::nullopt};
            }
        } else {
            for(const auto& parent : v.parents()) {
                if(m_vertices.find(parent) == m_vertices.end()) {
                    return ledger_error{ledger_error_code::missing_parent,
                                        parent};
                }
            }
        }

        if(is_genesis) {
            m_genesis_id = id;
        } else {
            const auto& parents = v.parents();
            for(size_t i = 0; i < parents.size(); i++) {
                const auto& parent = parents[i];
                if(std::find(parents.begin(), parents.begin() + i, parent)
                   != parents.begin() + i) {
                    continue;
                }
                m_children[parent].push_back(id);
                m_tips.erase(std::remove(m_tips.begin(), m_tips.end(), parent),
                             m_tips.end());
            }
        }

        v.m_own_weight = 1;
        v.m_cumulative_weight = v.m_own_weight;
        v.m_final = false;

        m_tips.push_back(id);
        m_order.push_back(id);
        m_max_depth = std::max(m_max_depth, v.m_depth);
        apply_balance(v.m_tx.m_payload);

        auto it = m_vertices.emplace(id, std::move(v)).first;
        propagate_weight(it->second);

        return std::nullopt;
    }

    void ledger::propagate_weight(const vertex& v) {
        auto visited = hash_set();
        auto pending = std::vector<hash_t>();
        for(const auto& parent : v.parents()) {
            if(!is_zero(parent)) {
                pending.push_back(parent);
            }
        }

        while(!pending.empty()) {
            const auto id = pending.back();
            pending.pop_back();
            if(!visited.insert(id).second) {
                continue;
            }

            auto it = m_vertices.find(id);
            assert(it != m_vertices.end());
            if(it == m_vertices.end()) {
                continue;
            }

            auto& ancestor = it->second;
            ancestor.m_cumulative_weight++;
            if(ancestor.m_cumulative_weight >= config::finality_threshold) {
                ancestor.m_final = true;
            }

            for(const auto& parent : ancestor.parents()) {
                if(!is_zero(parent) && visited.count(parent) == 0) {
                    pending.push_back(parent);
                }
            }
        }
    }

    auto ledger::saturating_add(uint64_t a, uint64_t b) -> uint64_t {
        if(a > std::numeric_limits<uint64_t>::max() - b) {
            return std::numeric_limits<uint64_t>::max();
        }
        return a + b;
    }

    auto ledger::net(const balance_entry& entry) -> uint64_t {
        if(entry.m_debits >= entry.m_credits) {
            return 0;
        }
        return entry.m_credits - entry.m_debits;
    }

    void ledger::apply_balance(const transaction::tx_payload& payload) {
        auto& recipient = m_balances[payload.m_recipient];
        recipient.m_credits
            = saturating_add(recipient.m_credits, payload.m_amount);
        if(payload.m_sender != payload.m_recipient) {
            auto& sender = m_balances[payload.m_sender];
            sender.m_debits = saturating_add(
                sender.m_debits,
                saturating_add(payload.m_amount, payload.m_fee));
        }
    }

    auto ledger::get(const hash_t& id) const -> std::optional<vertex> {
        auto it = m_vertices.find(id);
        if(it == m_vertices.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    auto ledger::contains(const hash_t& id) const -> bool {
        return m_vertices.find(id) != m_vertices.end();
    }

    auto ledger::children(const hash_t& id) const -> std::vector<hash_t> {
        auto it = m_children.find(id);
        if(it == m_children.end()) {
            return {};
        }
        return it->second;
    }

    auto ledger::tips() const -> const std::vector<hash_t>& {
        return m_tips;
    }

    auto ledger::select_parents() const -> transaction::parents_t {
        if(m_tips.empty()) {
            return {hash_t{}, hash_t{}};
        }
        if(m_tips.size() == 1) {
            return {m_tips[0], m_tips[0]};
        }

        auto sorted = std::vector<std::pair<hash_t, uint64_t>>();
        sorted.reserve(m_tips.size());
        for(const auto& tip : m_tips) {
            sorted.emplace_back(tip, m_vertices.at(tip).m_depth);
        }
        std::stable_sort(sorted.begin(),
                         sorted.end(),
                         [](const auto& a, const auto& b) {
                             return a.second > b.second;
                         });
        return {sorted[0].first, sorted[1].first};
    }

    auto ledger::get_balance(const pubkey_t& key) const -> uint64_t {
        auto it = m_balances.find(key);
        if(it == m_balances.end()) {
            return 0;
        }
        return net(it->second);
    }

    auto ledger::scan_balance(const pubkey_t& key) const -> uint64_t {
        auto entry = balance_entry();
        for(const auto& [id, v] : m_vertices) {
            const auto& payload = v.m_tx.m_payload;
            if(payload.m_recipient == key) {
                entry.m_credits
                    = saturating_add(entry.m_credits, payload.m_amount);
            }
            if(payload.m_sender == key && payload.m_recipient != key) {
                entry.m_debits = saturating_add(
                    entry.m_debits,
                    saturating_add(payload.m_amount, payload.m_fee));
            }
        }
        return net(entry);
    }

    auto ledger::depth() const -> uint64_t {
        return m_max_depth;
    }

    auto ledger::size() const -> size_t {
        return m_vertices.size();
    }

    auto ledger::empty() const -> bool {
        return m_vertices.empty();
    }

    auto ledger::transaction_ids() const -> const std::vector<hash_t>& {
        return m_order;
    }

    auto ledger::genesis_id() const -> std::optional<hash_t> {
        return m_genesis_id;
    }

    auto ledger::vertices() const -> const vertex_map& {
        return m_vertices;
    }
}
