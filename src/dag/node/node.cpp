// Copyright (c) 2026 The Rhiza developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "node.hpp"

#include "dag/wallet/address.hpp"
#include "util/common/random_source.hpp"
#include "util/common/variant_overloaded.hpp"

#include <algorithm>
#include <stdexcept>

namespace rhiza::node {
    namespace {
        auto load_keys(const config::options& opts, secp256k1_context* ctx)
            -> key_pair {
            if(opts.m_node_private_key.has_value()) {
                const auto& priv = opts.m_node_private_key.value();
                if(!is_valid_privkey(priv, ctx)) {
                    throw std::invalid_argument(
                        "Node private key is not a valid secp256k1 scalar");
                }
                return key_pair(priv, ctx);
            }
            auto rnd = random_source(config::random_source);
            return key_pair::generate(rnd, ctx);
        }
    }

    auto to_string(const node_error& err) -> std::string {
        return std::visit(
            overloaded{[](const transaction::validation::tx_error& e) {
                           return "Validation failed: "
                                + transaction::validation::to_string(e);
                       },
                       [](const dag::ledger_error& e) {
                           return "Ledger refused transaction: "
                                + dag::to_string(e);
                       },
                       [](node_error_code code) {
                           switch(code) {
                               case node_error_code::no_reward_available:
                                   return std::string(
                                       "No relay reward available");
                           }
                           return std::string("Unknown node error");
                       }},
            err);
    }

    node::node(config::options opts, std::shared_ptr<logging::log> log)
        : m_opts(std::move(opts)),
          m_log(std::move(log)),
          m_keys(load_keys(m_opts, m_secp.get())) {
        m_log->set_tag(m_opts.m_node_name);
        m_log->info("Node key",
                    rhiza::to_string(m_keys.pubkey()),
                    "address",
                    wallet::encode_address(m_keys.pubkey()));
    }

    auto node::initialize_genesis() -> bool {
        std::unique_lock<std::mutex> l(m_mut);
        if(!m_ledger.empty()) {
            m_log->warn("Ledger already initialized, skipping genesis");
            return false;
        }

        auto genesis = transaction::make_genesis(m_secp.get(), m_keys);
        const auto genesis_id = genesis.m_id;
        auto err = m_ledger.insert(dag::vertex(std::move(genesis), 0));
        if(err) {
            m_log->error("Failed to insert genesis:", dag::to_string(*err));
            return false;
        }
        m_log->info("Created genesis", rhiza::to_string(genesis_id));
        m_nonce = 1;

        if(!m_opts.m_founder_public_key.has_value()) {
            m_log->info("No founder key configured, skipping allocation");
            return true;
        }

        auto founder_tx = transaction::make_founder_allocation(
            m_secp.get(),
            m_keys,
            m_opts.m_founder_public_key.value(),
            genesis_id);
        const auto founder_id = founder_tx.m_id;
        err = m_ledger.insert(dag::vertex(std::move(founder_tx), 1));
        if(err) {
            m_log->error("Failed to insert founder allocation:",
                         dag::to_string(*err));
            return true;
        }
        m_nonce = 2;
        m_log->info("Created founder allocation",
                    rhiza::to_string(founder_id),
                    "of",
                    config::founder_allocation,
                    "units");
        return true;
    }

    auto node::admit(const transaction::signed_tx& tx)
        -> std::optional<node_error> {
        const auto tx_err = transaction::validation::check_tx(tx, m_ledger);
        if(tx_err) {
            m_log->warn("Rejected transaction",
                        rhiza::to_string(tx.m_id),
                        "-",
                        transaction::validation::to_string(*tx_err));
            return *tx_err;
        }

        const auto depth = m_ledger.depth() + 1;
        const auto ledger_err = m_ledger.insert(dag::vertex(tx, depth));
        if(ledger_err) {
            m_log->warn("Ledger refused transaction",
                        rhiza::to_string(tx.m_id),
                        "-",
                        dag::to_string(*ledger_err));
            return *ledger_err;
        }

        m_log->debug("Admitted",
                     transaction::to_string(tx.m_payload.m_type),
                     rhiza::to_string(tx.m_id),
                     "at depth",
                     depth);
        return std::nullopt;
    }

    auto node::admit_and_relay(const transaction::signed_tx& tx)
        -> std::optional<node_error> {
        auto err = admit(tx);
        if(err) {
            return err;
        }

        const auto reward = m_relays.record_relay(m_keys.pubkey());
        m_unclaimed += reward;
        if(reward > 0) {
            m_log->info("Relay reward earned:", reward, "units");
        }
        return std::nullopt;
    }

    auto node::process_transaction(const transaction::signed_tx& tx)
        -> std::optional<node_error> {
        std::unique_lock<std::mutex> l(m_mut);
        return admit_and_relay(tx);
    }

    auto node::next_nonce() -> uint64_t {
        return m_nonce++;
    }

    auto node::send(const pubkey_t& recipient, uint64_t amount)
        -> std::variant<transaction::signed_tx, node_error> {
        std::unique_lock<std::mutex> l(m_mut);
        auto tx = transaction::make_transfer(m_secp.get(),
                                             m_keys,
                                             recipient,
                                             amount,
                                             m_ledger.select_parents(),
                                             next_nonce());
        auto err = admit(tx);
        if(err) {
            return *err;
        }
        m_log->info("Sent",
                    amount,
                    "units to",
                    wallet::encode_address(recipient));
        return tx;
    }

    auto node::claim_relay_reward()
        -> std::variant<transaction::signed_tx, node_error> {
        std::unique_lock<std::mutex> l(m_mut);
        if(m_unclaimed == 0) {
            return node_error_code::no_reward_available;
        }

        const auto amount = std::min(m_unclaimed, config::base_relay_reward);
        auto tx = transaction::make_relay_reward(m_secp.get(),
                                                 m_keys,
                                                 amount,
                                                 m_ledger.select_parents(),
                                                 next_nonce());
        auto err = admit(tx);
        if(err) {
            return *err;
        }
        m_unclaimed -= amount;
        m_log->info("Claimed relay reward of", amount, "units");
        return tx;
    }

    auto node::announce_relay(const hash_t& tx_id, uint8_t hop_count)
        -> gossip::relay_announce {
        std::unique_lock<std::mutex> l(m_mut);
        return gossip::relay_announce{
            consensus::make_relay_proof(m_secp.get(),
                                        m_keys,
                                        tx_id,
                                        hop_count,
                                        transaction::now_ms())};
    }

    auto node::handle_message(const gossip::message& msg)
        -> std::optional<gossip::message> {
        std::unique_lock<std::mutex> l(m_mut);
        m_log->trace("Received", gossip::type_name(msg));
        return std::visit(
            overloaded{
                [&](const gossip::new_transaction& m)
                    -> std::optional<gossip::message> {
                    static_cast<void>(admit_and_relay(m.m_tx));
                    return std::nullopt;
                },
                [&](const gossip::relay_announce& m)
                    -> std::optional<gossip::message> {
                    if(!consensus::verify_relay_proof(m_secp.get(),
                                                      m.m_proof)) {
                        m_log->warn("Invalid relay proof for",
                                    rhiza::to_string(m.m_proof.m_tx_id));
                        return std::nullopt;
                    }
                    m_log->debug("Peer relayed",
                                 rhiza::to_string(m.m_proof.m_tx_id),
                                 "hop",
                                 static_cast<int>(m.m_proof.m_hop_count));
                    return std::nullopt;
                },
                [&](const gossip::sync_request& m)
                    -> std::optional<gossip::message> {
                    auto resp = gossip::sync_response();
                    for(const auto& id : m.m_missing) {
                        auto v = m_ledger.get(id);
                        if(v.has_value()) {
                            resp.m_transactions.push_back(
                                std::move(v->m_tx));
                        }
                    }
                    return resp;
                },
                [&](const gossip::sync_response& m)
                    -> std::optional<gossip::message> {
                    for(const auto& tx : m.m_transactions) {
                        if(m_ledger.contains(tx.m_id)) {
                            continue;
                        }
                        static_cast<void>(admit_and_relay(tx));
                    }
                    return std::nullopt;
                },
                [&](const gossip::tip_announce& m)
                    -> std::optional<gossip::message> {
                    m_log->debug("Peer announced",
                                 m.m_tips.size(),
                                 "tips at depth",
                                 m.m_depth);
                    return std::nullopt;
                },
                [&](const gossip::ping& m) -> std::optional<gossip::message> {
                    return gossip::pong{m.m_timestamp};
                },
                [&](const gossip::pong& m) -> std::optional<gossip::message> {
                    m_log->trace("Pong", m.m_timestamp);
                    return std::nullopt;
                }},
            msg);
    }

    auto node::balance() const -> uint64_t {
        std::unique_lock<std::mutex> l(m_mut);
        return m_ledger.get_balance(m_keys.pubkey());
    }

    auto node::balance_of(const pubkey_t& key) const -> uint64_t {
        std::unique_lock<std::mutex> l(m_mut);
        return m_ledger.get_balance(key);
    }

    auto node::address() const -> std::string {
        return wallet::encode_address(m_keys.pubkey());
    }

    auto node::pubkey() const -> const pubkey_t& {
        return m_keys.pubkey();
    }

    auto node::finality(const hash_t& id) const
        -> consensus::finality_status {
        std::unique_lock<std::mutex> l(m_mut);
        return consensus::get_finality_status(m_ledger, id);
    }

    auto node::tip_announcement() const -> gossip::tip_announce {
        std::unique_lock<std::mutex> l(m_mut);
        return gossip::tip_announce{m_ledger.tips(), m_ledger.depth()};
    }

    auto node::unclaimed_rewards() const -> uint64_t {
        std::unique_lock<std::mutex> l(m_mut);
        return m_unclaimed;
    }

    auto node::relay_count() const -> uint64_t {
        std::unique_lock<std::mutex> l(m_mut);
        return m_relays.get_relay_count(m_keys.pubkey());
    }

    auto node::snapshot() const -> dag::ledger {
        std::unique_lock<std::mutex> l(m_mut);
        return m_ledger;
    }
}
