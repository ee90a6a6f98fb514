// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Copyright (c) 2026 The Rhiza developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "validation.hpp"

#include <limits>
#include <memory>
#include <secp256k1.h>
#include <tuple>

namespace rhiza::transaction::validation {
    using secp256k1_context_destroy_type = void (*)(secp256k1_context*);

    std::unique_ptr<secp256k1_context, secp256k1_context_destroy_type>
        secp_context{secp256k1_context_create(SECP256K1_CONTEXT_NONE),
                     &secp256k1_context_destroy};

    auto balance_error::operator==(const balance_error& rhs) const -> bool {
        return std::tie(m_have, m_need) == std::tie(rhs.m_have, rhs.m_need);
    }

    auto tx_error::operator==(const tx_error& rhs) const -> bool {
        return std::tie(m_code, m_balance)
            == std::tie(rhs.m_code, rhs.m_balance);
    }

    auto check_tx(const signed_tx& tx, const dag::ledger& l)
        -> std::optional<tx_error> {
        const auto id_err = check_id(tx);
        if(id_err) {
            return id_err;
        }

        const auto sig_err = check_signature(tx);
        if(sig_err) {
            return sig_err;
        }

        const auto& payload = tx.m_payload;
        switch(payload.m_type) {
            case tx_type::genesis:
                return check_genesis(payload, l);
            case tx_type::transfer:
                return check_transfer(payload, l);
            case tx_type::relay_reward:
                return check_relay_reward(payload, l);
            case tx_type::founder_allocation:
                return tx_error{tx_error_code::unauthorized_allocation};
        }

        return tx_error{tx_error_code::unknown_type};
    }

    auto check_id(const signed_tx& tx) -> std::optional<tx_error> {
        if(!verify_id(tx)) {
            return tx_error{tx_error_code::invalid_id};
        }
        return std::nullopt;
    }

    auto check_signature(const signed_tx& tx) -> std::optional<tx_error> {
        if(!verify_signature(secp_context.get(), tx)) {
            return tx_error{tx_error_code::invalid_signature};
        }
        return std::nullopt;
    }

    auto check_genesis(const tx_payload& payload, const dag::ledger& l)
        -> std::optional<tx_error> {
        if(l.genesis_id().has_value()) {
            return tx_error{tx_error_code::invalid_id};
        }
        if(!is_genesis_shaped(payload)) {
            return tx_error{tx_error_code::parent_not_found};
        }
        return std::nullopt;
    }

    auto check_transfer(const tx_payload& payload, const dag::ledger& l)
        -> std::optional<tx_error> {
        if(payload.m_amount == 0) {
            return tx_error{tx_error_code::zero_amount};
        }
        if(payload.m_amount > config::max_supply) {
            return tx_error{tx_error_code::exceeds_max_supply};
        }

        const auto parent_err = check_parents(payload, l);
        if(parent_err) {
            return parent_err;
        }

        if(payload.m_fee
           > std::numeric_limits<uint64_t>::max() - payload.m_amount) {
            return tx_error{tx_error_code::exceeds_max_supply};
        }
        const auto need = payload.m_amount + payload.m_fee;
        const auto have = l.get_balance(payload.m_sender);
        if(have < need) {
            return tx_error{tx_error_code::insufficient_balance,
                            balance_error{have, need}};
        }

        return std::nullopt;
    }

    auto check_relay_reward(const tx_payload& payload, const dag::ledger& l)
        -> std::optional<tx_error> {
        if(payload.m_sender != payload.m_recipient) {
            return tx_error{tx_error_code::invalid_relay_reward};
        }

        const auto parent_err = check_parents(payload, l);
        if(parent_err) {
            return parent_err;
        }

        if(payload.m_amount > config::base_relay_reward) {
            return tx_error{tx_error_code::invalid_relay_reward};
        }

        return std::nullopt;
    }

    auto check_parents(const tx_payload& payload, const dag::ledger& l)
        -> std::optional<tx_error> {
        for(const auto& parent : payload.m_parents) {
            if(!l.contains(parent)) {
                return tx_error{tx_error_code::parent_not_found};
            }
        }
        return std::nullopt;
    }

    auto to_string(tx_error_code code) -> std::string {
        switch(code) {
            case tx_error_code::invalid_id:
                return "Invalid transaction ID";
            case tx_error_code::invalid_signature:
                return "Invalid signature";
            case tx_error_code::insufficient_balance:
                return "Insufficient balance";
            case tx_error_code::zero_amount:
                return "Zero amount";
            case tx_error_code::exceeds_max_supply:
                return "Amount exceeds max supply";
            case tx_error_code::parent_not_found:
                return "Parent transaction not found";
            case tx_error_code::self_reference:
                return "Self reference";
            case tx_error_code::invalid_relay_reward:
                return "Invalid relay reward";
            case tx_error_code::invalid_timestamp:
                return "Invalid timestamp";
            case tx_error_code::unauthorized_allocation:
                return "Founder allocation outside genesis initialization";
            case tx_error_code::unknown_type:
                return "Unknown transaction type";
        }
        return "Unknown error";
    }

    auto to_string(const tx_error& err) -> std::string {
        auto ret = to_string(err.m_code);
        if(err.m_balance.has_value()) {
            ret += ": have " + std::to_string(err.m_balance->m_have)
                 + ", need " + std::to_string(err.m_balance->m_need);
        }
        return ret;
    }
}
