// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Copyright (c) 2026 The Rhiza developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef RHIZA_SRC_TRANSACTION_VALIDATION_H_
#define RHIZA_SRC_TRANSACTION_VALIDATION_H_

#include "dag/ledger/ledger.hpp"
#include "transaction.hpp"

#include <optional>
#include <string>

namespace rhiza::transaction::validation {
    /// Reasons a transaction can be refused admission.
    enum class tx_error_code : uint8_t {
        /// The stored id does not match the payload.
        invalid_id,
        /// The signature does not verify against the sender key.
        invalid_signature,
        /// The sender cannot cover amount plus fee. See \ref balance_error.
        insufficient_balance,
        /// A transfer moves zero units.
        zero_amount,
        /// The amount, or amount plus fee, is larger than the maximum
        /// supply.
        exceeds_max_supply,
        /// A parent is not in the ledger, or a genesis parent is not zero.
        parent_not_found,
        /// Reserved. Identical parents are legal when only one tip exists.
        self_reference,
        /// A relay reward pays someone else or exceeds the base reward.
        invalid_relay_reward,
        /// Reserved. Timestamps are not checked so validation stays a pure
        /// function of the transaction and the ledger.
        invalid_timestamp,
        /// Founder allocations are only created by genesis initialization.
        unauthorized_allocation,
        /// The type tag names no known transaction type.
        unknown_type
    };

    /// Balance details for insufficient_balance.
    struct balance_error {
        /// Current balance of the sender.
        uint64_t m_have{};
        /// Amount plus fee.
        uint64_t m_need{};

        auto operator==(const balance_error& rhs) const -> bool;
    };

    /// Error returned by \ref check_tx.
    struct tx_error {
        tx_error_code m_code{};
        /// Set only for insufficient_balance.
        std::optional<balance_error> m_balance{};

        auto operator==(const tx_error& rhs) const -> bool;
    };

    /// \brief Checks whether a transaction may be admitted to the ledger.
    ///
    /// Checks the id, then the signature, then the rules for the
    /// transaction's type, and reports the first failure. Does not modify
    /// the ledger.
    /// \param tx transaction to check.
    /// \param l ledger to check parents and balances against.
    /// \return std::nullopt if the transaction is admissible.
    auto check_tx(const signed_tx& tx, const dag::ledger& l)
        -> std::optional<tx_error>;

    /// Checks that the transaction id matches its payload.
    auto check_id(const signed_tx& tx) -> std::optional<tx_error>;

    /// Checks the sender's signature over the canonical payload.
    auto check_signature(const signed_tx& tx) -> std::optional<tx_error>;

    /// Genesis rules: no genesis stored yet, both parents zero.
    auto check_genesis(const tx_payload& payload, const dag::ledger& l)
        -> std::optional<tx_error>;

    /// Transfer rules: non-zero amount within supply, known parents and a
    /// sufficient sender balance.
    auto check_transfer(const tx_payload& payload, const dag::ledger& l)
        -> std::optional<tx_error>;

    /// Relay reward rules: paid to the relayer itself, known parents and
    /// no more than config::base_relay_reward.
    auto check_relay_reward(const tx_payload& payload, const dag::ledger& l)
        -> std::optional<tx_error>;

    /// Checks that both parents are stored in the ledger.
    auto check_parents(const tx_payload& payload, const dag::ledger& l)
        -> std::optional<tx_error>;

    auto to_string(tx_error_code code) -> std::string;

    /// Returns a human readable description of the error, including the
    /// balance figures where present.
    auto to_string(const tx_error& err) -> std::string;
}

#endif // RHIZA_SRC_TRANSACTION_VALIDATION_H_
