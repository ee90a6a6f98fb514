// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Copyright (c) 2026 The Rhiza developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef RHIZA_SRC_TRANSACTION_MESSAGES_H_
#define RHIZA_SRC_TRANSACTION_MESSAGES_H_

#include "transaction.hpp"
#include "util/serialization/format.hpp"
#include "util/serialization/serializer.hpp"

namespace rhiza {
    /// \brief Serializes a transaction payload in canonical form.
    ///
    /// Serializes the type tag as one byte, both parent digests, the sender
    /// and recipient keys, then amount, fee, timestamp and nonce as 8-byte
    /// integers, and finally the memo as a presence flag followed by a
    /// length-prefixed string. Transaction ids and signatures are computed
    /// over exactly these bytes.
    /// \see \ref rhiza::operator<<(serializer&, const std::array<T, N>&)
    /// \see \ref rhiza::operator<<(serializer&, const std::optional<T>&)
    auto operator<<(serializer& packet, const transaction::tx_payload& tx)
        -> serializer&;

    /// Deserializes a transaction payload. The type tag is not
    /// range-checked.
    /// \see \ref rhiza::operator<<(serializer&, const transaction::tx_payload&)
    auto operator>>(serializer& packet, transaction::tx_payload& tx)
        -> serializer&;

    /// \brief Serializes a signed transaction.
    ///
    /// Serializes the id, then the payload, then the signature.
    auto operator<<(serializer& packet, const transaction::signed_tx& tx)
        -> serializer&;

    /// Deserializes a signed transaction.
    /// \see \ref rhiza::operator<<(serializer&, const transaction::signed_tx&)
    auto operator>>(serializer& packet, transaction::signed_tx& tx)
        -> serializer&;
}

#endif // RHIZA_SRC_TRANSACTION_MESSAGES_H_
