// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Copyright (c) 2026 The Rhiza developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "messages.hpp"

namespace rhiza {
    auto operator<<(serializer& packet, const transaction::tx_payload& tx)
        -> serializer& {
        return packet << tx.m_type << tx.m_parents[0] << tx.m_parents[1]
                      << tx.m_sender << tx.m_recipient << tx.m_amount
                      << tx.m_fee << tx.m_timestamp << tx.m_nonce
                      << tx.m_memo;
    }

    auto operator>>(serializer& packet, transaction::tx_payload& tx)
        -> serializer& {
        return packet >> tx.m_type >> tx.m_parents[0] >> tx.m_parents[1]
            >> tx.m_sender >> tx.m_recipient >> tx.m_amount >> tx.m_fee
            >> tx.m_timestamp >> tx.m_nonce >> tx.m_memo;
    }

    auto operator<<(serializer& packet, const transaction::signed_tx& tx)
        -> serializer& {
        return packet << tx.m_id << tx.m_payload << tx.m_signature;
    }

    auto operator>>(serializer& packet, transaction::signed_tx& tx)
        -> serializer& {
        return packet >> tx.m_id >> tx.m_payload >> tx.m_signature;
    }
}
