// Copyright (c) 2026 The Rhiza developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "messages.hpp"

#include "util/common/variant_overloaded.hpp"
#include "util/serialization/buffer_serializer.hpp"
#include "util/serialization/util.hpp"

#include <tuple>

namespace rhiza::gossip {
    namespace {
        auto is_known_type(transaction::tx_type type) -> bool {
            switch(type) {
                case transaction::tx_type::transfer:
                case transaction::tx_type::genesis:
                case transaction::tx_type::relay_reward:
                case transaction::tx_type::founder_allocation:
                    return true;
            }
            return false;
        }

        auto check_types(const message& msg) -> std::optional<gossip_error> {
            auto check = [](const transaction::signed_tx& tx)
                -> std::optional<gossip_error> {
                if(!is_known_type(tx.m_payload.m_type)) {
                    return gossip_error{
                        gossip_error_code::invalid_message,
                        "unknown transaction type "
                            + std::to_string(static_cast<unsigned>(
                                tx.m_payload.m_type))
                            + " in " + rhiza::to_string(tx.m_id)};
                }
                return std::nullopt;
            };

            return std::visit(
                overloaded{[&](const new_transaction& m) {
                               return check(m.m_tx);
                           },
                           [&](const sync_response& m) {
                               for(const auto& tx : m.m_transactions) {
                                   auto err = check(tx);
                                   if(err) {
                                       return err;
                                   }
                               }
                               return std::optional<gossip_error>();
                           },
                           [](const auto& /* m */) {
                               return std::optional<gossip_error>();
                           }},
                msg);
        }
    }

    auto new_transaction::operator==(const new_transaction& rhs) const
        -> bool {
        return m_tx == rhs.m_tx;
    }

    auto relay_announce::operator==(const relay_announce& rhs) const -> bool {
        return m_proof == rhs.m_proof;
    }

    auto sync_request::operator==(const sync_request& rhs) const -> bool {
        return m_missing == rhs.m_missing;
    }

    auto sync_response::operator==(const sync_response& rhs) const -> bool {
        return m_transactions == rhs.m_transactions;
    }

    auto tip_announce::operator==(const tip_announce& rhs) const -> bool {
        return std::tie(m_tips, m_depth) == std::tie(rhs.m_tips, rhs.m_depth);
    }

    auto ping::operator==(const ping& rhs) const -> bool {
        return m_timestamp == rhs.m_timestamp;
    }

    auto pong::operator==(const pong& rhs) const -> bool {
        return m_timestamp == rhs.m_timestamp;
    }

    auto gossip_error::operator==(const gossip_error& rhs) const -> bool {
        return std::tie(m_code, m_cause) == std::tie(rhs.m_code, rhs.m_cause);
    }

    auto encode(const message& msg) -> buffer {
        return make_buffer(msg);
    }

    auto decode(buffer& buf) -> std::variant<message, gossip_error> {
        auto deser = buffer_serializer(buf);
        uint8_t tag{};
        if(!(deser >> tag)) {
            return gossip_error{gossip_error_code::deserialization_error,
                                "empty frame"};
        }
        if(tag >= std::variant_size_v<message>) {
            return gossip_error{gossip_error_code::deserialization_error,
                                "unknown message tag "
                                    + std::to_string(tag)};
        }

        deser.rewind();
        auto msg = message();
        if(!(deser >> msg)) {
            return gossip_error{gossip_error_code::deserialization_error,
                                "malformed " + type_name(msg) + " payload"};
        }
        if(!deser.exhausted()) {
            return gossip_error{gossip_error_code::deserialization_error,
                                std::to_string(deser.remaining())
                                    + " trailing bytes after "
                                    + type_name(msg)};
        }

        auto type_err = check_types(msg);
        if(type_err) {
            return type_err.value();
        }

        return msg;
    }

    auto type_name(const message& msg) -> std::string {
        return std::visit(overloaded{[](const new_transaction&) {
                                         return "NewTransaction";
                                     },
                                     [](const relay_announce&) {
                                         return "RelayAnnounce";
                                     },
                                     [](const sync_request&) {
                                         return "SyncRequest";
                                     },
                                     [](const sync_response&) {
                                         return "SyncResponse";
                                     },
                                     [](const tip_announce&) {
                                         return "TipAnnounce";
                                     },
                                     [](const ping&) {
                                         return "Ping";
                                     },
                                     [](const pong&) {
                                         return "Pong";
                                     }},
                          msg);
    }

    auto to_string(const gossip_error& err) -> std::string {
        switch(err.m_code) {
            case gossip_error_code::deserialization_error:
                return "Deserialization error: " + err.m_cause;
            case gossip_error_code::invalid_message:
                return "Invalid message: " + err.m_cause;
        }
        return err.m_cause;
    }
}

namespace rhiza {
    auto operator<<(serializer& packet, const gossip::new_transaction& msg)
        -> serializer& {
        return packet << msg.m_tx;
    }

    auto operator>>(serializer& packet, gossip::new_transaction& msg)
        -> serializer& {
        return packet >> msg.m_tx;
    }

    auto operator<<(serializer& packet, const gossip::relay_announce& msg)
        -> serializer& {
        return packet << msg.m_proof;
    }

    auto operator>>(serializer& packet, gossip::relay_announce& msg)
        -> serializer& {
        return packet >> msg.m_proof;
    }

    auto operator<<(serializer& packet, const gossip::sync_request& msg)
        -> serializer& {
        return packet << msg.m_missing;
    }

    auto operator>>(serializer& packet, gossip::sync_request& msg)
        -> serializer& {
        return packet >> msg.m_missing;
    }

    auto operator<<(serializer& packet, const gossip::sync_response& msg)
        -> serializer& {
        return packet << msg.m_transactions;
    }

    auto operator>>(serializer& packet, gossip::sync_response& msg)
        -> serializer& {
        return packet >> msg.m_transactions;
    }

    auto operator<<(serializer& packet, const gossip::tip_announce& msg)
        -> serializer& {
        return packet << msg.m_tips << msg.m_depth;
    }

    auto operator>>(serializer& packet, gossip::tip_announce& msg)
        -> serializer& {
        return packet >> msg.m_tips >> msg.m_depth;
    }

    auto operator<<(serializer& packet, const gossip::ping& msg)
        -> serializer& {
        return packet << msg.m_timestamp;
    }

    auto operator>>(serializer& packet, gossip::ping& msg) -> serializer& {
        return packet >> msg.m_timestamp;
    }

    auto operator<<(serializer& packet, const gossip::pong& msg)
        -> serializer& {
        return packet << msg.m_timestamp;
    }

    auto operator>>(serializer& packet, gossip::pong& msg) -> serializer& {
        return packet >> msg.m_timestamp;
    }
}
