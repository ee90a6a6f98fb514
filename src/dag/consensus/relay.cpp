// Copyright (c) 2026 The Rhiza developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "relay.hpp"

#include <array>
#include <cstring>
#include <tuple>

namespace rhiza::consensus {
    namespace {
        constexpr std::array<char, 6> relay_tag{'R', 'E', 'L', 'A', 'Y', ':'};
    }

    auto relay_proof::operator==(const relay_proof& rhs) const -> bool {
        return std::tie(m_relayer,
                        m_tx_id,
                        m_hop_count,
                        m_timestamp,
                        m_signature)
            == std::tie(rhs.m_relayer,
                        rhs.m_tx_id,
                        rhs.m_hop_count,
                        rhs.m_timestamp,
                        rhs.m_signature);
    }

    auto relay_signing_data(const hash_t& tx_id,
                            uint8_t hop_count,
                            uint64_t timestamp) -> buffer {
        auto ret = buffer();
        ret.append(relay_tag.data(), relay_tag.size());
        ret.append(tx_id.data(), tx_id.size());
        ret.append(&hop_count, sizeof(hop_count));

        std::array<unsigned char, sizeof(timestamp)> ts_le{};
        for(size_t i = 0; i < ts_le.size(); i++) {
            static constexpr auto bits_per_byte = 8;
            ts_le[i] = static_cast<unsigned char>(
                (timestamp >> (i * bits_per_byte)) & UINT8_MAX);
        }
        ret.append(ts_le.data(), ts_le.size());
        return ret;
    }

    auto make_relay_proof(secp256k1_context* ctx,
                          const key_pair& relayer,
                          const hash_t& tx_id,
                          uint8_t hop_count,
                          uint64_t timestamp) -> relay_proof {
        auto ret = relay_proof();
        ret.m_relayer = relayer.pubkey();
        ret.m_tx_id = tx_id;
        ret.m_hop_count = hop_count;
        ret.m_timestamp = timestamp;
        ret.m_signature = relayer.sign(
            relay_signing_data(tx_id, hop_count, timestamp),
            ctx);
        return ret;
    }

    auto verify_relay_proof(secp256k1_context* ctx, const relay_proof& proof)
        -> bool {
        return check_signature(proof.m_relayer,
                               relay_signing_data(proof.m_tx_id,
                                                  proof.m_hop_count,
                                                  proof.m_timestamp),
                               proof.m_signature,
                               ctx);
    }

    relay_tracker::relay_tracker(uint64_t issued_rewards)
        : m_total_rewards(issued_rewards) {}

    auto relay_tracker::record_relay(const pubkey_t& relayer) -> uint64_t {
        auto& count = m_counts[relayer];
        count++;
        m_total_relays++;

        const auto reward = capped(calculate_reward(count));
        m_total_rewards += reward;
        return reward;
    }

    auto relay_tracker::preview_reward(const pubkey_t& relayer) const
        -> uint64_t {
        return capped(calculate_reward(get_relay_count(relayer) + 1));
    }

    auto relay_tracker::calculate_reward(uint64_t relay_count) -> uint64_t {
        return config::base_relay_reward
             / (1 + relay_count / config::relay_halving_interval);
    }

    auto relay_tracker::capped(uint64_t reward) const -> uint64_t {
        if(m_total_rewards >= config::max_supply
           || reward > config::max_supply - m_total_rewards) {
            return 0;
        }
        return reward;
    }

    auto relay_tracker::get_relay_count(const pubkey_t& relayer) const
        -> uint64_t {
        auto it = m_counts.find(relayer);
        if(it == m_counts.end()) {
            return 0;
        }
        return it->second;
    }

    auto relay_tracker::total_relays() const -> uint64_t {
        return m_total_relays;
    }

    auto relay_tracker::total_rewards() const -> uint64_t {
        return m_total_rewards;
    }
}

namespace rhiza {
    auto operator<<(serializer& packet, const consensus::relay_proof& proof)
        -> serializer& {
        return packet << proof.m_relayer << proof.m_tx_id
                      << proof.m_hop_count << proof.m_timestamp
                      << proof.m_signature;
    }

    auto operator>>(serializer& packet, consensus::relay_proof& proof)
        -> serializer& {
        return packet >> proof.m_relayer >> proof.m_tx_id
            >> proof.m_hop_count >> proof.m_timestamp >> proof.m_signature;
    }
}
