// Copyright (c) 2026 The Rhiza developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "address.hpp"

#include "bech32/bech32.h"
#include "bech32/util/strencodings.h"

#include <algorithm>
#include <vector>

namespace rhiza::wallet {
    static constexpr auto bits_per_byte = 8;
    static constexpr auto bech32_bits_per_symbol = 5;

    auto address_payload(const pubkey_t& key) -> address_payload_t {
        const auto digest = hash_data(key.data(), key.size());
        auto ret = address_payload_t();
        std::copy_n(digest.begin(), ret.size(), ret.begin());
        return ret;
    }

    auto encode_address(const pubkey_t& key) -> std::string {
        const auto payload = address_payload(key);
        auto data = std::vector<uint8_t>();
        ConvertBits<bits_per_byte, bech32_bits_per_symbol, true>(
            [&](uint8_t c) {
                data.push_back(c);
            },
            payload.begin(),
            payload.end());
        return bech32::Encode(config::bech32_hrp, data);
    }

    auto decode_address(const std::string& addr)
        -> std::variant<address_payload_t, address_error> {
        const auto [hrp, enc_data] = bech32::Decode(addr);
        if(hrp.empty()) {
            return address_error::invalid_encoding;
        }
        if(hrp != config::bech32_hrp) {
            return address_error::invalid_hrp;
        }

        auto data = std::vector<uint8_t>();
        const auto converted
            = ConvertBits<bech32_bits_per_symbol, bits_per_byte, false>(
                [&](uint8_t c) {
                    data.push_back(c);
                },
                enc_data.begin(),
                enc_data.end());
        if(!converted) {
            return address_error::invalid_length;
        }

        auto ret = address_payload_t();
        if(data.size() != ret.size()) {
            return address_error::invalid_length;
        }
        std::copy_n(data.begin(), ret.size(), ret.begin());
        return ret;
    }

    auto matches(const std::string& addr, const pubkey_t& key) -> bool {
        const auto decoded = decode_address(addr);
        const auto* payload = std::get_if<address_payload_t>(&decoded);
        return payload != nullptr && *payload == address_payload(key);
    }

    auto to_string(address_error err) -> std::string {
        switch(err) {
            case address_error::invalid_encoding:
                return "Invalid address encoding";
            case address_error::invalid_hrp:
                return "Invalid address prefix, expected "
                     + config::bech32_hrp;
            case address_error::invalid_length:
                return "Invalid address payload length";
        }
        return "Unknown address error";
    }
}
