// Copyright (c) 2026 The Rhiza developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef RHIZA_SRC_WALLET_ADDRESS_H_
#define RHIZA_SRC_WALLET_ADDRESS_H_

#include "util/common/config.hpp"
#include "util/common/keys.hpp"

#include <array>
#include <string>
#include <variant>

namespace rhiza::wallet {
    /// Truncated public key digest carried by an address.
    using address_payload_t
        = std::array<unsigned char, config::address_payload_len>;

    /// Reasons an address string is refused.
    enum class address_error : uint8_t {
        /// Not valid bech32: bad characters, mixed case or bad checksum.
        invalid_encoding,
        /// Valid bech32 under a prefix other than config::bech32_hrp.
        invalid_hrp,
        /// The payload is not config::address_payload_len bytes.
        invalid_length
    };

    /// Returns the first config::address_payload_len bytes of the SHA256
    /// digest of the public key.
    auto address_payload(const pubkey_t& key) -> address_payload_t;

    /// Encodes the public key's address payload as bech32 under
    /// config::bech32_hrp.
    /// \param key public key.
    /// \return address string, beginning with "rhz1".
    auto encode_address(const pubkey_t& key) -> std::string;

    /// Decodes an address string back to its payload.
    /// \param addr address string.
    /// \return the payload, or the reason the string was refused.
    auto decode_address(const std::string& addr)
        -> std::variant<address_payload_t, address_error>;

    /// Returns true if the address string was derived from the public key.
    auto matches(const std::string& addr, const pubkey_t& key) -> bool;

    auto to_string(address_error err) -> std::string;
}

#endif // RHIZA_SRC_WALLET_ADDRESS_H_
