// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Copyright (c) 2026 The Rhiza developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef RHIZA_SRC_COMMON_HASH_H_
#define RHIZA_SRC_COMMON_HASH_H_

#include "buffer.hpp"

#include <array>
#include <cstddef>
#include <optional>
#include <string>

namespace rhiza {
    /// Size in bytes of transaction ids and other digests.
    static constexpr const int hash_size = 32;

    /// SHA-256 digest.
    using hash_t = std::array<unsigned char, rhiza::hash_size>;

    /// Converts a hash to a 64-character lowercase hex string.
    auto to_string(const hash_t& val) -> std::string;

    /// Parses a hash from hex.
    /// \param val exactly 64 hex digits.
    /// \return the hash, or std::nullopt if val is not valid hex of the
    ///         right length.
    auto hash_from_hex(const std::string& val) -> std::optional<hash_t>;

    /// Calculates the SHA-256 digest of a byte range.
    /// \param data start of the range.
    /// \param len number of bytes to hash.
    /// \return the digest.
    auto hash_data(const void* data, size_t len) -> hash_t;

    /// Calculates the SHA-256 digest of the contents of a buffer.
    auto hash_data(const buffer& buf) -> hash_t;

    /// Returns true if every byte of the hash is zero. The all-zero hash
    /// stands in for "no parent" on the genesis transaction.
    auto is_zero(const hash_t& val) -> bool;
}

#endif // RHIZA_SRC_COMMON_HASH_H_
