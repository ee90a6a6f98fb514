// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Copyright (c) 2026 The Rhiza developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "hash.hpp"

#include "crypto/sha256.h"

#include <algorithm>

namespace rhiza {
    auto to_string(const hash_t& val) -> std::string {
        return to_hex(val.data(), val.size());
    }

    auto hash_from_hex(const std::string& val) -> std::optional<hash_t> {
        const auto buf = buffer::from_hex(val);
        if(!buf.has_value() || buf->size() != std::tuple_size_v<hash_t>) {
            return std::nullopt;
        }
        auto ret = hash_t();
        std::copy_n(buf->data(), ret.size(), ret.begin());
        return ret;
    }

    auto hash_data(const void* data, size_t len) -> hash_t {
        hash_t ret;
        CSHA256()
            // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
            .Write(reinterpret_cast<const unsigned char*>(data), len)
            .Finalize(ret.data());
        return ret;
    }

    auto hash_data(const buffer& buf) -> hash_t {
        return hash_data(buf.data(), buf.size());
    }

    auto is_zero(const hash_t& val) -> bool {
        return std::all_of(val.begin(), val.end(), [](unsigned char b) {
            return b == 0;
        });
    }
}
