// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Copyright (c) 2026 The Rhiza developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "hashmap.hpp"

#include <cstring>

namespace rhiza::hashing {
    auto fold::operator()(const hash_t& val) const noexcept -> size_t {
        static_assert(std::tuple_size_v<hash_t> % sizeof(size_t) == 0);
        size_t ret{};
        for(size_t off = 0; off < val.size(); off += sizeof(size_t)) {
            size_t word{};
            std::memcpy(&word, val.data() + off, sizeof(word));
            ret ^= word;
        }
        return ret;
    }
}
