// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Copyright (c) 2026 The Rhiza developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef RHIZA_SRC_COMMON_HASHMAP_H_
#define RHIZA_SRC_COMMON_HASHMAP_H_

#include "hash.hpp"

#include <unordered_map>
#include <unordered_set>

namespace rhiza {
    namespace hashing {
        /// \brief Bucket function for 32-byte digests and x-only keys.
        ///
        /// XORs the four machine words of the value together. Ids and
        /// keys are outputs of SHA-256 or of the curve, so no further
        /// mixing is needed.
        struct fold {
            auto operator()(const hash_t& val) const noexcept -> size_t;
        };
    }

    /// Map keyed by transaction id or public key.
    template<typename V>
    using hash_map = std::unordered_map<hash_t, V, hashing::fold>;

    /// Set of transaction ids or public keys.
    using hash_set = std::unordered_set<hash_t, hashing::fold>;
}

#endif // RHIZA_SRC_COMMON_HASHMAP_H_
