// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Copyright (c) 2026 The Rhiza developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/** \file random_source.hpp
 *  Deterministic random bit generator for node key material.
 */

#ifndef RHIZA_SRC_COMMON_RANDOM_SOURCE_H_
#define RHIZA_SRC_COMMON_RANDOM_SOURCE_H_

#include "hash.hpp"

#include <cstdint>
#include <mutex>
#include <string>

namespace rhiza {
    /// \brief Produces 32-byte random values from a 32-byte seed.
    ///
    /// Output n is SHA256(seed || n) with n as a little-endian 64-bit
    /// counter. Thread-safe.
    class random_source {
      public:
        /// Seeds the generator from the first 32 bytes of a file, usually
        /// /dev/urandom.
        /// \param source_file path to the entropy source.
        /// \throws std::runtime_error if 32 bytes could not be read.
        explicit random_source(const std::string& source_file);

        /// Seeds the generator with a fixed value. Outputs are
        /// reproducible across instances with the same seed.
        explicit random_source(const hash_t& seed);

        ~random_source() = default;

        random_source(const random_source& other) = delete;
        auto operator=(const random_source& other) = delete;

        random_source(random_source&& other) = delete;
        auto operator=(random_source&& other) = delete;

        /// Returns the next 32-byte output.
        auto random_hash() -> hash_t;

      private:
        std::mutex m_mut;
        hash_t m_seed{};
        uint64_t m_counter{};
    };
}

#endif // RHIZA_SRC_COMMON_RANDOM_SOURCE_H_
