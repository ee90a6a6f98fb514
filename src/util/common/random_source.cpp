// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Copyright (c) 2026 The Rhiza developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "random_source.hpp"

#include "crypto/sha256.h"

#include <algorithm>
#include <array>
#include <fstream>
#include <stdexcept>

namespace rhiza {
    random_source::random_source(const std::string& source_file) {
        std::ifstream source(source_file, std::ios::in | std::ios::binary);
        auto seed = std::array<char, std::tuple_size_v<hash_t>>();
        source.read(seed.data(), seed.size());
        if(!source
           || source.gcount() != static_cast<std::streamsize>(seed.size())) {
            throw std::runtime_error("Unable to read entropy from "
                                     + source_file);
        }
        std::copy(seed.begin(), seed.end(), m_seed.begin());
    }

    random_source::random_source(const hash_t& seed) : m_seed(seed) {}

    auto random_source::random_hash() -> hash_t {
        static constexpr auto bits_per_byte = 8;
        auto counter = std::array<unsigned char, sizeof(uint64_t)>();
        {
            std::unique_lock<std::mutex> l(m_mut);
            for(size_t i = 0; i < counter.size(); i++) {
                counter[i] = static_cast<unsigned char>(
                    (m_counter >> (i * bits_per_byte)) & UINT8_MAX);
            }
            m_counter++;
        }

        auto ret = hash_t();
        CSHA256()
            .Write(m_seed.data(), m_seed.size())
            .Write(counter.data(), counter.size())
            .Finalize(ret.data());
        return ret;
    }
}
