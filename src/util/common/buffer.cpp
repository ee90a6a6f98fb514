// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Copyright (c) 2026 The Rhiza developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "buffer.hpp"

#include <cstring>

namespace rhiza {
    namespace {
        constexpr auto hex_digits = "0123456789abcdef";
        constexpr unsigned nibble_bits = 4;
        constexpr unsigned nibble_mask = 0x0f;

        auto nibble(char c) -> std::optional<unsigned char> {
            static constexpr auto alpha_offset = 10;
            if(c >= '0' && c <= '9') {
                return static_cast<unsigned char>(c - '0');
            }
            if(c >= 'a' && c <= 'f') {
                return static_cast<unsigned char>(c - 'a' + alpha_offset);
            }
            if(c >= 'A' && c <= 'F') {
                return static_cast<unsigned char>(c - 'A' + alpha_offset);
            }
            return std::nullopt;
        }
    }

    auto to_hex(const unsigned char* data, size_t len) -> std::string {
        auto ret = std::string();
        ret.reserve(len * 2);
        for(size_t i = 0; i < len; i++) {
            ret.push_back(hex_digits[data[i] >> nibble_bits]);
            ret.push_back(hex_digits[data[i] & nibble_mask]);
        }
        return ret;
    }

    auto buffer::size() const -> size_t {
        return m_data.size();
    }

    auto buffer::empty() const -> bool {
        return m_data.empty();
    }

    auto buffer::data() const -> const unsigned char* {
        return m_data.data();
    }

    void buffer::append(const void* data, size_t len) {
        write_at(m_data.size(), data, len);
    }

    void buffer::write_at(size_t offset, const void* data, size_t len) {
        if(len == 0) {
            return;
        }
        if(offset + len > m_data.size()) {
            m_data.resize(offset + len);
        }
        std::memcpy(&m_data[offset], data, len);
    }

    auto buffer::read_at(size_t offset, void* data, size_t len) const
        -> bool {
        if(offset > m_data.size() || len > m_data.size() - offset) {
            return false;
        }
        if(len != 0) {
            std::memcpy(data, &m_data[offset], len);
        }
        return true;
    }

    void buffer::clear() {
        m_data.clear();
    }

    auto buffer::operator==(const buffer& other) const -> bool {
        return m_data == other.m_data;
    }

    auto buffer::operator!=(const buffer& other) const -> bool {
        return !(*this == other);
    }

    auto buffer::to_hex() const -> std::string {
        return rhiza::to_hex(m_data.data(), m_data.size());
    }

    auto buffer::from_hex(const std::string& hex) -> std::optional<buffer> {
        if(hex.empty() || hex.size() % 2 != 0) {
            return std::nullopt;
        }

        auto ret = buffer();
        ret.m_data.reserve(hex.size() / 2);
        for(size_t i = 0; i < hex.size(); i += 2) {
            const auto hi = nibble(hex[i]);
            const auto lo = nibble(hex[i + 1]);
            if(!hi.has_value() || !lo.has_value()) {
                return std::nullopt;
            }
            ret.m_data.push_back(
                static_cast<unsigned char>(hi.value() << nibble_bits)
                | lo.value());
        }

        return ret;
    }
}
