// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Copyright (c) 2026 The Rhiza developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "buffer_serializer.hpp"

namespace rhiza {
    buffer_serializer::buffer_serializer(buffer& buf) : m_buf(buf) {}

    buffer_serializer::operator bool() const {
        return m_ok;
    }

    void buffer_serializer::fail() {
        m_ok = false;
    }

    auto buffer_serializer::write(const void* data, size_t len) -> bool {
        if(!m_ok) {
            return false;
        }
        m_buf.write_at(m_cursor, data, len);
        m_cursor += len;
        return true;
    }

    auto buffer_serializer::read(void* data, size_t len) -> bool {
        if(!m_ok || !m_buf.read_at(m_cursor, data, len)) {
            m_ok = false;
            return false;
        }
        m_cursor += len;
        return true;
    }

    void buffer_serializer::rewind() {
        m_cursor = 0;
        m_ok = true;
    }

    auto buffer_serializer::exhausted() const -> bool {
        return m_cursor >= m_buf.size();
    }

    auto buffer_serializer::remaining() const -> size_t {
        return exhausted() ? 0 : m_buf.size() - m_cursor;
    }
}
