// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Copyright (c) 2026 The Rhiza developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef RHIZA_SRC_SERIALIZATION_BUFFER_SERIALIZER_H_
#define RHIZA_SRC_SERIALIZATION_BUFFER_SERIALIZER_H_

#include "serializer.hpp"
#include "util/common/buffer.hpp"

namespace rhiza {
    /// \brief Serializer over a \ref buffer with a single read/write
    ///        cursor.
    ///
    /// Writes overwrite from the cursor and grow the buffer. Reads never
    /// go past the end of the buffer.
    class buffer_serializer final : public serializer {
      public:
        /// Constructor. The cursor starts at the beginning of the buffer.
        /// \param buf buffer to serialize into or out of. Must outlive the
        ///            serializer.
        explicit buffer_serializer(buffer& buf);

        explicit operator bool() const final;

        void fail() final;

        auto write(const void* data, size_t len) -> bool final;

        auto read(void* data, size_t len) -> bool final;

        /// Moves the cursor back to the beginning of the buffer and
        /// clears any failure.
        void rewind();

        /// Indicates whether every byte of the buffer has been consumed.
        [[nodiscard]] auto exhausted() const -> bool;

        /// Returns the number of bytes between the cursor and the end of
        /// the buffer.
        [[nodiscard]] auto remaining() const -> size_t;

      private:
        buffer& m_buf;
        size_t m_cursor{};
        bool m_ok{true};
    };
}

#endif // RHIZA_SRC_SERIALIZATION_BUFFER_SERIALIZER_H_
