// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Copyright (c) 2026 The Rhiza developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef RHIZA_SRC_COMMON_BUFFER_H_
#define RHIZA_SRC_COMMON_BUFFER_H_

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace rhiza {
    /// Encodes a byte range as a lowercase hexadecimal string.
    /// \param data start of the range.
    /// \param len number of bytes in the range.
    /// \return hex string twice as long as the range.
    auto to_hex(const unsigned char* data, size_t len) -> std::string;

    /// \brief Growable byte string.
    ///
    /// Holds canonical transaction encodings, signing payloads, relay
    /// proof messages and gossip frames.
    class buffer {
      public:
        buffer() = default;

        /// Returns the number of bytes contained in the buffer.
        /// \return the number of bytes.
        [[nodiscard]] auto size() const -> size_t;

        /// Indicates whether the buffer holds no bytes.
        [[nodiscard]] auto empty() const -> bool;

        /// Returns a pointer to the first byte of the buffer.
        [[nodiscard]] auto data() const -> const unsigned char*;

        /// Adds bytes to the end of the buffer.
        /// \param data pointer to the start of the data.
        /// \param len the number of bytes to copy.
        void append(const void* data, size_t len);

        /// Copies bytes into the buffer starting at the given offset,
        /// growing the buffer if the range ends past its current size.
        /// Any gap between the old end and the offset is zero-filled.
        /// \param offset position of the first byte to overwrite.
        /// \param data pointer to the start of the data.
        /// \param len the number of bytes to copy.
        void write_at(size_t offset, const void* data, size_t len);

        /// Copies bytes out of the buffer.
        /// \param offset position of the first byte to read.
        /// \param data destination of the bytes.
        /// \param len the number of bytes to copy.
        /// \return false if the range extends past the end of the buffer.
        [[nodiscard]] auto read_at(size_t offset, void* data, size_t len) const
            -> bool;

        /// Removes all content from the buffer.
        void clear();

        auto operator==(const buffer& other) const -> bool;
        auto operator!=(const buffer& other) const -> bool;

        /// Returns the contents of the buffer as lowercase hex.
        [[nodiscard]] auto to_hex() const -> std::string;

        /// Decodes a hex string into a new buffer. Accepts upper and
        /// lower case digits.
        /// \param hex string of hex digit pairs.
        /// \return the decoded buffer, or std::nullopt if the string is
        ///         empty, of odd length or contains non-hex characters.
        static auto from_hex(const std::string& hex) -> std::optional<buffer>;

      private:
        std::vector<unsigned char> m_data{};
    };
}

#endif // RHIZA_SRC_COMMON_BUFFER_H_
