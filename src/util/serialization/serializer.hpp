// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Copyright (c) 2026 The Rhiza developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef RHIZA_SRC_SERIALIZATION_SERIALIZER_H_
#define RHIZA_SRC_SERIALIZATION_SERIALIZER_H_

#include <cstddef>

namespace rhiza {
    /// \brief Byte sink and source used by the stream operators in
    ///        format.hpp.
    ///
    /// A serializer starts healthy and stays failed after the first
    /// operation that could not complete. Callers chain operators and
    /// check the result once.
    class serializer {
      public:
        virtual ~serializer() = default;
        serializer(const serializer&) = delete;
        auto operator=(const serializer&) = delete;
        serializer(serializer&&) = delete;
        auto operator=(serializer&&) = delete;

        /// Indicates whether every operation so far has succeeded.
        virtual explicit operator bool() const = 0;

        /// Marks the serializer as failed. For bytes that were read
        /// successfully but do not decode to a valid value.
        virtual void fail() = 0;

        /// Appends raw bytes at the current position.
        /// \param data start of the bytes to write.
        /// \param len number of bytes to write.
        /// \return false if the serializer has failed.
        virtual auto write(const void* data, size_t len) -> bool = 0;

        /// Consumes raw bytes from the current position.
        /// \param data destination for the bytes.
        /// \param len number of bytes to read.
        /// \return false if fewer than len bytes were available or the
        ///         serializer had already failed.
        virtual auto read(void* data, size_t len) -> bool = 0;

      protected:
        serializer() = default;
    };
}

#endif // RHIZA_SRC_SERIALIZATION_SERIALIZER_H_
