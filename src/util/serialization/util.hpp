// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Copyright (c) 2026 The Rhiza developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef RHIZA_SRC_SERIALIZATION_UTIL_H_
#define RHIZA_SRC_SERIALIZATION_UTIL_H_

#include "buffer_serializer.hpp"

#include <optional>

namespace rhiza {
    /// Encodes an object into a fresh buffer.
    template<typename T>
    auto make_buffer(const T& obj) -> buffer {
        auto ret = buffer();
        auto ser = buffer_serializer(ret);
        ser << obj;
        return ret;
    }

    /// Decodes an object that must span the whole buffer.
    /// \return the object, or std::nullopt if decoding failed or bytes
    ///         were left over.
    template<typename T>
    auto from_buffer(buffer& buf) -> std::optional<T> {
        auto deser = buffer_serializer(buf);
        auto ret = T();
        if(!(deser >> ret) || !deser.exhausted()) {
            return std::nullopt;
        }
        return ret;
    }
}

#endif // RHIZA_SRC_SERIALIZATION_UTIL_H_
