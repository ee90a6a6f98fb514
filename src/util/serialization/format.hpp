// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Copyright (c) 2026 The Rhiza developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef RHIZA_SRC_SERIALIZATION_FORMAT_H_
#define RHIZA_SRC_SERIALIZATION_FORMAT_H_

#include "serializer.hpp"
#include "util/common/config.hpp"
#include "util/common/variant_overloaded.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace rhiza {
    /// \brief Writes an integer or enum as its `sizeof(T)` bytes, least
    ///        significant first.
    ///
    /// Enums are written as their underlying type and bools as one byte,
    /// so encodings are identical on every host.
    template<typename T>
    auto operator<<(serializer& ser, T val)
        -> std::enable_if_t<std::is_integral_v<T> || std::is_enum_v<T>,
                            serializer&> {
        if constexpr(std::is_enum_v<T>) {
            return ser << static_cast<std::underlying_type_t<T>>(val);
        } else if constexpr(std::is_same_v<T, bool>) {
            return ser << static_cast<uint8_t>(val);
        } else {
            auto u = static_cast<std::make_unsigned_t<T>>(val);
            auto bytes = std::array<unsigned char, sizeof(T)>();
            for(auto& b : bytes) {
                b = static_cast<unsigned char>(u & 0xffU);
                u = static_cast<std::make_unsigned_t<T>>(u >> 8U);
            }
            ser.write(bytes.data(), bytes.size());
            return ser;
        }
    }

    /// Reads an integer or enum written least significant byte first.
    /// `val` is only assigned on success. Enum values are not
    /// range-checked.
    template<typename T>
    auto operator>>(serializer& deser, T& val)
        -> std::enable_if_t<std::is_integral_v<T> || std::is_enum_v<T>,
                            serializer&> {
        if constexpr(std::is_enum_v<T>) {
            auto raw = std::underlying_type_t<T>();
            if(deser >> raw) {
                val = static_cast<T>(raw);
            }
        } else if constexpr(std::is_same_v<T, bool>) {
            uint8_t raw{};
            if(deser >> raw) {
                val = raw != 0;
            }
        } else {
            using U = std::make_unsigned_t<T>;
            auto bytes = std::array<unsigned char, sizeof(T)>();
            if(!deser.read(bytes.data(), bytes.size())) {
                return deser;
            }
            U u{};
            for(size_t i = sizeof(T); i > 0; i--) {
                u = static_cast<U>(static_cast<U>(u << 8U) | bytes[i - 1]);
            }
            val = static_cast<T>(u);
        }
        return deser;
    }

    /// Writes a fixed-size array of bytes with no length prefix.
    /// Digests, keys and signatures use this form.
    template<typename T, size_t N>
    auto operator<<(serializer& ser, const std::array<T, N>& arr)
        -> std::enable_if_t<std::is_integral_v<T> && sizeof(T) == 1,
                            serializer&> {
        ser.write(arr.data(), sizeof(T) * N);
        return ser;
    }

    template<typename T, size_t N>
    auto operator>>(serializer& deser, std::array<T, N>& arr)
        -> std::enable_if_t<std::is_integral_v<T> && sizeof(T) == 1,
                            serializer&> {
        deser.read(arr.data(), sizeof(T) * N);
        return deser;
    }

    /// Writes a 64-bit byte count followed by the raw UTF-8 bytes.
    auto operator<<(serializer& ser, const std::string& str) -> serializer&;

    /// \brief Reads a length-prefixed string.
    ///
    /// Storage grows by at most config::maximum_reservation bytes per step
    /// so a forged length fails on the missing bytes before it can force
    /// a large allocation. Bytes that are not well-formed UTF-8 fail the
    /// serializer. `str` is only assigned on success.
    auto operator>>(serializer& deser, std::string& str) -> serializer&;

    /// Writes a one-byte presence flag, then the value if there is one.
    template<typename T>
    auto operator<<(serializer& ser, const std::optional<T>& val)
        -> serializer& {
        ser << static_cast<uint8_t>(val.has_value());
        if(val.has_value()) {
            ser << val.value();
        }
        return ser;
    }

    /// Reads an optional. A presence flag other than 0 or 1 fails the
    /// serializer.
    template<typename T>
    auto operator>>(serializer& deser, std::optional<T>& val) -> serializer& {
        uint8_t present{};
        if(!(deser >> present)) {
            return deser;
        }
        if(present > 1) {
            deser.fail();
            return deser;
        }
        if(present == 0) {
            val = std::nullopt;
            return deser;
        }
        auto inner = T();
        if(deser >> inner) {
            val = std::move(inner);
        }
        return deser;
    }

    /// Writes a 64-bit element count followed by each element in order.
    template<typename T>
    auto operator<<(serializer& ser, const std::vector<T>& vec)
        -> serializer& {
        ser << static_cast<uint64_t>(vec.size());
        for(const auto& elem : vec) {
            ser << elem;
        }
        return ser;
    }

    /// \brief Reads a counted vector, replacing the contents of `vec`.
    ///
    /// Capacity is reserved in chunks of config::maximum_reservation
    /// bytes. On failure `vec` keeps the elements decoded so far.
    template<typename T>
    auto operator>>(serializer& deser, std::vector<T>& vec) -> serializer& {
        static_assert(sizeof(T) <= config::maximum_reservation,
                      "Vector element size too large");
        static_assert(std::is_default_constructible_v<T>);
        constexpr uint64_t per_chunk = config::maximum_reservation / sizeof(T);

        uint64_t count{};
        if(!(deser >> count)) {
            return deser;
        }

        vec.clear();
        while(vec.size() < count) {
            if(vec.size() == vec.capacity()) {
                vec.reserve(static_cast<size_t>(
                    std::min<uint64_t>(count, vec.size() + per_chunk)));
            }
            auto elem = T();
            if(!(deser >> elem)) {
                return deser;
            }
            vec.push_back(std::move(elem));
        }
        return deser;
    }

    /// Writes the alternative index as one byte, then the held value.
    template<typename... Ts>
    auto operator<<(serializer& ser, const std::variant<Ts...>& var)
        -> serializer& {
        static_assert(sizeof...(Ts) <= std::numeric_limits<uint8_t>::max());
        ser << static_cast<uint8_t>(var.index());
        std::visit(
            [&](const auto& alt) {
                ser << alt;
            },
            var);
        return ser;
    }

    /// Reads a variant. An index past the last alternative fails the
    /// serializer and leaves `var` unchanged.
    template<typename... Ts>
    auto operator>>(serializer& deser, std::variant<Ts...>& var)
        -> std::enable_if_t<(std::is_default_constructible_v<Ts> && ...),
                            serializer&> {
        uint8_t index{};
        if(!(deser >> index)) {
            return deser;
        }
        auto alt = default_alternative<std::variant<Ts...>>(index);
        if(!alt.has_value()) {
            deser.fail();
            return deser;
        }
        var = std::move(alt.value());
        std::visit(
            [&](auto& held) {
                deser >> held;
            },
            var);
        return deser;
    }
}

#endif // RHIZA_SRC_SERIALIZATION_FORMAT_H_
