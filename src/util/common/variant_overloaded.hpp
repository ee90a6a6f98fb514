// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Copyright (c) 2026 The Rhiza developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef RHIZA_SRC_COMMON_VARIANT_OVERLOADED_H_
#define RHIZA_SRC_COMMON_VARIANT_OVERLOADED_H_

#include <cstddef>
#include <optional>
#include <utility>
#include <variant>

namespace rhiza {
    /// \brief Combines lambdas into one visitor for std::visit.
    ///
    /// \code{.cpp}
    ///      std::visit(overloaded{[&](const ping& p) {...},
    ///                            [&](const auto&) {...}},
    ///                 msg);
    /// \endcode
    template<class... Ts>
    struct overloaded : Ts... {
        using Ts::operator()...;
    };

    template<class... Ts>
    overloaded(Ts...) -> overloaded<Ts...>;

    /// \brief Builds a variant holding a default-constructed alternative
    ///        chosen at runtime.
    ///
    /// \tparam V variant type whose alternatives are default-constructible.
    /// \param index position of the alternative to construct.
    /// \return the variant, or std::nullopt if index is past the last
    ///         alternative.
    template<typename V, size_t I = 0>
    [[nodiscard]] auto default_alternative(size_t index) -> std::optional<V> {
        if constexpr(I < std::variant_size_v<V>) {
            if(index == I) {
                return V{std::in_place_index<I>};
            }
            return default_alternative<V, I + 1>(index);
        } else {
            return std::nullopt;
        }
    }
}

#endif // RHIZA_SRC_COMMON_VARIANT_OVERLOADED_H_
