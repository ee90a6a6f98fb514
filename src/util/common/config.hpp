// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Copyright (c) 2026 The Rhiza developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * \file config.hpp
 * Protocol constants, plus tools for reading node options from a
 * configuration file.
 */

#ifndef RHIZA_SRC_COMMON_CONFIG_H_
#define RHIZA_SRC_COMMON_CONFIG_H_

#include "hash.hpp"
#include "keys.hpp"
#include "logging.hpp"

#include <istream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>

namespace rhiza::config {
    /// Entropy source that seeds node key generation.
    static constexpr const char* random_source{"/dev/urandom"};

    /// Bech32 human readable part of every address.
    static const std::string bech32_hrp = "rhz";

    /// Number of bytes of the public key digest carried in an address.
    static constexpr size_t address_payload_len{20};

    /// Largest allocation a decoder makes ahead of the bytes that justify
    /// it. Bounds what a forged length prefix in a gossip frame can cost.
    static constexpr uint64_t maximum_reservation{1024 * 1024};

    /// Smallest units per whole coin.
    static constexpr uint64_t units_per_coin{100'000'000};
    /// Hard cap on the total amount that can ever exist, in units.
    static constexpr uint64_t max_supply{21'000'000 * units_per_coin};
    /// Number of parents every transaction references.
    static constexpr size_t parent_count{2};
    /// Cumulative weight at which a transaction becomes final.
    static constexpr uint64_t finality_threshold{10};
    /// Relay reward paid before any halving, in units.
    static constexpr uint64_t base_relay_reward{1'000'000};
    /// Number of relays by one key after which its reward halves again.
    static constexpr uint64_t relay_halving_interval{1000};
    /// One-time allocation to the founder key, 5% of the maximum supply.
    static constexpr uint64_t founder_allocation{max_supply / 100 * 5};

    /// Memo carried by the genesis transaction.
    static constexpr auto genesis_memo = "Rhiza Genesis - Proof of Relay";
    /// Memo carried by the founder allocation.
    static constexpr auto founder_memo = "Founder Allocation - 5%";

    namespace defaults {
        static constexpr auto node_name = "rhiza-node";
        static constexpr auto log_level = logging::log_level::warn;
    }

    static constexpr auto node_name_key = "node_name";
    static constexpr auto node_loglevel_key = "node_loglevel";
    static constexpr auto node_logfile_key = "node_logfile";
    static constexpr auto node_private_key_key = "node_private_key";
    static constexpr auto founder_public_key_key = "founder_public_key";

    /// Node configuration options.
    struct options {
        /// Name used to tag log output.
        std::string m_node_name{defaults::node_name};
        /// Log level of the node.
        logging::log_level m_node_loglevel{defaults::log_level};
        /// File the node log is appended to. Standard output when absent.
        std::optional<std::string> m_node_logfile;
        /// Private key the node signs its own transactions with. A fresh
        /// key is generated when absent.
        std::optional<privkey_t> m_node_private_key;
        /// Recipient of the founder allocation. When absent, genesis
        /// initialization creates no founder allocation.
        std::optional<pubkey_t> m_founder_public_key;
    };

    /// Reads node options from a config file. Keys that are absent keep
    /// their defaults.
    /// \param config_file path of the file.
    /// \return the options, or a description of the first unreadable or
    ///         malformed setting.
    auto read_options(const std::string& config_file)
        -> std::variant<options, std::string>;

    /// Reads node options with read_options, then validates them with
    /// check_options.
    auto load_options(const std::string& config_file)
        -> std::variant<options, std::string>;

    /// Rejects option combinations a node cannot start with: an empty
    /// name, an all-zero private or founder key, or a private key outside
    /// the secp256k1 scalar range.
    /// \return std::nullopt if the options are usable, or an error string.
    auto check_options(const options& opts) -> std::optional<std::string>;

    /// Creates the log described by the options, tagged with the node
    /// name.
    auto make_log(const options& opts) -> std::shared_ptr<logging::log>;

    /// \brief Reader for `key=value` config files.
    ///
    /// Every value is a double-quoted string, for example
    /// `node_name="alpha"`. Blank lines and lines starting with `#` are
    /// ignored, and so is any line whose value is not a complete quoted
    /// string. When a key appears twice, the first occurrence wins.
    ///
    /// An environment variable named after the upper-cased key takes
    /// precedence over the file and follows the same quoting, so
    /// `NODE_NAME='"beta"'` overrides `node_name`.
    class parser {
      public:
        /// Reads a file. A file that cannot be opened yields a parser with
        /// no values.
        explicit parser(const std::string& filename);

        /// Reads from a stream until it is exhausted.
        explicit parser(std::istream& stream);

        /// Returns the unquoted value for a key.
        [[nodiscard]] auto get_string(const std::string& key) const
            -> std::optional<std::string>;

        /// Interprets the value for a key as a log level name.
        /// \see logging::parse_loglevel
        [[nodiscard]] auto get_loglevel(const std::string& key) const
            -> std::optional<logging::log_level>;

        /// Decodes the value for a key as 64 hex characters.
        [[nodiscard]] auto get_key(const std::string& key) const
            -> std::optional<hash_t>;

      private:
        void read(std::istream& stream);

        [[nodiscard]] static auto unquote(const std::string& raw)
            -> std::optional<std::string>;

        std::map<std::string, std::string> m_values;
    };
}

#endif // RHIZA_SRC_COMMON_CONFIG_H_
