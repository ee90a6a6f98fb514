// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Copyright (c) 2026 The Rhiza developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <secp256k1.h>

namespace rhiza::config {
    namespace {
        auto read_key(const parser& cfg,
                      const char* key,
                      const char* what,
                      std::optional<hash_t>& out)
            -> std::optional<std::string> {
            if(!cfg.get_string(key).has_value()) {
                return std::nullopt;
            }
            out = cfg.get_key(key);
            if(!out.has_value()) {
                return std::string("Malformed ") + what + " (" + key + ")";
            }
            return std::nullopt;
        }
    }

    auto read_options(const std::string& config_file)
        -> std::variant<options, std::string> {
        if(!std::ifstream(config_file).good()) {
            return "Unable to open config file " + config_file;
        }

        const auto cfg = parser(config_file);
        auto opts = options{};

        if(auto name = cfg.get_string(node_name_key)) {
            opts.m_node_name = std::move(name.value());
        }

        if(const auto lvl = cfg.get_string(node_loglevel_key)) {
            const auto parsed = cfg.get_loglevel(node_loglevel_key);
            if(!parsed.has_value()) {
                return "Unknown log level " + lvl.value() + " ("
                     + node_loglevel_key + ")";
            }
            opts.m_node_loglevel = parsed.value();
        }

        opts.m_node_logfile = cfg.get_string(node_logfile_key);

        if(auto err = read_key(cfg,
                               node_private_key_key,
                               "private key",
                               opts.m_node_private_key)) {
            return err.value();
        }
        if(auto err = read_key(cfg,
                               founder_public_key_key,
                               "public key",
                               opts.m_founder_public_key)) {
            return err.value();
        }

        return opts;
    }

    auto load_options(const std::string& config_file)
        -> std::variant<options, std::string> {
        auto res = read_options(config_file);
        if(const auto* opts = std::get_if<options>(&res)) {
            if(auto err = check_options(*opts)) {
                return err.value();
            }
        }
        return res;
    }

    auto check_options(const options& opts) -> std::optional<std::string> {
        if(opts.m_node_name.empty()) {
            return "Node name must not be empty";
        }

        if(opts.m_node_logfile.has_value() && opts.m_node_logfile->empty()) {
            return "Node log file must not be empty";
        }

        if(opts.m_node_private_key.has_value()
           && is_zero(opts.m_node_private_key.value())) {
            return "Node private key must not be zero";
        }

        if(opts.m_node_private_key.has_value()) {
            auto secp = std::unique_ptr<secp256k1_context,
                                        decltype(&secp256k1_context_destroy)>(
                secp256k1_context_create(SECP256K1_CONTEXT_NONE),
                &secp256k1_context_destroy);
            if(!is_valid_privkey(opts.m_node_private_key.value(),
                                 secp.get())) {
                return "Node private key is not a valid secp256k1 scalar";
            }
        }

        if(opts.m_founder_public_key.has_value()
           && is_zero(opts.m_founder_public_key.value())) {
            return "Founder public key must not be zero";
        }

        return std::nullopt;
    }

    auto make_log(const options& opts) -> std::shared_ptr<logging::log> {
        auto ret = opts.m_node_logfile.has_value()
                     ? std::make_shared<logging::log>(
                         opts.m_node_loglevel,
                         opts.m_node_logfile.value())
                     : std::make_shared<logging::log>(opts.m_node_loglevel);
        ret->set_tag(opts.m_node_name);
        return ret;
    }

    parser::parser(const std::string& filename) {
        std::ifstream file(filename);
        if(file.good()) {
            read(file);
        }
    }

    parser::parser(std::istream& stream) {
        read(stream);
    }

    void parser::read(std::istream& stream) {
        std::string line;
        while(std::getline(stream, line)) {
            if(line.empty() || line.front() == '#') {
                continue;
            }
            const auto eq = line.find('=');
            if(eq == std::string::npos || eq == 0) {
                continue;
            }
            auto value = unquote(line.substr(eq + 1));
            if(value.has_value()) {
                m_values.emplace(line.substr(0, eq), std::move(value.value()));
            }
        }
    }

    auto parser::get_string(const std::string& key) const
        -> std::optional<std::string> {
        auto env_key = key;
        std::transform(env_key.begin(),
                       env_key.end(),
                       env_key.begin(),
                       [](unsigned char c) {
                           return static_cast<char>(std::toupper(c));
                       });
        if(const auto* env_v = std::getenv(env_key.c_str())) {
            return unquote(env_v);
        }

        const auto it = m_values.find(key);
        if(it == m_values.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    auto parser::get_loglevel(const std::string& key) const
        -> std::optional<logging::log_level> {
        const auto val = get_string(key);
        if(!val.has_value()) {
            return std::nullopt;
        }
        return logging::parse_loglevel(val.value());
    }

    auto parser::get_key(const std::string& key) const
        -> std::optional<hash_t> {
        const auto val = get_string(key);
        if(!val.has_value()) {
            return std::nullopt;
        }
        return hash_from_hex(val.value());
    }

    auto parser::unquote(const std::string& raw)
        -> std::optional<std::string> {
        if(raw.size() < 2 || raw.front() != '"' || raw.back() != '"') {
            return std::nullopt;
        }
        return raw.substr(1, raw.size() - 2);
    }
}
