// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Copyright (c) 2026 The Rhiza developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "keys.hpp"

#include <cassert>
#include <secp256k1.h>
#include <secp256k1_extrakeys.h>
#include <secp256k1_schnorrsig.h>

namespace rhiza {
    auto pubkey_from_privkey(const privkey_t& privkey, secp256k1_context* ctx)
        -> pubkey_t {
        secp256k1_keypair keypair{};
        [[maybe_unused]] const auto create_ret
            = ::secp256k1_keypair_create(ctx, &keypair, privkey.data());
        assert(create_ret == 1);

        secp256k1_xonly_pubkey xpub{};
        [[maybe_unused]] const auto xonly_ret
            = ::secp256k1_keypair_xonly_pub(ctx, &xpub, nullptr, &keypair);
        assert(xonly_ret == 1);

        pubkey_t pubkey;
        [[maybe_unused]] const auto ser_ret
            = ::secp256k1_xonly_pubkey_serialize(ctx, pubkey.data(), &xpub);
        assert(ser_ret == 1);
        return pubkey;
    }

    auto is_valid_privkey(const privkey_t& privkey, secp256k1_context* ctx)
        -> bool {
        return ::secp256k1_ec_seckey_verify(ctx, privkey.data()) == 1;
    }

    auto sign_message(const privkey_t& privkey,
                      const buffer& msg,
                      secp256k1_context* ctx) -> signature_t {
        secp256k1_keypair keypair{};
        [[maybe_unused]] const auto create_ret
            = ::secp256k1_keypair_create(ctx, &keypair, privkey.data());
        assert(create_ret == 1);

        signature_t sig{};
        [[maybe_unused]] const auto sign_ret
            = ::secp256k1_schnorrsig_sign_custom(ctx,
                                                 sig.data(),
                                                 msg.data(),
                                                 msg.size(),
                                                 &keypair,
                                                 nullptr);
        assert(sign_ret == 1);
        return sig;
    }

    auto check_signature(const pubkey_t& pubkey,
                         const buffer& msg,
                         const signature_t& sig,
                         secp256k1_context* ctx) -> bool {
        secp256k1_xonly_pubkey xpub{};
        if(::secp256k1_xonly_pubkey_parse(ctx, &xpub, pubkey.data()) != 1) {
            return false;
        }

        return ::secp256k1_schnorrsig_verify(ctx,
                                             sig.data(),
                                             msg.data(),
                                             msg.size(),
                                             &xpub)
            == 1;
    }

    key_pair::key_pair(const privkey_t& privkey, secp256k1_context* ctx)
        : m_privkey(privkey),
          m_pubkey(pubkey_from_privkey(privkey, ctx)) {}

    auto key_pair::generate(random_source& rnd, secp256k1_context* ctx)
        -> key_pair {
        auto privkey = rnd.random_hash();
        while(!is_valid_privkey(privkey, ctx)) {
            privkey = rnd.random_hash();
        }
        return key_pair(privkey, ctx);
    }

    auto key_pair::privkey() const -> const privkey_t& {
        return m_privkey;
    }

    auto key_pair::pubkey() const -> const pubkey_t& {
        return m_pubkey;
    }

    auto key_pair::sign(const buffer& msg, secp256k1_context* ctx) const
        -> signature_t {
        return sign_message(m_privkey, msg, ctx);
    }

    auto key_pair::operator==(const key_pair& rhs) const -> bool {
        return m_privkey == rhs.m_privkey && m_pubkey == rhs.m_pubkey;
    }
}
