// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Copyright (c) 2026 The Rhiza developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef RHIZA_SRC_COMMON_KEYS_H_
#define RHIZA_SRC_COMMON_KEYS_H_

#include "buffer.hpp"
#include "random_source.hpp"

#include <array>

struct secp256k1_context_struct;
using secp256k1_context = struct secp256k1_context_struct;

namespace rhiza {
    /// Size of x-only public keys and private keys, in bytes.
    static constexpr size_t pubkey_len = 32;
    /// Size of BIP340 signatures, in bytes.
    static constexpr size_t sig_len = 64;

    /// A secp256k1 secret scalar.
    using privkey_t = std::array<unsigned char, pubkey_len>;
    /// An x-only public key of a public/private keypair.
    using pubkey_t = std::array<unsigned char, pubkey_len>;
    /// A BIP340 Schnorr signature.
    using signature_t = std::array<unsigned char, sig_len>;

    /// Generates a public key from the specified private key.
    /// \param privkey private key for which to generate the public key.
    /// \param ctx the secp context to use.
    /// \return the public key.
    auto pubkey_from_privkey(const privkey_t& privkey, secp256k1_context* ctx)
        -> pubkey_t;

    /// Checks whether the given bytes are a valid secp256k1 private key.
    /// \param privkey candidate private key.
    /// \param ctx the secp context to use.
    /// \return true if the scalar is non-zero and below the curve order.
    auto is_valid_privkey(const privkey_t& privkey, secp256k1_context* ctx)
        -> bool;

    /// Signs an arbitrary-length message. No auxiliary randomness is used
    /// so the signature is a pure function of the key and message.
    /// \param privkey private key to sign with. Must be valid.
    /// \param msg message bytes.
    /// \param ctx the secp context to use.
    /// \return the signature.
    auto sign_message(const privkey_t& privkey,
                      const buffer& msg,
                      secp256k1_context* ctx) -> signature_t;

    /// Verifies a signature over an arbitrary-length message.
    /// \param pubkey x-only public key of the signer.
    /// \param msg message bytes.
    /// \param sig signature to check.
    /// \param ctx the secp context to use.
    /// \return true if the public key parses and the signature is valid.
    auto check_signature(const pubkey_t& pubkey,
                         const buffer& msg,
                         const signature_t& sig,
                         secp256k1_context* ctx) -> bool;

    /// Private key together with its derived public key.
    class key_pair {
      public:
        /// Constructor. Derives the public key.
        /// \param privkey a valid private key.
        /// \param ctx the secp context to use.
        key_pair(const privkey_t& privkey, secp256k1_context* ctx);

        /// Draws private keys from the random source until one is a valid
        /// scalar.
        /// \param rnd entropy source.
        /// \param ctx the secp context to use.
        /// \return a new key pair.
        static auto generate(random_source& rnd, secp256k1_context* ctx)
            -> key_pair;

        [[nodiscard]] auto privkey() const -> const privkey_t&;
        [[nodiscard]] auto pubkey() const -> const pubkey_t&;

        /// Signs a message with this key pair's private key.
        /// \see sign_message
        [[nodiscard]] auto sign(const buffer& msg,
                                secp256k1_context* ctx) const -> signature_t;

        auto operator==(const key_pair& rhs) const -> bool;

      private:
        privkey_t m_privkey;
        pubkey_t m_pubkey;
    };
}

#endif // RHIZA_SRC_COMMON_KEYS_H_
