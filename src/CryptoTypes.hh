//
// CryptoTypes.hh
//
// Copyright © 2022 Jens Alfke. All rights reserved.
//

#pragma once
#include "monocypher/encryption.hh"
#include "monocypher/hash.hh"
#include "monocypher/key_exchange.hh"
#include "monocypher/signatures.hh"
#include "monocypher/ext/ed25519.hh"
#include "monocypher/ext/sha256.hh"
#include <stdexcept>

#ifndef SHS1_SCUTTLEBUTT_COMPATIBLE
/// If this is true, use XSalsa20 instead of XChaCha20, for compatibility with other
/// implementations of SecretHandshake.
#define SHS1_SCUTTLEBUTT_COMPATIBLE 1
#endif

#if SHS1_SCUTTLEBUTT_COMPATIBLE
#include "monocypher/ext/xsalsa20.hh"
#endif


namespace shs1::impl {
    template <size_t S> using byte_array = monocypher::byte_array<S>;
    template <size_t S> using secret_byte_array = monocypher::secret_byte_array<S>;
    using input_bytes    = monocypher::input_bytes;

    using network_id     = byte_array<32>;

    // Long-term (Ed25519) identity keys:
    using key_pair       = monocypher::key_pair<monocypher::Ed25519>;
    using signing_key    = monocypher::signing_key<monocypher::Ed25519>;
    using public_key     = monocypher::public_key<monocypher::Ed25519>;
    using signature      = signing_key::signature;

    // Ephemeral (X25519) Diffie-Hellman keys:
    using key_exchange     = monocypher::key_exchange<monocypher::X25519_Raw>;
    using kx_public_key    = key_exchange::public_key;
    using kx_secret_key    = key_exchange::secret_key;
    using kx_shared_secret = key_exchange::shared_secret;

    using sha256         = monocypher::ext::sha256;

    /// HMAC-SHA-512-256, i.e. the first 256 bits of HMAC-SHA-512.
    struct sha512256 : public byte_array<32> { };

    using session_key    = secret_byte_array<32>;
    using nonce          = byte_array<24>;

#if SHS1_SCUTTLEBUTT_COMPATIBLE
    using box_key = monocypher::session::encryption_key<monocypher::ext::XSalsa20_Poly1305>;
#else
    using box_key = monocypher::session::key;
#endif

    /// Size of the authentication tag a box adds to its plaintext.
    static constexpr size_t kBoxTagSize = 16;


    /// Thrown when a crypto primitive produces an unusable result, such as an all-zero
    /// Diffie-Hellman shared secret. Never thrown when both peers follow the protocol.
    class crypto_error : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

}
