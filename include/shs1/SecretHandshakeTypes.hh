//
// SecretHandshakeTypes.hh
//
// Copyright © 2021 Jens Alfke. All rights reserved.
//

#pragma once
#include <array>
#include <cstdint>
#include <cstring>

namespace shs1 {

    /// Types shared by the client and server sides of the SHS1 ("secret handshake") protocol.
    /// See `SecretHandshake.hh` for the handshake itself.


    /// A 32-byte value shared by every node of a network, out of band.
    /// Client and server must both use the same NetworkID to connect; a handshake between
    /// nodes of different networks fails at the first message.
    using NetworkID = std::array<uint8_t, 32>;

    /// A 256-bit Ed25519 public key: a node's long-term identity.
    /// Data layout is the same as the public key in Sodium's `crypto_sign_` API
    /// and Monocypher's `crypto_ed25519_` API.
    using PublicKey = std::array<uint8_t, 32>;

    /// The secret "seed" of an Ed25519 key-pair, from which the whole pair can be reconstituted.
    using SigningKey = std::array<uint8_t, 32>;

    /// A 256-bit symmetric session key, for use by the transport that runs after the handshake.
    using SessionKey = std::array<uint8_t, 32>;

    /// A 192-bit nonce to go with a `SessionKey`.
    using Nonce = std::array<uint8_t, 24>;

    using KeyPairBytes = std::array<uint8_t, 64>;


    /// A node's long-term Ed25519 key-pair.
    /// Data layout is the same as the "secret key" in Sodium's `crypto_sign_` API.
    struct KeyPair {
        SigningKey signingKey;
        PublicKey  publicKey;

        /// Generates a new random key-pair.
        static KeyPair generate();

        /// Reconstitutes a key-pair from its signing key alone.
        explicit KeyPair(SigningKey const&);

        /// Copies a key-pair in Sodium's 64-byte layout (seed followed by public key.)
        /// The halves are not checked against each other here; a handshake will refuse a
        /// key-pair whose public key doesn't belong to its signing key.
        explicit KeyPair(KeyPairBytes const& bytes) {
            ::memcpy(&signingKey, &bytes, sizeof(bytes));
        }

        KeyPair(KeyPair const&) = default;
        KeyPair& operator=(KeyPair const&) = default;

        KeyPairBytes data() const {
            KeyPairBytes bytes;
            ::memcpy(&bytes, &signingKey, sizeof(bytes));
            return bytes;
        }

        /// True if `publicKey` really is the public half of `signingKey`.
        bool isValid() const;

        ~KeyPair();
    };

    static inline bool operator==(KeyPair const& kp1, KeyPair const& kp2) {
        return kp1.signingKey == kp2.signingKey && kp1.publicKey == kp2.publicKey;
    }



    /// The local, long-lived state needed to start a handshake: network ID and key-pair.
    struct Context {
        Context(NetworkID const& n, KeyPair const& kp)  :networkID(n), keyPair(kp) { }
        Context(char const* str, KeyPair const& kp)     :networkID(networkIDFromString(str)), keyPair(kp) { }

        NetworkID const networkID;  ///< Scopes the handshake to one network
        KeyPair const   keyPair;    ///< This node's long-term identity

        /// Simple transformation of an ASCII string to a NetworkID.
        /// Up to 32 bytes of the string are copied, and the rest is padded with 00.
        static NetworkID networkIDFromString(const char *str);
    };



    /// Result of a successful handshake, handed to the encrypted transport:
    /// * one key and starting nonce per direction,
    /// * and the peer's long-term public key (which is news to the server, but not to the client.)
    /// The client's encryption key/nonce equal the server's decryption key/nonce, and vice versa.
    struct SessionKeys {
        SessionKey  encryptionKey;          ///< Key for data sent to the peer
        Nonce       encryptionNonce;        ///< Starting nonce for data sent to the peer
        SessionKey  decryptionKey;          ///< Key for data received from the peer
        Nonce       decryptionNonce;        ///< Starting nonce for data received from the peer

        PublicKey   peerPublicKey;          ///< The peer's authenticated long-term public key

        ~SessionKeys();
    };

}
