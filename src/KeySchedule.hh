//
// KeySchedule.hh
//
// Copyright © 2022 Jens Alfke. All rights reserved.
//

#pragma once
#include "CryptoTypes.hh"
#include <optional>

/*
 The SHS1 key schedule, as pure functions. Names follow the protocol description:

    "A" means "client" and "B" means "server".
    K       : the network ID (a 256-bit constant known to both)
    (A, Ap) : client's long-term Ed25519 key pair
    (B, Bp) : server's long-term Ed25519 key pair
    (a, ap) : client's ephemeral X25519 key pair
    (b, bp) : server's ephemeral X25519 key pair

    x | y       : concatenation
    x · y       : X25519 of my _private_ key x and the peer's _public_ key y, i.e. x·yp,
                  which is the same as y·xp. Ed25519 keys are converted to X25519 first.
    hmac[k](d)  : HMAC-SHA-512-256 of `d` with key `k`
    hash(d)     : SHA-256 of `d`
    sign[k](d)  : Ed25519 signature of `d` with key `k`
    box[k](d)   : XSalsa20-Poly1305 secret box of `d` with key `k` and an all-zero nonce

 The three shared secrets are a·b (== b·a), a·B (== B·a) and A·b (== b·A).
 */

namespace shs1::impl {

    sha256 hash(input_bytes);

    /// hmac[K](in)
    sha512256 hmac(network_id const& K, input_bytes in);

    /// The first 24 bytes of an HMAC, used as a nonce.
    nonce hashToNonce(sha512256 const&);


    /// An ephemeral X25519 key-pair, good for exactly one handshake.
    /// It can be moved but not copied. Once `consume` has been called (or it's been moved from)
    /// its secret is gone and any further Diffie-Hellman with it throws std::logic_error.
    class ephemeral_key {
    public:
        /// Generates a random key-pair.
        ephemeral_key();

        /// Uses a specific secret key; only for reproducing test vectors.
        explicit ephemeral_key(kx_secret_key const&);

        ephemeral_key(ephemeral_key&&);
        ephemeral_key& operator=(ephemeral_key&&);
        ephemeral_key(ephemeral_key const&) = delete;
        ephemeral_key& operator=(ephemeral_key const&) = delete;
        ~ephemeral_key();

        kx_public_key const& publicKey() const  {return _publicKey;}

        /// Diffie-Hellman with a peer's ephemeral key.
        kx_shared_secret operator* (kx_public_key const&) const;
        /// Diffie-Hellman with a peer's long-term key.
        kx_shared_secret operator* (public_key const&) const;

        /// Wipes the secret key.
        void consume();
        bool consumed() const                   {return !_kx.has_value();}

    private:
        key_exchange const& secret() const;

        std::optional<key_exchange> _kx;
        kx_public_key               _publicKey;
    };


    /// Diffie-Hellman of a long-term signing key with a peer's ephemeral key.
    kx_shared_secret operator* (signing_key const&, kx_public_key const&);


    /// hmac[K](xp): the tag that proves a hello message belongs to network K.
    sha512256 networkTag(network_id const& K, kx_public_key const& xp);

    /// hash(K | a·b | a·B): the key of the client-auth box (msg3).
    box_key clientAuthKey(network_id const& K,
                          kx_shared_secret const& ab,
                          kx_shared_secret const& aB);

    /// hash(K | a·b | a·B | A·b): the key of the server-accept box (msg4), which is also the
    /// root of the session keys.
    box_key serverAckKey(network_id const& K,
                         kx_shared_secret const& ab,
                         kx_shared_secret const& aB,
                         kx_shared_secret const& Ab);

    /// K | Bp | hash(a·b): what the client signs in msg3.
    byte_array<96> clientAuthStatement(network_id const& K,
                                       public_key const& Bp,
                                       sha256 const& hashab);

    /// K | H | hash(a·b): what the server signs in msg4, where H is msg3's plaintext.
    byte_array<160> serverAckStatement(network_id const& K,
                                       byte_array<96> const& H,
                                       sha256 const& hashab);


    /// One direction of a session: the key and starting nonce for data sent to `recipient`.
    struct directional_key {
        session_key key;
        nonce       firstNonce;
    };

    /// hash(hash(serverAckKey) | recipient), with nonce hmac[K](recipientEphemeral).
    /// Mixing in the recipient's identity keeps the two directions' keys distinct.
    directional_key sessionKeyFor(network_id const& K,
                                  box_key const& serverAckKey,
                                  public_key const& recipient,
                                  kx_public_key const& recipientEphemeral);

}
