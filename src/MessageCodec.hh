//
// MessageCodec.hh
//
// Copyright © 2022 Jens Alfke. All rights reserved.
//

#pragma once
#include "CryptoTypes.hh"
#include <optional>

namespace shs1::impl {

    // The four wire messages. Each has a fixed length and no framing.

    using ChallengeData  = byte_array<64>;     // msg1, msg2:  hmac[K](xp) | xp
    using ClientAuthData = byte_array<112>;    // msg3:        box[...](H)
    using ServerAckData  = byte_array<80>;     // msg4:        box[...](sign[B](...))

    /// Plaintext of msg3: H = sign[A](K | Bp | hash(a·b)) | Ap
    using ClientHello    = byte_array<96>;

    static_assert(sizeof(ChallengeData)  == 64);
    static_assert(sizeof(ClientAuthData) == sizeof(ClientHello) + kBoxTagSize);
    static_assert(sizeof(ServerAckData)  == sizeof(signature) + kBoxTagSize);


    /// Returns `src` as a `Message` if `size` is exactly the message's length, else nullptr.
    template <class Message>
    Message const* messageFrom(const void *src, size_t size) {
        if (size != sizeof(Message))
            return nullptr;
        return static_cast<Message const*>(src);
    }


    /// A hello message (msg1 or msg2), unpacked.
    struct Challenge {
        byte_array<32> tag;             // hmac[K](xp)
        kx_public_key  ephemeralKey;    // xp
    };

    ChallengeData encodeChallenge(sha512256 const& tag, kx_public_key const& ephemeralKey);
    Challenge decodeChallenge(ChallengeData const&);


    ClientHello encodeClientHello(signature const&, public_key const& clientKey);
    signature const& clientHelloSignature(ClientHello const&);
    public_key clientHelloKey(ClientHello const&);


    /// Encrypts msg3's plaintext. Each key must be used only once.
    ClientAuthData sealClientAuth(box_key const&, ClientHello const&);
    /// Decrypts msg3, or returns nullopt if it's been tampered with or used the wrong key.
    std::optional<ClientHello> openClientAuth(box_key const&, ClientAuthData const&);

    /// Encrypts msg4's plaintext. Each key must be used only once.
    ServerAckData sealServerAck(box_key const&, signature const&);
    /// Decrypts msg4, or returns nullopt if it's been tampered with or used the wrong key.
    std::optional<signature> openServerAck(box_key const&, ServerAckData const&);

}
