//
// MessageCodec.cc
//
// Copyright © 2022 Jens Alfke. All rights reserved.
//
// Licensed under the MIT License:
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
// THE SOFTWARE.
//

#include "MessageCodec.hh"


namespace shs1::impl {
    using namespace std;


    // This hardcodes an all-zeroes nonce, which is only safe because the protocol uses each
    // key only once!
    template <size_t InputSize>
    static byte_array<InputSize + kBoxTagSize> box(box_key const& key,
                                                   byte_array<InputSize> const& plaintext) {
        return key.box<InputSize + kBoxTagSize>(monocypher::session::nonce(0), plaintext);
    }


    template <size_t InputSize>
    static optional<byte_array<InputSize - kBoxTagSize>> unbox(box_key const& key,
                                                               byte_array<InputSize> const& ciphertext) {
        byte_array<InputSize - kBoxTagSize> output;
        if (!key.unbox(monocypher::session::nonce(0), ciphertext, output))
            return nullopt;
        return output;
    }


#pragma mark - HELLO:


    // hmac[K](xp) | xp
    ChallengeData encodeChallenge(sha512256 const& tag, kx_public_key const& ephemeralKey) {
        return tag | ephemeralKey;
    }


    Challenge decodeChallenge(ChallengeData const& challenge) {
        auto &tag = challenge.range<0,               sizeof(sha512256)>();
        auto &key = challenge.range<sizeof(sha512256), sizeof(kx_public_key)>();
        return Challenge{tag, kx_public_key(key)};
    }


#pragma mark - CLIENT AUTH:


    // The published protocol paper puts Ap first; every implementation puts it last.
    ClientHello encodeClientHello(signature const& sig, public_key const& clientKey) {
        return sig | clientKey;
    }


    signature const& clientHelloSignature(ClientHello const& H) {
        return reinterpret_cast<signature const&>(H.range<0, sizeof(signature)>());
    }


    public_key clientHelloKey(ClientHello const& H) {
        return public_key(H.range<sizeof(signature), sizeof(public_key)>());
    }


    ClientAuthData sealClientAuth(box_key const& key, ClientHello const& H) {
        return box(key, H);
    }


    optional<ClientHello> openClientAuth(box_key const& key, ClientAuthData const& msg) {
        return unbox(key, msg);
    }


#pragma mark - SERVER ACCEPT:


    ServerAckData sealServerAck(box_key const& key, signature const& sig) {
        return box<sizeof(signature)>(key, sig);
    }


    optional<signature> openServerAck(box_key const& key, ServerAckData const& msg) {
        if (auto sig = unbox(key, msg))
            return reinterpret_cast<signature&>(*sig);
        return nullopt;
    }

}
