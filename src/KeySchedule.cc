//
// KeySchedule.cc
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

#include "KeySchedule.hh"


namespace shs1::impl {
    using namespace std;


    sha256 hash(input_bytes in) {
        return sha256::create(in);
    }


    sha512256 hmac(network_id const& K, input_bytes in) {
        // (HMAC-SHA-512-256 is just the first 256 bits of HMAC-SHA-512.)
        auto h = monocypher::hash<monocypher::SHA512>::createMAC(in, K);
        return reinterpret_cast<sha512256&>(h.range<0, 32>());
    }


    nonce hashToNonce(sha512256 const& h) {
        return h.range<0, sizeof(nonce)>();
    }


    // A peer that sends a low-order curve point forces the shared secret to zero, which would
    // make every key derived from it predictable.
    static kx_shared_secret checked(kx_shared_secret const& secret) {
        uint8_t bits = 0;
        for (uint8_t b : secret)
            bits |= b;
        if (bits == 0)
            throw crypto_error("Diffie-Hellman produced an all-zero shared secret");
        return secret;
    }


#pragma mark - EPHEMERAL KEY:


    ephemeral_key::ephemeral_key()
    :_kx(in_place)
    ,_publicKey(_kx->get_public_key())
    { }


    ephemeral_key::ephemeral_key(kx_secret_key const& sk)
    :_kx(in_place, sk)
    ,_publicKey(_kx->get_public_key())
    { }


    ephemeral_key::ephemeral_key(ephemeral_key &&other)
    :_kx(other._kx)
    ,_publicKey(other._publicKey)
    {
        other.consume();
    }


    ephemeral_key& ephemeral_key::operator=(ephemeral_key &&other) {
        if (&other != this) {
            consume();
            _kx = other._kx;
            _publicKey = other._publicKey;
            other.consume();
        }
        return *this;
    }


    ephemeral_key::~ephemeral_key() {
        consume();
    }


    void ephemeral_key::consume() {
        if (_kx) {
            monocypher::wipe(&*_kx, sizeof(key_exchange));
            _kx.reset();
        }
    }


    key_exchange const& ephemeral_key::secret() const {
        if (!_kx)
            throw logic_error("Ephemeral key has already been used up");
        return *_kx;
    }


    kx_shared_secret ephemeral_key::operator* (kx_public_key const& pk) const {
        return checked(secret() * pk);
    }


    kx_shared_secret ephemeral_key::operator* (public_key const& pk) const {
        return checked(secret() * kx_public_key(pk));
    }


    kx_shared_secret operator* (signing_key const& k, kx_public_key const& pk) {
        return checked(key_exchange(k) * pk);
    }


#pragma mark - DERIVATIONS:


    sha512256 networkTag(network_id const& K, kx_public_key const& xp) {
        return hmac(K, xp);
    }


    // The algorithm generates box keys by running the key material through SHA-256.
    template <class Material>
    static box_key makeBoxKey(Material &keyMaterial) {
        box_key key(hash(keyMaterial));
        monocypher::wipe(&keyMaterial, sizeof(keyMaterial));
        return key;
    }


    box_key clientAuthKey(network_id const& K,
                          kx_shared_secret const& ab,
                          kx_shared_secret const& aB)
    {
        auto material = K | ab | aB;
        return makeBoxKey(material);
    }


    box_key serverAckKey(network_id const& K,
                         kx_shared_secret const& ab,
                         kx_shared_secret const& aB,
                         kx_shared_secret const& Ab)
    {
        auto material = K | ab | aB | Ab;
        return makeBoxKey(material);
    }


    byte_array<96> clientAuthStatement(network_id const& K,
                                       public_key const& Bp,
                                       sha256 const& hashab)
    {
        return K | Bp | hashab;
    }


    byte_array<160> serverAckStatement(network_id const& K,
                                       byte_array<96> const& H,
                                       sha256 const& hashab)
    {
        return K | H | hashab;
    }


    directional_key sessionKeyFor(network_id const& K,
                                  box_key const& serverAckKey,
                                  public_key const& recipient,
                                  kx_public_key const& recipientEphemeral)
    {
        // hash(hash(hash(K | a·b | a·B | A·b)) | recipient):
        auto boxKeyHash = hash(serverAckKey);
        directional_key result;
        result.key = session_key(hash(boxKeyHash | recipient));
        result.firstNonce = hashToNonce(hmac(K, recipientEphemeral));
        monocypher::wipe(&boxKeyHash, sizeof(boxKeyHash));
        return result;
    }

}
