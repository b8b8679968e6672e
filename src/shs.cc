//
// shs.cc
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

#include "shs.hh"

/*
 THE PROTOCOL (terminology as in KeySchedule.hh):

 # Before:
    Client knows:  K, A, Ap, Bp
    Server knows:  K, B, Bp

 # Messages:
    0. (client generates key-pair a/ap, server generates b/bp)
    1. client hello  :  hmac[K](ap) | ap
    2. server hello  :  hmac[K](bp) | bp
    3. client auth   :  box[K | a·b | a·B](H)   ... where H = sign[A](K | Bp | hash(a·b)) | Ap
    4. server accept :  box[K | a·b | a·B | A·b](sign[B](K | H | hash(a·b)))

 # Afterwards:
    Server now knows:       Ap  ... the client's identity
    Client encryption key:  hash(hash(hash(K | a·b | a·B | A·b)) | Bp)
    Client nonce:           hmac[K](bp)   [only 1st 24 bytes needed]
    Server encryption key:  hash(hash(hash(K | a·b | a·B | A·b)) | Ap)
    Server nonce:           hmac[K](ap)   [only 1st 24 bytes needed]

 These byte layouts follow the deployed implementations (Scuttlebutt, shs1-c), which differ in
 small ways from the paper; changing any of them breaks interoperability.
 */


#define _UNUSED
#ifdef __has_attribute
#  if __has_attribute(unused)
#    undef _UNUSED
#    define _UNUSED __attribute__((unused))
#  endif
#endif


namespace shs1::impl {
    using namespace std;


    template <class T>
    static void erase(optional<T> &value) {
        if (value) {
            monocypher::wipe(&*value, sizeof(T));
            value.reset();
        }
    }


#pragma mark - COMMON CODE:


    handshake::handshake(network_id const& networkID,
                         signing_key const& signingKey,
                         public_key const& publicKey,
                         ephemeral_key ephemeralKey)
    :_K(networkID)
    ,_X(signingKey)
    ,_Xp(publicKey)
    ,_x(std::move(ephemeralKey))
    ,_xp(_x.publicKey())
    { }


    handshake::~handshake() {
        wipe();
    }


    void handshake::wipe() {
        _x.consume();
        monocypher::wipe(&_X, sizeof(_X));
        eraseSharedSecrets();
        erase(_hashab);
        erase(_serverAckKey);
        erase(_H);
    }


    // Once the server-accept key exists, the raw DH outputs aren't needed any more.
    void handshake::eraseSharedSecrets() {
        erase(_ab);
        erase(_aB);
        erase(_Ab);
    }


    // hmac[K](xp) | xp
    ChallengeData handshake::createChallenge() {
        return encodeChallenge(networkTag(_K, _xp), _xp);
    }


    // hmac[K](yp) | yp
    bool handshake::verifyChallenge(ChallengeData const& challenge) {
        Challenge c = decodeChallenge(challenge);
        // Check the network before doing any expensive math:
        if (c.tag != networkTag(_K, c.ephemeralKey))
            return false;
        // Now we know yp, the peer's ephemeral public key:
        _ab = _x * c.ephemeralKey;
        _hashab = hash(*_ab);
        _yp = c.ephemeralKey;
        return true;
    }


    void handshake::getOutcome(session_key & encryptionKey,
                               nonce       & encryptionNonce,
                               session_key & decryptionKey,
                               nonce       & decryptionNonce,
                               public_key  & peerPublicKey)
    {
        // Data I send is keyed to the peer's identity, data I receive to mine:
        auto out = sessionKeyFor(_K, _serverAckKey.value(), _Yp.value(), _yp.value());
        auto in  = sessionKeyFor(_K, _serverAckKey.value(), _Xp, _xp);
        encryptionKey   = out.key;
        encryptionNonce = out.firstNonce;
        decryptionKey   = in.key;
        decryptionNonce = in.firstNonce;
        peerPublicKey   = _Yp.value();
        wipe();
    }


#pragma mark - CLIENT:


#define WITH_CLIENT_VARS \
    _UNUSED auto &A  = _X;\
    _UNUSED auto &Ap = _Xp;\
    _UNUSED auto &Bp = _Yp.value();\
    _UNUSED auto &a  = _x;\
    _UNUSED auto &ap = _xp;\
    _UNUSED auto &bp = _yp.value();


    void handshake::setServerPublicKey(const public_key &pk) {
        _Yp = pk;
    }


    // box[K | a·b | a·B](H)
    ClientAuthData handshake::createClientAuth() {
        WITH_CLIENT_VARS
        // Compute H = sign[A](K | Bp | hash(a·b)) | Ap
        _H = encodeClientHello(A.sign(clientAuthStatement(_K, Bp, _hashab.value()), Ap), Ap);
        _Ab = A * bp;
        _aB = a * Bp;
        a.consume();    // that was the ephemeral key's last use
        _serverAckKey = serverAckKey(_K, *_ab, *_aB, *_Ab);
        auto auth = sealClientAuth(clientAuthKey(_K, *_ab, *_aB), *_H);
        eraseSharedSecrets();
        return auth;
    }


    // ack = box[K | a·b | a·B | A·b](sign[B](K | H | hash(a·b)))
    bool handshake::verifyServerAck(ServerAckData const& ack) {
        WITH_CLIENT_VARS
        // Unbox, producing the signature.
        // Then verify it's the true signature of K | H | hash(a·b).
        if (auto sig = openServerAck(_serverAckKey.value(), ack))
            return Bp.check(*sig, serverAckStatement(_K, _H.value(), _hashab.value()));
        else
            return false;
    }


#pragma mark - SERVER:


#define WITH_SERVER_VARS \
        _UNUSED auto &B  = _X;\
        _UNUSED auto &Bp = _Xp;\
        _UNUSED auto &b  = _x;\
        _UNUSED auto &bp = _xp;\
        _UNUSED auto &ap = _yp.value();\


    // auth = box[K | a·b | a·B](H)   ... where H = sign[A](K | Bp | hash(a·b)) | Ap
    bool handshake::verifyClientAuth(ClientAuthData const& auth) {
        WITH_SERVER_VARS
        _aB = B * ap;           // because a·Bp == ap·B == B·ap
        auto H = openClientAuth(clientAuthKey(_K, *_ab, *_aB), auth);
        if (!H)
            return false;

        // Split H into `sign[A](K | Bp | hash(a·b))` and `Ap`, and verify the signature:
        public_key Ap = clientHelloKey(*H);
        if (!Ap.check(clientHelloSignature(*H), clientAuthStatement(_K, Bp, _hashab.value())))
            return false;

        // Only now is the client's identity known to be genuine:
        _Ab = b * Ap;           // because A·bp == Ap·b == b·Ap
        b.consume();
        _Yp = Ap;
        _H = *H;
        _serverAckKey = serverAckKey(_K, *_ab, *_aB, *_Ab);
        eraseSharedSecrets();
        return true;
    }


    // box[K | a·b | a·B | A·b](sign[B](K | H | hash(a·b)))
    ServerAckData handshake::createServerAck() {
        WITH_SERVER_VARS
        return sealServerAck(_serverAckKey.value(),
                             B.sign(serverAckStatement(_K, _H.value(), _hashab.value()), Bp));
    }

}
