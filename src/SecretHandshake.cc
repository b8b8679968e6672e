//
// SecretHandshake.cc
//
// Copyright © 2021 Jens Alfke. All rights reserved.
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

#include "shs1/SecretHandshake.hh"
#include "shs.hh"
#include <algorithm>
#include <cassert>
#include <cstring>
#include <iostream>
#include <stdexcept>

// Minimalist logging. Define SHS1_LOG_HANDSHAKE=1 to enable it.
// Never log keys, secrets or message contents.
#ifndef SHS1_LOG_HANDSHAKE
#  define SHS1_LOG_HANDSHAKE 0
#endif
#define LOG  if (SHS1_LOG_HANDSHAKE) std::cerr << "SecretHandshake: " <<

namespace shs1 {


    KeyPair::KeyPair(SigningKey const& sk)
    :signingKey(sk)
    ,publicKey(impl::signing_key(sk).get_public_key())
    { }


    KeyPair KeyPair::generate() {
        auto pair = impl::key_pair::generate();
        return KeyPair(SigningKey(pair.get_seed()));
    }


    bool KeyPair::isValid() const {
        impl::public_key derived = impl::signing_key(signingKey).get_public_key();
        return derived == impl::public_key(publicKey);
    }


    KeyPair::~KeyPair() {
        monocypher::wipe(&signingKey, sizeof(signingKey));
    }


    NetworkID Context::networkIDFromString(const char *str) {
        monocypher::byte_array<32> id;
        id.fillWithString(str);
        return id;
    }


    SessionKeys::~SessionKeys() {
        monocypher::wipe(this, sizeof(*this));
    }


#pragma mark - HANDSHAKE:


    static const char* const kErrorNames[] = {
        "no error", "malformed message", "authentication failure", "protocol violation",
        "internal crypto failure", "client rejected"
    };


    Handshake::Handshake(Context const& context, bool isClient)
    :_context(context)
    ,_isClient(isClient)
    {
        if (!context.keyPair.isValid())
            throw std::invalid_argument("Key-pair's public key doesn't match its signing key");
        _impl = std::make_unique<impl::handshake>(impl::network_id(context.networkID),
                                                  impl::signing_key(context.keyPair.signingKey),
                                                  impl::public_key(context.keyPair.publicKey));
    }


    Handshake::~Handshake() = default;


    void Handshake::nextStep() {
        assert(_step > FailedStep && _step < Finished);
        _step = Step(_step + 1);
        if (_step == Finished)
            LOG "Success!\n";
    }


    Handshake::Error Handshake::fail(Error error) {
        // Complete and Failed are terminal; a late call can't change them.
        if (_step == FailedStep || _step == Finished)
            return error;
        LOG "Step " << _step << "/4: " << kErrorNames[error] << "; HANDSHAKE FAILED\n";
        _step = FailedStep;
        _error = error;
        _impl->wipe();
        _inputBuffer.clear();
        _outputBuffer.clear();
        return error;
    }


    bool Handshake::isSendStep() const {
        switch (_step) {
            case ClientChallenge:
            case ClientAuth:        return _isClient;
            case ServerChallenge:
            case ServerAck:         return !_isClient;
            default:                return false;
        }
    }


    Handshake::State Handshake::state() const {
        switch (_step) {
            case FailedStep:        return Failed;
            case ClientChallenge:   return Init;
            case ServerChallenge:   return _isClient ? AwaitingPeerHello : AwaitingAuthOrAccept;
            case ClientAuth:
            case ServerAck:         return AwaitingAuthOrAccept;
            case Finished:          return Complete;
        }
        return Failed;
    }


    std::vector<uint8_t> Handshake::nextOutboundMessage() {
        if (!isSendStep()) {
            LOG "Unexpected call to nextOutboundMessage\n";
            fail(ProtocolViolation);
            return {};
        }
        std::vector<uint8_t> message;
        try {
            _fillOutputBuffer(message);
        } catch (impl::crypto_error const& x) {
            LOG "Step " << _step << "/4: " << x.what() << "\n";
            fail(InternalCryptoFailure);
            return {};
        }
        LOG "Step " << _step << "/4: Sending " << message.size() << " bytes\n";
        nextStep();
        return message;
    }


    Handshake::Error Handshake::consumeInboundMessage(const void *src, size_t size) {
        if (_step == FailedStep || _step == Finished || isSendStep() || !_inputBuffer.empty()) {
            LOG "Unexpected call to consumeInboundMessage\n";
            return fail(ProtocolViolation);
        }
        LOG "Step " << _step << "/4: Received " << size << " bytes...\n";
        Error error;
        try {
            error = _receivedBytes(src, size);
        } catch (impl::crypto_error const& x) {
            LOG "          ..." << x.what() << "\n";
            error = InternalCryptoFailure;
        }
        if (error != NoError)
            return fail(error);
        LOG "          ...OK!\n";
        nextStep();
        return NoError;
    }


    intptr_t Handshake::receivedBytes(const void *src, size_t count) {
        if (_step == FailedStep)
            return -1;
        size_t needed = byteCountNeeded();
        if (needed == 0)
            return 0;
        count = std::min(count, needed - _inputBuffer.size());
        _inputBuffer.reserve(needed);
        _inputBuffer.insert(_inputBuffer.end(), (const uint8_t*)src, (const uint8_t*)src + count);
        if (_inputBuffer.size() < needed) {
            // Wait for more bytes:
            LOG "          ...Received " << count << " bytes; waiting...\n";
        } else {
            // Buffer has a whole message, so consume it:
            std::vector<uint8_t> message;
            message.swap(_inputBuffer);
            consumeInboundMessage(message.data(), message.size());
        }
        return _step != FailedStep ? intptr_t(count) : -1;
    }


    intptr_t Handshake::copyBytesToSend(void *dst, size_t maxCount) {
        if (_step == FailedStep)
            return -1;
        if (_outputBuffer.empty()) {
            if (!isSendStep())
                return 0;
            _outputBuffer = nextOutboundMessage();
            if (_outputBuffer.empty())
                return -1;
        }
        // Copy bytes from buffer to dst:
        size_t count = std::min(_outputBuffer.size(), maxCount);
        ::memcpy(dst, _outputBuffer.data(), count);
        _outputBuffer.erase(_outputBuffer.begin(), _outputBuffer.begin() + count);
        if (!_outputBuffer.empty())
            LOG "          ...Copied " << count << " bytes; " << _outputBuffer.size() << " to go\n";
        return intptr_t(count);
    }


    SessionKeys Handshake::sessionKeys() {
        if (_step != Finished)
            throw std::logic_error("SHS1 handshake isn't complete");
        if (_sessionTaken)
            throw std::logic_error("SHS1 session keys have already been taken");
        SessionKeys keys;
        _impl->getOutcome((impl::session_key&)keys.encryptionKey,
                          (impl::nonce&)keys.encryptionNonce,
                          (impl::session_key&)keys.decryptionKey,
                          (impl::nonce&)keys.decryptionNonce,
                          (impl::public_key&)keys.peerPublicKey);
        _sessionTaken = true;
        return keys;
    }


    template <class T>
    static T& spaceFor(std::vector<uint8_t> &output) {
        output.resize(sizeof(T));
        return *(T*)output.data();
    }


    // Checks the message length, then runs `verify` on it.
    template <class Message, class Verifier>
    static Handshake::Error verifyMessage(const void *src, size_t size, Verifier verify) {
        auto message = impl::messageFrom<Message>(src, size);
        if (!message)
            return Handshake::MalformedMessage;
        return verify(*message) ? Handshake::NoError : Handshake::AuthenticationFailure;
    }


#pragma mark - CLIENT:


    /* Notes on interpreting client-side failures:
     - AuthenticationFailure on msg2:
         - It's not an SHS1 server, or it uses a different NetworkID
     - EOF instead of msg4:
         - Server has a different public key (it can't open msg3)
         - Server doesn't allow connections from your public key
     - AuthenticationFailure on msg4:
         - Data corruption, or a MITM altering data
     */


    ClientHandshake::ClientHandshake(Context const& context,
                                     PublicKey const& theirPublicKey)
    :Handshake(context, true)
    {
        _impl->setServerPublicKey(impl::public_key(theirPublicKey));
    }


    size_t ClientHandshake::byteCountNeeded() const {
        switch (_step) {
            case ServerChallenge:  return sizeof(impl::ChallengeData);
            case ServerAck:        return sizeof(impl::ServerAckData);
            default:               return 0;
        }
    }


    size_t ClientHandshake::outboundByteCount() const {
        switch (_step) {
            case ClientChallenge:  return sizeof(impl::ChallengeData);
            case ClientAuth:       return sizeof(impl::ClientAuthData);
            default:               return 0;
        }
    }


    Handshake::Error ClientHandshake::_receivedBytes(const void *src, size_t size) {
        switch (_step) {
            case ServerChallenge:
                return verifyMessage<impl::ChallengeData>(src, size, [&](auto &msg) {
                    return _impl->verifyServerChallenge(msg);
                });
            case ServerAck:
                return verifyMessage<impl::ServerAckData>(src, size, [&](auto &msg) {
                    return _impl->verifyServerAck(msg);
                });
            default:
                return ProtocolViolation;
        }
    }


    void ClientHandshake::_fillOutputBuffer(std::vector<uint8_t> &output) {
        switch (_step) {
            case ClientChallenge:
                spaceFor<impl::ChallengeData>(output) = _impl->createClientChallenge();
                break;
            case ClientAuth:
                spaceFor<impl::ClientAuthData>(output) = _impl->createClientAuth();
                break;
            default:
                break;
        }
    }


#pragma mark - SERVER:


    ServerHandshake::ServerHandshake(Context const& context)
    :Handshake(context, false)
    { }


    size_t ServerHandshake::byteCountNeeded() const {
        switch (_step) {
            case ClientChallenge:  return sizeof(impl::ChallengeData);
            case ClientAuth:       return sizeof(impl::ClientAuthData);
            default:               return 0;
        }
    }


    size_t ServerHandshake::outboundByteCount() const {
        switch (_step) {
            case ServerChallenge:  return sizeof(impl::ChallengeData);
            case ServerAck:        return sizeof(impl::ServerAckData);
            default:               return 0;
        }
    }


    Handshake::Error ServerHandshake::_receivedBytes(const void *src, size_t size) {
        switch (_step) {
            case ClientChallenge:
                return verifyMessage<impl::ChallengeData>(src, size, [&](auto &msg) {
                    return _impl->verifyClientChallenge(msg);
                });
            case ClientAuth: {
                Error error = verifyMessage<impl::ClientAuthData>(src, size, [&](auto &msg) {
                    return _impl->verifyClientAuth(msg);
                });
                if (error == NoError && _clientAuth) {
                    bool allowed;
                    try {
                        allowed = _clientAuth(PublicKey(_impl->getPeerPublicKey()));
                    } catch (...) {
                        // The authorizer's exception propagates, but the handshake is over.
                        fail(ClientRejected);
                        throw;
                    }
                    if (!allowed)
                        error = ClientRejected;
                }
                return error;
            }
            default:
                return ProtocolViolation;
        }
    }


    void ServerHandshake::_fillOutputBuffer(std::vector<uint8_t> &output) {
        switch (_step) {
            case ServerChallenge:
                spaceFor<impl::ChallengeData>(output) = _impl->createServerChallenge();
                break;
            case ServerAck:
                spaceFor<impl::ServerAckData>(output) = _impl->createServerAck();
                break;
            default:
                break;
        }
    }

}
