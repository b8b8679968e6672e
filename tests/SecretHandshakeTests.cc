//
// SecretHandshakeTests.cc
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
//

#include "shs1/SecretHandshake.hh"
#include "monocypher/base.hh"
#include "hexString.hh"
#include <iostream>

#include "catch.hpp"

using namespace std;
using namespace shs1;


template <size_t SIZE>
static void randomize(std::array<uint8_t,SIZE> &array) {
    monocypher::randomize(array.data(), SIZE);
}


TEST_CASE("SecretKey", "[SecretHandshake]") {
    KeyPair kp = KeyPair::generate();
    PublicKey pk = kp.publicKey;
    SigningKey sk = kp.signingKey;
    CHECK(kp.isValid());

    KeyPair kp2 = KeyPair(sk);
    PublicKey pk2 = kp2.publicKey;
    CHECK(kp2 == kp);
    CHECK(pk2 == pk);

    KeyPair kp3 = KeyPair(kp.data());
    CHECK(kp3 == kp);

    KeyPair other = KeyPair::generate();
    CHECK(other.publicKey != kp.publicKey);
}


TEST_CASE("Inconsistent KeyPair", "[SecretHandshake]") {
    KeyPair kp = KeyPair::generate();
    KeyPair bad = kp;
    bad.publicKey[3] ^= 0x10;
    CHECK(!bad.isValid());

    PublicKey serverKey = KeyPair::generate().publicKey;
    CHECK_THROWS_AS(ServerHandshake({"App", bad}), std::invalid_argument);
    CHECK_THROWS_AS(ClientHandshake({"App", bad}, serverKey), std::invalid_argument);
}


TEST_CASE("NetworkID", "[SecretHandshake]") {
    NetworkID id = Context::networkIDFromString("");
    CHECK(hexString(id, true) == "00000000 00000000 00000000 00000000 00000000 00000000 00000000 00000000");
    id = Context::networkIDFromString("ABCDEF");
    CHECK(hexString(id, true) == "41424344 45460000 00000000 00000000 00000000 00000000 00000000 00000000");
    id = Context::networkIDFromString("A string that is too long to fit in a NetworkID");
    CHECK(hexString(id, true) == "41207374 72696e67 20746861 74206973 20746f6f 206c6f6e 6720746f 20666974");
}


struct HandshakeTest {
    KeyPair serverKey, clientKey;
    ServerHandshake server;
    ClientHandshake client;

    HandshakeTest()
    :serverKey(KeyPair::generate())
    ,clientKey(KeyPair::generate())
    ,server({"App", serverKey})
    ,client({"App", clientKey}, serverKey.publicKey)
    { }

    bool sendFromTo(Handshake &src, Handshake &dst, size_t expectedCount) {
        // One step of the handshake:
        CHECK(src.byteCountNeeded() == 0);
        CHECK(dst.outboundByteCount() == 0);
        CHECK(src.outboundByteCount() == expectedCount);
        CHECK(dst.byteCountNeeded() == expectedCount);
        vector<uint8_t> message = src.nextOutboundMessage();
        CHECK(message.size() == expectedCount);
        dst.consumeInboundMessage(message);
        return !src.failed() && !dst.failed();
    }

    void runHandshake() {
        REQUIRE(sendFromTo(client, server,  64));
        REQUIRE(sendFromTo(server, client,  64));
        REQUIRE(sendFromTo(client, server, 112));
        REQUIRE(sendFromTo(server, client,  80));
    }
};


TEST_CASE_METHOD(HandshakeTest, "Handshake", "[SecretHandshake]") {
    CHECK(client.state() == Handshake::Init);
    CHECK(server.state() == Handshake::Init);

    // Run the handshake:
    REQUIRE(sendFromTo(client, server,  64));
    CHECK(client.state() == Handshake::AwaitingPeerHello);
    CHECK(server.state() == Handshake::AwaitingAuthOrAccept);
    REQUIRE(sendFromTo(server, client,  64));
    CHECK(client.state() == Handshake::AwaitingAuthOrAccept);
    REQUIRE(sendFromTo(client, server, 112));
    REQUIRE(server.finished() == false);
    REQUIRE(sendFromTo(server, client,  80));

    REQUIRE(server.finished());
    REQUIRE(client.finished());
    CHECK(server.state() == Handshake::Complete);
    CHECK(client.state() == Handshake::Complete);
    CHECK(server.error() == Handshake::NoError);
    CHECK(client.error() == Handshake::NoError);
    CHECK(client.byteCountNeeded() == 0);
    CHECK(client.outboundByteCount() == 0);

    // Check that they ended up with matching session keys, and each other's public keys:
    SessionKeys clientSession = client.sessionKeys(), serverSession = server.sessionKeys();
    CHECK(clientSession.encryptionKey   == serverSession.decryptionKey);
    CHECK(clientSession.encryptionNonce == serverSession.decryptionNonce);
    CHECK(clientSession.decryptionKey   == serverSession.encryptionKey);
    CHECK(clientSession.decryptionNonce == serverSession.encryptionNonce);
    CHECK(clientSession.encryptionKey   != clientSession.decryptionKey);
    CHECK(clientSession.encryptionNonce != clientSession.decryptionNonce);

    CHECK(serverSession.peerPublicKey   == clientKey.publicKey);
    CHECK(clientSession.peerPublicKey   == serverKey.publicKey);

    // The keys can only be taken once:
    CHECK_THROWS_AS(client.sessionKeys(), std::logic_error);
    CHECK_THROWS_AS(server.sessionKeys(), std::logic_error);
}


TEST_CASE_METHOD(HandshakeTest, "Session keys before completion", "[SecretHandshake]") {
    CHECK_THROWS_AS(client.sessionKeys(), std::logic_error);
    REQUIRE(sendFromTo(client, server,  64));
    REQUIRE(sendFromTo(server, client,  64));
    CHECK_THROWS_AS(client.sessionKeys(), std::logic_error);
    CHECK_THROWS_AS(server.sessionKeys(), std::logic_error);
    CHECK(!client.failed());
}


TEST_CASE_METHOD(HandshakeTest, "Handshakes are unique", "[SecretHandshake]") {
    // Same identities, new handshake: everything on the wire and every key must differ.
    ServerHandshake server2({"App", serverKey});
    ClientHandshake client2({"App", clientKey}, serverKey.publicKey);

    vector<uint8_t> msg1 = client.nextOutboundMessage(), msg1b = client2.nextOutboundMessage();
    CHECK(msg1 != msg1b);
    REQUIRE(server.consumeInboundMessage(msg1) == Handshake::NoError);
    REQUIRE(server2.consumeInboundMessage(msg1b) == Handshake::NoError);
    REQUIRE(sendFromTo(server, client,  64));
    REQUIRE(sendFromTo(client, server, 112));
    REQUIRE(sendFromTo(server, client,  80));
    REQUIRE(sendFromTo(server2, client2,  64));
    REQUIRE(sendFromTo(client2, server2, 112));
    REQUIRE(sendFromTo(server2, client2,  80));

    SessionKeys s1 = client.sessionKeys(), s2 = client2.sessionKeys();
    CHECK(s1.encryptionKey   != s2.encryptionKey);
    CHECK(s1.decryptionKey   != s2.decryptionKey);
    CHECK(s1.encryptionNonce != s2.encryptionNonce);
    CHECK(s1.peerPublicKey   == s2.peerPublicKey);
}


TEST_CASE_METHOD(HandshakeTest, "Handshake with wrong server key", "[SecretHandshake]") {
    // Create a client that has the wrong server public key:
    PublicKey badServerKey = serverKey.publicKey;
    badServerKey[17]++;
    ClientHandshake badClient({"App", clientKey}, badServerKey);

    // Run the handshake:
    CHECK(sendFromTo(badClient, server,  64));
    CHECK(sendFromTo(server, badClient,  64));
    CHECK(!sendFromTo(badClient, server, 112));
    CHECK(server.failed());
    CHECK(server.error() == Handshake::AuthenticationFailure);
    CHECK(server.outboundByteCount() == 0);
}


TEST_CASE_METHOD(HandshakeTest, "Handshake with wrong network ID", "[SecretHandshake]") {
    NetworkID otherID = Context::networkIDFromString("App");
    otherID[0] ^= 0x01;     // one bit off

    SECTION("Server rejects client hello") {
        ServerHandshake otherServer({otherID, serverKey});
        CHECK(!sendFromTo(client, otherServer, 64));
        CHECK(otherServer.error() == Handshake::AuthenticationFailure);
        CHECK(otherServer.state() == Handshake::Failed);
    }
    SECTION("Client rejects server hello") {
        ServerHandshake otherServer({otherID, serverKey});
        ClientHandshake otherClient({otherID, clientKey}, serverKey.publicKey);
        REQUIRE(sendFromTo(otherClient, otherServer, 64));
        REQUIRE(client.nextOutboundMessage().size() == 64);
        CHECK(!sendFromTo(otherServer, client, 64));
        CHECK(client.error() == Handshake::AuthenticationFailure);
    }
}


TEST_CASE_METHOD(HandshakeTest, "Handshake with forged messages", "[SecretHandshake]") {
    REQUIRE(sendFromTo(client, server,  64));
    REQUIRE(sendFromTo(server, client,  64));

    SECTION("Random client auth") {
        array<uint8_t,112> garbage;
        randomize(garbage);
        CHECK(server.consumeInboundMessage(garbage.data(), garbage.size())
                == Handshake::AuthenticationFailure);
        CHECK(server.failed());
        CHECK_THROWS_AS(server.sessionKeys(), std::logic_error);
    }
    SECTION("Tampered server accept") {
        REQUIRE(sendFromTo(client, server, 112));
        vector<uint8_t> msg4 = server.nextOutboundMessage();
        msg4[50] ^= 0x20;
        CHECK(client.consumeInboundMessage(msg4) == Handshake::AuthenticationFailure);
        CHECK(client.state() == Handshake::Failed);
    }
}


TEST_CASE("Handshake with truncated messages", "[SecretHandshake]") {
    // At each of the four steps, deliver a message one byte short:
    for (int badStep = 1; badStep <= 4; ++badStep) {
        HandshakeTest t;
        Handshake* sender[4]   = {&t.client, &t.server, &t.client, &t.server};
        Handshake* receiver[4] = {&t.server, &t.client, &t.server, &t.client};
        for (int step = 1; step < badStep; ++step) {
            auto msg = sender[step-1]->nextOutboundMessage();
            REQUIRE(receiver[step-1]->consumeInboundMessage(msg) == Handshake::NoError);
        }
        auto msg = sender[badStep-1]->nextOutboundMessage();
        REQUIRE(!msg.empty());
        msg.pop_back();
        Handshake &dst = *receiver[badStep-1];
        CHECK(dst.consumeInboundMessage(msg) == Handshake::MalformedMessage);
        CHECK(dst.failed());
        CHECK(dst.byteCountNeeded() == 0);
    }
}


TEST_CASE_METHOD(HandshakeTest, "Handshake out of order", "[SecretHandshake]") {
    SECTION("Server speaks first") {
        CHECK(server.nextOutboundMessage().empty());
        CHECK(server.error() == Handshake::ProtocolViolation);
        CHECK(server.state() == Handshake::Failed);
    }
    SECTION("Client reads before sending") {
        uint8_t msg[64] = {};
        CHECK(client.consumeInboundMessage(msg, sizeof(msg)) == Handshake::ProtocolViolation);
        CHECK(client.failed());
    }
    SECTION("Client sends twice") {
        REQUIRE(client.nextOutboundMessage().size() == 64);
        CHECK(client.nextOutboundMessage().empty());
        CHECK(client.error() == Handshake::ProtocolViolation);
    }
}


TEST_CASE_METHOD(HandshakeTest, "Terminal states", "[SecretHandshake]") {
    SECTION("Complete") {
        runHandshake();
        CHECK(client.nextOutboundMessage().empty());
        uint8_t msg[80] = {};
        CHECK(client.consumeInboundMessage(msg, sizeof(msg)) == Handshake::ProtocolViolation);
        CHECK(client.state() == Handshake::Complete);
        CHECK(client.error() == Handshake::NoError);
        CHECK(client.receivedBytes(msg, sizeof(msg)) == 0);
        CHECK(client.copyBytesToSend(msg, sizeof(msg)) == 0);

        // Still usable:
        SessionKeys keys = client.sessionKeys();
        CHECK(keys.peerPublicKey == serverKey.publicKey);
    }
    SECTION("Failed") {
        uint8_t msg[64] = {};
        CHECK(server.consumeInboundMessage(msg, 10) == Handshake::MalformedMessage);
        CHECK(server.consumeInboundMessage(msg, 64) == Handshake::ProtocolViolation);
        CHECK(server.nextOutboundMessage().empty());
        CHECK(server.error() == Handshake::MalformedMessage);
        CHECK(server.state() == Handshake::Failed);
        CHECK(server.receivedBytes(msg, sizeof(msg)) == -1);
        CHECK(server.copyBytesToSend(msg, sizeof(msg)) == -1);
    }
}


TEST_CASE_METHOD(HandshakeTest, "Client authorizer", "[SecretHandshake]") {
    PublicKey seenKey = {};
    bool allow = true, unavailable = false;
    server.setClientAuthorizer([&](PublicKey const& key) {
        seenKey = key;
        if (unavailable)
            throw std::runtime_error("key directory unavailable");
        return allow;
    });

    SECTION("Accept") {
        runHandshake();
        CHECK(seenKey == clientKey.publicKey);
    }
    SECTION("Reject") {
        allow = false;
        REQUIRE(sendFromTo(client, server,  64));
        REQUIRE(sendFromTo(server, client,  64));
        CHECK(!sendFromTo(client, server, 112));
        CHECK(seenKey == clientKey.publicKey);
        CHECK(server.error() == Handshake::ClientRejected);
        CHECK(server.outboundByteCount() == 0);
    }
    SECTION("Authorizer throws") {
        unavailable = true;
        REQUIRE(sendFromTo(client, server,  64));
        REQUIRE(sendFromTo(server, client,  64));
        vector<uint8_t> msg3 = client.nextOutboundMessage();
        CHECK_THROWS_AS(server.consumeInboundMessage(msg3), std::runtime_error);
        CHECK(server.failed());
        CHECK(server.error() == Handshake::ClientRejected);
        CHECK(server.outboundByteCount() == 0);
        CHECK(server.nextOutboundMessage().empty());
        CHECK_THROWS_AS(server.sessionKeys(), std::logic_error);

        // Trying again doesn't revive it:
        CHECK(server.consumeInboundMessage(msg3) == Handshake::ProtocolViolation);
        CHECK(server.state() == Handshake::Failed);
    }
}


TEST_CASE_METHOD(HandshakeTest, "Handshake in pieces", "[SecretHandshake]") {
    // Pass bytes between the two through a tiny buffer, as a socket might:
    auto pump = [](Handshake &src, Handshake &dst, size_t chunk) {
        uint8_t buf[7];
        size_t total = 0;
        intptr_t n;
        while ((n = src.copyBytesToSend(buf, std::min(chunk, sizeof(buf)))) > 0) {
            REQUIRE(dst.receivedBytes(buf, size_t(n)) == n);
            total += size_t(n);
        }
        REQUIRE(n == 0);
        return total;
    };

    CHECK(pump(server, client, 7) == 0);        // nothing to send yet
    CHECK(pump(client, server, 7) == 64);
    CHECK(pump(server, client, 5) == 64);
    CHECK(pump(client, server, 7) == 112);
    CHECK(pump(server, client, 3) == 80);

    REQUIRE(client.finished());
    REQUIRE(server.finished());
    SessionKeys clientSession = client.sessionKeys(), serverSession = server.sessionKeys();
    CHECK(clientSession.encryptionKey == serverSession.decryptionKey);
    CHECK(clientSession.decryptionKey == serverSession.encryptionKey);
    CHECK(serverSession.peerPublicKey == clientKey.publicKey);
}


TEST_CASE_METHOD(HandshakeTest, "Partial input is limited to one message", "[SecretHandshake]") {
    vector<uint8_t> msg1 = client.nextOutboundMessage();
    msg1.resize(100, 0xEE);     // extra bytes past the message
    CHECK(server.receivedBytes(msg1.data(), 30) == 30);
    CHECK(server.state() == Handshake::Init);
    CHECK(server.receivedBytes(&msg1[30], 70) == 34);
    CHECK(server.state() == Handshake::AwaitingAuthOrAccept);
    CHECK(server.receivedBytes(&msg1[64], 36) == 0);
}
