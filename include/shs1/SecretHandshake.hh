//
// SecretHandshake.hh
//
// Copyright © 2021 Jens Alfke. All rights reserved.
//

#pragma once
#include "SecretHandshakeTypes.hh"
#include <functional>
#include <memory>
#include <utility>
#include <vector>

namespace shs1 {
    namespace impl { class handshake; }


    /// An idiomatic C++ implementation of the SHS1
    /// ["Secret Handshake"](https://github.com/auditdrivencrypto/secret-handshake) protocol.
    /// A client and server, each with a long-term key-pair, exchange four fixed-size messages
    /// that authenticate both of them and produce session keys for the traffic that follows.
    /// To connect, the client must already know the server's public key; the server learns the
    /// client's only once it has been proven.
    ///
    /// The handshake does no I/O. Feed it the messages received from the peer, and send the
    /// messages it produces:
    ///
    ///     client: nextOutboundMessage()       -> msg1 (64 bytes)
    ///     server: consumeInboundMessage(msg1)
    ///     server: nextOutboundMessage()       -> msg2 (64 bytes)
    ///     client: consumeInboundMessage(msg2)
    ///     client: nextOutboundMessage()       -> msg3 (112 bytes)
    ///     server: consumeInboundMessage(msg3)
    ///     server: nextOutboundMessage()       -> msg4 (80 bytes)
    ///     client: consumeInboundMessage(msg4)
    ///     both:   sessionKeys()
    ///
    /// Any failure is final: the handshake wipes its secrets and stays failed. Close the
    /// connection; don't tell the peer why.


    /// Abstract base class of the SHS1 protocol.
    /// Superclass of ClientHandshake and ServerHandshake.
    class Handshake {
    public:
        enum Error {
            NoError,                ///< No error (yet)
            MalformedMessage,       ///< Inbound message has the wrong length
            AuthenticationFailure,  ///< A network tag, box or signature didn't verify
            ProtocolViolation,      ///< A method was called out of order
            InternalCryptoFailure,  ///< A crypto primitive failed (e.g. a degenerate DH result)
            ClientRejected,         ///< The server's client authorizer refused the client
        };

        /// Coarse protocol state.
        enum State {
            Init,                   ///< Nothing exchanged yet
            AwaitingPeerHello,      ///< Client has sent its hello, waiting for the server's
            AwaitingAuthOrAccept,   ///< Hellos exchanged; msg3/msg4 under way
            Complete,               ///< Success; session keys are available
            Failed,                 ///< Failure; see `error`
        };

        /// Returns the next message to send to the peer, and advances past it.
        /// An empty vector means there is nothing to send:
        /// * If the handshake is waiting for the peer, it fails with `ProtocolViolation`.
        /// * If it has already finished or failed, it's left as it is and `error()` still returns
        ///   the original result (NoError after success).
        std::vector<uint8_t> nextOutboundMessage();

        /// Processes a complete message received from the peer.
        /// @param src  The message.
        /// @param size  Its length; this must be exactly the length of the expected message.
        /// @return  `NoError` on success, else the reason the handshake has failed.
        Error consumeInboundMessage(const void *src, size_t size);

        Error consumeInboundMessage(std::vector<uint8_t> const& msg) {
            return consumeInboundMessage(msg.data(), msg.size());
        }

        /// After the handshake is complete, returns the results to use for communication.
        /// This can only be called once; afterwards the handshake's secrets are wiped.
        /// @throws std::logic_error  if the handshake isn't complete, or the keys were taken.
        SessionKeys sessionKeys();

        /// Length of the message `consumeInboundMessage` expects next; 0 if none.
        virtual size_t byteCountNeeded() const =0;

        /// Length of the message `nextOutboundMessage` would return; 0 if none.
        virtual size_t outboundByteCount() const =0;

        //---- Partial I/O, for transports that deliver or accept arbitrary chunks of bytes.

        /// Call this when data is received from the peer. Bytes are buffered until a whole
        /// message has arrived, which is then consumed.
        /// @return  The number of bytes used (which may be less than `count`), or -1 on error.
        intptr_t receivedBytes(const void *src, size_t count);

        /// Copies (part of) the pending outbound message to `dst`.
        /// @return  The number of bytes written, 0 if there's nothing to send, or -1 on error.
        intptr_t copyBytesToSend(void *dst, size_t maxCount);

        //---- Status

        State state() const;

        /// Current error; if not NoError, the handshake has failed and you should close the socket.
        Error error() const             {return _error;}

        /// Becomes true when the handshake is complete.
        bool finished() const           {return _step == Finished;}

        /// Becomes true if the handshake fails.
        bool failed() const             {return _step == FailedStep;}

        virtual ~Handshake();

    protected:
        // The four messages, in the order both sides go through them:
        enum Step {
            FailedStep = 0,
            ClientChallenge,    // msg1: client's hello (start here)
            ServerChallenge,    // msg2: server's hello
            ClientAuth,         // msg3: client auth
            ServerAck,          // msg4: server accept
            Finished
        };

        Handshake(Context const&, bool isClient);
        void nextStep();
        Error fail(Error);
        bool isSendStep() const;
        virtual Error _receivedBytes(const void*, size_t) =0;     // verify & process received msg
        virtual void _fillOutputBuffer(std::vector<uint8_t>&) =0; // resize & fill vector with msg

        Context                 _context;                   // Network ID and local key-pair
        Step                    _step = ClientChallenge;    // Current step in protocol, or failed
        Error                   _error = NoError;           // Current error
        std::unique_ptr<impl::handshake> _impl;             // Crypto implementation object
    private:
        std::vector<uint8_t>    _inputBuffer;               // Partially received message
        std::vector<uint8_t>    _outputBuffer;              // Partially sent message
        bool const              _isClient;
        bool                    _sessionTaken = false;
    };



    /// Client (active) side of the protocol.
    class ClientHandshake final : public Handshake {
    public:
        /// Constructs a Client for making a connection to a Server.
        /// @param context  The network ID and the client's key-pair.
        /// @param serverPublicKey  The server's identity. If this is incorrect the handshake fails.
        /// @throws std::invalid_argument  if the key-pair is inconsistent.
        ClientHandshake(Context const& context,
                        PublicKey const& serverPublicKey);

        size_t byteCountNeeded() const override;
        size_t outboundByteCount() const override;
    protected:
        Error _receivedBytes(const void *src, size_t size) override;
        void _fillOutputBuffer(std::vector<uint8_t>&) override;
    };



    /// Server (passive) side of the protocol.
    class ServerHandshake final : public Handshake {
    public:
        /// Constructs a Server for accepting a connection from a Client.
        /// @param context  The network ID and the server's key-pair.
        /// @throws std::invalid_argument  if the key-pair is inconsistent.
        explicit ServerHandshake(Context const& context);

        using ClientAuthorizer = std::function<bool(PublicKey const&)>;

        /// Registers a callback that determines whether a client should be allowed to connect.
        /// It's called with the client's public key only after the client has proven it owns
        /// it, and returns true to allow the connection.
        void setClientAuthorizer(ClientAuthorizer a)    {_clientAuth = std::move(a);}

        size_t byteCountNeeded() const override;
        size_t outboundByteCount() const override;
    protected:
        Error _receivedBytes(const void *src, size_t size) override;
        void _fillOutputBuffer(std::vector<uint8_t>&) override;

        ClientAuthorizer _clientAuth;
    };

}
