//
// shs.hh
//
// Copyright © 2022 Jens Alfke. All rights reserved.
//

#pragma once
#include "KeySchedule.hh"
#include "MessageCodec.hh"
#include <optional>


namespace shs1::impl {

    /// Low-level implementation of the SHS1 crypto operations for one handshake attempt.
    /// It does not check that its methods are called in the right order; `shs1::Handshake` does.
    /// Verification methods return false (having stored nothing from the message) if the message
    /// fails to authenticate. Any method may throw `crypto_error`.
    class handshake {
    public:
        /// @param networkID  The network ID, K.
        /// @param longTermSigningKey  My long-term signing key (A or B).
        /// @param longTermPublicKey  My long-term public key (Ap or Bp).
        /// @param ephemeralKey  My ephemeral key-pair (a/ap or b/bp). Defaults to a random one;
        ///                      unit tests pass specific keys to reproduce test vectors.
        handshake(network_id const& networkID,
                  signing_key const& longTermSigningKey,
                  public_key const& longTermPublicKey,
                  ephemeral_key ephemeralKey = ephemeral_key());

        ~handshake();

        // The client must call these in order:

        void setServerPublicKey(public_key const&);
        ChallengeData createClientChallenge()               {return createChallenge();}
        bool verifyServerChallenge(ChallengeData const& c)  {return verifyChallenge(c);}
        ClientAuthData createClientAuth();
        bool verifyServerAck(ServerAckData const&);

        // The server must call these in order:

        bool verifyClientChallenge(ChallengeData const& c)  {return verifyChallenge(c);}
        ChallengeData createServerChallenge()               {return createChallenge();}
        bool verifyClientAuth(ClientAuthData const&);
        ServerAckData createServerAck();

        /// The peer's long-term public key: known in advance by the client, and learned by the
        /// server once `verifyClientAuth` succeeds.
        public_key const& getPeerPublicKey() const          {return _Yp.value();}

        // Both client and server call this last, to get the session keys.
        // It wipes the intermediate secrets afterwards.
        void getOutcome(session_key &encryptionKey,
                        nonce       &encryptionNonce,
                        session_key &decryptionKey,
                        nonce       &decryptionNonce,
                        public_key  &peerPublicKey);

        /// Securely erases every secret: ephemeral key, shared secrets and derived keys.
        /// The object is unusable afterwards.
        void wipe();

        // optional non-denominational names:
        ChallengeData createChallenge();
        bool verifyChallenge(ChallengeData const&);

    private:
        void eraseSharedSecrets();

        // Input data. Here, 'x' means 'me' and 'y' means 'the peer'.
        network_id const                 _K;             // Network ID
        signing_key                      _X;             // My signing key (A or B)
        public_key                       _Xp;            // My public key (Ap or Bp)
        ephemeral_key                    _x;             // My ephemeral key-pair (a or b)
        kx_public_key                    _xp;            // My ephemeral public key (ap or bp)

        // These get set as the handshake progresses:
        std::optional<public_key>        _Yp;            // Peer's public key (Bp or Ap)
        std::optional<kx_public_key>     _yp;            // Peer's ephemeral public key (bp or ap)
        std::optional<kx_shared_secret>  _ab;            // _x * _yp, which is a·b on both sides
        std::optional<sha256>            _hashab;        // SHA256(a·b)
        std::optional<kx_shared_secret>  _aB;            // a·Bp, which is also B·ap
        std::optional<kx_shared_secret>  _Ab;            // A·bp, which is also b·Ap
        std::optional<box_key>           _serverAckKey;  // hash(K | a·b | a·B | A·b)
        std::optional<ClientHello>       _H;             // sign[A](K | Bp | hash(a·b)) | Ap
    };

}
