#ifndef KKLINK_NOISE_STATE_HPP
#define KKLINK_NOISE_STATE_HPP

#include "crypto.hpp"
#include "keys.hpp"
#include "packet.hpp"

#include <cstdint>
#include <optional>
#include <utility>

namespace KKLink {
namespace noise {

    /**
     * @brief A ChaChaPoly key and the counter used as its nonce.
     *
     * The counter advances by one on every successful encryption or
     * decryption. A failed decryption leaves it untouched.
     */
    class CipherState {
    public:
        CipherState() = default;
        explicit CipherState(const SymmetricKey& key);
        ~CipherState();

        CipherState(const CipherState&) = delete;
        CipherState& operator=(const CipherState&) = delete;
        CipherState(CipherState&& other) noexcept;
        CipherState& operator=(CipherState&& other) noexcept;

        void initialize_key(const SymmetricKey& key);
        bool has_key() const { return has_key_; }
        uint64_t nonce() const { return nonce_; }

        byte_vector encrypt_with_ad(const byte_vector& ad, const byte_vector& plaintext);
        byte_vector decrypt_with_ad(const byte_vector& ad, const byte_vector& ciphertext);

    private:
        SymmetricKey key_{};
        bool has_key_ = false;
        uint64_t nonce_ = 0;
    };

    /**
     * @brief Chaining key and handshake hash, as defined by the Noise framework.
     */
    class SymmetricState {
    public:
        explicit SymmetricState(const char* protocol_name);
        ~SymmetricState();

        SymmetricState(SymmetricState&&) noexcept = default;
        SymmetricState& operator=(SymmetricState&&) noexcept = default;

        void mix_key(const byte_vector& input_key_material);
        void mix_hash(const byte_vector& data);
        byte_vector encrypt_and_hash(const byte_vector& plaintext);
        byte_vector decrypt_and_hash(const byte_vector& ciphertext);
        std::pair<CipherState, CipherState> split();

        const Digest& handshake_hash() const { return h_; }

    private:
        CipherState cipher_;
        Digest ck_{};
        Digest h_{};
    };

    class TransportState;

    /**
     * @brief Optional inputs of a handshake. The defaults are what the protocol uses.
     */
    struct HandshakeOptions {
        // Mixed into the handshake hash before the pre-messages
        byte_vector prologue;
        // Fixed ephemeral secret, to reproduce a known handshake. A fresh one is generated when empty.
        std::optional<SecretKey> local_ephemeral;
    };

    /**
     * @brief A Noise_KK_25519_ChaChaPoly_SHA256 handshake in progress.
     *
     * KK:
     *   -> s
     *   <- s
     *   ...
     *   -> e, es, ss
     *   <- e, ee, se
     */
    class HandshakeState {
    public:
        /**
         * @brief Builds the state of the party sending the first message.
         * @param local_static Our static secret key.
         * @param remote_static The static public key we expect the responder to own.
         */
        static HandshakeState build_initiator(const SecretKey& local_static, const PublicKey& remote_static,
                                              const HandshakeOptions& options = HandshakeOptions());

        /**
         * @brief Builds the state of the party receiving the first message.
         * @param local_static Our static secret key.
         * @param remote_static The static public key we expect the initiator to own.
         */
        static HandshakeState build_responder(const SecretKey& local_static, const PublicKey& remote_static,
                                              const HandshakeOptions& options = HandshakeOptions());

        ~HandshakeState();
        HandshakeState(HandshakeState&&) noexcept = default;
        HandshakeState& operator=(HandshakeState&&) noexcept = default;

        /**
         * @brief Writes the next handshake message carrying the given payload.
         * @throws KKLink::CryptoError if it is not our turn, the handshake is over
         *         or the message would exceed the Noise maximum size.
         */
        byte_vector write_message(const byte_vector& payload);

        /**
         * @brief Reads the next handshake message.
         * @return The decrypted payload.
         * @throws KKLink::CryptoError if the message does not authenticate or arrives out of turn.
         */
        byte_vector read_message(const byte_vector& message);

        bool is_initiator() const { return initiator_; }
        bool is_handshake_finished() const;
        const PublicKey& remote_static() const { return rs_; }
        const Digest& handshake_hash() const { return symmetric_.handshake_hash(); }

        /**
         * @brief Turns a finished handshake into its transport state.
         * @throws KKLink::CryptoError if the handshake is not finished.
         */
        TransportState into_transport_mode() &&;

    private:
        HandshakeState(bool initiator, const SecretKey& local_static, const PublicKey& remote_static,
                       const HandshakeOptions& options);

        bool is_my_turn_to_write() const;
        void write_ephemeral(byte_vector& out);
        void read_ephemeral(const byte_vector& message);
        void finish();

        SymmetricState symmetric_;
        bool initiator_;
        bool failed_ = false;
        size_t message_index_ = 0;

        SecretKey s_;
        SecretKey e_;
        PublicKey e_pub_;
        bool fixed_ephemeral_ = false;
        PublicKey rs_;
        PublicKey re_;

        CipherState send_;
        CipherState recv_;
    };

    /**
     * @brief Post-handshake state: one CipherState per direction.
     *
     * Not thread-safe. Each call advances a nonce counter, so messages must be
     * read in the order the peer wrote them.
     */
    class TransportState {
    public:
        TransportState(TransportState&&) noexcept = default;
        TransportState& operator=(TransportState&&) noexcept = default;

        /**
         * @brief Encrypts one transport message.
         * @throws KKLink::CryptoError if the ciphertext would exceed 65535 bytes.
         */
        byte_vector write_message(const byte_vector& payload);

        /**
         * @brief Decrypts one transport message.
         * @throws KKLink::CryptoError on authentication failure or oversized input.
         */
        byte_vector read_message(const byte_vector& message);

        const PublicKey& remote_static() const { return remote_static_; }
        bool is_initiator() const { return initiator_; }
        uint64_t sending_nonce() const { return send_.nonce(); }
        uint64_t receiving_nonce() const { return recv_.nonce(); }

    private:
        friend class HandshakeState;
        TransportState(CipherState send, CipherState recv, const PublicKey& remote_static, bool initiator);

        CipherState send_;
        CipherState recv_;
        PublicKey remote_static_;
        bool initiator_;
    };

} // namespace noise
} // namespace KKLink

#endif // KKLINK_NOISE_STATE_HPP
