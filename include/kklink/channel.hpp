#ifndef KKLINK_CHANNEL_HPP
#define KKLINK_CHANNEL_HPP

#include "handshake.hpp"
#include "keys.hpp"
#include "noise_state.hpp"
#include "packet.hpp"

#include <cstdint>
#include <memory>

namespace KKLink {

    /**
     * @brief A KK Noise channel: symmetric encryption with explicit framing.
     *
     * Every encryption and decryption advances a per-direction nonce, so the
     * peer must decrypt headers and bodies in exactly the order they were
     * produced. A Channel is move-only and not thread-safe; callers that need
     * to share one must serialize access themselves, concurrent calls corrupt
     * the stream for good.
     */
    class Channel {
    public:
        /**
         * @brief Constructs the channel from a final stage KK handshake.
         * @throws KKLink::CryptoError if the handshake is not complete.
         * @throws KKLink::LogicError if the act two was already consumed.
         */
        static Channel from_handshake(HandshakeActTwo handshake);

        Channel(const Channel&) = delete;
        Channel& operator=(const Channel&) = delete;
        Channel(Channel&&) noexcept = default;
        Channel& operator=(Channel&&) noexcept = default;

        /**
         * @brief Encrypts a message no larger than NOISE_PLAINTEXT_MAX_SIZE.
         *
         * The message is prefixed with a 2-byte big-endian length field, MAC'ed
         * on its own, to permit incremental reads. The length is the one of the
         * encrypted body, MAC included.
         *
         * @param message The plaintext.
         * @return The header followed by the body.
         * @throws KKLink::InvalidPlaintext if the message is too large.
         */
        EncryptedMessage encrypt_message(const byte_vector& message);

        /**
         * @brief Gets the size of the encrypted body following this header.
         * @throws KKLink::CryptoError if the header does not authenticate.
         */
        uint16_t decrypt_header(const EncryptedHeader& header);

        /**
         * @brief Gets the plaintext of a body announced by decrypt_header.
         * @throws KKLink::InvalidCiphertext if the body is smaller than a MAC or
         *         larger than a Noise message.
         * @throws KKLink::CryptoError if the body does not authenticate.
         */
        byte_vector decrypt_message(const EncryptedMessage& message);

        /**
         * @brief Gets the static public key of the peer.
         */
        const PublicKey& remote_static() const;

    private:
        explicit Channel(std::unique_ptr<noise::TransportState> transport_state);

        noise::TransportState& state();

        std::unique_ptr<noise::TransportState> transport_state_;
    };

} // namespace KKLink

#endif // KKLINK_CHANNEL_HPP
