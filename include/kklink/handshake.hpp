#ifndef KKLINK_HANDSHAKE_HPP
#define KKLINK_HANDSHAKE_HPP

#include "handshake_messages.hpp"
#include "keys.hpp"
#include "noise_state.hpp"

#include <memory>
#include <utility>
#include <vector>

namespace KKLink {

    class HandshakeActTwo;
    class Channel;

    /**
     * @brief First round of the KK handshake.
     *
     * Each act owns the Noise handshake state and is consumed, by move, by the
     * next one: HandshakeActOne -> HandshakeActTwo -> Channel. A failed act
     * cannot be retried, the caller has to start over from a fresh act one.
     */
    class HandshakeActOne {
    public:
        /**
         * @brief [INITIATOR] Starts the handshake by sharing e, es, ss.
         * @param my_secret Our static secret key.
         * @param their_public The static public key of the party we are calling.
         * @return The act to hand to HandshakeActTwo::initiator and the message to send.
         * @throws KKLink::CryptoError on malformed key material.
         */
        static std::pair<HandshakeActOne, MessageActOne> initiator(const SecretKey& my_secret,
                                                                   const PublicKey& their_public);

        /**
         * @brief [RESPONDER] Reads the first message of a caller we don't know yet.
         *
         * The message is tried against each candidate key in order, the first
         * one that decrypts it wins.
         *
         * @param my_secret Our static secret key.
         * @param their_possible_publics The static public keys of every party allowed to call us.
         * @param message The first message received from the initiator.
         * @throws KKLink::HandshakeMismatch if the message decrypts but does not carry our protocol tag.
         * @throws KKLink::MissingStaticKey if no candidate key decrypts the message.
         */
        static HandshakeActOne responder(const SecretKey& my_secret,
                                         const std::vector<PublicKey>& their_possible_publics,
                                         const MessageActOne& message);

        HandshakeActOne(const HandshakeActOne&) = delete;
        HandshakeActOne& operator=(const HandshakeActOne&) = delete;
        HandshakeActOne(HandshakeActOne&&) noexcept = default;
        HandshakeActOne& operator=(HandshakeActOne&&) noexcept = default;

        /**
         * @brief Whether this act has already been consumed by HandshakeActTwo.
         */
        bool is_consumed() const { return !state_; }

    private:
        friend class HandshakeActTwo;
        explicit HandshakeActOne(std::unique_ptr<noise::HandshakeState> state);

        std::unique_ptr<noise::HandshakeState> take_state();

        std::unique_ptr<noise::HandshakeState> state_;
    };

    /**
     * @brief Final round of the KK handshake.
     */
    class HandshakeActTwo {
    public:
        /**
         * @brief [INITIATOR] Reads the responder's reply (e, ee, se).
         * @param handshake The act one returned by HandshakeActOne::initiator.
         * @param message The second message received from the responder.
         * @throws KKLink::CryptoError if the message is corrupted or was not written for us.
         * @throws KKLink::LogicError if the act one was already consumed.
         */
        static HandshakeActTwo initiator(HandshakeActOne handshake, const MessageActTwo& message);

        /**
         * @brief [RESPONDER] Writes our reply (e, ee, se) with an empty payload.
         * @param handshake The act one returned by HandshakeActOne::responder.
         * @return The act to hand to Channel::from_handshake and the message to send.
         * @throws KKLink::LogicError if the act one was already consumed.
         */
        static std::pair<HandshakeActTwo, MessageActTwo> responder(HandshakeActOne handshake);

        HandshakeActTwo(const HandshakeActTwo&) = delete;
        HandshakeActTwo& operator=(const HandshakeActTwo&) = delete;
        HandshakeActTwo(HandshakeActTwo&&) noexcept = default;
        HandshakeActTwo& operator=(HandshakeActTwo&&) noexcept = default;

        bool is_consumed() const { return !state_; }

    private:
        friend class Channel;
        explicit HandshakeActTwo(std::unique_ptr<noise::HandshakeState> state);

        std::unique_ptr<noise::HandshakeState> take_state();

        std::unique_ptr<noise::HandshakeState> state_;
    };

} // namespace KKLink

#endif // KKLINK_HANDSHAKE_HPP
