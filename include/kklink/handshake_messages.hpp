#ifndef KKLINK_HANDSHAKE_MESSAGES_HPP
#define KKLINK_HANDSHAKE_MESSAGES_HPP

#include "keys.hpp"
#include "packet.hpp"
#include "version.hpp"

namespace KKLink {

    // e, es, ss
    constexpr size_t KK_MSG_1_SIZE = KEY_SIZE + HANDSHAKE_MESSAGE_SIZE + MAC_SIZE;
    // e, ee, se
    constexpr size_t KK_MSG_2_SIZE = KEY_SIZE + MAC_SIZE;

    // --- Handshake Data Structures ---

    // Message sent during the first round of the KK handshake (e, es, ss)
    struct MessageActOne {
        std::array<uint8_t, KK_MSG_1_SIZE> data{};

        byte_vector serialize() const;
        static MessageActOne deserialize(const byte_vector& data);
    };

    // Message sent during the final round of the KK handshake (e, ee, se)
    struct MessageActTwo {
        std::array<uint8_t, KK_MSG_2_SIZE> data{};

        byte_vector serialize() const;
        static MessageActTwo deserialize(const byte_vector& data);
    };

}  // namespace KKLink

#endif  // KKLINK_HANDSHAKE_MESSAGES_HPP
