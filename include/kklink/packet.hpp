#ifndef KKLINK_PACKET_HPP
#define KKLINK_PACKET_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "keys.hpp"

namespace KKLink {

    // Using a simple vector of bytes for data representation.
    using byte_vector = std::vector<uint8_t>;

    // Size of the poly1305 MAC
    constexpr size_t MAC_SIZE = 16;
    // Max message size specified by the Noise Protocol Framework
    constexpr size_t NOISE_MESSAGE_MAX_SIZE = 65535;
    // Two bytes are used for the message length prefix
    constexpr size_t LENGTH_PREFIX_SIZE = 2;
    // Message header length plus its MAC
    constexpr size_t NOISE_MESSAGE_HEADER_SIZE = LENGTH_PREFIX_SIZE + MAC_SIZE;
    // Maximum size of a message before being encrypted
    constexpr size_t NOISE_PLAINTEXT_MAX_SIZE = NOISE_MESSAGE_MAX_SIZE - NOISE_MESSAGE_HEADER_SIZE - MAC_SIZE;

    /**
     * @brief Ciphertext of the 2-byte length prefix of a message, MAC'ed on its own.
     */
    struct EncryptedHeader {
        std::array<uint8_t, NOISE_MESSAGE_HEADER_SIZE> data{};
    };

    /**
     * @brief Ciphertext of a message body, or of a whole framed message
     *        (header followed by body) when returned by Channel::encrypt_message.
     */
    struct EncryptedMessage {
        byte_vector data;
    };

    /**
     * @brief Size on the wire of a framed message carrying plaintext_size bytes.
     */
    constexpr size_t encrypted_message_size(size_t plaintext_size) {
        // Length prefix + MAC || Message + MAC
        return NOISE_MESSAGE_HEADER_SIZE + plaintext_size + MAC_SIZE;
    }

    // Big-endian encoding of the length prefix.
    std::array<uint8_t, LENGTH_PREFIX_SIZE> encode_length_prefix(uint16_t length);
    uint16_t decode_length_prefix(const uint8_t* prefix);

} // namespace KKLink

#endif // KKLINK_PACKET_HPP
