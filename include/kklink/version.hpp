#ifndef KKLINK_VERSION_HPP
#define KKLINK_VERSION_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

namespace KKLink {

    // Noise protocol name. Both the pattern and the cipher suite are fixed.
    constexpr char PROTOCOL_NAME[] = "Noise_KK_25519_ChaChaPoly_SHA256";

    // Sent for versioning and identification during the handshake. The
    // terminating NUL is part of the tag, changing wire compatibility means
    // changing this string.
    constexpr char HANDSHAKE_MESSAGE[] = "practical_revault_0";
    constexpr size_t HANDSHAKE_MESSAGE_SIZE = sizeof(HANDSHAKE_MESSAGE);

    /**
     * @brief Produces and checks the protocol tag carried by the first handshake message.
     */
    class HandshakeTag {
    public:
        /**
         * @brief The tag as it is written on the wire.
         */
        static std::vector<uint8_t> bytes();

        /**
         * @brief Checks that a decrypted handshake payload is exactly our tag.
         * @param payload The payload of the first handshake message.
         * @return True if both length and content match.
         */
        static bool matches(const std::vector<uint8_t>& payload);
    };

}  // namespace KKLink

#endif  // KKLINK_VERSION_HPP
