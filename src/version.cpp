#include "kklink/version.hpp"

#include <algorithm>

namespace KKLink {

    std::vector<uint8_t> HandshakeTag::bytes() {
        return std::vector<uint8_t>(HANDSHAKE_MESSAGE, HANDSHAKE_MESSAGE + HANDSHAKE_MESSAGE_SIZE);
    }

    bool HandshakeTag::matches(const std::vector<uint8_t>& payload) {
        if (payload.size() != HANDSHAKE_MESSAGE_SIZE) {
            return false;
        }
        return std::equal(payload.begin(), payload.end(), reinterpret_cast<const uint8_t*>(HANDSHAKE_MESSAGE));
    }

}  // namespace KKLink
