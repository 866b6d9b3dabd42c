#include "kklink/handshake_messages.hpp"
#include "kklink/errors.hpp"

#include <algorithm>
#include <string>

namespace KKLink {

// MessageActOne

byte_vector MessageActOne::serialize() const {
    return byte_vector(data.begin(), data.end());
}

MessageActOne MessageActOne::deserialize(const byte_vector& data) {
    if (data.size() != KK_MSG_1_SIZE) {
        throw InvalidArgument("Invalid first handshake message: expected " + std::to_string(KK_MSG_1_SIZE) +
                              " bytes, got " + std::to_string(data.size()) + ".");
    }
    MessageActOne msg;
    std::copy(data.begin(), data.end(), msg.data.begin());
    return msg;
}


// MessageActTwo

byte_vector MessageActTwo::serialize() const {
    return byte_vector(data.begin(), data.end());
}

MessageActTwo MessageActTwo::deserialize(const byte_vector& data) {
    if (data.size() != KK_MSG_2_SIZE) {
        throw InvalidArgument("Invalid second handshake message: expected " + std::to_string(KK_MSG_2_SIZE) +
                              " bytes, got " + std::to_string(data.size()) + ".");
    }
    MessageActTwo msg;
    std::copy(data.begin(), data.end(), msg.data.begin());
    return msg;
}

} // namespace KKLink
