#include "kklink/packet.hpp"

#include <arpa/inet.h> // For htons, ntohs

#include <algorithm>

namespace KKLink {

std::array<uint8_t, LENGTH_PREFIX_SIZE> encode_length_prefix(uint16_t length) {
    std::array<uint8_t, LENGTH_PREFIX_SIZE> prefix;
    uint16_t be_length = htons(length);
    std::copy(reinterpret_cast<uint8_t*>(&be_length), reinterpret_cast<uint8_t*>(&be_length) + sizeof(be_length), prefix.begin());
    return prefix;
}

uint16_t decode_length_prefix(const uint8_t* prefix) {
    uint16_t be_length;
    std::copy(prefix, prefix + LENGTH_PREFIX_SIZE, reinterpret_cast<uint8_t*>(&be_length));
    return ntohs(be_length);
}

} // namespace KKLink
