#ifndef KKLINK_KEYS_HPP
#define KKLINK_KEYS_HPP

#include <array>
#include <cstddef>
#include <cstdint>

namespace KKLink {

    // The size of a key, either public or secret, on the Curve25519
    constexpr size_t KEY_SIZE = 32;

    // The static public key used to enact Noise authenticated and encrypted channels.
    struct PublicKey {
        std::array<uint8_t, KEY_SIZE> data{};

        bool operator==(const PublicKey& other) const { return data == other.data; }
        bool operator!=(const PublicKey& other) const { return data != other.data; }
    };

    // The static secret key used to enact Noise authenticated and encrypted channels.
    struct SecretKey {
        std::array<uint8_t, KEY_SIZE> data{};
    };

    // A key pair consisting of a public and a secret key.
    struct KeyPair {
        PublicKey publicKey;
        SecretKey secretKey;
    };

} // namespace KKLink

#endif // KKLINK_KEYS_HPP
