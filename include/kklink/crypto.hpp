#ifndef KKLINK_CRYPTO_HPP
#define KKLINK_CRYPTO_HPP

#include "keys.hpp"
#include "packet.hpp"

#include <array>
#include <cstdint>

namespace KKLink {

    // Output size of SHA-256, also the Noise HASHLEN.
    constexpr size_t HASH_SIZE = 32;

    using SymmetricKey = std::array<uint8_t, KEY_SIZE>;
    using Digest = std::array<uint8_t, HASH_SIZE>;

    /**
     * @brief The 25519 / ChaChaPoly / SHA256 primitives backing the Noise engine.
     */
    class Crypto {
    public:
        /**
         * @brief Initializes the cryptographic library. Safe to call more than once.
         * @return 0 on success, -1 on error.
         */
        static int init();

        /**
         * @brief Generates a Curve25519 key pair.
         * @return A KeyPair object.
         */
        static KeyPair generate_keypair();

        /**
         * @brief Computes the public key matching a secret key.
         */
        static PublicKey derive_public_key(const SecretKey& secret_key);

        /**
         * @brief X25519 Diffie-Hellman.
         * @param secret_key Our secret key.
         * @param public_key Their public key.
         * @return The 32-byte shared secret.
         * @throws KKLink::CryptoError if the public key is a low-order point.
         */
        static SymmetricKey dh(const SecretKey& secret_key, const PublicKey& public_key);

        static Digest sha256(const byte_vector& data);

        static Digest hmac_sha256(const uint8_t* key, size_t key_size, const byte_vector& data);

        /**
         * @brief The two outputs of the Noise HKDF.
         */
        struct HkdfOutput {
            Digest first;
            Digest second;
        };

        /**
         * @brief Noise HKDF(chaining_key, input_key_material) with two outputs.
         */
        static HkdfOutput hkdf2(const Digest& chaining_key, const byte_vector& input_key_material);

        /**
         * @brief Encrypts using ChaCha20-Poly1305 (IETF) with a Noise counter nonce.
         * @param key The symmetric encryption key.
         * @param nonce The message counter.
         * @param ad Associated data, authenticated but not encrypted.
         * @param plaintext The data to encrypt.
         * @return The ciphertext followed by the 16-byte MAC.
         */
        static byte_vector aead_encrypt(const SymmetricKey& key, uint64_t nonce, const byte_vector& ad,
                                        const byte_vector& plaintext);

        /**
         * @brief Decrypts using ChaCha20-Poly1305 (IETF) with a Noise counter nonce.
         * @return The plaintext, MAC stripped.
         * @throws KKLink::CryptoError if the ciphertext does not authenticate.
         */
        static byte_vector aead_decrypt(const SymmetricKey& key, uint64_t nonce, const byte_vector& ad,
                                        const byte_vector& ciphertext);

        /**
         * @brief Overwrites memory holding secret material.
         */
        static void wipe(void* data, size_t size);
    };

} // namespace KKLink

#endif // KKLINK_CRYPTO_HPP
