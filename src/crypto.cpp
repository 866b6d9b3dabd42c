#include "kklink/crypto.hpp"

#include <sodium.h>

#include <atomic>

#include "kklink/errors.hpp"

namespace KKLink {

    static std::atomic<bool> g_sodium_initialized = false;

    // ChaChaPoly nonce: 32 bits of zeros followed by the little-endian counter.
    static std::array<uint8_t, crypto_aead_chacha20poly1305_ietf_NPUBBYTES> make_nonce(uint64_t counter) {
        std::array<uint8_t, crypto_aead_chacha20poly1305_ietf_NPUBBYTES> nonce{};
        for (size_t i = 0; i < sizeof(counter); ++i) {
            nonce[4 + i] = static_cast<uint8_t>(counter >> (8 * i));
        }
        return nonce;
    }

    int Crypto::init() {
        if (g_sodium_initialized) {
            return 0;  // Already successfully initialized
        }

        if (sodium_init() < 0) {
            return -1;  // Initialization failed
        }

        g_sodium_initialized = true;
        return 0;
    }

    KeyPair Crypto::generate_keypair() {
        static_assert(crypto_box_PUBLICKEYBYTES == KEY_SIZE, "Curve25519 public keys are 32 bytes");
        static_assert(crypto_box_SECRETKEYBYTES == KEY_SIZE, "Curve25519 secret keys are 32 bytes");

        KeyPair kp;
        crypto_box_keypair(kp.publicKey.data.data(), kp.secretKey.data.data());
        return kp;
    }

    PublicKey Crypto::derive_public_key(const SecretKey& secret_key) {
        PublicKey pk;
        if (crypto_scalarmult_base(pk.data.data(), secret_key.data.data()) != 0) {
            throw CryptoError("Failed to derive public key.");
        }
        return pk;
    }

    SymmetricKey Crypto::dh(const SecretKey& secret_key, const PublicKey& public_key) {
        SymmetricKey shared;
        if (crypto_scalarmult(shared.data(), secret_key.data.data(), public_key.data.data()) != 0) {
            throw CryptoError("Diffie-Hellman failed: invalid public key.");
        }
        return shared;
    }

    Digest Crypto::sha256(const byte_vector& data) {
        Digest digest;
        crypto_hash_sha256(digest.data(), data.data(), data.size());
        return digest;
    }

    Digest Crypto::hmac_sha256(const uint8_t* key, size_t key_size, const byte_vector& data) {
        crypto_auth_hmacsha256_state state;
        Digest mac;
        crypto_auth_hmacsha256_init(&state, key, key_size);
        crypto_auth_hmacsha256_update(&state, data.data(), data.size());
        crypto_auth_hmacsha256_final(&state, mac.data());
        sodium_memzero(&state, sizeof(state));
        return mac;
    }

    Crypto::HkdfOutput Crypto::hkdf2(const Digest& chaining_key, const byte_vector& input_key_material) {
        Digest temp_key = hmac_sha256(chaining_key.data(), chaining_key.size(), input_key_material);

        HkdfOutput out;
        out.first = hmac_sha256(temp_key.data(), temp_key.size(), byte_vector{0x01});

        byte_vector second_input(out.first.begin(), out.first.end());
        second_input.push_back(0x02);
        out.second = hmac_sha256(temp_key.data(), temp_key.size(), second_input);

        sodium_memzero(temp_key.data(), temp_key.size());
        sodium_memzero(second_input.data(), second_input.size());
        return out;
    }

    byte_vector Crypto::aead_encrypt(const SymmetricKey& key, uint64_t nonce, const byte_vector& ad,
                                     const byte_vector& plaintext) {
        auto npub = make_nonce(nonce);

        byte_vector ciphertext(plaintext.size() + crypto_aead_chacha20poly1305_ietf_ABYTES);
        unsigned long long ciphertext_len;
        crypto_aead_chacha20poly1305_ietf_encrypt(ciphertext.data(),
                                                  &ciphertext_len,
                                                  plaintext.data(),
                                                  plaintext.size(),
                                                  ad.data(),
                                                  ad.size(),
                                                  nullptr,  // nsec is not used
                                                  npub.data(),
                                                  key.data());
        ciphertext.resize(ciphertext_len);
        return ciphertext;
    }

    byte_vector Crypto::aead_decrypt(const SymmetricKey& key, uint64_t nonce, const byte_vector& ad,
                                     const byte_vector& ciphertext) {
        if (ciphertext.size() < crypto_aead_chacha20poly1305_ietf_ABYTES) {
            throw CryptoError("Ciphertext too small to hold a MAC.");
        }
        auto npub = make_nonce(nonce);

        byte_vector plaintext(ciphertext.size() - crypto_aead_chacha20poly1305_ietf_ABYTES);
        unsigned long long plaintext_len;
        if (crypto_aead_chacha20poly1305_ietf_decrypt(plaintext.data(),
                                                      &plaintext_len,
                                                      nullptr,  // nsec is not used
                                                      ciphertext.data(),
                                                      ciphertext.size(),
                                                      ad.data(),
                                                      ad.size(),
                                                      npub.data(),
                                                      key.data()) != 0) {
            throw CryptoError("Failed to decrypt message. Authentication tag may be invalid.");
        }
        plaintext.resize(plaintext_len);
        return plaintext;
    }

    void Crypto::wipe(void* data, size_t size) {
        sodium_memzero(data, size);
    }

}  // namespace KKLink
