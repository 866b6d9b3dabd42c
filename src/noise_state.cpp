#include "kklink/noise_state.hpp"

#include <algorithm>
#include <cstring>
#include <limits>

#include "kklink/errors.hpp"
#include "kklink/version.hpp"

namespace KKLink {
namespace noise {

// --- CipherState ---

CipherState::CipherState(const SymmetricKey& key) {
    initialize_key(key);
}

CipherState::~CipherState() {
    Crypto::wipe(key_.data(), key_.size());
}

CipherState::CipherState(CipherState&& other) noexcept
    : key_(other.key_), has_key_(other.has_key_), nonce_(other.nonce_) {
    Crypto::wipe(other.key_.data(), other.key_.size());
    other.has_key_ = false;
    other.nonce_ = 0;
}

CipherState& CipherState::operator=(CipherState&& other) noexcept {
    if (this != &other) {
        key_ = other.key_;
        has_key_ = other.has_key_;
        nonce_ = other.nonce_;
        Crypto::wipe(other.key_.data(), other.key_.size());
        other.has_key_ = false;
        other.nonce_ = 0;
    }
    return *this;
}

void CipherState::initialize_key(const SymmetricKey& key) {
    key_ = key;
    has_key_ = true;
    nonce_ = 0;
}

byte_vector CipherState::encrypt_with_ad(const byte_vector& ad, const byte_vector& plaintext) {
    if (!has_key_) {
        return plaintext;
    }
    // 2^64-1 is reserved by the Noise framework
    if (nonce_ == std::numeric_limits<uint64_t>::max()) {
        throw CryptoError("Nonce exhausted, the session must be rebuilt.");
    }
    byte_vector ciphertext = Crypto::aead_encrypt(key_, nonce_, ad, plaintext);
    ++nonce_;
    return ciphertext;
}

byte_vector CipherState::decrypt_with_ad(const byte_vector& ad, const byte_vector& ciphertext) {
    if (!has_key_) {
        return ciphertext;
    }
    if (nonce_ == std::numeric_limits<uint64_t>::max()) {
        throw CryptoError("Nonce exhausted, the session must be rebuilt.");
    }
    byte_vector plaintext = Crypto::aead_decrypt(key_, nonce_, ad, ciphertext);
    ++nonce_;
    return plaintext;
}


// --- SymmetricState ---

SymmetricState::SymmetricState(const char* protocol_name) {
    size_t name_size = std::strlen(protocol_name);
    if (name_size <= HASH_SIZE) {
        std::memcpy(h_.data(), protocol_name, name_size);
    } else {
        h_ = Crypto::sha256(byte_vector(protocol_name, protocol_name + name_size));
    }
    ck_ = h_;
}

SymmetricState::~SymmetricState() {
    Crypto::wipe(ck_.data(), ck_.size());
}

void SymmetricState::mix_key(const byte_vector& input_key_material) {
    Crypto::HkdfOutput out = Crypto::hkdf2(ck_, input_key_material);
    ck_ = out.first;
    cipher_.initialize_key(out.second);
    Crypto::wipe(&out, sizeof(out));
}

void SymmetricState::mix_hash(const byte_vector& data) {
    byte_vector input(h_.begin(), h_.end());
    input.insert(input.end(), data.begin(), data.end());
    h_ = Crypto::sha256(input);
}

byte_vector SymmetricState::encrypt_and_hash(const byte_vector& plaintext) {
    byte_vector h(h_.begin(), h_.end());
    byte_vector ciphertext = cipher_.encrypt_with_ad(h, plaintext);
    mix_hash(ciphertext);
    return ciphertext;
}

byte_vector SymmetricState::decrypt_and_hash(const byte_vector& ciphertext) {
    byte_vector h(h_.begin(), h_.end());
    byte_vector plaintext = cipher_.decrypt_with_ad(h, ciphertext);
    mix_hash(ciphertext);
    return plaintext;
}

std::pair<CipherState, CipherState> SymmetricState::split() {
    Crypto::HkdfOutput out = Crypto::hkdf2(ck_, byte_vector{});
    std::pair<CipherState, CipherState> states(CipherState(out.first), CipherState(out.second));
    Crypto::wipe(&out, sizeof(out));
    return states;
}


// --- HandshakeState ---

namespace {
    // KK has exactly two messages
    constexpr size_t KK_MESSAGE_COUNT = 2;

    byte_vector to_bytes(const PublicKey& key) {
        return byte_vector(key.data.begin(), key.data.end());
    }

    byte_vector to_bytes(const SymmetricKey& key) {
        return byte_vector(key.begin(), key.end());
    }
}

HandshakeState::HandshakeState(bool initiator, const SecretKey& local_static, const PublicKey& remote_static,
                               const HandshakeOptions& options)
    : symmetric_(PROTOCOL_NAME), initiator_(initiator), s_(local_static), rs_(remote_static) {
    if (Crypto::init() != 0) {
        throw CryptoError("Failed to initialize the crypto library.");
    }

    if (options.local_ephemeral) {
        e_ = *options.local_ephemeral;
        e_pub_ = Crypto::derive_public_key(e_);
        fixed_ephemeral_ = true;
    }

    symmetric_.mix_hash(options.prologue);

    // Pre-messages: the initiator's static key, then the responder's
    PublicKey local_static_pub = Crypto::derive_public_key(s_);
    if (initiator_) {
        symmetric_.mix_hash(to_bytes(local_static_pub));
        symmetric_.mix_hash(to_bytes(rs_));
    } else {
        symmetric_.mix_hash(to_bytes(rs_));
        symmetric_.mix_hash(to_bytes(local_static_pub));
    }
}

HandshakeState::~HandshakeState() {
    Crypto::wipe(s_.data.data(), s_.data.size());
    Crypto::wipe(e_.data.data(), e_.data.size());
}

HandshakeState HandshakeState::build_initiator(const SecretKey& local_static, const PublicKey& remote_static,
                                               const HandshakeOptions& options) {
    return HandshakeState(true, local_static, remote_static, options);
}

HandshakeState HandshakeState::build_responder(const SecretKey& local_static, const PublicKey& remote_static,
                                               const HandshakeOptions& options) {
    return HandshakeState(false, local_static, remote_static, options);
}

bool HandshakeState::is_handshake_finished() const {
    return !failed_ && message_index_ >= KK_MESSAGE_COUNT;
}

bool HandshakeState::is_my_turn_to_write() const {
    // The initiator writes the even messages, the responder the odd ones
    return (message_index_ % 2 == 0) == initiator_;
}

void HandshakeState::write_ephemeral(byte_vector& out) {
    if (!fixed_ephemeral_) {
        KeyPair ephemeral = Crypto::generate_keypair();
        e_ = ephemeral.secretKey;
        e_pub_ = ephemeral.publicKey;
        Crypto::wipe(ephemeral.secretKey.data.data(), ephemeral.secretKey.data.size());
    }

    out.insert(out.end(), e_pub_.data.begin(), e_pub_.data.end());
    symmetric_.mix_hash(to_bytes(e_pub_));
}

void HandshakeState::read_ephemeral(const byte_vector& message) {
    if (message.size() < KEY_SIZE) {
        throw CryptoError("Handshake message too short for an ephemeral key.");
    }
    std::copy(message.begin(), message.begin() + KEY_SIZE, re_.data.begin());
    symmetric_.mix_hash(to_bytes(re_));
}

void HandshakeState::finish() {
    auto states = symmetric_.split();
    if (initiator_) {
        send_ = std::move(states.first);
        recv_ = std::move(states.second);
    } else {
        send_ = std::move(states.second);
        recv_ = std::move(states.first);
    }
}

byte_vector HandshakeState::write_message(const byte_vector& payload) {
    if (failed_) {
        throw CryptoError("Handshake state is unusable after a failed operation.");
    }
    if (message_index_ >= KK_MESSAGE_COUNT) {
        throw CryptoError("No handshake messages left.");
    }
    if (!is_my_turn_to_write()) {
        throw CryptoError("Unexpected call to write_message, a message must be read first.");
    }
    if (KEY_SIZE + payload.size() + MAC_SIZE > NOISE_MESSAGE_MAX_SIZE) {
        throw CryptoError("Handshake payload too large.");
    }

    try {
        byte_vector out;
        out.reserve(KEY_SIZE + payload.size() + MAC_SIZE);

        write_ephemeral(out);
        if (message_index_ == 0) {
            // es, ss
            SymmetricKey es = Crypto::dh(e_, rs_);
            symmetric_.mix_key(to_bytes(es));
            SymmetricKey ss = Crypto::dh(s_, rs_);
            symmetric_.mix_key(to_bytes(ss));
            Crypto::wipe(es.data(), es.size());
            Crypto::wipe(ss.data(), ss.size());
        } else {
            // ee, se
            SymmetricKey ee = Crypto::dh(e_, re_);
            symmetric_.mix_key(to_bytes(ee));
            SymmetricKey se = Crypto::dh(e_, rs_);
            symmetric_.mix_key(to_bytes(se));
            Crypto::wipe(ee.data(), ee.size());
            Crypto::wipe(se.data(), se.size());
        }

        byte_vector ciphertext = symmetric_.encrypt_and_hash(payload);
        out.insert(out.end(), ciphertext.begin(), ciphertext.end());

        ++message_index_;
        if (message_index_ == KK_MESSAGE_COUNT) {
            finish();
        }
        return out;
    } catch (const Exception&) {
        failed_ = true;
        throw;
    }
}

byte_vector HandshakeState::read_message(const byte_vector& message) {
    if (failed_) {
        throw CryptoError("Handshake state is unusable after a failed operation.");
    }
    if (message_index_ >= KK_MESSAGE_COUNT) {
        throw CryptoError("No handshake messages left.");
    }
    if (is_my_turn_to_write()) {
        throw CryptoError("Unexpected call to read_message, a message must be written first.");
    }
    if (message.size() > NOISE_MESSAGE_MAX_SIZE) {
        throw CryptoError("Handshake message too large.");
    }

    try {
        read_ephemeral(message);
        if (message_index_ == 0) {
            // es, ss
            SymmetricKey es = Crypto::dh(s_, re_);
            symmetric_.mix_key(to_bytes(es));
            SymmetricKey ss = Crypto::dh(s_, rs_);
            symmetric_.mix_key(to_bytes(ss));
            Crypto::wipe(es.data(), es.size());
            Crypto::wipe(ss.data(), ss.size());
        } else {
            // ee, se
            SymmetricKey ee = Crypto::dh(e_, re_);
            symmetric_.mix_key(to_bytes(ee));
            SymmetricKey se = Crypto::dh(s_, re_);
            symmetric_.mix_key(to_bytes(se));
            Crypto::wipe(ee.data(), ee.size());
            Crypto::wipe(se.data(), se.size());
        }

        byte_vector ciphertext(message.begin() + KEY_SIZE, message.end());
        byte_vector payload = symmetric_.decrypt_and_hash(ciphertext);

        ++message_index_;
        if (message_index_ == KK_MESSAGE_COUNT) {
            finish();
        }
        return payload;
    } catch (const Exception&) {
        failed_ = true;
        throw;
    }
}

TransportState HandshakeState::into_transport_mode() && {
    if (!is_handshake_finished()) {
        throw CryptoError("Handshake is not finished, cannot enter transport mode.");
    }
    return TransportState(std::move(send_), std::move(recv_), rs_, initiator_);
}


// --- TransportState ---

TransportState::TransportState(CipherState send, CipherState recv, const PublicKey& remote_static, bool initiator)
    : send_(std::move(send)), recv_(std::move(recv)), remote_static_(remote_static), initiator_(initiator) {}

byte_vector TransportState::write_message(const byte_vector& payload) {
    if (payload.size() + MAC_SIZE > NOISE_MESSAGE_MAX_SIZE) {
        throw CryptoError("Transport message too large.");
    }
    return send_.encrypt_with_ad(byte_vector{}, payload);
}

byte_vector TransportState::read_message(const byte_vector& message) {
    if (message.size() > NOISE_MESSAGE_MAX_SIZE) {
        throw CryptoError("Transport message too large.");
    }
    return recv_.decrypt_with_ad(byte_vector{}, message);
}

} // namespace noise
} // namespace KKLink
