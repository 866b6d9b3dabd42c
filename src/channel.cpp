#include "kklink/channel.hpp"
#include "kklink/errors.hpp"

namespace KKLink {

Channel::Channel(std::unique_ptr<noise::TransportState> transport_state)
    : transport_state_(std::move(transport_state)) {}

Channel Channel::from_handshake(HandshakeActTwo handshake) {
    std::unique_ptr<noise::HandshakeState> state = handshake.take_state();
    return Channel(std::make_unique<noise::TransportState>(std::move(*state).into_transport_mode()));
}

noise::TransportState& Channel::state() {
    if (!transport_state_) {
        throw LogicError("Channel was moved from.");
    }
    return *transport_state_;
}

const PublicKey& Channel::remote_static() const {
    // We could not have settled a KK channel without their key
    if (!transport_state_) {
        throw LogicError("Channel was moved from.");
    }
    return transport_state_->remote_static();
}

// --- Data Transfer ---

EncryptedMessage Channel::encrypt_message(const byte_vector& message) {
    if (message.size() > NOISE_PLAINTEXT_MAX_SIZE) {
        throw InvalidPlaintext("Message exceeds the maximum plaintext size.");
    }
    noise::TransportState& transport = state();

    auto prefix = encode_length_prefix(static_cast<uint16_t>(MAC_SIZE + message.size()));

    // Header first, then body: each call consumes one nonce
    byte_vector header = transport.write_message(byte_vector(prefix.begin(), prefix.end()));
    byte_vector body = transport.write_message(message);

    EncryptedMessage output;
    output.data.reserve(encrypted_message_size(message.size()));
    output.data.insert(output.data.end(), header.begin(), header.end());
    output.data.insert(output.data.end(), body.begin(), body.end());

    return output;
}

uint16_t Channel::decrypt_header(const EncryptedHeader& header) {
    byte_vector prefix = state().read_message(byte_vector(header.data.begin(), header.data.end()));
    if (prefix.size() != LENGTH_PREFIX_SIZE) {
        throw CryptoError("Decrypted header has an unexpected size.");
    }
    return decode_length_prefix(prefix.data());
}

byte_vector Channel::decrypt_message(const EncryptedMessage& message) {
    if (message.data.size() > NOISE_MESSAGE_MAX_SIZE) {
        throw InvalidCiphertext("Encrypted message exceeds the maximum Noise message size.");
    }
    if (message.data.size() < MAC_SIZE) {
        throw InvalidCiphertext("Encrypted message is smaller than its MAC.");
    }

    // The MAC is checked and stripped by the transport state
    return state().read_message(message.data);
}

} // namespace KKLink
