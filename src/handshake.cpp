#include "kklink/handshake.hpp"
#include "kklink/errors.hpp"

#include <algorithm>

namespace KKLink {

// --- Act one ---

HandshakeActOne::HandshakeActOne(std::unique_ptr<noise::HandshakeState> state)
    : state_(std::move(state)) {}

std::unique_ptr<noise::HandshakeState> HandshakeActOne::take_state() {
    if (!state_) {
        throw LogicError("The first act of this handshake was already consumed.");
    }
    return std::move(state_);
}

std::pair<HandshakeActOne, MessageActOne> HandshakeActOne::initiator(const SecretKey& my_secret,
                                                                     const PublicKey& their_public) {
    auto state = std::make_unique<noise::HandshakeState>(
        noise::HandshakeState::build_initiator(my_secret, their_public));

    byte_vector written = state->write_message(HandshakeTag::bytes());
    if (written.size() != KK_MSG_1_SIZE) {
        throw CryptoError("Unexpected size for the first handshake message.");
    }

    MessageActOne msg;
    std::copy(written.begin(), written.end(), msg.data.begin());

    return std::make_pair(HandshakeActOne(std::move(state)), msg);
}

HandshakeActOne HandshakeActOne::responder(const SecretKey& my_secret,
                                           const std::vector<PublicKey>& their_possible_publics,
                                           const MessageActOne& message) {
    byte_vector received = message.serialize();

    // TODO: index candidates by a hint in the first message if the key set grows large,
    // every miss costs two DH and a failed decryption.
    for (const auto& their_public : their_possible_publics) {
        auto state = std::make_unique<noise::HandshakeState>(
            noise::HandshakeState::build_responder(my_secret, their_public));

        byte_vector payload;
        try {
            payload = state->read_message(received);
        } catch (const CryptoError&) {
            // Not this one, a fresh state is built for the next candidate
            continue;
        }

        if (!HandshakeTag::matches(payload)) {
            throw HandshakeMismatch("Handshake payload does not match our protocol tag.");
        }

        return HandshakeActOne(std::move(state));
    }

    throw MissingStaticKey("No known static key could validate the first handshake message.");
}


// --- Act two ---

HandshakeActTwo::HandshakeActTwo(std::unique_ptr<noise::HandshakeState> state)
    : state_(std::move(state)) {}

std::unique_ptr<noise::HandshakeState> HandshakeActTwo::take_state() {
    if (!state_) {
        throw LogicError("The second act of this handshake was already consumed.");
    }
    return std::move(state_);
}

HandshakeActTwo HandshakeActTwo::initiator(HandshakeActOne handshake, const MessageActTwo& message) {
    std::unique_ptr<noise::HandshakeState> state = handshake.take_state();
    if (!state->is_initiator()) {
        throw LogicError("A responder's first act cannot read the second handshake message.");
    }

    // No payload is expected in this message, only its MAC matters
    state->read_message(message.serialize());

    return HandshakeActTwo(std::move(state));
}

std::pair<HandshakeActTwo, MessageActTwo> HandshakeActTwo::responder(HandshakeActOne handshake) {
    std::unique_ptr<noise::HandshakeState> state = handshake.take_state();
    if (state->is_initiator()) {
        throw LogicError("An initiator's first act cannot write the second handshake message.");
    }

    byte_vector written = state->write_message(byte_vector{});
    if (written.size() != KK_MSG_2_SIZE) {
        throw CryptoError("Unexpected size for the second handshake message.");
    }

    MessageActTwo msg;
    std::copy(written.begin(), written.end(), msg.data.begin());

    return std::make_pair(HandshakeActTwo(std::move(state)), msg);
}

} // namespace KKLink
