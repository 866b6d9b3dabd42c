#include <algorithm>
#include <iostream>
#include <string>
#include <vector>
#include <cassert>
#include <cstdio>

#include "kklink/channel.hpp"
#include "kklink/crypto.hpp"
#include "kklink/errors.hpp"
#include "kklink/handshake.hpp"
#include "kklink/packet.hpp"

void print_bytes(const std::string& title, const uint8_t* data, size_t size) {
    std::cout << title << " (" << size << " bytes): ";
    for (size_t i = 0; i < size && i < 24; ++i) {
        printf("%02x", data[i]);
    }
    if (size > 24) {
        std::cout << "...";
    }
    std::cout << std::endl;
}

void print_bytes(const std::string& title, const KKLink::byte_vector& bytes) {
    print_bytes(title, bytes.data(), bytes.size());
}

int main() {
    // 1. Initialize the crypto library
    if (KKLink::Crypto::init() != 0) {
        std::cerr << "Failed to initialize crypto library!" << std::endl;
        return 1;
    }
    std::cout << "Crypto library initialized." << std::endl;

    // 2. Both parties know each other's static public key beforehand
    auto client_keys = KKLink::Crypto::generate_keypair();
    auto server_keys = KKLink::Crypto::generate_keypair();
    print_bytes("Client Public Key", client_keys.publicKey.data.data(), KKLink::KEY_SIZE);
    print_bytes("Server Public Key", server_keys.publicKey.data.data(), KKLink::KEY_SIZE);

    // The server accepts a few clients, ours is among them
    std::vector<KKLink::PublicKey> allowed_clients;
    allowed_clients.push_back(KKLink::Crypto::generate_keypair().publicKey);
    allowed_clients.push_back(client_keys.publicKey);

    std::cout << "\n--- Starting Handshake ---" << std::endl;

    // 3. Act one: the client writes its first message
    auto client_act_1 = KKLink::HandshakeActOne::initiator(client_keys.secretKey, server_keys.publicKey);
    std::cout << "[C->S] Sending act one" << std::endl;
    print_bytes("  Message", client_act_1.second.serialize());

    // 4. The server reads it, finding out who is calling
    auto server_act_1 = KKLink::HandshakeActOne::responder(server_keys.secretKey, allowed_clients,
                                                           client_act_1.second);
    std::cout << "[SERVER] Client identified." << std::endl;

    // 5. Act two: the server answers
    auto server_act_2 = KKLink::HandshakeActTwo::responder(std::move(server_act_1));
    std::cout << "[S->C] Sending act two" << std::endl;
    print_bytes("  Message", server_act_2.second.serialize());

    auto client_act_2 = KKLink::HandshakeActTwo::initiator(std::move(client_act_1.first), server_act_2.second);

    KKLink::Channel client_channel = KKLink::Channel::from_handshake(std::move(client_act_2));
    KKLink::Channel server_channel = KKLink::Channel::from_handshake(std::move(server_act_2.first));
    assert(server_channel.remote_static() == client_keys.publicKey);

    std::cout << "\n--- Handshake Successful ---" << std::endl;

    // 6. Data Transfer: Client -> Server
    std::cout << "\n--- Testing Data Transfer (Client to Server) ---" << std::endl;
    std::string hello = "Hello";
    KKLink::EncryptedMessage message = client_channel.encrypt_message(KKLink::byte_vector(hello.begin(), hello.end()));
    std::cout << "[C->S] Sending encrypted message..." << std::endl;
    print_bytes("  Full Message", message.data);

    // 7. The server decrypts the header first, then the body it announces
    KKLink::EncryptedHeader header;
    std::copy(message.data.begin(), message.data.begin() + KKLink::NOISE_MESSAGE_HEADER_SIZE, header.data.begin());
    uint16_t body_size = server_channel.decrypt_header(header);
    std::cout << "[SERVER] Header announces a " << body_size << " bytes body." << std::endl;

    KKLink::EncryptedMessage body{
        KKLink::byte_vector(message.data.begin() + KKLink::NOISE_MESSAGE_HEADER_SIZE, message.data.end())};
    KKLink::byte_vector plaintext = server_channel.decrypt_message(body);
    std::cout << "[SERVER] Decrypted: " << std::string(plaintext.begin(), plaintext.end()) << std::endl;

    // 8. Tampering is detected
    std::cout << "\n--- Testing Tampering ---" << std::endl;
    KKLink::EncryptedMessage tampered = client_channel.encrypt_message(KKLink::byte_vector(hello.begin(), hello.end()));
    std::copy(tampered.data.begin(), tampered.data.begin() + KKLink::NOISE_MESSAGE_HEADER_SIZE, header.data.begin());
    header.data[0] ^= 0xFF;
    try {
        server_channel.decrypt_header(header);
        std::cerr << "[SERVER] Tampered header was accepted!" << std::endl;
        return 1;
    } catch (const KKLink::CryptoError& e) {
        std::cout << "[SERVER] Rejected tampered header: " << e.what() << std::endl;
    }

    return 0;
}
