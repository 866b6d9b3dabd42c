#include <iostream>
#include <string>
#include <thread>

#include "kklink/crypto.hpp"
#include "kklink/errors.hpp"
#include "kklink/transport.hpp"

using KKLink::net::tcp;
using KKLink::net::Transport;

int main() {
    if (KKLink::Crypto::init() != 0) {
        std::cerr << "Failed to initialize crypto library!" << std::endl;
        return 1;
    }

    auto client_keys = KKLink::Crypto::generate_keypair();
    auto server_keys = KKLink::Crypto::generate_keypair();

    boost::asio::io_context io;
    tcp::acceptor acceptor(io, tcp::endpoint(boost::asio::ip::address_v4::loopback(), 0));
    tcp::endpoint address = acceptor.local_endpoint();
    std::cout << "Server listening on " << address << std::endl;

    std::thread server_thread([&]() {
        try {
            Transport transport = Transport::accept(acceptor, server_keys.secretKey, {client_keys.publicKey});
            std::cout << "[SERVER] Handshake complete with " << transport.remote_endpoint() << std::endl;

            KKLink::byte_vector request = transport.read();
            std::cout << "[SERVER] Received: " << std::string(request.begin(), request.end()) << std::endl;

            std::string reply = "Goodbye";
            transport.write(KKLink::byte_vector(reply.begin(), reply.end()));
        } catch (const KKLink::Exception& e) {
            std::cerr << "[SERVER] " << e.what() << std::endl;
        }
    });

    int status = 0;
    try {
        Transport transport = Transport::connect(address, client_keys.secretKey, server_keys.publicKey);
        std::cout << "[CLIENT] Connected from " << transport.local_endpoint() << std::endl;

        std::string request = "Hello";
        transport.write(KKLink::byte_vector(request.begin(), request.end()));

        KKLink::byte_vector reply = transport.read();
        std::cout << "[CLIENT] Received: " << std::string(reply.begin(), reply.end()) << std::endl;
    } catch (const KKLink::Exception& e) {
        std::cerr << "[CLIENT] " << e.what() << std::endl;
        status = 1;
    }

    server_thread.join();
    return status;
}
