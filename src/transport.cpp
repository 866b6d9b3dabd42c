#include "kklink/transport.hpp"

#include <boost/asio/error.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>

#include <iostream>
#include <string>
#include <thread>

#include "kklink/errors.hpp"
#include "kklink/handshake.hpp"
#include "kklink/handshake_messages.hpp"

namespace KKLink {
    namespace net {

        namespace {

            void check_config(const TransportConfig& config) {
                if (config.max_attempts < 1) {
                    throw InvalidArgument("TransportConfig::max_attempts must be at least 1.");
                }
            }

            void write_all(tcp::socket& socket, const uint8_t* data, size_t size, const std::string& what) {
                boost::system::error_code ec;
                boost::asio::write(socket, boost::asio::buffer(data, size), ec);
                if (ec) {
                    throw TransportError("Failed to write " + what, ec);
                }
            }

            void read_exact(tcp::socket& socket, uint8_t* data, size_t size, const std::string& what) {
                boost::system::error_code ec;
                boost::asio::read(socket, boost::asio::buffer(data, size), ec);
                if (ec) {
                    throw TransportError("Failed to read " + what, ec);
                }
            }

            // Blocking connect bounded by a timeout: the io_context only runs
            // for that long, after which the pending connect is cancelled.
            void connect_with_timeout(boost::asio::io_context& io,
                                      tcp::socket& socket,
                                      const tcp::endpoint& address,
                                      std::chrono::milliseconds timeout) {
                boost::system::error_code result = boost::asio::error::would_block;
                socket.async_connect(address, [&result](const boost::system::error_code& ec) { result = ec; });

                io.restart();
                io.run_for(timeout);

                if (!io.stopped()) {
                    boost::system::error_code ignored;
                    socket.close(ignored);
                    io.run();
                    throw TransportError("Connection to " + address.address().to_string() + ":" +
                                             std::to_string(address.port()) + " timed out",
                                         boost::asio::error::timed_out);
                }
                if (result) {
                    throw TransportError("Failed to connect to " + address.address().to_string() + ":" +
                                             std::to_string(address.port()),
                                         result);
                }
            }

            // Runs both responder acts. Only a failed handshake is logged as a rejection.
            std::pair<HandshakeActTwo, MessageActTwo> respond(const tcp::socket& socket,
                                                              const SecretKey& my_secret,
                                                              const std::vector<PublicKey>& their_possible_publics,
                                                              const MessageActOne& msg_1) {
                try {
                    HandshakeActOne act_one = HandshakeActOne::responder(my_secret, their_possible_publics, msg_1);
                    return HandshakeActTwo::responder(std::move(act_one));
                } catch (const RuntimeError& e) {
                    boost::system::error_code ignored;
                    std::cerr << "Rejected handshake from " << socket.remote_endpoint(ignored) << ": " << e.what()
                              << std::endl;
                    throw;
                }
            }

        }  // namespace

        bool is_fatal_read_error(const boost::system::error_code& ec) {
            return ec == boost::asio::error::eof || ec == boost::asio::error::interrupted;
        }

        Transport::Transport(std::unique_ptr<boost::asio::io_context> io, std::unique_ptr<tcp::socket> socket,
                             Channel channel, const TransportConfig& config)
            : io_(std::move(io)), socket_(std::move(socket)), channel_(std::move(channel)), config_(config) {}

        Transport& Transport::operator=(Transport&& other) {
            if (this != &other) {
                // Our old socket goes away while the io_context it is bound to still exists
                socket_ = std::move(other.socket_);
                io_ = std::move(other.io_);
                channel_ = std::move(other.channel_);
                config_ = other.config_;
            }
            return *this;
        }

        Transport Transport::connect(const tcp::endpoint& address,
                                     const SecretKey& my_secret,
                                     const PublicKey& their_public,
                                     const TransportConfig& config) {
            check_config(config);

            auto io = std::make_unique<boost::asio::io_context>();
            auto socket = std::make_unique<tcp::socket>(*io);
            connect_with_timeout(*io, *socket, address, config.connect_timeout);

            auto act_one = HandshakeActOne::initiator(my_secret, their_public);

            // write msg_1 to stream (e, es, ss)
            write_all(*socket, act_one.second.data.data(), act_one.second.data.size(), "first handshake message");

            // read msg_2 from stream (e, ee, se)
            MessageActTwo msg_2;
            read_exact(*socket, msg_2.data.data(), msg_2.data.size(), "second handshake message");

            HandshakeActTwo act_two = HandshakeActTwo::initiator(std::move(act_one.first), msg_2);
            Channel channel = Channel::from_handshake(std::move(act_two));

            return Transport(std::move(io), std::move(socket), std::move(channel), config);
        }

        Transport Transport::accept(tcp::acceptor& listener,
                                    const SecretKey& my_secret,
                                    const std::vector<PublicKey>& their_possible_publics,
                                    const TransportConfig& config) {
            check_config(config);

            auto io = std::make_unique<boost::asio::io_context>();
            auto socket = std::make_unique<tcp::socket>(*io);

            boost::system::error_code ec;
            listener.accept(*socket, ec);
            if (ec) {
                throw TransportError("Failed to accept connection", ec);
            }

            // read msg_1 from stream
            MessageActOne msg_1;
            read_exact(*socket, msg_1.data.data(), msg_1.data.size(), "first handshake message");

            auto act_two = respond(*socket, my_secret, their_possible_publics, msg_1);
            Channel channel = Channel::from_handshake(std::move(act_two.first));

            // write msg_2 to stream
            write_all(*socket, act_two.second.data.data(), act_two.second.data.size(), "second handshake message");

            return Transport(std::move(io), std::move(socket), std::move(channel), config);
        }

        tcp::socket& Transport::stream() {
            if (!socket_) {
                throw LogicError("Transport was moved from.");
            }
            return *socket_;
        }

        const tcp::socket& Transport::stream() const {
            if (!socket_) {
                throw LogicError("Transport was moved from.");
            }
            return *socket_;
        }

        void Transport::write(const byte_vector& message) {
            tcp::socket& socket = stream();
            EncryptedMessage encrypted = channel_.encrypt_message(message);

            for (int attempt = 1;; ++attempt) {
                boost::system::error_code ec;
                boost::asio::write(socket, boost::asio::buffer(encrypted.data), ec);
                if (!ec) {
                    return;
                }
                if (attempt >= config_.max_attempts || !socket.is_open()) {
                    std::cerr << "Write failed after " << attempt << " attempt(s): " << ec.message() << std::endl;
                    throw TransportError("Failed to write message", ec);
                }
                std::cerr << "Write attempt " << attempt << "/" << config_.max_attempts
                          << " failed: " << ec.message() << ", retrying" << std::endl;
                std::this_thread::sleep_for(config_.retry_delay);
            }
        }

        byte_vector Transport::read_once() {
            tcp::socket& socket = stream();

            EncryptedHeader header;
            read_exact(socket, header.data.data(), header.data.size(), "message header");
            uint16_t body_size = channel_.decrypt_header(header);

            // body_size cannot be > 65535 (2 bytes)
            EncryptedMessage body;
            body.data.resize(body_size);
            read_exact(socket, body.data.data(), body.data.size(), "message body");

            return channel_.decrypt_message(body);
        }

        byte_vector Transport::read() {
            for (int attempt = 1;; ++attempt) {
                try {
                    return read_once();
                } catch (const TransportError& e) {
                    if (is_fatal_read_error(e.code()) || !stream().is_open()) {
                        std::cerr << "Read failed: " << e.what() << ", not retrying" << std::endl;
                        throw;
                    }
                    if (attempt >= config_.max_attempts) {
                        std::cerr << "Read failed after " << attempt << " attempt(s): " << e.what() << std::endl;
                        throw;
                    }
                    std::cerr << "Read attempt " << attempt << "/" << config_.max_attempts
                              << " failed: " << e.what() << ", retrying" << std::endl;
                    std::this_thread::sleep_for(config_.retry_delay);
                }
            }
        }

        const PublicKey& Transport::remote_static() const {
            return channel_.remote_static();
        }

        tcp::endpoint Transport::local_endpoint() const {
            boost::system::error_code ec;
            tcp::endpoint endpoint = stream().local_endpoint(ec);
            if (ec) {
                throw TransportError("Failed to get local endpoint", ec);
            }
            return endpoint;
        }

        tcp::endpoint Transport::remote_endpoint() const {
            boost::system::error_code ec;
            tcp::endpoint endpoint = stream().remote_endpoint(ec);
            if (ec) {
                throw TransportError("Failed to get remote endpoint", ec);
            }
            return endpoint;
        }

        bool Transport::is_open() const {
            return socket_ && socket_->is_open();
        }

        tcp::socket& Transport::socket() {
            return stream();
        }

        void Transport::close() {
            if (!is_open()) {
                return;
            }
            boost::system::error_code ec;
            // The peer may already be gone, in which case shutdown fails harmlessly
            socket_->shutdown(tcp::socket::shutdown_both, ec);
            socket_->close(ec);
            if (ec) {
                throw TransportError("Failed to close connection", ec);
            }
        }

    }  // namespace net
}  // namespace KKLink
