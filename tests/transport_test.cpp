#include "kklink/transport.hpp"

#include <gtest/gtest.h>

#include <boost/asio/error.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>

#include <chrono>
#include <future>
#include <string>
#include <thread>
#include <vector>

#include "kklink/crypto.hpp"
#include "kklink/errors.hpp"
#include "kklink/handshake.hpp"

using namespace KKLink;
using KKLink::net::tcp;
using KKLink::net::Transport;
using KKLink::net::TransportConfig;

namespace {

    byte_vector bytes(const std::string& s) {
        return byte_vector(s.begin(), s.end());
    }

    // Retries are slow enough that a test finishing quickly proves none happened
    TransportConfig slow_retries() {
        TransportConfig config;
        config.connect_timeout = std::chrono::seconds(5);
        config.retry_delay = std::chrono::seconds(2);
        return config;
    }

    // Short pauses, so that retries can be counted from the elapsed time
    TransportConfig quick_retries() {
        TransportConfig config;
        config.connect_timeout = std::chrono::seconds(5);
        config.max_attempts = 3;
        config.retry_delay = std::chrono::milliseconds(200);
        return config;
    }

    class TransportTest : public ::testing::Test {
    protected:
        void SetUp() override {
            ASSERT_EQ(Crypto::init(), 0);
            client_keys = Crypto::generate_keypair();
            server_keys = Crypto::generate_keypair();
            acceptor.open(tcp::v4());
            acceptor.set_option(tcp::acceptor::reuse_address(true));
            acceptor.bind(tcp::endpoint(boost::asio::ip::address_v4::loopback(), 0));
            acceptor.listen();
        }

        tcp::endpoint address() const { return acceptor.local_endpoint(); }

        // A connected client and server pair sharing the given config
        std::pair<Transport, Transport> connect_pair(const TransportConfig& config) {
            auto server = std::async(std::launch::async, [this, config]() {
                return Transport::accept(acceptor, server_keys.secretKey, {client_keys.publicKey}, config);
            });
            Transport client = Transport::connect(address(), client_keys.secretKey, server_keys.publicKey, config);
            return std::make_pair(std::move(client), server.get());
        }

        KeyPair client_keys;
        KeyPair server_keys;
        boost::asio::io_context io;
        tcp::acceptor acceptor{io};
    };

}  // namespace

TEST_F(TransportTest, HelloGoodbye) {
    auto server = std::async(std::launch::async, [this]() {
        Transport transport = Transport::accept(acceptor, server_keys.secretKey, {client_keys.publicKey});
        byte_vector received = transport.read();
        transport.write(bytes("Goodbye"));
        return std::make_pair(received, transport.remote_static());
    });

    Transport client = Transport::connect(address(), client_keys.secretKey, server_keys.publicKey);
    ASSERT_EQ(client.remote_static(), server_keys.publicKey);
    ASSERT_EQ(client.remote_endpoint(), address());

    client.write(bytes("Hello"));
    byte_vector reply = client.read();

    auto result = server.get();
    ASSERT_EQ(result.first, bytes("Hello"));
    ASSERT_EQ(result.second, client_keys.publicKey);
    ASSERT_EQ(reply, bytes("Goodbye"));
}

TEST_F(TransportTest, ServerIdentifiesClientAmongCandidates) {
    auto other_client = Crypto::generate_keypair();

    auto server = std::async(std::launch::async, [this, &other_client]() {
        Transport transport = Transport::accept(acceptor, server_keys.secretKey,
                                                {other_client.publicKey, client_keys.publicKey});
        return transport.remote_static();
    });

    Transport client = Transport::connect(address(), client_keys.secretKey, server_keys.publicKey);
    ASSERT_EQ(server.get(), client_keys.publicKey);
}

TEST_F(TransportTest, MessagesArriveInOrder) {
    auto server = std::async(std::launch::async, [this]() {
        Transport transport = Transport::accept(acceptor, server_keys.secretKey, {client_keys.publicKey});
        std::vector<byte_vector> received;
        for (int i = 0; i < 4; ++i) {
            received.push_back(transport.read());
        }
        return received;
    });

    Transport client = Transport::connect(address(), client_keys.secretKey, server_keys.publicKey);
    byte_vector largest(NOISE_PLAINTEXT_MAX_SIZE, 0xAB);
    client.write(bytes("one"));
    client.write(byte_vector());
    client.write(largest);
    client.write(bytes("four"));

    auto received = server.get();
    ASSERT_EQ(received.size(), 4u);
    EXPECT_EQ(received[0], bytes("one"));
    EXPECT_TRUE(received[1].empty());
    EXPECT_EQ(received[2], largest);
    EXPECT_EQ(received[3], bytes("four"));
}

TEST_F(TransportTest, WireSizesOnTheStream) {
    // The server end is a bare socket, to look at what actually travels
    auto server = std::async(std::launch::async, [this]() {
        tcp::socket socket(io);
        acceptor.accept(socket);

        MessageActOne msg_1;
        boost::asio::read(socket, boost::asio::buffer(msg_1.data));
        auto act_1 = HandshakeActOne::responder(server_keys.secretKey, {client_keys.publicKey}, msg_1);
        auto act_2 = HandshakeActTwo::responder(std::move(act_1));
        boost::asio::write(socket, boost::asio::buffer(act_2.second.data));
        Channel channel = Channel::from_handshake(std::move(act_2.first));

        EncryptedHeader header;
        boost::asio::read(socket, boost::asio::buffer(header.data));
        uint16_t body_size = channel.decrypt_header(header);
        EncryptedMessage body;
        body.data.resize(body_size);
        boost::asio::read(socket, boost::asio::buffer(body.data));
        return std::make_pair(body_size, channel.decrypt_message(body));
    });

    Transport client = Transport::connect(address(), client_keys.secretKey, server_keys.publicKey);
    client.write(bytes("Hello"));

    auto result = server.get();
    ASSERT_EQ(result.first, 5 + MAC_SIZE);
    ASSERT_EQ(result.second, bytes("Hello"));
}

TEST_F(TransportTest, UnknownClientIsRejected) {
    auto stranger = Crypto::generate_keypair();

    auto server = std::async(std::launch::async, [this, &stranger]() {
        return Transport::accept(acceptor, server_keys.secretKey, {stranger.publicKey});
    });

    // The server hangs up instead of answering
    ASSERT_THROW(Transport::connect(address(), client_keys.secretKey, server_keys.publicKey), TransportError);
    ASSERT_THROW(server.get(), MissingStaticKey);
}

TEST_F(TransportTest, PeerLeavingDuringHandshakeIsNotARejection) {
    // Many decoys ahead of the real key keep the server busy until the reset has arrived
    std::vector<PublicKey> candidates;
    for (int i = 0; i < 500; ++i) {
        candidates.push_back(Crypto::generate_keypair().publicKey);
    }
    candidates.push_back(client_keys.publicKey);

    testing::internal::CaptureStderr();
    auto server = std::async(std::launch::async, [this, &candidates]() {
        return Transport::accept(acceptor, server_keys.secretKey, candidates);
    });

    tcp::socket socket(io);
    socket.connect(address());
    auto act_1 = HandshakeActOne::initiator(client_keys.secretKey, server_keys.publicKey);
    boost::asio::write(socket, boost::asio::buffer(act_1.second.data));
    socket.set_option(tcp::socket::linger(true, 0));
    socket.close();

    std::string outcome;
    try {
        server.get();
        outcome = "accepted";
    } catch (const TransportError&) {
        outcome = "stream failure";
    } catch (const Exception& e) {
        outcome = e.what();
    }
    std::string log = testing::internal::GetCapturedStderr();

    EXPECT_EQ(outcome, "stream failure");
    EXPECT_EQ(log.find("Rejected handshake"), std::string::npos) << log;
}

TEST_F(TransportTest, ClosedPeerIsFatalWithoutRetry) {
    auto server = std::async(std::launch::async, [this]() {
        Transport transport = Transport::accept(acceptor, server_keys.secretKey, {client_keys.publicKey});
        transport.close();
        return transport.is_open();
    });

    Transport client = Transport::connect(address(), client_keys.secretKey, server_keys.publicKey, slow_retries());
    ASSERT_FALSE(server.get());

    auto start = std::chrono::steady_clock::now();
    try {
        client.read();
        FAIL() << "Reading from a closed stream must fail";
    } catch (const TransportError& e) {
        EXPECT_EQ(e.code(), boost::asio::error::eof);
    }
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(1));
}

TEST_F(TransportTest, CorruptedMessageIsNotRetried) {
    auto server = std::async(std::launch::async, [this]() {
        return Transport::accept(acceptor, server_keys.secretKey, {client_keys.publicKey}, slow_retries());
    });

    // Hand-driven client, so that it can put garbage on the wire
    tcp::socket socket(io);
    socket.connect(address());
    auto act_1 = HandshakeActOne::initiator(client_keys.secretKey, server_keys.publicKey);
    boost::asio::write(socket, boost::asio::buffer(act_1.second.data));
    MessageActTwo msg_2;
    boost::asio::read(socket, boost::asio::buffer(msg_2.data));
    Channel channel = Channel::from_handshake(HandshakeActTwo::initiator(std::move(act_1.first), msg_2));

    Transport transport = server.get();
    ASSERT_EQ(transport.remote_static(), client_keys.publicKey);

    EncryptedHeader garbage;
    garbage.data.fill(0x5A);
    boost::asio::write(socket, boost::asio::buffer(garbage.data));

    auto start = std::chrono::steady_clock::now();
    ASSERT_THROW(transport.read(), CryptoError);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(1));
}

TEST_F(TransportTest, ClosedTransportFailsImmediately) {
    auto server = std::async(std::launch::async, [this]() {
        return Transport::accept(acceptor, server_keys.secretKey, {client_keys.publicKey});
    });

    Transport client = Transport::connect(address(), client_keys.secretKey, server_keys.publicKey, slow_retries());
    Transport server_transport = server.get();

    client.close();
    ASSERT_FALSE(client.is_open());

    auto start = std::chrono::steady_clock::now();
    ASSERT_THROW(client.read(), TransportError);
    ASSERT_THROW(client.write(bytes("late")), TransportError);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(1));

    // Closing twice is harmless
    ASSERT_NO_THROW(client.close());
}

TEST_F(TransportTest, MoveAssignmentReplacesConnection) {
    auto server = std::async(std::launch::async, [this]() {
        Transport first = Transport::accept(acceptor, server_keys.secretKey, {client_keys.publicKey});
        Transport second = Transport::accept(acceptor, server_keys.secretKey, {client_keys.publicKey});

        byte_vector received = second.read();
        second.write(bytes("ack"));

        boost::system::error_code first_end;
        try {
            first.read();
        } catch (const TransportError& e) {
            first_end = e.code();
        }
        return std::make_pair(received, first_end);
    });

    Transport client = Transport::connect(address(), client_keys.secretKey, server_keys.publicKey);
    Transport other = Transport::connect(address(), client_keys.secretKey, server_keys.publicKey);

    // Drops the first connection and takes over the second one
    client = std::move(other);
    ASSERT_TRUE(client.is_open());
    ASSERT_FALSE(other.is_open());
    ASSERT_THROW(other.read(), LogicError);

    client.write(bytes("over the second connection"));
    ASSERT_EQ(client.read(), bytes("ack"));

    auto result = server.get();
    ASSERT_EQ(result.first, bytes("over the second connection"));
    ASSERT_EQ(result.second, boost::asio::error::eof);
}

TEST_F(TransportTest, ReadRetriesUntilDataArrives) {
    TransportConfig config = quick_retries();
    auto transports = connect_pair(config);
    Transport& client = transports.first;
    Transport& server = transports.second;

    // With nothing to read, a non-blocking socket fails with would_block
    server.socket().non_blocking(true);

    auto writer = std::async(std::launch::async, [&client]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        client.write(bytes("late"));
    });

    auto start = std::chrono::steady_clock::now();
    byte_vector received = server.read();
    auto elapsed = std::chrono::steady_clock::now() - start;
    writer.get();

    ASSERT_EQ(received, bytes("late"));
    // One failed attempt, one pause, then success
    EXPECT_GE(elapsed, config.retry_delay);
    EXPECT_LT(elapsed, 2 * config.retry_delay);
}

TEST_F(TransportTest, ReadGivesUpAfterMaxAttempts) {
    TransportConfig config = quick_retries();
    auto transports = connect_pair(config);
    Transport& client = transports.first;
    Transport& server = transports.second;

    server.socket().non_blocking(true);

    auto start = std::chrono::steady_clock::now();
    try {
        server.read();
        FAIL() << "Nothing was written, the read must fail";
    } catch (const TransportError& e) {
        EXPECT_EQ(e.code(), boost::asio::error::would_block);
    }
    auto elapsed = std::chrono::steady_clock::now() - start;

    // Three attempts, two pauses
    EXPECT_GE(elapsed, 2 * config.retry_delay);
    EXPECT_LT(elapsed, 3 * config.retry_delay);

    // Nothing was consumed, the channel is still in step
    server.socket().non_blocking(false);
    client.write(bytes("still here"));
    ASSERT_EQ(server.read(), bytes("still here"));
}

TEST_F(TransportTest, WriteGivesUpAfterMaxAttempts) {
    TransportConfig config = quick_retries();
    auto transports = connect_pair(config);
    Transport client = std::move(transports.first);
    {
        Transport server = std::move(transports.second);
        // Closing with a zero linger resets the connection
        server.socket().set_option(tcp::socket::linger(true, 0));
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    auto start = std::chrono::steady_clock::now();
    try {
        client.write(bytes("nobody listens"));
        FAIL() << "Writing to a reset connection must fail";
    } catch (const TransportError& e) {
        // The reset is reported once, later attempts see a broken pipe
        EXPECT_EQ(e.code(), boost::asio::error::broken_pipe);
    }
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_GE(elapsed, 2 * config.retry_delay);
    EXPECT_LT(elapsed, 3 * config.retry_delay);
}

TEST_F(TransportTest, ReadRetriesResetThenStopsAtEndOfStream) {
    TransportConfig config = quick_retries();
    auto transports = connect_pair(config);
    Transport client = std::move(transports.first);
    {
        Transport server = std::move(transports.second);
        server.socket().set_option(tcp::socket::linger(true, 0));
    }

    auto start = std::chrono::steady_clock::now();
    try {
        client.read();
        FAIL() << "Reading from a reset connection must fail";
    } catch (const TransportError& e) {
        // A reset is worth another try, the end of stream that follows is not
        EXPECT_EQ(e.code(), boost::asio::error::eof);
    }
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_GE(elapsed, config.retry_delay);
    EXPECT_LT(elapsed, 2 * config.retry_delay);
}

TEST_F(TransportTest, ConnectionRefused) {
    tcp::endpoint unused = address();
    acceptor.close();

    ASSERT_THROW(Transport::connect(unused, client_keys.secretKey, server_keys.publicKey), TransportError);
}

TEST_F(TransportTest, InvalidConfigIsRejected) {
    TransportConfig config;
    config.max_attempts = 0;

    ASSERT_THROW(Transport::connect(address(), client_keys.secretKey, server_keys.publicKey, config),
                 InvalidArgument);
    ASSERT_THROW(Transport::accept(acceptor, server_keys.secretKey, {client_keys.publicKey}, config),
                 InvalidArgument);
}

TEST(TransportErrorTest, FatalReadErrors) {
    EXPECT_TRUE(net::is_fatal_read_error(boost::asio::error::eof));
    EXPECT_TRUE(net::is_fatal_read_error(boost::asio::error::interrupted));

    EXPECT_FALSE(net::is_fatal_read_error(boost::asio::error::connection_reset));
    EXPECT_FALSE(net::is_fatal_read_error(boost::asio::error::timed_out));
    EXPECT_FALSE(net::is_fatal_read_error(boost::asio::error::would_block));
}
