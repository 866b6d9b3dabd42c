#ifndef KKLINK_TRANSPORT_HPP
#define KKLINK_TRANSPORT_HPP

#include "channel.hpp"
#include "keys.hpp"
#include "packet.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/system/error_code.hpp>

#include <chrono>
#include <memory>
#include <vector>

namespace KKLink {
namespace net {

    using tcp = boost::asio::ip::tcp;

    /**
     * @brief Connection parameters. The defaults are the protocol's reference values.
     */
    struct TransportConfig {
        // Bound on the TCP connection attempt in Transport::connect
        std::chrono::milliseconds connect_timeout{std::chrono::seconds(10)};
        // Total number of tries for a stream read or write, first one included
        int max_attempts = 5;
        // Pause between two tries
        std::chrono::milliseconds retry_delay{std::chrono::seconds(1)};
    };

    /**
     * @brief Whether a failed stream read can't be recovered by trying again.
     *
     * A clean end of stream and an interrupted operation are fatal, any other
     * error is considered transient.
     */
    bool is_fatal_read_error(const boost::system::error_code& ec);

    /**
     * @brief A TCP stream wrapped in a KK Noise channel.
     *
     * Both are owned exclusively for the lifetime of the connection. All calls
     * block. Like the Channel it wraps, a Transport must not be driven from
     * several threads at once.
     */
    class Transport {
    public:
        /**
         * @brief Connects to a server and enacts the Noise handshake as initiator.
         * @param address The server's address.
         * @param my_secret Our static secret key.
         * @param their_public The server's static public key.
         * @param config Connection parameters.
         * @throws KKLink::TransportError if the connection fails or times out.
         * @throws KKLink::CryptoError if the server's reply does not authenticate.
         */
        static Transport connect(const tcp::endpoint& address,
                                 const SecretKey& my_secret,
                                 const PublicKey& their_public,
                                 const TransportConfig& config = TransportConfig());

        /**
         * @brief Accepts an incoming connection and immediately performs the Noise
         *        handshake as responder.
         *
         * The caller is identified among their_possible_publics, see remote_static().
         *
         * @param listener A bound and listening acceptor.
         * @param my_secret Our static secret key.
         * @param their_possible_publics The static public keys of every party allowed to connect.
         * @param config Connection parameters.
         * @throws KKLink::TransportError on a stream failure.
         * @throws KKLink::MissingStaticKey if the caller is not one of the candidates.
         * @throws KKLink::HandshakeMismatch if the caller speaks another protocol version.
         */
        static Transport accept(tcp::acceptor& listener,
                                const SecretKey& my_secret,
                                const std::vector<PublicKey>& their_possible_publics,
                                const TransportConfig& config = TransportConfig());

        Transport(const Transport&) = delete;
        Transport& operator=(const Transport&) = delete;
        Transport(Transport&&) = default;
        Transport& operator=(Transport&& other);

        /**
         * @brief Encrypts a message and writes it to the stream.
         *
         * A failed write is retried up to config.max_attempts times in total.
         *
         * @throws KKLink::InvalidPlaintext if the message is too large.
         * @throws KKLink::TransportError with the last error once attempts are exhausted.
         */
        void write(const byte_vector& message);

        /**
         * @brief Reads and decrypts the next message from the stream.
         *
         * Transient stream errors are retried up to config.max_attempts times in
         * total. End of stream and interruption are returned immediately, as are
         * decryption failures.
         *
         * @throws KKLink::TransportError on a stream failure.
         * @throws KKLink::CryptoError if the message does not authenticate.
         */
        byte_vector read();

        /**
         * @brief Gets the static public key of the peer.
         */
        const PublicKey& remote_static() const;

        tcp::endpoint local_endpoint() const;
        tcp::endpoint remote_endpoint() const;

        bool is_open() const;

        /**
         * @brief The underlying TCP socket, for socket options.
         *
         * Reading or writing it directly desynchronizes the channel.
         * @throws KKLink::LogicError if the transport was moved from.
         */
        tcp::socket& socket();

        /**
         * @brief Shuts the stream down. Later reads and writes fail.
         */
        void close();

    private:
        Transport(std::unique_ptr<boost::asio::io_context> io, std::unique_ptr<tcp::socket> socket,
                  Channel channel, const TransportConfig& config);

        tcp::socket& stream();
        const tcp::socket& stream() const;
        byte_vector read_once();

        // The socket is bound to io_ and must always be released before it
        std::unique_ptr<boost::asio::io_context> io_;
        std::unique_ptr<tcp::socket> socket_;
        Channel channel_;
        TransportConfig config_;
    };

} // namespace net
} // namespace KKLink

#endif // KKLINK_TRANSPORT_HPP
