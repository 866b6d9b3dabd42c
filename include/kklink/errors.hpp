#ifndef KKLINK_ERRORS_HPP
#define KKLINK_ERRORS_HPP

#include <boost/system/error_code.hpp>

#include <stdexcept>
#include <string>

namespace KKLink {

/**
 * @brief Base class for all KKLink exceptions.
 */
class Exception : public std::exception {
public:
    explicit Exception(const std::string& message) : msg_(message) {}
    explicit Exception(const char* message) : msg_(message) {}
    virtual ~Exception() noexcept override = default;

    virtual const char* what() const noexcept override {
        return msg_.c_str();
    }

protected:
    std::string msg_;
};

/**
 * @brief Exception for errors that occur at runtime.
 */
class RuntimeError : public Exception {
public:
    explicit RuntimeError(const std::string& message) : Exception(message) {}
    explicit RuntimeError(const char* message) : Exception(message) {}
};

/**
 * @brief Exception for logic errors in the library's usage.
 */
class LogicError : public Exception {
public:
    explicit LogicError(const std::string& message) : Exception(message) {}
    explicit LogicError(const char* message) : Exception(message) {}
};

/**
 * @brief Exception for invalid arguments.
 */
class InvalidArgument : public LogicError {
public:
    explicit InvalidArgument(const std::string& message) : LogicError(message) {}
    explicit InvalidArgument(const char* message) : LogicError(message) {}
};

/**
 * @brief A handshake or transport operation was rejected by the Noise engine
 *        (bad key, corrupted ciphertext, failed MAC).
 */
class CryptoError : public RuntimeError {
public:
    explicit CryptoError(const std::string& message) : RuntimeError(message) {}
    explicit CryptoError(const char* message) : RuntimeError(message) {}
};

/**
 * @brief None of the responder's candidate public keys could validate the
 *        first handshake message.
 */
class MissingStaticKey : public CryptoError {
public:
    explicit MissingStaticKey(const std::string& message) : CryptoError(message) {}
    explicit MissingStaticKey(const char* message) : CryptoError(message) {}
};

/**
 * @brief The first handshake message decrypted correctly but did not carry
 *        our protocol tag. The peer speaks another protocol version.
 */
class HandshakeMismatch : public RuntimeError {
public:
    explicit HandshakeMismatch(const std::string& message) : RuntimeError(message) {}
    explicit HandshakeMismatch(const char* message) : RuntimeError(message) {}
};

/**
 * @brief Ciphertext is shorter than a MAC or longer than a Noise message.
 */
class InvalidCiphertext : public RuntimeError {
public:
    explicit InvalidCiphertext(const std::string& message) : RuntimeError(message) {}
    explicit InvalidCiphertext(const char* message) : RuntimeError(message) {}
};

/**
 * @brief Plaintext is too large to fit in a single Noise message.
 */
class InvalidPlaintext : public InvalidArgument {
public:
    explicit InvalidPlaintext(const std::string& message) : InvalidArgument(message) {}
    explicit InvalidPlaintext(const char* message) : InvalidArgument(message) {}
};

/**
 * @brief The underlying byte stream failed to connect, read or write.
 */
class TransportError : public RuntimeError {
public:
    TransportError(const std::string& message, boost::system::error_code code)
        : RuntimeError(message + ": " + code.message()), code_(code) {}

    const boost::system::error_code& code() const noexcept {
        return code_;
    }

private:
    boost::system::error_code code_;
};

} // namespace KKLink

#endif // KKLINK_ERRORS_HPP
