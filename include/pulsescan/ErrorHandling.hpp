#ifndef PULSESCAN_ERROR_HANDLING_HPP
#define PULSESCAN_ERROR_HANDLING_HPP

#include <stdexcept>
#include <string>

namespace PulseScan {

// Error handling utilities
namespace ErrorHandling {
    // Get error message for the last failed socket or file operation
    std::string getSystemErrorMsg();

    // Drain the OpenSSL error queue into one message
    std::string getOpenSSLErrorMsg();

    // Exception classes
    class NetworkException : public std::runtime_error {
    public:
        explicit NetworkException(const std::string& message)
            : std::runtime_error("Network error: " + message) {}
    };

    // A peer answered with something that is not a device message
    class ProtocolException : public std::runtime_error {
    public:
        explicit ProtocolException(const std::string& message)
            : std::runtime_error("Protocol error: " + message) {}
    };

    class CryptoException : public std::runtime_error {
    public:
        explicit CryptoException(const std::string& message)
            : std::runtime_error("Crypto error: " + message) {}
    };

    class ConfigException : public std::runtime_error {
    public:
        explicit ConfigException(const std::string& message)
            : std::runtime_error("Configuration error: " + message) {}
    };

    class InvalidNetworkException : public ConfigException {
    public:
        explicit InvalidNetworkException(const std::string& message)
            : ConfigException("Invalid network: " + message) {}
    };
}

} // namespace PulseScan

#endif // PULSESCAN_ERROR_HANDLING_HPP
