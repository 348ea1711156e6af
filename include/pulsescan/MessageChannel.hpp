#ifndef PULSESCAN_MESSAGE_CHANNEL_HPP
#define PULSESCAN_MESSAGE_CHANNEL_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace PulseScan {

// Message-framed transport to one device. Every operation is bounded by the
// open() timeout and throws NetworkException on failure
class MessageChannel {
public:
    virtual ~MessageChannel() = default;

    virtual void open(const std::string& host, uint16_t port, std::chrono::milliseconds timeout) = 0;
    virtual void send(const std::string& message) = 0;
    virtual std::string receive() = 0;

    // Safe to call on every exit path, including after a failure or twice
    virtual void close() noexcept = 0;
};

using ChannelFactory = std::function<std::unique_ptr<MessageChannel>()>;

} // namespace PulseScan

#endif // PULSESCAN_MESSAGE_CHANNEL_HPP
