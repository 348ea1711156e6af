#ifndef PULSESCAN_WEBSOCKET_CHANNEL_HPP
#define PULSESCAN_WEBSOCKET_CHANNEL_HPP

#include <chrono>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/websocket/stream.hpp>

#include "pulsescan/MessageChannel.hpp"

namespace PulseScan {

// WebSocket client transport (ws://host:port/) built on Boost.Beast.
// Owns a private io_context; one thread per instance
class WebSocketChannel : public MessageChannel {
private:
    boost::asio::io_context ioc;
    boost::beast::websocket::stream<boost::beast::tcp_stream> ws;
    std::chrono::milliseconds timeout;
    std::string peer;
    bool connected;

    template <typename Operation>
    void runWithDeadline(const char* what, Operation&& operation);

public:
    WebSocketChannel();
    ~WebSocketChannel() override;

    WebSocketChannel(const WebSocketChannel&) = delete;
    WebSocketChannel& operator=(const WebSocketChannel&) = delete;

    void open(const std::string& host, uint16_t port, std::chrono::milliseconds timeout) override;
    void send(const std::string& message) override;
    std::string receive() override;
    void close() noexcept override;

    static ChannelFactory factory();
};

} // namespace PulseScan

#endif // PULSESCAN_WEBSOCKET_CHANNEL_HPP
