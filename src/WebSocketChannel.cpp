#include "pulsescan/WebSocketChannel.hpp"
#include "pulsescan/Config.hpp"
#include "pulsescan/ErrorHandling.hpp"

#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/websocket.hpp>

#include <spdlog/spdlog.h>

namespace beast = boost::beast;
namespace websocket = boost::beast::websocket;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

namespace PulseScan {

WebSocketChannel::WebSocketChannel()
    : ws(ioc), timeout(100), connected(false) {}

WebSocketChannel::~WebSocketChannel() {
    close();
}

// Starts one async operation, arms the stream deadline and runs the private
// io_context until the handler fired. A deadline hit closes the socket and
// surfaces as beast::error::timeout.
template <typename Operation>
void WebSocketChannel::runWithDeadline(const char* what, Operation&& operation) {
    boost::system::error_code result = net::error::would_block;

    beast::get_lowest_layer(ws).expires_after(timeout);
    operation([&result](boost::system::error_code ec, std::size_t = 0) { result = ec; });

    ioc.restart();
    ioc.run();

    if (result) {
        throw ErrorHandling::NetworkException(peer + " " + what + ": " + result.message());
    }
}

void WebSocketChannel::open(const std::string& host, uint16_t port, std::chrono::milliseconds timeout) {
    this->timeout = timeout;
    peer = host + ":" + std::to_string(port);

    boost::system::error_code ec;
    auto address = net::ip::make_address_v4(host, ec);
    if (ec) {
        throw ErrorHandling::NetworkException("Invalid IP address " + host + ": " + ec.message());
    }
    tcp::endpoint endpoint(address, port);

    runWithDeadline("connect", [this, &endpoint](auto handler) {
        beast::get_lowest_layer(ws).async_connect(endpoint, std::move(handler));
    });

    ws.set_option(websocket::stream_base::decorator([](websocket::request_type& req) {
        req.set(beast::http::field::user_agent, std::string("pulsescan/") + VERSION);
    }));

    runWithDeadline("handshake", [this](auto handler) {
        ws.async_handshake(peer, "/", std::move(handler));
    });

    ws.text(true);
    connected = true;
}

void WebSocketChannel::send(const std::string& message) {
    runWithDeadline("send", [this, &message](auto handler) {
        ws.async_write(net::buffer(message), std::move(handler));
    });
}

std::string WebSocketChannel::receive() {
    beast::flat_buffer buffer;
    runWithDeadline("receive", [this, &buffer](auto handler) {
        ws.async_read(buffer, std::move(handler));
    });
    return beast::buffers_to_string(buffer.data());
}

void WebSocketChannel::close() noexcept {
    if (connected) {
        connected = false;
        try {
            runWithDeadline("close", [this](auto handler) {
                ws.async_close(websocket::close_code::normal, std::move(handler));
            });
        } catch (const std::exception& e) {
            spdlog::debug("Closing {} uncleanly: {}", peer, e.what());
        }
    }

    boost::system::error_code ec;
    beast::get_lowest_layer(ws).socket().close(ec);
    if (ec) {
        spdlog::debug("Closing socket to {}: {}", peer, ec.message());
    }
}

ChannelFactory WebSocketChannel::factory() {
    return [] { return std::make_unique<WebSocketChannel>(); };
}

} // namespace PulseScan
