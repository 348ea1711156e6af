#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include "pulsescan/ErrorHandling.hpp"
#include "pulsescan/ProbeSession.hpp"
#include "pulsescan/QueryCatalog.hpp"
#include "pulsescan/WebSocketChannel.hpp"

using namespace PulseScan;

namespace beast = boost::beast;
namespace websocket = boost::beast::websocket;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

namespace {

// Single-connection device on 127.0.0.1 with an ephemeral port, served from
// its own thread.
class LoopbackDevice {
public:
    enum class Mode {
        ANSWER,  // greets with a nonce and answers every message
        SILENT,  // completes the WebSocket handshake, then never writes
        RAW_TCP  // accepts TCP but never answers the WebSocket upgrade
    };

    explicit LoopbackDevice(Mode mode)
        : mode(mode),
          acceptor(ioc, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0)),
          socket(ioc) {
        port = acceptor.local_endpoint().port();
        acceptor.async_accept(socket, [this](beast::error_code ec) { onAccept(ec); });
        worker = std::thread([this] { ioc.run(); });
    }

    ~LoopbackDevice() {
        ioc.stop();
        worker.join();
    }

    uint16_t port = 0;

    std::vector<std::string> received() const {
        std::lock_guard<std::mutex> lock(mutex);
        return messages;
    }

    // True once the client side went away, within the given wait
    bool waitForPeerClose(std::chrono::milliseconds wait) {
        std::unique_lock<std::mutex> lock(mutex);
        return closedCondition.wait_for(lock, wait, [this] { return peerClosed; });
    }

private:
    void onAccept(beast::error_code ec) {
        if (ec) {
            return;
        }
        if (mode == Mode::RAW_TCP) {
            readRaw();
            return;
        }

        ws = std::make_unique<websocket::stream<tcp::socket>>(std::move(socket));
        ws->text(true);
        ws->async_accept([this](beast::error_code acceptEc) {
            if (acceptEc) {
                markClosed();
                return;
            }
            if (mode == Mode::ANSWER) {
                writeThenRead(R"({"uname":"nPoint","nonce":"n0\u0001"})");
            } else {
                readMessages();
            }
        });
    }

    void writeThenRead(std::string message) {
        outgoing = std::move(message);
        ws->async_write(net::buffer(outgoing), [this](beast::error_code ec, std::size_t) {
            if (ec) {
                markClosed();
                return;
            }
            readMessages();
        });
    }

    void readMessages() {
        ws->async_read(inbound, [this](beast::error_code ec, std::size_t) {
            if (ec) {
                markClosed();
                return;
            }
            {
                std::lock_guard<std::mutex> lock(mutex);
                messages.push_back(beast::buffers_to_string(inbound.data()));
            }
            inbound.consume(inbound.size());

            if (mode == Mode::ANSWER) {
                writeThenRead(R"({"nonce":"n)" + std::to_string(++replies) + R"(","data":"value","success":true})");
            } else {
                readMessages();
            }
        });
    }

    void readRaw() {
        socket.async_read_some(net::buffer(rawBuffer), [this](beast::error_code ec, std::size_t) {
            if (ec) {
                markClosed();
                return;
            }
            readRaw();
        });
    }

    void markClosed() {
        {
            std::lock_guard<std::mutex> lock(mutex);
            peerClosed = true;
        }
        closedCondition.notify_all();
    }

    Mode mode;
    net::io_context ioc;
    tcp::acceptor acceptor;
    tcp::socket socket;
    std::unique_ptr<websocket::stream<tcp::socket>> ws;
    beast::flat_buffer inbound;
    std::string outgoing;
    char rawBuffer[1024];
    int replies = 0;

    mutable std::mutex mutex;
    std::condition_variable closedCondition;
    std::vector<std::string> messages;
    bool peerClosed = false;

    std::thread worker;
};

// A port nothing listens on
uint16_t closedPort() {
    net::io_context ioc;
    tcp::acceptor acceptor(ioc, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0));
    uint16_t port = acceptor.local_endpoint().port();
    acceptor.close();
    return port;
}

using Clock = std::chrono::steady_clock;

const auto kDeadline = std::chrono::milliseconds(200);
const auto kSlack = std::chrono::milliseconds(2000);

} // namespace

TEST(WebSocketChannelTest, ReceivesGreetingAndExchangesMessages) {
    LoopbackDevice device(LoopbackDevice::Mode::ANSWER);

    {
        WebSocketChannel channel;
        channel.open("127.0.0.1", device.port, std::chrono::milliseconds(1000));

        EXPECT_EQ(channel.receive(), "{\"uname\":\"nPoint\",\"nonce\":\"n0\\u0001\"}");

        channel.send(R"({"callType":"gtme_web","parameter":"","signature":"abc"})");
        EXPECT_EQ(channel.receive(), R"({"nonce":"n1","data":"value","success":true})");

        channel.close();
        channel.close(); // second close is a no-op
    }

    EXPECT_TRUE(device.waitForPeerClose(kSlack));
    ASSERT_EQ(device.received().size(), 1u);
    EXPECT_EQ(device.received()[0], R"({"callType":"gtme_web","parameter":"","signature":"abc"})");
}

TEST(WebSocketChannelTest, ReceiveTimesOutNearTheDeadline) {
    LoopbackDevice device(LoopbackDevice::Mode::SILENT);

    WebSocketChannel channel;
    channel.open("127.0.0.1", device.port, kDeadline);

    auto start = Clock::now();
    EXPECT_THROW(channel.receive(), ErrorHandling::NetworkException);
    auto elapsed = Clock::now() - start;

    EXPECT_GE(elapsed, kDeadline - std::chrono::milliseconds(50));
    EXPECT_LT(elapsed, kSlack);

    channel.close();
    EXPECT_TRUE(device.waitForPeerClose(kSlack));
}

TEST(WebSocketChannelTest, UnansweredUpgradeTimesOutDuringOpen) {
    LoopbackDevice device(LoopbackDevice::Mode::RAW_TCP);

    auto start = Clock::now();
    {
        WebSocketChannel channel;
        EXPECT_THROW(channel.open("127.0.0.1", device.port, kDeadline), ErrorHandling::NetworkException);
        // destructor closes the half-open connection
    }
    auto elapsed = Clock::now() - start;

    EXPECT_LT(elapsed, kSlack);
    EXPECT_TRUE(device.waitForPeerClose(kSlack));
}

TEST(WebSocketChannelTest, RefusedPortFailsOpen) {
    uint16_t port = closedPort();

    WebSocketChannel channel;
    EXPECT_THROW(channel.open("127.0.0.1", port, kDeadline), ErrorHandling::NetworkException);
    channel.close();
}

TEST(WebSocketChannelTest, InvalidAddressFailsOpen) {
    WebSocketChannel channel;
    EXPECT_THROW(channel.open("not-an-address", 8000, kDeadline), ErrorHandling::NetworkException);
}

TEST(WebSocketChannelTest, SessionOverLoopbackFindsDevice) {
    LoopbackDevice device(LoopbackDevice::Mode::ANSWER);

    SessionOptions options;
    options.timeout = std::chrono::milliseconds(1000);
    options.port = device.port;

    ProbeSession session("127.0.0.1", QueryCatalog::standard(), options);
    WebSocketChannel channel;
    ProbeOutcome outcome = session.run(channel);

    EXPECT_TRUE(outcome.isFound);
    ASSERT_EQ(outcome.fields.size(), 2u);
    EXPECT_EQ(outcome.fields[0].spec->key, "gtme_web");
    EXPECT_EQ(outcome.fields[1].spec->key, "bver");
    EXPECT_EQ(outcome.fields[1].value, "value");

    EXPECT_TRUE(device.waitForPeerClose(kSlack));
    EXPECT_EQ(device.received().size(), 2u);
}

TEST(WebSocketChannelTest, SessionMapsTransportFailures) {
    SessionOptions options;
    options.timeout = kDeadline;

    {
        LoopbackDevice device(LoopbackDevice::Mode::SILENT);
        options.port = device.port;
        WebSocketChannel channel;
        ProbeOutcome outcome = ProbeSession("127.0.0.1", QueryCatalog::standard(), options).run(channel);
        EXPECT_EQ(outcome.reason, FailureReason::NO_NONCE);
        EXPECT_TRUE(device.waitForPeerClose(kSlack));
    }
    {
        LoopbackDevice device(LoopbackDevice::Mode::RAW_TCP);
        options.port = device.port;
        WebSocketChannel channel;
        ProbeOutcome outcome = ProbeSession("127.0.0.1", QueryCatalog::standard(), options).run(channel);
        EXPECT_EQ(outcome.reason, FailureReason::CONNECT_FAILED);
        EXPECT_TRUE(device.waitForPeerClose(kSlack));
    }
    {
        options.port = closedPort();
        WebSocketChannel channel;
        ProbeOutcome outcome = ProbeSession("127.0.0.1", QueryCatalog::standard(), options).run(channel);
        EXPECT_EQ(outcome.reason, FailureReason::CONNECT_FAILED);
    }
}
