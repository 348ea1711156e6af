#include "FakeDevices.hpp"

#include "pulsescan/ErrorHandling.hpp"
#include "pulsescan/Signature.hpp"

#include <nlohmann/json.hpp>

namespace PulseScan {
namespace Testing {

ScriptedChannel::ScriptedChannel(std::vector<std::string> inbound, bool failOpen)
    : inbound(inbound.begin(), inbound.end()), failOpen(failOpen) {}

void ScriptedChannel::open(const std::string& host, uint16_t port, std::chrono::milliseconds timeout) {
    openedHost = host;
    openedPort = port;
    openedTimeout = timeout;
    if (failOpen) {
        throw ErrorHandling::NetworkException(host + " connect: Connection refused");
    }
}

void ScriptedChannel::send(const std::string& message) {
    sent.push_back(message);
}

std::string ScriptedChannel::receive() {
    if (inbound.empty()) {
        throw ErrorHandling::NetworkException("receive: The socket was closed due to a timeout");
    }
    std::string message = inbound.front();
    inbound.pop_front();
    return message;
}

class SimulatedChannel : public MessageChannel {
public:
    explicit SimulatedChannel(std::shared_ptr<SimulatedNetwork> network)
        : network(std::move(network)) {}

    void open(const std::string& host, uint16_t, std::chrono::milliseconds) override {
        std::lock_guard<std::mutex> lock(network->mutex);
        network->opens++;
        auto it = network->devices.find(host);
        if (it == network->devices.end()) {
            throw ErrorHandling::NetworkException(host + " connect: Connection refused");
        }
        address = host;
        profile = it->second;

        nlohmann::json greeting;
        greeting["uname"] = "nPoint";
        if (profile.sendNonce) {
            greeting["nonce"] = issueNonce();
        }
        pending.push_back(greeting.dump());
    }

    void send(const std::string& message) override {
        nlohmann::json query = nlohmann::json::parse(message);
        std::string callType = query.at("callType").get<std::string>();
        std::string signature = query.at("signature").get<std::string>();

        std::lock_guard<std::mutex> lock(network->mutex);
        network->queries[address].push_back(callType);

        if (signature != Signature::signQuery(callType, nonce)) {
            network->mismatch = true;
            return;
        }
        if (callType == profile.silentOn) {
            return;
        }

        nlohmann::json reply;
        reply["nonce"] = issueNonce();
        reply["data"] = profile.attributes[callType];
        reply["success"] = true;
        pending.push_back(reply.dump());
    }

    std::string receive() override {
        if (pending.empty()) {
            throw ErrorHandling::NetworkException(address + " receive: The socket was closed due to a timeout");
        }
        std::string message = pending.front();
        pending.pop_front();
        return message;
    }

    void close() noexcept override {
        std::lock_guard<std::mutex> lock(network->mutex);
        network->closes++;
    }

private:
    // Embeds a control character so hashing has to use the decoded value
    std::string issueNonce() {
        nonce = "N" + std::to_string(++counter) + "\x1f" + address;
        return nonce;
    }

    std::shared_ptr<SimulatedNetwork> network;
    std::string address;
    DeviceProfile profile;
    std::string nonce;
    int counter = 0;
    std::deque<std::string> pending;
};

void SimulatedNetwork::addDevice(const std::string& address, DeviceProfile profile) {
    std::lock_guard<std::mutex> lock(mutex);
    devices[address] = std::move(profile);
}

ChannelFactory SimulatedNetwork::factory() {
    auto self = shared_from_this();
    return [self] { return std::make_unique<SimulatedChannel>(self); };
}

std::vector<std::string> SimulatedNetwork::queriesSentTo(const std::string& address) const {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = queries.find(address);
    return it == queries.end() ? std::vector<std::string>{} : it->second;
}

size_t SimulatedNetwork::openCount() const {
    std::lock_guard<std::mutex> lock(mutex);
    return opens;
}

size_t SimulatedNetwork::closeCount() const {
    std::lock_guard<std::mutex> lock(mutex);
    return closes;
}

bool SimulatedNetwork::signatureMismatch() const {
    std::lock_guard<std::mutex> lock(mutex);
    return mismatch;
}

DeviceProfile SimulatedNetwork::fullDevice(const std::string& mac) {
    DeviceProfile profile;
    profile.attributes = {
        {"gtme_web", mac},
        {"bver", "3.2.1-build77"},
        {"temp", "48.5"},
        {"link", "1000Mb/s Full"},
        {"up_dhm", "3d 4h 12m"},
        {"batt", "BATT=3.02V"},
        {"poev", "POEV=48.1V"},
        {"gurl", "https://cloud.example.net"},
        {"mach", "armv7l"},
        {"sw_port", "Gi1/0/12"},
        {"sw_addr", "10.0.0.254/00:11:22:33:44:55"},
        {"sw_name", "core-sw-01"},
        {"free", "MemTotal: 1024 kB\nMemFree: 512 kB"},
    };
    return profile;
}

} // namespace Testing
} // namespace PulseScan
