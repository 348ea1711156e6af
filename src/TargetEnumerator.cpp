#include "pulsescan/TargetEnumerator.hpp"
#include "pulsescan/ErrorHandling.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>

#include <cctype>

namespace PulseScan {
namespace TargetEnumerator {

namespace {
    struct Network {
        uint32_t network;
        uint32_t broadcast;
        int prefixLen;
    };

    std::string toDottedQuad(uint32_t hostOrder) {
        struct in_addr addr;
        addr.s_addr = htonl(hostOrder);
        char buf[INET_ADDRSTRLEN];
        if (inet_ntop(AF_INET, &addr, buf, sizeof(buf)) == nullptr) {
            throw ErrorHandling::InvalidNetworkException("Cannot format address: " + ErrorHandling::getSystemErrorMsg());
        }
        return buf;
    }

    Network parseCidr(std::string_view cidr) {
        std::string rangeStr(cidr);

        size_t cidrPos = rangeStr.find('/');
        if (cidrPos == std::string::npos) {
            throw ErrorHandling::InvalidNetworkException("Missing prefix length in " + rangeStr);
        }

        std::string baseIP = rangeStr.substr(0, cidrPos);
        std::string prefixStr = rangeStr.substr(cidrPos + 1);
        if (prefixStr.empty() || prefixStr.size() > 2) {
            throw ErrorHandling::InvalidNetworkException("Invalid CIDR prefix length in " + rangeStr);
        }
        for (char c : prefixStr) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                throw ErrorHandling::InvalidNetworkException("Invalid CIDR prefix length in " + rangeStr);
            }
        }

        int prefixLen = std::stoi(prefixStr);
        if (prefixLen < 0 || prefixLen > 32) {
            throw ErrorHandling::InvalidNetworkException("Invalid CIDR prefix length: " + std::to_string(prefixLen));
        }

        // inet_pton only accepts the strict four-part dotted quad
        struct in_addr addr;
        if (inet_pton(AF_INET, baseIP.c_str(), &addr) != 1) {
            throw ErrorHandling::InvalidNetworkException("Invalid IP address in CIDR notation: " + baseIP);
        }

        uint32_t ip = ntohl(addr.s_addr);
        uint32_t mask = prefixLen == 0 ? 0 : (0xFFFFFFFFu << (32 - prefixLen));
        uint32_t network = ip & mask;
        uint32_t broadcast = network | ~mask;

        return Network{network, broadcast, prefixLen};
    }
}

std::vector<ScanTarget> enumerate(std::string_view cidr) {
    Network net = parseCidr(cidr);

    if (net.broadcast - net.network < 2) {
        throw ErrorHandling::InvalidNetworkException("No usable host addresses in " + std::string(cidr));
    }

    std::vector<ScanTarget> targets;
    targets.reserve(static_cast<size_t>(net.broadcast - net.network - 1));
    for (uint32_t i = net.network + 1; i < net.broadcast; i++) {
        targets.push_back(ScanTarget{toDottedQuad(i), i});
    }
    return targets;
}

std::string canonicalNetwork(std::string_view cidr) {
    Network net = parseCidr(cidr);
    return toDottedQuad(net.network) + "/" + std::to_string(net.prefixLen);
}

} // namespace TargetEnumerator
} // namespace PulseScan
