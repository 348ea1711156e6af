#ifndef PULSESCAN_TARGET_ENUMERATOR_HPP
#define PULSESCAN_TARGET_ENUMERATOR_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace PulseScan {

// One IPv4 host to probe during a scan pass
struct ScanTarget {
    std::string address; // dotted quad
    uint32_t hostOrder;  // numeric value, host byte order
};

namespace TargetEnumerator {
    // Usable host addresses of a CIDR network, ascending. Host bits are masked off.
    // Throws InvalidNetworkException for malformed input or /31 and /32
    std::vector<ScanTarget> enumerate(std::string_view cidr);

    // Canonical "network/prefix" form of a CIDR string, e.g. "10.0.0.0/30"
    std::string canonicalNetwork(std::string_view cidr);
}

} // namespace PulseScan

#endif // PULSESCAN_TARGET_ENUMERATOR_HPP
