#ifndef PULSESCAN_SIGNATURE_HPP
#define PULSESCAN_SIGNATURE_HPP

#include <string>
#include <string_view>

namespace PulseScan {
namespace Signature {
    // Lowercase hex SHA-1 digest of the raw bytes of input
    std::string sha1Hex(std::string_view input);

    // Proof of possession for one query: SHA1(queryKey ++ nonce), no separator
    std::string signQuery(std::string_view queryKey, std::string_view nonce);
}
} // namespace PulseScan

#endif // PULSESCAN_SIGNATURE_HPP
