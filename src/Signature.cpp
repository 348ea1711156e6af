#include "pulsescan/Signature.hpp"
#include "pulsescan/ErrorHandling.hpp"
#include "pulsescan/ResourceGuard.hpp"

#include <openssl/evp.h>

namespace PulseScan {
namespace Signature {

std::string sha1Hex(std::string_view input) {
    ResourceGuard::EVP_MD_CTX_ptr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        throw ErrorHandling::CryptoException(ErrorHandling::getOpenSSLErrorMsg());
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLen = 0;

    if (EVP_DigestInit_ex(ctx.get(), EVP_sha1(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), input.data(), input.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest, &digestLen) != 1) {
        throw ErrorHandling::CryptoException(ErrorHandling::getOpenSSLErrorMsg());
    }

    static constexpr char hexDigits[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(digestLen * 2);
    for (unsigned int i = 0; i < digestLen; ++i) {
        hex += hexDigits[digest[i] >> 4];
        hex += hexDigits[digest[i] & 0x0F];
    }
    return hex;
}

std::string signQuery(std::string_view queryKey, std::string_view nonce) {
    std::string input;
    input.reserve(queryKey.size() + nonce.size());
    input.append(queryKey.data(), queryKey.size());
    input.append(nonce.data(), nonce.size());
    return sha1Hex(input);
}

} // namespace Signature
} // namespace PulseScan
