#include "pulsescan/ErrorHandling.hpp"

#include <cerrno>
#include <cstring>

#include <openssl/err.h>

namespace PulseScan {
namespace ErrorHandling {

std::string getSystemErrorMsg() {
    int errCode = errno;
    return "Error " + std::to_string(errCode) + ": " + std::strerror(errCode);
}

std::string getOpenSSLErrorMsg() {
    std::string errorMsg;
    unsigned long errCode;
    char errBuf[256];

    while ((errCode = ERR_get_error()) != 0) {
        ERR_error_string_n(errCode, errBuf, sizeof(errBuf));
        if (!errorMsg.empty()) {
            errorMsg += "; ";
        }
        errorMsg += errBuf;
    }

    return errorMsg.empty() ? "Unknown OpenSSL error" : errorMsg;
}

} // namespace ErrorHandling
} // namespace PulseScan
