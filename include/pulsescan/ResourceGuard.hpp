#ifndef PULSESCAN_RESOURCE_GUARD_HPP
#define PULSESCAN_RESOURCE_GUARD_HPP

#include <memory>

#include <openssl/evp.h>

#include "pulsescan/MessageChannel.hpp"

namespace PulseScan {

// RAII wrappers for resources
namespace ResourceGuard {
    // Closes a channel when the owning scope exits
    class ChannelGuard {
    public:
        explicit ChannelGuard(MessageChannel& channel) : channel(&channel) {}
        ~ChannelGuard() {
            if (channel) {
                channel->close();
            }
        }

        // Delete copy operators
        ChannelGuard(const ChannelGuard&) = delete;
        ChannelGuard& operator=(const ChannelGuard&) = delete;

        ChannelGuard(ChannelGuard&& other) noexcept : channel(other.channel) {
            other.channel = nullptr;
        }

        ChannelGuard& operator=(ChannelGuard&&) = delete;

    private:
        MessageChannel* channel;
    };

    // OpenSSL resource deleters
    struct EVP_MD_CTX_deleter {
        void operator()(EVP_MD_CTX* ctx) const { if(ctx) EVP_MD_CTX_free(ctx); }
    };

    using EVP_MD_CTX_ptr = std::unique_ptr<EVP_MD_CTX, EVP_MD_CTX_deleter>;
}

} // namespace PulseScan

#endif // PULSESCAN_RESOURCE_GUARD_HPP
