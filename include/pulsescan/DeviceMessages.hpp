#ifndef PULSESCAN_DEVICE_MESSAGES_HPP
#define PULSESCAN_DEVICE_MESSAGES_HPP

#include <optional>
#include <string>

namespace PulseScan {

// JSON message codec for the device protocol
namespace DeviceMessages {
    // {"callType":<key>,"parameter":"","signature":<signature>}
    std::string encodeQuery(const std::string& callType, const std::string& signature);

    // Value of a string member of a JSON object message. Returns nullopt when the
    // message is not a JSON object or the member is missing or not a string.
    std::optional<std::string> stringField(const std::string& message, const char* field);

    struct QueryReply {
        std::string data;
        std::string nonce;
    };

    // Throws ErrorHandling::ProtocolException when data or nonce is missing
    QueryReply decodeReply(const std::string& message);
}

} // namespace PulseScan

#endif // PULSESCAN_DEVICE_MESSAGES_HPP
