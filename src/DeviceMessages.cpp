#include "pulsescan/DeviceMessages.hpp"
#include "pulsescan/ErrorHandling.hpp"

#include <nlohmann/json.hpp>

namespace PulseScan {
namespace DeviceMessages {

namespace {
    nlohmann::json parseObject(const std::string& message) {
        // Non-throwing parse; a discarded value means malformed input
        nlohmann::json parsed = nlohmann::json::parse(message, nullptr, false);
        if (parsed.is_discarded() || !parsed.is_object()) {
            return nlohmann::json();
        }
        return parsed;
    }

    std::optional<std::string> member(const nlohmann::json& object, const char* field) {
        if (!object.is_object()) {
            return std::nullopt;
        }
        auto it = object.find(field);
        if (it == object.end() || !it->is_string()) {
            return std::nullopt;
        }
        return it->get<std::string>();
    }
}

std::string encodeQuery(const std::string& callType, const std::string& signature) {
    nlohmann::ordered_json query;
    query["callType"] = callType;
    query["parameter"] = "";
    query["signature"] = signature;
    return query.dump();
}

std::optional<std::string> stringField(const std::string& message, const char* field) {
    return member(parseObject(message), field);
}

QueryReply decodeReply(const std::string& message) {
    nlohmann::json reply = parseObject(message);
    if (!reply.is_object()) {
        throw ErrorHandling::ProtocolException("reply is not a JSON object");
    }

    auto data = member(reply, "data");
    if (!data) {
        throw ErrorHandling::ProtocolException("reply has no data field");
    }
    auto nonce = member(reply, "nonce");
    if (!nonce) {
        throw ErrorHandling::ProtocolException("reply has no nonce field");
    }
    return QueryReply{std::move(*data), std::move(*nonce)};
}

} // namespace DeviceMessages
} // namespace PulseScan
