#include "pulsescan/ProbeSession.hpp"
#include "pulsescan/DeviceMessages.hpp"
#include "pulsescan/ErrorHandling.hpp"
#include "pulsescan/ResourceGuard.hpp"
#include "pulsescan/Signature.hpp"

#include <cctype>
#include <stdexcept>

#include <spdlog/spdlog.h>

namespace PulseScan {

ProbeOutcome ProbeOutcome::found(std::string address, std::vector<QueryResult> fields, bool matchedFilter) {
    ProbeOutcome outcome;
    outcome.address = std::move(address);
    outcome.isFound = true;
    outcome.fields = std::move(fields);
    outcome.matchedFilter = matchedFilter;
    return outcome;
}

ProbeOutcome ProbeOutcome::notFound(std::string address, FailureReason reason, std::string failedQuery) {
    ProbeOutcome outcome;
    outcome.address = std::move(address);
    outcome.reason = reason;
    outcome.failedQuery = std::move(failedQuery);
    return outcome;
}

std::string Nonce::sign(std::string_view queryKey) && {
    std::string signature = Signature::signQuery(queryKey, token);
    token.clear();
    return signature;
}

Nonce SessionState::takeNonce() {
    if (!nonce) {
        throw std::logic_error("nonce already consumed; rotate() must come first");
    }
    Nonce current = std::move(*nonce);
    nonce.reset();
    return current;
}

void SessionState::rotate(Nonce next) {
    nonce.emplace(std::move(next));
}

namespace Utils {

std::string failureReasonToString(FailureReason reason) {
    switch (reason) {
        case FailureReason::NONE: return "None";
        case FailureReason::CONNECT_FAILED: return "ConnectFailed";
        case FailureReason::NO_NONCE: return "NoNonce";
        case FailureReason::QUERY_FAILED: return "QueryFailed";
        case FailureReason::FILTER_MISMATCH: return "FilterMismatch";
        default: return "Unknown";
    }
}

namespace {
    std::string normalizeMac(std::string_view text) {
        std::string normalized;
        normalized.reserve(text.size());
        for (char c : text) {
            if (c == ':' || c == '-' || c == '.') {
                continue;
            }
            normalized += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        return normalized;
    }
}

bool macFilterMatches(std::string_view identityData, std::string_view macFilter) {
    std::string filter = normalizeMac(macFilter);
    if (filter.empty()) {
        return false;
    }
    return normalizeMac(identityData).find(filter) != std::string::npos;
}

} // namespace Utils

ProbeSession::ProbeSession(std::string address, const QueryCatalog& catalog, const SessionOptions& options)
    : address(std::move(address)), catalog(catalog), options(options) {}

Nonce ProbeSession::receiveHandshake(MessageChannel& channel) {
    std::string greeting = channel.receive();
    spdlog::debug("Received from {}: {}", address, greeting);

    auto nonce = DeviceMessages::stringField(greeting, "nonce");
    if (!nonce || nonce->empty()) {
        throw ErrorHandling::ProtocolException("handshake carries no nonce");
    }
    return Nonce(std::move(*nonce));
}

std::string ProbeSession::exchange(MessageChannel& channel, const QuerySpec& spec, SessionState& state) {
    std::string signature = state.takeNonce().sign(spec.key);
    std::string query = DeviceMessages::encodeQuery(spec.key, signature);

    channel.send(query);
    spdlog::debug("Sent to {}: {}", address, query);

    std::string reply = channel.receive();
    spdlog::debug("Received from {}: {}", address, reply);

    DeviceMessages::QueryReply decoded = DeviceMessages::decodeReply(reply);
    state.rotate(Nonce(std::move(decoded.nonce)));
    return std::move(decoded.data);
}

ProbeOutcome ProbeSession::run(MessageChannel& channel) {
    ResourceGuard::ChannelGuard guard(channel);

    try {
        channel.open(address, options.port, options.timeout);
    } catch (const std::exception& e) {
        spdlog::debug("Failed to connect to {}: {}", address, e.what());
        return ProbeOutcome::notFound(address, FailureReason::CONNECT_FAILED);
    }

    std::optional<SessionState> state;
    try {
        state.emplace(receiveHandshake(channel));
    } catch (const std::exception& e) {
        spdlog::debug("No nonce received from {}: {}", address, e.what());
        return ProbeOutcome::notFound(address, FailureReason::NO_NONCE);
    }

    for (const auto& spec : catalog.entries()) {
        if (spec.minDisplayLevel > options.displayLevel) {
            if (options.gating == QueryGating::TRUNCATE) {
                break;
            }
            continue;
        }

        std::string value;
        try {
            value = exchange(channel, spec, *state);
        } catch (const std::exception& e) {
            spdlog::debug("Failed to query {} from {}: {}", spec.key, address, e.what());
            return ProbeOutcome::notFound(address, FailureReason::QUERY_FAILED, spec.key);
        }

        if (catalog.isIdentity(spec) && !options.macFilter.empty()) {
            if (!Utils::macFilterMatches(value, options.macFilter)) {
                spdlog::debug("{} does not match MAC filter {}", address, options.macFilter);
                return ProbeOutcome::notFound(address, FailureReason::FILTER_MISMATCH);
            }
            state->markMatched();
        }

        state->record(spec, std::move(value));
    }

    spdlog::info("Found nGeniusPULSE device at {}", address);
    return ProbeOutcome::found(address, state->releaseResults(), state->matchedFilter());
}

} // namespace PulseScan
