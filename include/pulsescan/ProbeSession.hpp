#ifndef PULSESCAN_PROBE_SESSION_HPP
#define PULSESCAN_PROBE_SESSION_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "pulsescan/Config.hpp"
#include "pulsescan/MessageChannel.hpp"
#include "pulsescan/QueryCatalog.hpp"

namespace PulseScan {

enum class FailureReason {
    NONE,
    CONNECT_FAILED,
    NO_NONCE,
    QUERY_FAILED,
    FILTER_MISMATCH
};

// One collected attribute; spec points into the session's catalog
struct QueryResult {
    const QuerySpec* spec;
    std::string value;
};

// Terminal result of one probe
struct ProbeOutcome {
    std::string address;
    bool isFound;
    FailureReason reason;
    std::string failedQuery; // set for QUERY_FAILED
    std::vector<QueryResult> fields;
    bool matchedFilter;

    ProbeOutcome() : isFound(false), reason(FailureReason::NONE), matchedFilter(false) {}

    static ProbeOutcome found(std::string address, std::vector<QueryResult> fields, bool matchedFilter);
    static ProbeOutcome notFound(std::string address, FailureReason reason, std::string failedQuery = "");
};

// Single-use token issued by a device; sign() consumes it
class Nonce {
private:
    std::string token;

public:
    explicit Nonce(std::string value) : token(std::move(value)) {}

    Nonce(const Nonce&) = delete;
    Nonce& operator=(const Nonce&) = delete;
    Nonce(Nonce&&) noexcept = default;
    Nonce& operator=(Nonce&&) noexcept = default;

    const std::string& value() const { return token; }

    std::string sign(std::string_view queryKey) &&;
};

// Per-host mutable state, alive only for the duration of one probe
class SessionState {
private:
    std::optional<Nonce> nonce;
    std::vector<QueryResult> results;
    bool matched = false;

public:
    explicit SessionState(Nonce initial) : nonce(std::move(initial)) {}

    // Hands out the current nonce; the slot stays empty until rotate().
    // Throws std::logic_error when the nonce was already taken.
    Nonce takeNonce();
    void rotate(Nonce next);
    bool hasNonce() const { return nonce.has_value(); }

    void record(const QuerySpec& spec, std::string value) { results.push_back({&spec, std::move(value)}); }
    void markMatched() { matched = true; }

    bool matchedFilter() const { return matched; }
    std::vector<QueryResult> releaseResults() { return std::move(results); }
};

struct SessionOptions {
    std::chrono::milliseconds timeout{100};
    uint16_t port = DEVICE_PORT;
    int displayLevel = 0;
    std::string macFilter;
    QueryGating gating = QueryGating::TRUNCATE;
};

namespace Utils {
    std::string failureReasonToString(FailureReason reason);

    // Case-insensitive, separator-insensitive (':', '-', '.') containment test
    bool macFilterMatches(std::string_view identityData, std::string_view macFilter);
}

// Handshake plus signed query chain against one host. run() never throws
class ProbeSession {
private:
    std::string address;
    const QueryCatalog& catalog;
    const SessionOptions& options;

    Nonce receiveHandshake(MessageChannel& channel);
    std::string exchange(MessageChannel& channel, const QuerySpec& spec, SessionState& state);

public:
    ProbeSession(std::string address, const QueryCatalog& catalog, const SessionOptions& options);

    ProbeOutcome run(MessageChannel& channel);
};

} // namespace PulseScan

#endif // PULSESCAN_PROBE_SESSION_HPP
