#ifndef PULSESCAN_QUERY_CATALOG_HPP
#define PULSESCAN_QUERY_CATALOG_HPP

#include <string>
#include <vector>

#include "pulsescan/Config.hpp"

namespace PulseScan {

// One attribute the device protocol can be asked for
struct QuerySpec {
    std::string key;       // callType on the wire
    int minDisplayLevel;
    std::string labelEN;
    std::string labelES;

    const std::string& label(Language language) const {
        return language == Language::ES ? labelES : labelEN;
    }
};

// Ordered list of queries sent to every device (also the nonce chain order)
class QueryCatalog {
private:
    std::vector<QuerySpec> specs;

public:
    explicit QueryCatalog(std::vector<QuerySpec> entries);

    // The nGeniusPULSE attribute set
    static const QueryCatalog& standard();

    const std::vector<QuerySpec>& entries() const { return specs; }
    size_t size() const { return specs.size(); }

    // The first entry answers with the device identity (MAC address)
    const QuerySpec& identity() const { return specs.front(); }
    bool isIdentity(const QuerySpec& spec) const { return &spec == &specs.front(); }

    const QuerySpec* find(const std::string& key) const;

    // Keys that a session at displayLevel sends, in order
    std::vector<std::string> plannedKeys(int displayLevel, QueryGating gating) const;
};

} // namespace PulseScan

#endif // PULSESCAN_QUERY_CATALOG_HPP
