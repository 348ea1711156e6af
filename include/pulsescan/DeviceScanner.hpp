#ifndef PULSESCAN_DEVICE_SCANNER_HPP
#define PULSESCAN_DEVICE_SCANNER_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "pulsescan/Config.hpp"
#include "pulsescan/MessageChannel.hpp"
#include "pulsescan/QueryCatalog.hpp"
#include "pulsescan/ResultAggregator.hpp"
#include "pulsescan/TargetEnumerator.hpp"

namespace PulseScan {

// One scan pass: enumerate the network, probe every host, aggregate.
// Setters throw ConfigException on invalid values
class DeviceScanner {
private:
    ScanConfig config;
    std::vector<ScanTarget> targets;
    const QueryCatalog& catalog;
    ChannelFactory channelFactory;

public:
    explicit DeviceScanner(ChannelFactory factory, const QueryCatalog& queries = QueryCatalog::standard());

    void setNetwork(const std::string& cidr);
    void setTimeout(std::chrono::milliseconds timeout);
    void setPort(int port);
    void setDisplayLevel(int level);
    void setMacFilter(const std::string& filter);
    void setLanguage(Language language) { config.language = language; }
    void setGating(QueryGating gating) { config.gating = gating; }
    void setWorkers(int workers);

    const ScanConfig& getConfig() const { return config; }
    const std::vector<ScanTarget>& getTargets() const { return targets; }

    ScanSummary scan(ResultAggregator& aggregator);
};

} // namespace PulseScan

#endif // PULSESCAN_DEVICE_SCANNER_HPP
