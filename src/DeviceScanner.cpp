#include "pulsescan/DeviceScanner.hpp"
#include "pulsescan/ErrorHandling.hpp"
#include "pulsescan/ProbeScheduler.hpp"

#include <spdlog/spdlog.h>

namespace PulseScan {

DeviceScanner::DeviceScanner(ChannelFactory factory, const QueryCatalog& queries)
    : catalog(queries), channelFactory(std::move(factory)) {
    if (!channelFactory) {
        throw ErrorHandling::ConfigException("A channel factory is required");
    }
}

void DeviceScanner::setNetwork(const std::string& cidr) {
    auto hosts = TargetEnumerator::enumerate(cidr);
    config.network = TargetEnumerator::canonicalNetwork(cidr);
    targets = std::move(hosts);
}

void DeviceScanner::setTimeout(std::chrono::milliseconds timeout) {
    if (timeout.count() <= 0) {
        throw ErrorHandling::ConfigException("Timeout must be positive");
    }
    if (timeout > std::chrono::duration<double>(MAX_TIMEOUT_SEC)) {
        throw ErrorHandling::ConfigException("Timeout must not exceed one day");
    }
    config.timeout = timeout;
}

void DeviceScanner::setPort(int port) {
    if (port <= 0 || port > 65535) {
        throw ErrorHandling::ConfigException("Invalid port number: " + std::to_string(port));
    }
    config.port = static_cast<uint16_t>(port);
}

void DeviceScanner::setDisplayLevel(int level) {
    if (level < 0 || level > MAX_DISPLAY_LEVEL) {
        throw ErrorHandling::ConfigException("Display level must be between 0 and " +
                                             std::to_string(MAX_DISPLAY_LEVEL));
    }
    config.displayLevel = level;
}

void DeviceScanner::setMacFilter(const std::string& filter) {
    config.macFilter = filter;
}

void DeviceScanner::setWorkers(int workers) {
    if (workers <= 0) {
        throw ErrorHandling::ConfigException("Worker count must be positive");
    }
    config.maxWorkers = static_cast<size_t>(workers);
}

ScanSummary DeviceScanner::scan(ResultAggregator& aggregator) {
    if (targets.empty()) {
        throw ErrorHandling::ConfigException("No targets specified. Use setNetwork() first.");
    }

    SessionOptions options;
    options.timeout = config.timeout;
    options.port = config.port;
    options.displayLevel = config.displayLevel;
    options.macFilter = config.macFilter;
    options.gating = config.gating;

    spdlog::debug("Scan settings: timeout={}ms port={} display_level={} gating={} mac_filter='{}' language={}",
                  config.timeout.count(), config.port, config.displayLevel,
                  Utils::gatingToString(config.gating), config.macFilter,
                  Utils::languageToString(config.language));

    ProbeScheduler scheduler(catalog, options, channelFactory, config.maxWorkers);

    auto startTime = std::chrono::steady_clock::now();
    aggregator.begin(config.network, targets);
    auto outcomes = scheduler.run(targets, [&aggregator](const ProbeOutcome& outcome) {
        aggregator.consume(outcome);
    });
    auto endTime = std::chrono::steady_clock::now();

    spdlog::debug("{} of {} targets probed, {} outcomes reported",
                  scheduler.launchedCount(), targets.size(), outcomes.size());

    return aggregator.finish(std::chrono::duration<double>(endTime - startTime));
}

} // namespace PulseScan
