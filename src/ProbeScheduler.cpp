#include "pulsescan/ProbeScheduler.hpp"
#include "pulsescan/ErrorHandling.hpp"

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <system_error>
#include <thread>

#include <spdlog/spdlog.h>

namespace PulseScan {

ProbeScheduler::ProbeScheduler(const QueryCatalog& catalog, SessionOptions options,
                               ChannelFactory channelFactory, size_t maxWorkers)
    : catalog(catalog),
      options(std::move(options)),
      channelFactory(std::move(channelFactory)),
      maxWorkers(maxWorkers),
      targets(nullptr),
      callback(nullptr),
      nextTarget(0),
      stopLaunching(false),
      launched(0),
      matchRecorded(false) {
    if (!this->channelFactory) {
        throw ErrorHandling::ConfigException("A channel factory is required");
    }
    if (this->maxWorkers == 0) {
        throw ErrorHandling::ConfigException("Worker count must be positive");
    }
}

ProbeOutcome ProbeScheduler::probe(const ScanTarget& target) {
    std::unique_ptr<MessageChannel> channel;
    try {
        channel = channelFactory();
    } catch (const std::exception& e) {
        spdlog::error("Cannot create channel for {}: {}", target.address, e.what());
        return ProbeOutcome::notFound(target.address, FailureReason::CONNECT_FAILED);
    }
    if (!channel) {
        spdlog::error("Channel factory returned no channel for {}", target.address);
        return ProbeOutcome::notFound(target.address, FailureReason::CONNECT_FAILED);
    }

    ProbeSession session(target.address, catalog, options);
    return session.run(*channel);
}

void ProbeScheduler::report(ProbeOutcome outcome) {
    std::lock_guard<std::mutex> lock(outcomesMutex);

    if (matchRecorded) {
        spdlog::debug("Dropping outcome for {}: MAC filter already matched", outcome.address);
        return;
    }

    if (!options.macFilter.empty() && outcome.isFound && outcome.matchedFilter) {
        matchRecorded = true;
        stopLaunching.store(true);
    }

    outcomes.push_back(std::move(outcome));
    if (*callback) {
        (*callback)(outcomes.back());
    }
}

void ProbeScheduler::workerThread() {
    const auto& pending = *targets;
    while (!stopLaunching.load()) {
        size_t index = nextTarget.fetch_add(1);
        if (index >= pending.size()) {
            break;
        }
        launched.fetch_add(1);

        ProbeOutcome outcome = probe(pending[index]);
        if (!outcome.isFound) {
            spdlog::debug("{} excluded: {}{}", outcome.address,
                          Utils::failureReasonToString(outcome.reason),
                          outcome.failedQuery.empty() ? "" : "(" + outcome.failedQuery + ")");
        }

        try {
            report(std::move(outcome));
        } catch (const std::exception& e) {
            // Consumer errors stay with this target
            spdlog::error("Error reporting outcome for {}: {}", pending[index].address, e.what());
        }
    }
}

std::vector<ProbeOutcome> ProbeScheduler::run(const std::vector<ScanTarget>& targets, const OutcomeCallback& onOutcome) {
    this->targets = &targets;
    callback = &onOutcome;
    nextTarget.store(0);
    stopLaunching.store(false);
    launched.store(0);
    matchRecorded = false;
    outcomes.clear();

    if (targets.empty()) {
        return {};
    }

    size_t numThreads = std::min(maxWorkers, targets.size());
    std::vector<std::thread> threads;
    threads.reserve(numThreads);

    try {
        for (size_t i = 0; i < numThreads; ++i) {
            threads.emplace_back(&ProbeScheduler::workerThread, this);
        }
    } catch (const std::system_error& e) {
        // Let the workers already running drain, then give up on the scan
        stopLaunching.store(true);
        for (auto& t : threads) {
            t.join();
        }
        throw std::runtime_error(std::string("Cannot start probe workers: ") + e.what());
    }

    // Wait for all threads to complete
    for (auto& t : threads) {
        t.join();
    }

    spdlog::debug("Probe scheduler finished: {} of {} targets launched, {} outcomes reported",
                  launched.load(), targets.size(), outcomes.size());

    return std::move(outcomes);
}

} // namespace PulseScan
