#ifndef PULSESCAN_PROBE_SCHEDULER_HPP
#define PULSESCAN_PROBE_SCHEDULER_HPP

#include <atomic>
#include <cstddef>
#include <functional>
#include <mutex>
#include <vector>

#include "pulsescan/MessageChannel.hpp"
#include "pulsescan/ProbeSession.hpp"
#include "pulsescan/QueryCatalog.hpp"
#include "pulsescan/TargetEnumerator.hpp"

namespace PulseScan {

// Called once per reported outcome, serialized by the scheduler
using OutcomeCallback = std::function<void(const ProbeOutcome&)>;

// Runs one ProbeSession per target on a bounded pool of worker threads.
// With a MAC filter set, the first match stops launching new sessions
class ProbeScheduler {
private:
    const QueryCatalog& catalog;
    SessionOptions options;
    ChannelFactory channelFactory;
    size_t maxWorkers;

    // Per-run state
    const std::vector<ScanTarget>* targets;
    const OutcomeCallback* callback;
    std::atomic<size_t> nextTarget;
    std::atomic<bool> stopLaunching;
    std::atomic<size_t> launched;
    std::mutex outcomesMutex;
    std::vector<ProbeOutcome> outcomes;
    bool matchRecorded;

    ProbeOutcome probe(const ScanTarget& target);
    void report(ProbeOutcome outcome);
    void workerThread();

public:
    ProbeScheduler(const QueryCatalog& catalog, SessionOptions options,
                   ChannelFactory channelFactory, size_t maxWorkers);

    ProbeScheduler(const ProbeScheduler&) = delete;
    ProbeScheduler& operator=(const ProbeScheduler&) = delete;

    // Blocks until every launched session terminated. Returns the reported
    // outcomes in completion order.
    std::vector<ProbeOutcome> run(const std::vector<ScanTarget>& targets, const OutcomeCallback& onOutcome);

    // Sessions started by the last run()
    size_t launchedCount() const { return launched.load(); }
};

} // namespace PulseScan

#endif // PULSESCAN_PROBE_SCHEDULER_HPP
