#ifndef PULSESCAN_RESULT_AGGREGATOR_HPP
#define PULSESCAN_RESULT_AGGREGATOR_HPP

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <mutex>
#include <ostream>
#include <string>
#include <vector>

#include "pulsescan/Config.hpp"
#include "pulsescan/ProbeSession.hpp"
#include "pulsescan/TargetEnumerator.hpp"

namespace PulseScan {

struct ScanSummary {
    std::string network;
    std::string scanDate;
    size_t targetCount = 0;
    size_t outcomeCount = 0;
    size_t totalFound = 0;
    std::vector<std::string> matchedAddresses;
    std::chrono::duration<double> elapsed{0.0};
    bool complete = false;
};

namespace Utils {
    // Display form of a query value (newlines folded, voltage prefixes cut,
    // memory blob split into lines)
    std::string formatValue(const std::string& key, const std::string& data);

    std::string getTimestamp();
}

// Consumes probe outcomes as they complete and keeps the running tally
class ResultAggregator {
private:
    std::ostream& out;
    Language language;
    std::string macFilter;
    mutable std::mutex outputMutex;
    ScanSummary current;
    std::vector<ProbeOutcome> reported;

    bool counts(const ProbeOutcome& outcome) const;
    void writeRecordText(const ProbeOutcome& outcome);

public:
    ResultAggregator(std::ostream& out, Language language, std::string macFilter);

    // Prints the scan banner
    void begin(const std::string& network, const std::vector<ScanTarget>& targets);

    void consume(const ProbeOutcome& outcome);

    // Prints the completion lines; call once, after the scheduler returned
    ScanSummary finish(std::chrono::duration<double> elapsed);

    ScanSummary summary() const;

    // JSON document with the summary and every counted host
    void writeReport(const std::filesystem::path& outputFile) const;
};

} // namespace PulseScan

#endif // PULSESCAN_RESULT_AGGREGATOR_HPP
