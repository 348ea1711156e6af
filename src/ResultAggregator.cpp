#include "pulsescan/ResultAggregator.hpp"
#include "pulsescan/ErrorHandling.hpp"

#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace PulseScan {

namespace {
    struct DisplayStrings {
        const char* ipAddress;
        const char* totalFound;
        const char* matchFound;
        const char* noMatch;
    };

    const DisplayStrings& displayStrings(Language language) {
        static const DisplayStrings english{
            "IP Address",
            "Total nGeniusPULSE devices found= ",
            "nGeniusPULSE device matching MAC filter ",
            "No nGeniusPULSE device matching MAC filter "};
        static const DisplayStrings spanish{
            "Dirección IP",
            "Total de dispositivos nGeniusPULSE encontrados= ",
            "Dispositivo nGeniusPULSE que coincide con el filtro MAC ",
            "Ningún dispositivo nGeniusPULSE coincide con el filtro MAC "};
        return language == Language::ES ? spanish : english;
    }

    void replaceAll(std::string& text, const std::string& from, const std::string& to) {
        size_t pos = 0;
        while ((pos = text.find(from, pos)) != std::string::npos) {
            text.replace(pos, from.size(), to);
            pos += to.size();
        }
    }
}

namespace Utils {

std::string formatValue(const std::string& key, const std::string& data) {
    std::string value = data;
    replaceAll(value, "\r\n", " ");
    replaceAll(value, "\n", " ");

    if (key == "batt" || key == "poev") {
        if (value.size() > 5) {
            value = value.substr(5);
        }
    } else if (key == "free") {
        replaceAll(value, ":", "=");
        replaceAll(value, "kB ", "kB\n");
        replaceAll(value, "kB", "k");
    }
    return value;
}

std::string getTimestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t time = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&time, &local);
    std::stringstream ss;
    ss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

} // namespace Utils

ResultAggregator::ResultAggregator(std::ostream& out, Language language, std::string macFilter)
    : out(out), language(language), macFilter(std::move(macFilter)) {}

bool ResultAggregator::counts(const ProbeOutcome& outcome) const {
    return outcome.isFound && (macFilter.empty() || outcome.matchedFilter);
}

void ResultAggregator::begin(const std::string& network, const std::vector<ScanTarget>& targets) {
    std::lock_guard<std::mutex> lock(outputMutex);

    current = ScanSummary{};
    current.network = network;
    current.scanDate = Utils::getTimestamp();
    current.targetCount = targets.size();
    reported.clear();

    spdlog::info("Scanning network: {} ({} IPs)", network, targets.size());

    out << "Scan IP Network: " << network << "\n";
    if (!targets.empty()) {
        out << "Scan Begin Addr: " << targets.front().address << "\n";
        out << "Scan End Addr:   " << targets.back().address << "\n";
    }
    out << std::endl;
}

void ResultAggregator::writeRecordText(const ProbeOutcome& outcome) {
    out << displayStrings(language).ipAddress << "= " << outcome.address << "\n";

    for (const auto& field : outcome.fields) {
        const std::string& label = field.spec->label(language);
        std::string value = Utils::formatValue(field.spec->key, field.value);

        if (field.spec->key == "free") {
            out << label << "\n" << value << "\n";
        } else {
            out << label << "= " << value << "\n";
        }
    }
    out << std::endl;
}

void ResultAggregator::consume(const ProbeOutcome& outcome) {
    std::lock_guard<std::mutex> lock(outputMutex);

    current.outcomeCount++;
    if (!counts(outcome)) {
        return;
    }

    current.totalFound++;
    if (!macFilter.empty()) {
        current.matchedAddresses.push_back(outcome.address);
    }
    reported.push_back(outcome);
    writeRecordText(outcome);
}

ScanSummary ResultAggregator::finish(std::chrono::duration<double> elapsed) {
    std::lock_guard<std::mutex> lock(outputMutex);

    current.elapsed = elapsed;
    current.complete = true;

    const DisplayStrings& strings = displayStrings(language);
    out << "\nDONE\n";
    if (macFilter.empty()) {
        out << strings.totalFound << current.totalFound << "\n";
    } else if (current.matchedAddresses.empty()) {
        out << strings.noMatch << macFilter << "\n";
    } else {
        for (const auto& address : current.matchedAddresses) {
            out << strings.matchFound << macFilter << ": " << address << "\n";
        }
    }
    out.flush();

    spdlog::info("Scan completed: {} nGeniusPULSE devices found in {:.3f}s",
                 current.totalFound, elapsed.count());
    return current;
}

ScanSummary ResultAggregator::summary() const {
    std::lock_guard<std::mutex> lock(outputMutex);
    return current;
}

void ResultAggregator::writeReport(const std::filesystem::path& outputFile) const {
    std::lock_guard<std::mutex> lock(outputMutex);

    nlohmann::ordered_json report;
    report["scanDate"] = current.scanDate;
    report["network"] = current.network;
    report["totalTargets"] = current.targetCount;
    report["totalFound"] = current.totalFound;
    report["elapsedSeconds"] = current.elapsed.count();
    if (!macFilter.empty()) {
        report["macFilter"] = macFilter;
    }

    report["devices"] = nlohmann::ordered_json::array();
    for (const auto& outcome : reported) {
        nlohmann::ordered_json device;
        device["ipAddress"] = outcome.address;
        device["fields"] = nlohmann::ordered_json::array();
        for (const auto& field : outcome.fields) {
            device["fields"].push_back({
                {"key", field.spec->key},
                {"label", field.spec->label(language)},
                {"value", field.value}});
        }
        report["devices"].push_back(std::move(device));
    }

    std::ofstream file(outputFile);
    if (!file) {
        throw ErrorHandling::ConfigException("Failed to open output file: " + outputFile.string() +
                                             " (" + ErrorHandling::getSystemErrorMsg() + ")");
    }
    // Device strings are not guaranteed to be valid UTF-8
    file << report.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
    if (!file) {
        throw ErrorHandling::ConfigException("Failed to write output file: " + outputFile.string());
    }
}

} // namespace PulseScan
