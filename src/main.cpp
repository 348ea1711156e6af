#include <iostream>
#include <string>

// Modern CLI parser
#include <CLI/CLI.hpp>

#include <spdlog/spdlog.h>

#include "pulsescan/Config.hpp"
#include "pulsescan/DeviceScanner.hpp"
#include "pulsescan/ErrorHandling.hpp"
#include "pulsescan/Logging.hpp"
#include "pulsescan/ResultAggregator.hpp"
#include "pulsescan/WebSocketChannel.hpp"

using namespace PulseScan;

// Command-line interface class
class CommandLineInterface {
public:
    int run(int argc, char* argv[]) {
        CLI::App app{"Discover NetScout nGeniusPULSE devices via WebSocket on a network."};

        std::string network = DEFAULT_NETWORK;
        app.add_option("-i,--network", network, "IPv4 network in CIDR notation")
            ->capture_default_str();

        std::string macFilter;
        app.add_option("-m,--mac-filter", macFilter, "MAC address suffix filter (e.g., 330030 or 00c017330030)");

        double timeoutSec = DEFAULT_TIMEOUT_SEC;
        app.add_option("-t,--timeout", timeoutSec, "Timeout in seconds")
            ->capture_default_str()
            ->check(CLI::PositiveNumber)
            ->check(CLI::Range(0.0, MAX_TIMEOUT_SEC));

        int displayLevel = 0;
        app.add_option("-d,--display-level", displayLevel, "Display info level: 0=minimal, 9=full")
            ->capture_default_str()
            ->check(CLI::Range(0, MAX_DISPLAY_LEVEL));

        std::string language = "EN";
        app.add_option("-l,--language", language, "Language: EN=English, ES=Spanish")
            ->capture_default_str()
            ->check(CLI::IsMember({"EN", "ES"}, CLI::ignore_case));

        std::string gating = "truncate";
        app.add_option("--gating", gating, "Display level gating: truncate stops at the first hidden query, skip leaves hidden queries out")
            ->capture_default_str()
            ->check(CLI::IsMember({"truncate", "skip"}, CLI::ignore_case));

        int port = DEVICE_PORT;
        app.add_option("-p,--port", port, "Device WebSocket port")
            ->capture_default_str()
            ->check(CLI::Range(1, 65535));

        int workers = static_cast<int>(DEFAULT_MAX_WORKERS);
        app.add_option("-w,--workers", workers, "Maximum number of hosts probed at once")
            ->capture_default_str()
            ->check(CLI::PositiveNumber);

        std::string logFile = DEFAULT_LOG_FILE;
        app.add_option("--log-file", logFile, "Scan log file (appended)")
            ->capture_default_str();

        std::string outputFile;
        app.add_option("-o,--output", outputFile, "Write a JSON report to file");

        bool verbose = false;
        app.add_flag("--verbose", verbose, "Enable verbose console output");

        app.set_version_flag("-v,--version", std::string(VERSION));

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            return app.exit(e);
        }

        try {
            Logging::init(logFile, verbose);

            DeviceScanner scanner(WebSocketChannel::factory());
            scanner.setNetwork(network);
            scanner.setTimeout(Utils::secondsToTimeout(timeoutSec));
            scanner.setDisplayLevel(displayLevel);
            scanner.setMacFilter(macFilter);
            scanner.setLanguage(Utils::stringToLanguage(language));
            scanner.setGating(Utils::stringToGating(gating));
            scanner.setPort(port);
            scanner.setWorkers(workers);

            ResultAggregator aggregator(std::cout, scanner.getConfig().language, macFilter);
            ScanSummary summary = scanner.scan(aggregator);
            spdlog::info("Total nGeniusPULSE devices found: {}", summary.totalFound);

            if (!outputFile.empty()) {
                aggregator.writeReport(outputFile);
                spdlog::info("Report written to {}", outputFile);
            }
        } catch (const ErrorHandling::ConfigException& e) {
            spdlog::error("{}", e.what());
            std::cerr << "Error: " << e.what() << std::endl;
            Logging::shutdown();
            return 2;
        } catch (const std::exception& e) {
            spdlog::error("Unexpected error: {}", e.what());
            std::cerr << "Error: " << e.what() << std::endl;
            Logging::shutdown();
            return 1;
        }

        Logging::shutdown();
        return 0;
    }
};

// Main function
int main(int argc, char* argv[]) {
    try {
        CommandLineInterface cli;
        return cli.run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
