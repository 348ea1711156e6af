#ifndef PULSESCAN_CONFIG_HPP
#define PULSESCAN_CONFIG_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace PulseScan {

// Version and constants
constexpr auto VERSION = "3.0.0";
constexpr auto DEFAULT_NETWORK = "129.196.196.0/23";
constexpr double DEFAULT_TIMEOUT_SEC = 0.10;
constexpr double MAX_TIMEOUT_SEC = 86400.0; // one day
constexpr uint16_t DEVICE_PORT = 8000;
constexpr int MAX_DISPLAY_LEVEL = 9;
constexpr auto DEFAULT_LOG_FILE = "pulsescan.log";
constexpr size_t DEFAULT_MAX_WORKERS = 256;

// Output language for labels and summary lines
enum class Language {
    EN,
    ES
};

// How the display level walks the query catalog
enum class QueryGating {
    TRUNCATE, // stop at the first query above the display level
    SKIP      // leave out queries above the display level, keep going
};

struct ScanConfig {
    std::string network = DEFAULT_NETWORK;
    std::chrono::milliseconds timeout{100};
    uint16_t port = DEVICE_PORT;
    int displayLevel = 0;
    std::string macFilter;
    Language language = Language::EN;
    QueryGating gating = QueryGating::TRUNCATE;
    size_t maxWorkers = DEFAULT_MAX_WORKERS;
};

namespace Utils {
    std::string languageToString(Language language);
    Language stringToLanguage(std::string_view str);
    std::string gatingToString(QueryGating gating);
    QueryGating stringToGating(std::string_view str);

    // Seconds as given on the command line; rounds up to whole milliseconds
    std::chrono::milliseconds secondsToTimeout(double seconds);
}

} // namespace PulseScan

#endif // PULSESCAN_CONFIG_HPP
