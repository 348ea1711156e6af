#include "pulsescan/Config.hpp"
#include "pulsescan/ErrorHandling.hpp"

#include <cctype>
#include <cmath>

namespace PulseScan {
namespace Utils {

namespace {
    std::string toUpper(std::string_view str) {
        std::string upper(str);
        for (char& c : upper) {
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
        return upper;
    }
}

std::string languageToString(Language language) {
    switch (language) {
        case Language::ES: return "ES";
        default: return "EN";
    }
}

Language stringToLanguage(std::string_view str) {
    std::string upper = toUpper(str);
    if (upper == "EN") return Language::EN;
    if (upper == "ES") return Language::ES;
    throw ErrorHandling::ConfigException("Unknown language: " + std::string(str));
}

std::string gatingToString(QueryGating gating) {
    switch (gating) {
        case QueryGating::SKIP: return "skip";
        default: return "truncate";
    }
}

QueryGating stringToGating(std::string_view str) {
    std::string upper = toUpper(str);
    if (upper == "TRUNCATE") return QueryGating::TRUNCATE;
    if (upper == "SKIP") return QueryGating::SKIP;
    throw ErrorHandling::ConfigException("Unknown gating mode: " + std::string(str));
}

std::chrono::milliseconds secondsToTimeout(double seconds) {
    if (!(seconds > 0.0) || !std::isfinite(seconds)) {
        throw ErrorHandling::ConfigException("Timeout must be positive");
    }
    if (seconds > MAX_TIMEOUT_SEC) {
        throw ErrorHandling::ConfigException("Timeout must not exceed " +
                                             std::to_string(static_cast<long>(MAX_TIMEOUT_SEC)) + " seconds");
    }
    auto ms = static_cast<std::chrono::milliseconds::rep>(std::ceil(seconds * 1000.0));
    return std::chrono::milliseconds(ms > 0 ? ms : 1);
}

} // namespace Utils
} // namespace PulseScan
