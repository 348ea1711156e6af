#ifndef PULSESCAN_LOGGING_HPP
#define PULSESCAN_LOGGING_HPP

#include <filesystem>

namespace PulseScan {
namespace Logging {
    // Installs the default spdlog logger: an appending file sink at debug level,
    // plus a stderr sink when verbose is set.
    void init(const std::filesystem::path& logFile, bool verbose);

    void shutdown();
}
} // namespace PulseScan

#endif // PULSESCAN_LOGGING_HPP
