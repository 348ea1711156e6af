#include "pulsescan/Logging.hpp"
#include "pulsescan/ErrorHandling.hpp"

#include <memory>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace PulseScan {
namespace Logging {

void init(const std::filesystem::path& logFile, bool verbose) {
    std::vector<spdlog::sink_ptr> sinks;

    try {
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile.string(), false));
    } catch (const spdlog::spdlog_ex& e) {
        throw ErrorHandling::ConfigException("Cannot open log file " + logFile.string() + ": " + e.what());
    }

    if (verbose) {
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    }

    auto logger = std::make_shared<spdlog::logger>("pulsescan", sinks.begin(), sinks.end());
    logger->set_pattern("%Y-%m-%d %H:%M:%S,%e [%l] %v");
    logger->set_level(spdlog::level::debug);
    logger->flush_on(spdlog::level::info);

    spdlog::set_default_logger(logger);
}

void shutdown() {
    spdlog::default_logger()->flush();
    spdlog::shutdown();
}

} // namespace Logging
} // namespace PulseScan
