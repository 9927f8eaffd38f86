#include "dfm/core/logging.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <vector>

namespace dfm {

bool configure_logging(const LoggingOptions& options) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    bool file_ok = true;
    if (options.log_file) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(options.log_file->string(), false));
        } catch (const spdlog::spdlog_ex& e) {
            file_ok = false;
            spdlog::warn("Failed to open log file {}: {}", options.log_file->string(), e.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>("dfmirror", sinks.begin(), sinks.end());
    logger->set_pattern("[%H:%M:%S] [%^%l%$] %v");
    logger->set_level(options.verbose ? spdlog::level::debug : spdlog::level::info);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);
    return file_ok;
}

} // namespace dfm
