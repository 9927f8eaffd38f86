#pragma once

#include <filesystem>
#include <optional>

namespace dfm {

struct LoggingOptions {
    bool verbose = false;
    std::optional<std::filesystem::path> log_file;
};

/**
 * @brief Install the process-wide spdlog logger
 *
 * Console output is always enabled; a file sink is added when log_file is
 * set. Returns false (and keeps console logging) if the file cannot be opened.
 */
bool configure_logging(const LoggingOptions& options);

} // namespace dfm
