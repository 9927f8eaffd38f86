#include "dfm/core/config.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <limits>
#include <map>
#include <sstream>
#include <vector>

namespace dfm {
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

dfm::Result<std::uint64_t, SyncError> parse_unsigned(const std::string& flag, const std::string& text) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        return Fail<std::uint64_t>(ErrorKind::Config, flag + " expects a non-negative integer, got '" + text + "'");
    }
    try {
        return dfm::Ok(static_cast<std::uint64_t>(std::stoull(text)));
    } catch (const std::out_of_range&) {
        return Fail<std::uint64_t>(ErrorKind::Config, flag + " value out of range: " + text);
    }
}

bool takes_value(const std::string& flag) {
    static const std::vector<std::string> flags_with_values{
        "--remote", "--max-workers", "--max-retries", "--chunk-size", "--timeout-ms",
        "--backoff-ms", "--log-file", "--config", "--port", "--bind", "--report-name"};
    for (const auto& candidate : flags_with_values) {
        if (candidate == flag) {
            return true;
        }
    }
    return false;
}

dfm::Result<void, SyncError> apply_flag(const std::string& flag, const std::string& value, CliConfig& config) {
    if (flag == "--remote") {
        config.remote_url = value;
    } else if (flag == "--log-file") {
        config.log_file = fs::path(value);
    } else if (flag == "--bind") {
        config.bind_address = value;
    } else if (flag == "--report-name") {
        config.sync.report_name = value;
    } else {
        auto number = parse_unsigned(flag, value);
        if (number.is_error()) {
            return Err<void>(number.error());
        }
        const auto n = number.value();
        if (flag == "--max-workers") {
            config.sync.max_workers = static_cast<std::size_t>(n);
        } else if (flag == "--max-retries") {
            if (n > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
                return Fail<void>(ErrorKind::Config, "--max-retries out of range: " + value);
            }
            config.sync.max_retries = static_cast<int>(n);
        } else if (flag == "--chunk-size") {
            config.sync.chunk_size = static_cast<std::size_t>(n);
        } else if (flag == "--timeout-ms") {
            config.sync.request_timeout = std::chrono::milliseconds(n);
        } else if (flag == "--backoff-ms") {
            config.sync.backoff_unit = std::chrono::milliseconds(n);
        } else if (flag == "--port") {
            if (n > 65535) {
                return Fail<void>(ErrorKind::Config, "--port out of range: " + value);
            }
            config.port = static_cast<std::uint16_t>(n);
        } else {
            return Fail<void>(ErrorKind::Config, "Unknown option: " + flag);
        }
    }
    return dfm::Ok();
}

} // namespace

dfm::Result<void, SyncError> validate_options(const SyncOptions& options) {
    if (options.chunk_size == 0) {
        return Fail<void>(ErrorKind::Config, "chunk_size must be > 0");
    }
    if (options.max_workers == 0) {
        return Fail<void>(ErrorKind::Config, "max_workers must be > 0");
    }
    if (options.max_workers > SyncOptions::kMaxWorkers) {
        return Fail<void>(ErrorKind::Config, "max_workers must be <= " + std::to_string(SyncOptions::kMaxWorkers));
    }
    if (options.max_retries <= 0) {
        return Fail<void>(ErrorKind::Config, "max_retries must be > 0");
    }
    if (options.request_timeout.count() <= 0) {
        return Fail<void>(ErrorKind::Config, "request_timeout must be > 0");
    }
    if (options.report_name.empty()) {
        return Fail<void>(ErrorKind::Config, "report_name must not be empty");
    }
    return dfm::Ok();
}

dfm::Result<void, SyncError> apply_config_file(const fs::path& path, SyncOptions& options) {
    std::ifstream input(path);
    if (!input) {
        return Fail<void>(ErrorKind::Config, "Failed to open config file: " + path.string());
    }

    const json doc = json::parse(input, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return Fail<void>(ErrorKind::Config, "Config file is not a JSON object: " + path.string());
    }

    try {
        options.chunk_size = doc.value("chunk_size", options.chunk_size);
        options.max_workers = doc.value("max_workers", options.max_workers);
        const auto retries = doc.value("max_retries", static_cast<std::int64_t>(options.max_retries));
        if (retries < 0 || retries > std::numeric_limits<int>::max()) {
            return Fail<void>(ErrorKind::Config, "max_retries out of range: " + std::to_string(retries));
        }
        options.max_retries = static_cast<int>(retries);
        options.request_timeout = std::chrono::milliseconds(
            doc.value("request_timeout_ms", static_cast<std::int64_t>(options.request_timeout.count())));
        options.backoff_unit = std::chrono::milliseconds(
            doc.value("backoff_unit_ms", static_cast<std::int64_t>(options.backoff_unit.count())));
        options.report_name = doc.value("report_name", options.report_name);
    } catch (const json::exception& e) {
        return Fail<void>(ErrorKind::Config, std::string("Invalid config value: ") + e.what());
    }
    return dfm::Ok();
}

dfm::Result<CliConfig, SyncError> parse_arguments(int argc, char* argv[]) {
    CliConfig config;
    if (argc < 2) {
        return dfm::Ok(config);
    }

    const std::string command = argv[1];
    if (command == "sync") {
        config.command = Command::Sync;
    } else if (command == "list") {
        config.command = Command::List;
    } else if (command == "serve") {
        config.command = Command::Serve;
    } else if (command == "help" || command == "-h" || command == "--help") {
        config.command = Command::Help;
        return dfm::Ok(config);
    } else {
        return Fail<CliConfig>(ErrorKind::Config, "Unknown command: " + command);
    }

    std::vector<std::string> positional;
    std::vector<std::pair<std::string, std::string>> flags;
    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "-v" || arg == "--verbose") {
            config.verbose = true;
        } else if (arg == "-h" || arg == "--help") {
            config.command = Command::Help;
            return dfm::Ok(config);
        } else if (arg.rfind("--", 0) == 0) {
            if (!takes_value(arg)) {
                return Fail<CliConfig>(ErrorKind::Config, "Unknown option: " + arg);
            }
            if (i + 1 >= argc) {
                return Fail<CliConfig>(ErrorKind::Config, "Missing value for " + arg);
            }
            if (arg == "--config") {
                config.config_file = fs::path(argv[++i]);
            } else {
                flags.emplace_back(arg, argv[++i]);
            }
        } else {
            positional.push_back(arg);
        }
    }

    if (config.config_file) {
        auto applied = apply_config_file(*config.config_file, config.sync);
        if (applied.is_error()) {
            return Err<CliConfig>(applied.error());
        }
    }

    if (const char* env_remote = std::getenv("DFM_REMOTE_URL")) {
        config.remote_url = env_remote;
    }

    for (const auto& [flag, value] : flags) {
        auto applied = apply_flag(flag, value, config);
        if (applied.is_error()) {
            return Err<CliConfig>(applied.error());
        }
    }

    switch (config.command) {
        case Command::Sync:
        case Command::List:
            if (positional.empty()) {
                return Fail<CliConfig>(ErrorKind::Config, "Missing remote path");
            }
            if (config.remote_url.empty()) {
                return Fail<CliConfig>(ErrorKind::Config, "Missing --remote (or DFM_REMOTE_URL)");
            }
            config.remote_path = positional[0];
            if (config.command == Command::Sync && positional.size() > 1) {
                config.local_path = fs::path(positional[1]);
            }
            if (positional.size() > (config.command == Command::Sync ? 2u : 1u)) {
                return Fail<CliConfig>(ErrorKind::Config, "Too many arguments");
            }
            break;
        case Command::Serve:
            if (positional.size() != 1) {
                return Fail<CliConfig>(ErrorKind::Config, "serve expects exactly one root directory");
            }
            config.serve_root = fs::path(positional[0]);
            break;
        case Command::Help:
            break;
    }

    auto valid = validate_options(config.sync);
    if (valid.is_error()) {
        return Err<CliConfig>(valid.error());
    }
    return dfm::Ok(config);
}

std::string usage() {
    std::ostringstream oss;
    oss << "Usage:\n"
        << "  dfmirror sync <remote_path> [local_path] --remote <url> [options]\n"
        << "  dfmirror list <remote_path> --remote <url>\n"
        << "  dfmirror serve <root_dir> [--port N] [--bind ADDR]\n"
        << "\n"
        << "Options:\n"
        << "  --remote URL        Remote store base URL (or DFM_REMOTE_URL)\n"
        << "  --max-workers N     Concurrent transfers (default 4)\n"
        << "  --max-retries N     Attempts per byte range (default 3)\n"
        << "  --chunk-size N      Diff window size in bytes (default 1048576)\n"
        << "  --timeout-ms N      Connect/read timeout per request (default 30000)\n"
        << "  --backoff-ms N      Retry backoff unit (default 1000)\n"
        << "  --report-name NAME  Run report file name (default sync_report.json)\n"
        << "  --config FILE       JSON file with the options above\n"
        << "  --log-file FILE     Also write logs to FILE\n"
        << "  -v, --verbose       Debug logging\n";
    return oss.str();
}

} // namespace dfm
