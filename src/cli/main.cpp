/**
 * @file main.cpp
 * @brief dfmirror command line
 *
 * sync  - mirror a remote path into a local directory
 * list  - print what a remote path contains
 * serve - expose a local directory over the store protocol
 */

#include "dfm/core/config.hpp"
#include "dfm/core/logging.hpp"
#include "dfm/events/components.hpp"
#include "dfm/events/event_bus.hpp"
#include "dfm/remote/http_remote_store.hpp"
#include "dfm/server/store_server.hpp"
#include "dfm/sync/tree_walker.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <iomanip>
#include <iostream>

namespace {

int run_sync(const dfm::CliConfig& config) {
    dfm::events::EventBus bus;
    dfm::events::LoggerComponent logger(bus);
    dfm::events::MetricsComponent metrics(bus);

    dfm::remote::HttpRemoteStore store(config.remote_url, config.sync.request_timeout);
    dfm::sync::TreeWalker walker(store, bus, config.sync);

    auto result = walker.run(config.remote_path, config.local_path);
    if (result.is_error()) {
        std::cerr << "sync failed: " << dfm::to_string(result.error().kind) << ": "
                  << result.error().message << "\n";
        return 1;
    }

    const auto summary = result.value().summary();
    std::cout << "Files:       " << summary.total_files << "\n"
              << "Successful:  " << summary.successful << "\n"
              << "Failed:      " << summary.failed << "\n"
              << "Transferred: " << std::fixed << std::setprecision(2)
              << static_cast<double>(summary.total_bytes_transferred) / (1024.0 * 1024.0) << " MiB in "
              << summary.total_changed_chunks << " changed ranges\n"
              << "Report:      " << (config.local_path / config.sync.report_name).string() << "\n";
    metrics.print_stats();
    return 0;
}

int run_list(const dfm::CliConfig& config) {
    dfm::events::EventBus bus;
    dfm::remote::HttpRemoteStore store(config.remote_url, config.sync.request_timeout);

    auto listed = dfm::sync::list_remote(store, bus, config.remote_path);
    if (listed.is_error()) {
        std::cerr << "list failed: " << dfm::to_string(listed.error().kind) << ": "
                  << listed.error().message << "\n";
        return 1;
    }

    for (const auto& item : listed.value()) {
        std::cout << dfm::sync::item_kind(item) << "\t";
        if (const auto* file = std::get_if<dfm::remote::RemoteFile>(&item)) {
            std::cout << file->declared_size;
        } else {
            std::cout << "-";
        }
        std::cout << "\t" << dfm::remote::item_path(item) << "\n";
    }
    return 0;
}

int run_serve(const dfm::CliConfig& config) {
    dfm::server::StoreServer server(config.serve_root, config.bind_address, config.port);
    spdlog::info("Serving {} on {}", config.serve_root.string(), server.base_url());
    spdlog::info("Press Ctrl+C to stop");
    server.run();
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    auto parsed = dfm::parse_arguments(argc, argv);
    if (parsed.is_error()) {
        std::cerr << parsed.error().message << "\n\n" << dfm::usage();
        return 1;
    }
    const auto& config = parsed.value();

    dfm::configure_logging(dfm::LoggingOptions{config.verbose, config.log_file});

    try {
        switch (config.command) {
            case dfm::Command::Sync: return run_sync(config);
            case dfm::Command::List: return run_list(config);
            case dfm::Command::Serve: return run_serve(config);
            case dfm::Command::Help: break;
        }
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }

    std::cout << dfm::usage();
    return 0;
}
