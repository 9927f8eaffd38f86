#include "dfm/sync/run_report.hpp"

#include <chrono>
#include <ctime>
#include <fstream>

namespace dfm::sync {
using json = nlohmann::json;

namespace {

std::string local_timestamp() {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &now);
#else
    localtime_r(&now, &local);
#endif
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &local);
    return buffer;
}

} // namespace

json to_json(const TransferOutcome& outcome) {
    json doc{
        {"path", outcome.path},
        {"declared_size", outcome.declared_size},
        {"bytes_transferred", outcome.bytes_transferred},
        {"checksum", outcome.checksum},
        {"status", to_string(outcome.status)},
        {"changed_range_count", outcome.changed_range_count},
    };
    doc["error"] = outcome.error ? json(*outcome.error) : json(nullptr);
    return doc;
}

RunReport::RunReport(const RunReport& other)
    : outcomes_(other.outcomes()) {
}

RunReport& RunReport::operator=(const RunReport& other) {
    if (this != &other) {
        auto copy = other.outcomes();
        std::lock_guard lock(mutex_);
        outcomes_ = std::move(copy);
    }
    return *this;
}

void RunReport::record(TransferOutcome outcome) {
    std::lock_guard lock(mutex_);
    outcomes_.push_back(std::move(outcome));
}

std::vector<TransferOutcome> RunReport::outcomes() const {
    std::lock_guard lock(mutex_);
    return outcomes_;
}

RunSummary RunReport::summary() const {
    std::lock_guard lock(mutex_);
    RunSummary summary;
    summary.total_files = outcomes_.size();
    for (const auto& outcome : outcomes_) {
        if (outcome.status == TransferStatus::Completed) {
            ++summary.successful;
        } else {
            ++summary.failed;
        }
        summary.total_bytes_transferred += outcome.bytes_transferred;
        summary.total_changed_chunks += outcome.changed_range_count;
    }
    summary.timestamp = local_timestamp();
    return summary;
}

json RunReport::to_json() const {
    const auto totals = summary();
    json details = json::array();
    for (const auto& outcome : outcomes()) {
        details.push_back(sync::to_json(outcome));
    }
    return json{
        {"summary", {
            {"total_files", totals.total_files},
            {"successful", totals.successful},
            {"failed", totals.failed},
            {"total_bytes_transferred", totals.total_bytes_transferred},
            {"total_changed_chunks", totals.total_changed_chunks},
            {"timestamp", totals.timestamp},
        }},
        {"details", details},
    };
}

dfm::Result<void, SyncError> RunReport::write(const std::filesystem::path& path) const {
    std::ofstream output(path, std::ios::trunc);
    if (!output) {
        return Fail<void>(ErrorKind::LocalIo, "Failed to open report " + path.string());
    }
    output << to_json().dump(2) << "\n";
    output.flush();
    if (!output) {
        return Fail<void>(ErrorKind::LocalIo, "Failed to write report " + path.string());
    }
    return dfm::Ok();
}

} // namespace dfm::sync
