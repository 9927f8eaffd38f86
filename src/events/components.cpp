#include "dfm/events/components.hpp"

#include <spdlog/spdlog.h>

namespace dfm::events {

using nlohmann::json;

json to_record(const ListingContentsEvent& e) {
    return {{"event", ListingContentsEvent::kEventName}, {"path", e.path}, {"items", e.item_count}};
}

json to_record(const EmptyDirectoryEvent& e) {
    return {{"event", EmptyDirectoryEvent::kEventName}, {"path", e.path}};
}

json to_record(const ItemInfoEvent& e) {
    return {{"event", ItemInfoEvent::kEventName},
            {"name", e.name},
            {"path", e.path},
            {"kind", e.kind},
            {"size", e.size}};
}

json to_record(const InvalidItemEvent& e) {
    return {{"event", InvalidItemEvent::kEventName},
            {"name", e.name},
            {"path", e.path},
            {"reason", e.reason}};
}

json to_record(const DuplicateSkippedEvent& e) {
    return {{"event", DuplicateSkippedEvent::kEventName}, {"path", e.path}};
}

json to_record(const DownloadStartedEvent& e) {
    return {{"event", DownloadStartedEvent::kEventName},
            {"file", e.file},
            {"path", e.path},
            {"size", e.declared_size},
            {"changed_ranges", e.changed_ranges}};
}

json to_record(const FileUnchangedEvent& e) {
    return {{"event", FileUnchangedEvent::kEventName},
            {"file", e.file},
            {"path", e.path},
            {"checksum", e.checksum}};
}

json to_record(const ResumeHintEvent& e) {
    return {{"event", ResumeHintEvent::kEventName}, {"path", e.path}, {"position", e.offset}};
}

json to_record(const TransferProgressEvent& e) {
    return {{"event", TransferProgressEvent::kEventName},
            {"path", e.path},
            {"range_start", e.range_start},
            {"range_end", e.range_end},
            {"bytes_written", e.bytes_written}};
}

json to_record(const DownloadSuccessEvent& e) {
    return {{"event", DownloadSuccessEvent::kEventName},
            {"file", e.file},
            {"path", e.path},
            {"bytes_transferred", e.bytes_transferred},
            {"changed_ranges", e.changed_ranges},
            {"checksum", e.checksum}};
}

json to_record(const DownloadFailedEvent& e) {
    return {{"event", DownloadFailedEvent::kEventName},
            {"file", e.file},
            {"path", e.path},
            {"error", e.error}};
}

json to_record(const InvalidTempFileEvent& e) {
    return {{"event", InvalidTempFileEvent::kEventName}, {"path", e.path}, {"reason", e.reason}};
}

json to_record(const DownloadCompletedEvent& e) {
    return {{"event", DownloadCompletedEvent::kEventName},
            {"report", e.report_path},
            {"total_files", e.total_files},
            {"successful", e.successful},
            {"failed", e.failed},
            {"total_bytes_transferred", e.total_bytes_transferred}};
}

LoggerComponent::LoggerComponent(EventBus& bus)
    : subscriptions_(bus) {
    using spdlog::level::level_enum;
    log_at<ListingContentsEvent>(level_enum::info);
    log_at<EmptyDirectoryEvent>(level_enum::info);
    log_at<ItemInfoEvent>(level_enum::info);
    log_at<InvalidItemEvent>(level_enum::warn);
    log_at<DuplicateSkippedEvent>(level_enum::warn);
    log_at<DownloadStartedEvent>(level_enum::info);
    log_at<FileUnchangedEvent>(level_enum::info);
    log_at<ResumeHintEvent>(level_enum::info);
    log_at<TransferProgressEvent>(level_enum::debug);
    log_at<DownloadSuccessEvent>(level_enum::info);
    log_at<DownloadFailedEvent>(level_enum::err);
    log_at<InvalidTempFileEvent>(level_enum::warn);
    log_at<DownloadCompletedEvent>(level_enum::info);
}

MetricsComponent::MetricsComponent(EventBus& bus)
    : subscriptions_(bus) {
    subscriptions_.add<DownloadStartedEvent>([this](const DownloadStartedEvent&) {
        stats_.files_started++;
    });
    subscriptions_.add<DownloadSuccessEvent>([this](const DownloadSuccessEvent& e) {
        stats_.files_completed++;
        stats_.bytes_transferred += e.bytes_transferred;
    });
    subscriptions_.add<FileUnchangedEvent>([this](const FileUnchangedEvent&) {
        stats_.files_unchanged++;
    });
    subscriptions_.add<DownloadFailedEvent>([this](const DownloadFailedEvent&) {
        stats_.files_failed++;
    });
    subscriptions_.add<InvalidItemEvent>([this](const InvalidItemEvent&) {
        stats_.items_skipped++;
    });
    subscriptions_.add<DuplicateSkippedEvent>([this](const DuplicateSkippedEvent&) {
        stats_.duplicates_skipped++;
    });
    subscriptions_.add<ListingContentsEvent>([this](const ListingContentsEvent&) {
        stats_.directories_listed++;
    });
}

void MetricsComponent::print_stats() const {
    spdlog::info("═══════════════════════════════════════");
    spdlog::info("Run Statistics:");
    spdlog::info("  Files downloaded:   {}", stats_.files_completed.load());
    spdlog::info("  Files unchanged:    {}", stats_.files_unchanged.load());
    spdlog::info("  Files failed:       {}", stats_.files_failed.load());
    spdlog::info("  Bytes transferred:  {}", stats_.bytes_transferred.load());
    spdlog::info("  Items skipped:      {}", stats_.items_skipped.load());
    spdlog::info("  Duplicates skipped: {}", stats_.duplicates_skipped.load());
    spdlog::info("  Directories listed: {}", stats_.directories_listed.load());
    spdlog::info("═══════════════════════════════════════");
}

} // namespace dfm::events
