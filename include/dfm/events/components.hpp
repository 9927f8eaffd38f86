/**
 * @file components.hpp
 * @brief Components that react to sync events
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * // Components automatically react to events!
 */

#pragma once

#include "dfm/events/event_bus.hpp"
#include "dfm/events/events.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdint>

namespace dfm::events {

// Flat key/value record for one event; "event" holds the event name
nlohmann::json to_record(const ListingContentsEvent& e);
nlohmann::json to_record(const EmptyDirectoryEvent& e);
nlohmann::json to_record(const ItemInfoEvent& e);
nlohmann::json to_record(const InvalidItemEvent& e);
nlohmann::json to_record(const DuplicateSkippedEvent& e);
nlohmann::json to_record(const DownloadStartedEvent& e);
nlohmann::json to_record(const FileUnchangedEvent& e);
nlohmann::json to_record(const ResumeHintEvent& e);
nlohmann::json to_record(const TransferProgressEvent& e);
nlohmann::json to_record(const DownloadSuccessEvent& e);
nlohmann::json to_record(const DownloadFailedEvent& e);
nlohmann::json to_record(const InvalidTempFileEvent& e);
nlohmann::json to_record(const DownloadCompletedEvent& e);

/**
 * @brief Logger component - writes every event as one JSON line via spdlog
 *
 * Failures and skipped items go out at warn level, transfer progress at
 * debug, everything else at info.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus);

private:
    template<typename EventType>
    void log_at(spdlog::level::level_enum level) {
        subscriptions_.add<EventType>([level](const EventType& e) {
            spdlog::log(level, "{}", to_record(e).dump());
        });
    }

    SubscriptionSet subscriptions_;
};

/**
 * @brief Metrics component - counts outcomes for the end-of-run summary
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> files_started{0};
        std::atomic<uint64_t> files_completed{0};
        std::atomic<uint64_t> files_unchanged{0};
        std::atomic<uint64_t> files_failed{0};
        std::atomic<uint64_t> bytes_transferred{0};
        std::atomic<uint64_t> items_skipped{0};
        std::atomic<uint64_t> duplicates_skipped{0};
        std::atomic<uint64_t> directories_listed{0};
    };

    explicit MetricsComponent(EventBus& bus);

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const;

private:
    Stats stats_;
    SubscriptionSet subscriptions_;
};

} // namespace dfm::events
