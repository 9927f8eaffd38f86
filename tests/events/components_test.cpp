#include "dfm/events/components.hpp"
#include "dfm/events/event_bus.hpp"
#include "dfm/events/events.hpp"

#include <gtest/gtest.h>

using namespace dfm::events;

TEST(MetricsComponentTest, CountsOutcomes) {
    EventBus bus;
    MetricsComponent metrics(bus);

    bus.emit(DownloadStartedEvent{"a.bin", "/m/a.bin", 100, 1});
    bus.emit(DownloadSuccessEvent{"a.bin", "/m/a.bin", 100, 1, "abc"});
    bus.emit(DownloadStartedEvent{"b.bin", "/m/b.bin", 50, 1});
    bus.emit(DownloadFailedEvent{"b.bin", "/m/b.bin", "transient: 503"});
    bus.emit(FileUnchangedEvent{"c.bin", "/m/c.bin", "def"});
    bus.emit(InvalidItemEvent{"l", "l", "link"});
    bus.emit(DuplicateSkippedEvent{"/m/a.bin"});
    bus.emit(ListingContentsEvent{"d", 3});

    const auto& stats = metrics.get_stats();
    EXPECT_EQ(stats.files_started.load(), 2u);
    EXPECT_EQ(stats.files_completed.load(), 1u);
    EXPECT_EQ(stats.files_failed.load(), 1u);
    EXPECT_EQ(stats.files_unchanged.load(), 1u);
    EXPECT_EQ(stats.bytes_transferred.load(), 100u);
    EXPECT_EQ(stats.items_skipped.load(), 1u);
    EXPECT_EQ(stats.duplicates_skipped.load(), 1u);
    EXPECT_EQ(stats.directories_listed.load(), 1u);
}

TEST(MetricsComponentTest, StopsCountingWhenDestroyed) {
    EventBus bus;
    {
        MetricsComponent metrics(bus);
        EXPECT_GT(bus.subscriber_count<DownloadSuccessEvent>(), 0u);
    }
    EXPECT_EQ(bus.subscriber_count<DownloadSuccessEvent>(), 0u);
    EXPECT_NO_THROW(bus.emit(DownloadSuccessEvent{"a", "b", 1, 1, "c"}));
}

TEST(LoggerComponentTest, SubscribesToEveryEvent) {
    EventBus bus;
    LoggerComponent logger(bus);

    EXPECT_EQ(bus.subscriber_count<ListingContentsEvent>(), 1u);
    EXPECT_EQ(bus.subscriber_count<EmptyDirectoryEvent>(), 1u);
    EXPECT_EQ(bus.subscriber_count<ItemInfoEvent>(), 1u);
    EXPECT_EQ(bus.subscriber_count<InvalidItemEvent>(), 1u);
    EXPECT_EQ(bus.subscriber_count<DuplicateSkippedEvent>(), 1u);
    EXPECT_EQ(bus.subscriber_count<DownloadStartedEvent>(), 1u);
    EXPECT_EQ(bus.subscriber_count<FileUnchangedEvent>(), 1u);
    EXPECT_EQ(bus.subscriber_count<ResumeHintEvent>(), 1u);
    EXPECT_EQ(bus.subscriber_count<TransferProgressEvent>(), 1u);
    EXPECT_EQ(bus.subscriber_count<DownloadSuccessEvent>(), 1u);
    EXPECT_EQ(bus.subscriber_count<DownloadFailedEvent>(), 1u);
    EXPECT_EQ(bus.subscriber_count<InvalidTempFileEvent>(), 1u);
    EXPECT_EQ(bus.subscriber_count<DownloadCompletedEvent>(), 1u);

    EXPECT_NO_THROW(bus.emit(DownloadCompletedEvent{"/m/sync_report.json", 3, 2, 1, 4096}));
}

TEST(EventRecordTest, RecordsCarryEventName) {
    const auto started = to_record(DownloadStartedEvent{"a.bin", "/m/a.bin", 3145728, 1});
    EXPECT_EQ(started["event"], "download_started");
    EXPECT_EQ(started["size"], 3145728);
    EXPECT_EQ(started["changed_ranges"], 1);

    const auto listing = to_record(ListingContentsEvent{"data", 4});
    EXPECT_EQ(listing["event"], "listing_contents");
    EXPECT_EQ(listing["items"], 4);

    const auto resume = to_record(ResumeHintEvent{"/m/a.bin", 1048576});
    EXPECT_EQ(resume["event"], "resume_hint");
    EXPECT_EQ(resume["position"], 1048576);

    const auto completed = to_record(DownloadCompletedEvent{"/m/sync_report.json", 3, 2, 1, 10});
    EXPECT_EQ(completed["event"], "download_completed");
    EXPECT_EQ(completed["report"], "/m/sync_report.json");
    EXPECT_EQ(completed["failed"], 1);
}
