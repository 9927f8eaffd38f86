#include "dfm/sync/file_session.hpp"
#include "dfm/core/hash.hpp"
#include "dfm/events/events.hpp"
#include "dfm/remote/http_remote_store.hpp"
#include "support/test_store.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

using namespace dfm::sync;
using dfm::ErrorKind;
using dfm::events::EventBus;
using dfm::network::HttpContext;
using dfm::network::HttpResponse;
using dfm::network::HttpStatus;
using dfm::test::TempDir;
using dfm::test::TestStore;
using dfm::test::make_bytes;
using dfm::test::read_file;
using dfm::test::write_file;

namespace fs = std::filesystem;

namespace {

constexpr std::uint64_t kMiB = 1024 * 1024;

std::string sha256_of(const std::string& data) {
    dfm::hash::Sha256Hasher hasher;
    hasher.update(reinterpret_cast<const std::uint8_t*>(data.data()), data.size());
    return hasher.hex_digest();
}

std::string with_window_replaced(std::string data, std::uint64_t index, std::uint32_t seed) {
    data.replace(index * kMiB, kMiB, make_bytes(kMiB, seed));
    return data;
}

class FileSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        options_.chunk_size = kMiB;
        options_.max_retries = 3;
        options_.backoff_unit = std::chrono::milliseconds(1);
        options_.request_timeout = std::chrono::milliseconds(5000);

        record<dfm::events::DownloadStartedEvent>();
        record<dfm::events::FileUnchangedEvent>();
        record<dfm::events::ResumeHintEvent>();
        record<dfm::events::DownloadSuccessEvent>();
        record<dfm::events::DownloadFailedEvent>();
        record<dfm::events::InvalidTempFileEvent>();
        bus_.subscribe<dfm::events::ResumeHintEvent>([this](const dfm::events::ResumeHintEvent& e) {
            resume_offset_ = e.offset;
        });
    }

    template<typename Event>
    void record() {
        bus_.subscribe<Event>([this](const Event&) {
            std::lock_guard lock(events_mutex_);
            events_.push_back(Event::kEventName);
        });
    }

    std::vector<std::string> events() {
        std::lock_guard lock(events_mutex_);
        return events_;
    }

    bool saw(const std::string& name) {
        const auto seen = events();
        return std::find(seen.begin(), seen.end(), name) != seen.end();
    }

    SyncContext context() {
        return SyncContext{remote_, fetcher_, bus_, options_};
    }

    dfm::remote::RemoteFile resolve_file(const std::string& path) {
        auto item = remote_.resolve(path);
        EXPECT_TRUE(item.is_ok());
        return std::get<dfm::remote::RemoteFile>(item.value());
    }

    // 503 for every ranged request whose Range value starts with prefix
    std::shared_ptr<std::atomic<int>> fail_ranges(const std::string& prefix = "bytes=") {
        auto hits = std::make_shared<std::atomic<int>>(0);
        store_.server().router().use([hits, prefix](const HttpContext& ctx, HttpResponse& response) {
            const std::string range = ctx.request.get_header("Range");
            if (range.compare(0, prefix.size(), prefix) == 0) {
                hits->fetch_add(1);
                response = dfm::network::json_error(HttpStatus::SERVICE_UNAVAILABLE, "injected");
                return false;
            }
            return true;
        });
        return hits;
    }

    TestStore store_;
    TempDir local_{"dfm_local"};
    EventBus bus_;
    dfm::network::HttpClient client_{std::chrono::milliseconds(5000)};
    RangeFetcher fetcher_{client_, std::chrono::milliseconds(1)};
    dfm::remote::HttpRemoteStore remote_{store_.base_url(), std::chrono::milliseconds(5000)};
    dfm::SyncOptions options_;

    std::mutex events_mutex_;
    std::vector<std::string> events_;
    std::atomic<std::uint64_t> resume_offset_{0};
};

} // namespace

TEST_F(FileSessionTest, DownloadsWholeFileWhenLocalIsAbsent) {
    const std::string content = make_bytes(3 * kMiB, 31);
    store_.put("data/big.bin", content);
    store_.start();

    const auto destination = local_.path() / "big.bin";
    auto ctx = context();
    FileSyncSession session(ctx, resolve_file("data/big.bin"), destination);

    ASSERT_TRUE(session.open().is_ok());
    ASSERT_TRUE(session.compute_plan().is_ok());
    EXPECT_EQ(session.state(), FileState::Diffed);
    EXPECT_EQ(session.plan(), (DiffPlan{ChunkRange{0, 3145727}}));

    const auto outcome = session.run();
    EXPECT_EQ(session.state(), FileState::Committed);
    EXPECT_EQ(outcome.status, TransferStatus::Completed);
    EXPECT_EQ(outcome.changed_range_count, 1u);
    EXPECT_EQ(outcome.bytes_transferred, 3 * kMiB);
    EXPECT_EQ(outcome.declared_size, 3 * kMiB);
    EXPECT_EQ(outcome.checksum, sha256_of(content));
    EXPECT_FALSE(outcome.error.has_value());

    EXPECT_EQ(fs::file_size(destination), 3 * kMiB);
    EXPECT_EQ(read_file(destination), content);
    EXPECT_FALSE(fs::exists(session.staging_path()));
    EXPECT_FALSE(fs::exists(TransferCheckpoint::sidecar_path(destination)));

    const auto seen = events();
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0], "download_started");
    EXPECT_EQ(seen[1], "download_success");
}

TEST_F(FileSessionTest, IdenticalLocalFileIsUnchanged) {
    const std::string content = make_bytes(2 * kMiB + 4321, 32);
    store_.put("same.bin", content);
    store_.start();

    const auto destination = local_.path() / "same.bin";
    write_file(destination, content);

    auto ctx = context();
    FileSyncSession session(ctx, resolve_file("same.bin"), destination);
    const auto outcome = session.run();

    EXPECT_EQ(session.state(), FileState::Unchanged);
    EXPECT_TRUE(session.plan().empty());
    EXPECT_EQ(outcome.status, TransferStatus::Completed);
    EXPECT_EQ(outcome.bytes_transferred, 0u);
    EXPECT_EQ(outcome.changed_range_count, 0u);
    EXPECT_EQ(outcome.checksum, sha256_of(content));
    EXPECT_TRUE(saw("file_unchanged"));
    EXPECT_FALSE(saw("download_started"));
    EXPECT_FALSE(fs::exists(session.staging_path()));
}

TEST_F(FileSessionTest, ChecksumIsStableAcrossRuns) {
    const std::string content = make_bytes(kMiB + 17, 33);
    store_.put("stable.bin", content);
    store_.start();
    const auto destination = local_.path() / "stable.bin";

    auto ctx = context();
    FileSyncSession first(ctx, resolve_file("stable.bin"), destination);
    const auto downloaded = first.run();
    ASSERT_EQ(downloaded.status, TransferStatus::Completed);

    FileSyncSession second(ctx, resolve_file("stable.bin"), destination);
    const auto unchanged = second.run();
    ASSERT_EQ(unchanged.status, TransferStatus::Completed);

    EXPECT_EQ(downloaded.checksum, unchanged.checksum);
    EXPECT_TRUE(second.plan().empty());
    EXPECT_EQ(unchanged.bytes_transferred, 0u);
}

TEST_F(FileSessionTest, OnlyChangedWindowsAreFetched) {
    const std::string remote_content = make_bytes(4 * kMiB, 34);
    store_.put("partial.bin", remote_content);
    store_.start();

    const auto destination = local_.path() / "partial.bin";
    write_file(destination, with_window_replaced(remote_content, 2, 99));

    auto ctx = context();
    FileSyncSession session(ctx, resolve_file("partial.bin"), destination);
    const auto outcome = session.run();

    ASSERT_EQ(outcome.status, TransferStatus::Completed);
    EXPECT_EQ(session.plan(), (DiffPlan{ChunkRange{2 * kMiB, 3 * kMiB - 1}}));
    EXPECT_EQ(outcome.bytes_transferred, kMiB);
    EXPECT_EQ(read_file(destination), remote_content);
}

TEST_F(FileSessionTest, RetryExhaustionLeavesDestinationUntouched) {
    const std::string remote_content = make_bytes(3 * kMiB, 35);
    store_.put("flaky.bin", remote_content);
    const auto hits = fail_ranges();
    store_.start();

    const auto destination = local_.path() / "flaky.bin";
    const std::string old_content = with_window_replaced(remote_content, 0, 77);
    write_file(destination, old_content);

    TransferCheckpoint checkpoint;
    checkpoint.save(destination, 512);

    auto ctx = context();
    FileSyncSession session(ctx, resolve_file("flaky.bin"), destination);
    const auto outcome = session.run();

    EXPECT_EQ(session.state(), FileState::Failed);
    EXPECT_EQ(outcome.status, TransferStatus::Failed);
    EXPECT_EQ(outcome.bytes_transferred, 0u);
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(outcome.error->rfind("transient", 0), 0u);
    EXPECT_EQ(hits->load(), 3);

    EXPECT_EQ(read_file(destination), old_content);
    EXPECT_FALSE(fs::exists(session.staging_path()));
    EXPECT_EQ(checkpoint.load(destination).last_committed_offset, 512u);
    EXPECT_EQ(resume_offset_.load(), 512u);
    EXPECT_TRUE(saw("download_failed"));
    EXPECT_FALSE(saw("download_success"));
}

TEST_F(FileSessionTest, CheckpointRecordsLastCompletedRange) {
    const std::string remote_content = make_bytes(3 * kMiB, 36);
    store_.put("resume.bin", remote_content);
    fail_ranges("bytes=2097152");
    store_.start();

    const auto destination = local_.path() / "resume.bin";
    const std::string old_content = with_window_replaced(with_window_replaced(remote_content, 0, 81), 2, 82);
    write_file(destination, old_content);

    auto ctx = context();
    FileSyncSession session(ctx, resolve_file("resume.bin"), destination);
    const auto outcome = session.run();

    ASSERT_EQ(outcome.status, TransferStatus::Failed);
    EXPECT_EQ(session.plan(), (DiffPlan{ChunkRange{0, kMiB - 1}, ChunkRange{2 * kMiB, 3 * kMiB - 1}}));
    EXPECT_EQ(TransferCheckpoint().load(destination).last_committed_offset, kMiB);
    EXPECT_EQ(read_file(destination), old_content);
    EXPECT_FALSE(fs::exists(session.staging_path()));
}

TEST_F(FileSessionTest, InterruptedBeforeCommitKeepsDestination) {
    const std::string remote_content = make_bytes(2 * kMiB, 37);
    store_.put("atomic.bin", remote_content);
    store_.start();

    const auto destination = local_.path() / "atomic.bin";
    const std::string old_content = with_window_replaced(remote_content, 1, 55);
    write_file(destination, old_content);
    const auto file = resolve_file("atomic.bin");

    auto ctx = context();
    fs::path staging;
    {
        FileSyncSession session(ctx, file, destination);
        ASSERT_TRUE(session.open().is_ok());
        ASSERT_TRUE(session.compute_plan().is_ok());
        ASSERT_TRUE(session.stage().is_ok());
        ASSERT_TRUE(session.verify().is_ok());
        EXPECT_EQ(session.state(), FileState::Verified);

        staging = session.staging_path();
        EXPECT_TRUE(fs::exists(staging));
        EXPECT_EQ(read_file(staging), remote_content);
        EXPECT_EQ(read_file(destination), old_content);
    }
    EXPECT_EQ(read_file(destination), old_content);
    EXPECT_FALSE(fs::exists(staging));

    FileSyncSession retry(ctx, file, destination);
    EXPECT_EQ(retry.run().status, TransferStatus::Completed);
    EXPECT_EQ(read_file(destination), remote_content);
}

TEST_F(FileSessionTest, StepsOutOfOrderAreRejected) {
    store_.put("order.bin", "ordered content");
    store_.start();

    auto ctx = context();
    FileSyncSession session(ctx, resolve_file("order.bin"), local_.path() / "order.bin");

    auto commit = session.commit();
    ASSERT_TRUE(commit.is_error());
    EXPECT_EQ(commit.error().kind, ErrorKind::InvalidState);

    auto stage = session.stage();
    ASSERT_TRUE(stage.is_error());
    EXPECT_EQ(stage.error().kind, ErrorKind::InvalidState);

    auto plan = session.compute_plan();
    ASSERT_TRUE(plan.is_error());
    EXPECT_EQ(plan.error().kind, ErrorKind::InvalidState);

    EXPECT_EQ(session.state(), FileState::Open);
    EXPECT_EQ(session.run().status, TransferStatus::Completed);
    EXPECT_EQ(read_file(local_.path() / "order.bin"), "ordered content");

    EXPECT_EQ(session.open().error().kind, ErrorKind::InvalidState);
}

TEST_F(FileSessionTest, TruncatedRemoteIsReconciled) {
    options_.chunk_size = 1024;
    const std::string local_content = make_bytes(4096, 38);
    const std::string remote_content = local_content.substr(0, 2048);
    store_.put("shrunk.bin", remote_content);
    store_.start();

    const auto destination = local_.path() / "shrunk.bin";
    write_file(destination, local_content);

    auto ctx = context();
    FileSyncSession session(ctx, resolve_file("shrunk.bin"), destination);
    const auto outcome = session.run();

    ASSERT_EQ(outcome.status, TransferStatus::Completed);
    EXPECT_TRUE(session.plan().empty());
    EXPECT_EQ(session.state(), FileState::Committed);
    EXPECT_EQ(outcome.changed_range_count, 0u);
    EXPECT_EQ(outcome.bytes_transferred, 0u);
    EXPECT_EQ(read_file(destination), remote_content);
}

TEST_F(FileSessionTest, EmptyRemoteFileCreatesEmptyDestination) {
    store_.put("empty.bin", "");
    store_.start();

    const auto destination = local_.path() / "nested" / "empty.bin";
    auto ctx = context();
    FileSyncSession session(ctx, resolve_file("empty.bin"), destination);
    const auto outcome = session.run();

    ASSERT_EQ(outcome.status, TransferStatus::Completed);
    ASSERT_TRUE(fs::exists(destination));
    EXPECT_EQ(fs::file_size(destination), 0u);
    EXPECT_EQ(outcome.checksum, "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_F(FileSessionTest, VanishedRemoteFileFails) {
    store_.put("gone.bin", "soon gone");
    store_.start();
    const auto file = resolve_file("gone.bin");
    fs::remove(store_.root() / "gone.bin");

    const auto destination = local_.path() / "gone.bin";
    auto ctx = context();
    FileSyncSession session(ctx, file, destination);
    const auto outcome = session.run();

    EXPECT_EQ(outcome.status, TransferStatus::Failed);
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(outcome.error->rfind("metadata", 0), 0u);
    EXPECT_FALSE(fs::exists(destination));
    EXPECT_TRUE(saw("download_failed"));
}

TEST_F(FileSessionTest, AbortCleansStagingOnce) {
    const std::string content = make_bytes(kMiB / 2, 39);
    store_.put("abort.bin", content);
    store_.start();

    auto ctx = context();
    FileSyncSession session(ctx, resolve_file("abort.bin"), local_.path() / "abort.bin");
    ASSERT_TRUE(session.open().is_ok());
    ASSERT_TRUE(session.compute_plan().is_ok());
    ASSERT_TRUE(session.stage().is_ok());
    ASSERT_TRUE(fs::exists(session.staging_path()));

    session.abort(dfm::make_error(ErrorKind::LocalIo, "disk full"));
    session.abort(dfm::make_error(ErrorKind::LocalIo, "again"));

    EXPECT_EQ(session.state(), FileState::Failed);
    EXPECT_FALSE(fs::exists(session.staging_path()));
    EXPECT_FALSE(fs::exists(local_.path() / "abort.bin"));

    const auto outcome = session.outcome();
    EXPECT_EQ(outcome.status, TransferStatus::Failed);
    EXPECT_EQ(outcome.error.value_or(""), "local_io: disk full");

    const auto seen = events();
    EXPECT_EQ(std::count(seen.begin(), seen.end(), "download_failed"), 1);
}
