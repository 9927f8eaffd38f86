#include "dfm/sync/checkpoint.hpp"
#include "support/test_store.hpp"

#include <gtest/gtest.h>

using dfm::sync::TransferCheckpoint;
using dfm::test::TempDir;
using dfm::test::read_file;
using dfm::test::write_file;

TEST(CheckpointTest, SidecarLivesBesideDestination) {
    EXPECT_EQ(TransferCheckpoint::sidecar_path("/m/data/a.bin"), std::filesystem::path("/m/data/a.bin.download"));
}

TEST(CheckpointTest, MissingSidecarLoadsAsZero) {
    TempDir dir;
    TransferCheckpoint checkpoint;
    const auto state = checkpoint.load(dir.path() / "a.bin");
    EXPECT_EQ(state.destination_path, dir.path() / "a.bin");
    EXPECT_EQ(state.last_committed_offset, 0u);
}

TEST(CheckpointTest, SaveLoadClear) {
    TempDir dir;
    const auto destination = dir.path() / "a.bin";
    TransferCheckpoint checkpoint;

    checkpoint.save(destination, 1048576);
    EXPECT_EQ(read_file(TransferCheckpoint::sidecar_path(destination)), R"({"position":1048576})");
    EXPECT_EQ(checkpoint.load(destination).last_committed_offset, 1048576u);

    checkpoint.save(destination, 2097152);
    EXPECT_EQ(checkpoint.load(destination).last_committed_offset, 2097152u);

    checkpoint.clear(destination);
    EXPECT_FALSE(std::filesystem::exists(TransferCheckpoint::sidecar_path(destination)));
    EXPECT_EQ(checkpoint.load(destination).last_committed_offset, 0u);
}

TEST(CheckpointTest, CorruptSidecarLoadsAsZero) {
    TempDir dir;
    const auto destination = dir.path() / "a.bin";
    TransferCheckpoint checkpoint;

    for (const char* content : {"garbage", "[]", R"({"offset": 5})", R"({"position": -3})",
                                R"({"position": "12"})"}) {
        write_file(TransferCheckpoint::sidecar_path(destination), content);
        EXPECT_EQ(checkpoint.load(destination).last_committed_offset, 0u) << content;
    }
}

TEST(CheckpointTest, FailuresAreNeverEscalated) {
    TempDir dir;
    const auto destination = dir.path() / "no" / "such" / "dir" / "a.bin";
    TransferCheckpoint checkpoint;

    EXPECT_NO_THROW(checkpoint.save(destination, 10));
    EXPECT_NO_THROW(checkpoint.clear(destination));
    EXPECT_EQ(checkpoint.load(destination).last_committed_offset, 0u);
}
