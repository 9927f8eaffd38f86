#include "dfm/core/config.hpp"
#include "support/test_store.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <string>
#include <vector>

using namespace dfm;

namespace {

// argv helper; keeps the strings alive for the call
class Args {
public:
    Args(std::initializer_list<std::string> args) : storage_(args) {
        for (auto& arg : storage_) {
            pointers_.push_back(arg.data());
        }
    }

    int argc() const { return static_cast<int>(pointers_.size()); }
    char** argv() { return pointers_.data(); }

private:
    std::vector<std::string> storage_;
    std::vector<char*> pointers_;
};

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override { unsetenv("DFM_REMOTE_URL"); }
    void TearDown() override { unsetenv("DFM_REMOTE_URL"); }
};

} // namespace

TEST_F(ConfigTest, DefaultsAreValid) {
    SyncOptions options;
    EXPECT_EQ(options.chunk_size, 1024u * 1024u);
    EXPECT_EQ(options.max_workers, 4u);
    EXPECT_EQ(options.max_retries, 3);
    EXPECT_EQ(options.report_name, "sync_report.json");
    EXPECT_TRUE(validate_options(options).is_ok());
}

TEST_F(ConfigTest, RejectsNonPositiveOptions) {
    SyncOptions options;
    options.chunk_size = 0;
    EXPECT_TRUE(validate_options(options).is_error());

    options = SyncOptions{};
    options.max_workers = 0;
    EXPECT_TRUE(validate_options(options).is_error());

    options = SyncOptions{};
    options.max_retries = 0;
    auto invalid = validate_options(options);
    ASSERT_TRUE(invalid.is_error());
    EXPECT_EQ(invalid.error().kind, ErrorKind::Config);
}

TEST_F(ConfigTest, RejectsOversizedWorkerPool) {
    SyncOptions options;
    options.max_workers = SyncOptions::kMaxWorkers;
    EXPECT_TRUE(validate_options(options).is_ok());

    options.max_workers = SyncOptions::kMaxWorkers + 1;
    auto invalid = validate_options(options);
    ASSERT_TRUE(invalid.is_error());
    EXPECT_EQ(invalid.error().kind, ErrorKind::Config);

    Args flag{"dfmirror", "sync", "a", "--remote", "http://h", "--max-workers", "1000000"};
    EXPECT_TRUE(parse_arguments(flag.argc(), flag.argv()).is_error());

    test::TempDir dir;
    const auto file = dir.path() / "wide.json";
    test::write_file(file, R"({"max_workers": -1})");
    Args from_file{"dfmirror", "sync", "a", "--remote", "http://h", "--config", file.string()};
    auto parsed = parse_arguments(from_file.argc(), from_file.argv());
    ASSERT_TRUE(parsed.is_error());
    EXPECT_EQ(parsed.error().kind, ErrorKind::Config);
}

TEST_F(ConfigTest, RejectsRetryCountBeyondIntRange) {
    Args flag{"dfmirror", "sync", "a", "--remote", "http://h", "--max-retries", "4294967297"};
    auto parsed = parse_arguments(flag.argc(), flag.argv());
    ASSERT_TRUE(parsed.is_error());
    EXPECT_EQ(parsed.error().kind, ErrorKind::Config);

    test::TempDir dir;
    const auto file = dir.path() / "retries.json";
    test::write_file(file, R"({"max_retries": 4294967297})");
    SyncOptions options;
    EXPECT_TRUE(apply_config_file(file, options).is_error());
    EXPECT_EQ(options.max_retries, 3);
}

TEST_F(ConfigTest, ParsesSyncCommand) {
    Args args{"dfmirror", "sync", "datasets/a", "/tmp/out", "--remote", "http://127.0.0.1:9000",
              "--max-workers", "8", "--max-retries", "5", "--chunk-size", "4096", "-v"};
    auto parsed = parse_arguments(args.argc(), args.argv());
    ASSERT_TRUE(parsed.is_ok()) << parsed.error().message;

    const auto& config = parsed.value();
    EXPECT_EQ(config.command, Command::Sync);
    EXPECT_EQ(config.remote_path, "datasets/a");
    EXPECT_EQ(config.local_path, std::filesystem::path("/tmp/out"));
    EXPECT_EQ(config.remote_url, "http://127.0.0.1:9000");
    EXPECT_EQ(config.sync.max_workers, 8u);
    EXPECT_EQ(config.sync.max_retries, 5);
    EXPECT_EQ(config.sync.chunk_size, 4096u);
    EXPECT_TRUE(config.verbose);
}

TEST_F(ConfigTest, LocalPathDefaultsToCurrentDirectory) {
    Args args{"dfmirror", "sync", "a.bin", "--remote", "http://host"};
    auto parsed = parse_arguments(args.argc(), args.argv());
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value().local_path, std::filesystem::path("."));
}

TEST_F(ConfigTest, RemoteUrlFromEnvironment) {
    setenv("DFM_REMOTE_URL", "http://from-env:8080", 1);
    Args args{"dfmirror", "list", "datasets"};
    auto parsed = parse_arguments(args.argc(), args.argv());
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value().command, Command::List);
    EXPECT_EQ(parsed.value().remote_url, "http://from-env:8080");
}

TEST_F(ConfigTest, MissingRemoteIsAnError) {
    Args args{"dfmirror", "sync", "a.bin"};
    auto parsed = parse_arguments(args.argc(), args.argv());
    ASSERT_TRUE(parsed.is_error());
    EXPECT_EQ(parsed.error().kind, ErrorKind::Config);
}

TEST_F(ConfigTest, RejectsUnknownOptionsAndBadNumbers) {
    Args unknown{"dfmirror", "sync", "a", "--remote", "http://h", "--bogus", "1"};
    EXPECT_TRUE(parse_arguments(unknown.argc(), unknown.argv()).is_error());

    Args negative{"dfmirror", "sync", "a", "--remote", "http://h", "--max-workers", "-2"};
    EXPECT_TRUE(parse_arguments(negative.argc(), negative.argv()).is_error());

    Args zero{"dfmirror", "sync", "a", "--remote", "http://h", "--chunk-size", "0"};
    EXPECT_TRUE(parse_arguments(zero.argc(), zero.argv()).is_error());

    Args command{"dfmirror", "frobnicate"};
    EXPECT_TRUE(parse_arguments(command.argc(), command.argv()).is_error());
}

TEST_F(ConfigTest, ConfigFileIsOverriddenByFlags) {
    test::TempDir dir;
    const auto file = dir.path() / "dfm.json";
    test::write_file(file, R"({"chunk_size": 2048, "max_workers": 2, "max_retries": 7,
                               "backoff_unit_ms": 5, "report_name": "r.json"})");

    Args args{"dfmirror", "sync", "a", "--remote", "http://h", "--config", file.string(), "--max-workers", "6"};
    auto parsed = parse_arguments(args.argc(), args.argv());
    ASSERT_TRUE(parsed.is_ok()) << parsed.error().message;

    const auto& sync = parsed.value().sync;
    EXPECT_EQ(sync.chunk_size, 2048u);
    EXPECT_EQ(sync.max_workers, 6u);
    EXPECT_EQ(sync.max_retries, 7);
    EXPECT_EQ(sync.backoff_unit.count(), 5);
    EXPECT_EQ(sync.report_name, "r.json");
}

TEST_F(ConfigTest, MalformedConfigFile) {
    test::TempDir dir;
    const auto file = dir.path() / "broken.json";
    test::write_file(file, "{not json");

    SyncOptions options;
    auto applied = apply_config_file(file, options);
    ASSERT_TRUE(applied.is_error());
    EXPECT_EQ(applied.error().kind, ErrorKind::Config);

    test::write_file(file, R"({"max_workers": "many"})");
    EXPECT_TRUE(apply_config_file(file, options).is_error());
}

TEST_F(ConfigTest, ServeCommand) {
    Args args{"dfmirror", "serve", "/srv/data", "--port", "9090", "--bind", "127.0.0.1"};
    auto parsed = parse_arguments(args.argc(), args.argv());
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value().command, Command::Serve);
    EXPECT_EQ(parsed.value().serve_root, std::filesystem::path("/srv/data"));
    EXPECT_EQ(parsed.value().port, 9090);
    EXPECT_EQ(parsed.value().bind_address, "127.0.0.1");
}
