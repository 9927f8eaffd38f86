#include "dfm/sync/file_session.hpp"

#include "dfm/core/hash.hpp"
#include "dfm/events/events.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <system_error>
#include <unordered_map>
#include <vector>

namespace dfm::sync {
namespace fs = std::filesystem;

namespace {

bool is_progressive(FileState current, FileState target) {
    static const std::unordered_map<FileState, std::vector<FileState>> transitions {
        {FileState::Open, {FileState::Diffed}},
        {FileState::Diffed, {FileState::Unchanged, FileState::Staging}},
        {FileState::Staging, {FileState::Verified}},
        {FileState::Verified, {FileState::Committed}},
    };

    const auto it = transitions.find(current);
    if (it == transitions.end()) {
        return false;
    }
    const auto& allowed_list = it->second;
    return std::find(allowed_list.begin(), allowed_list.end(), target) != allowed_list.end();
}

bool is_terminal(FileState state) {
    return state == FileState::Unchanged || state == FileState::Committed || state == FileState::Failed;
}

} // namespace

fs::path FileSyncSession::staging_path_for(const fs::path& destination) {
    fs::path staging = destination;
    staging += kStagingSuffix;
    return staging;
}

FileSyncSession::FileSyncSession(SyncContext& context, remote::RemoteFile file, fs::path destination)
    : context_(context)
    , file_(std::move(file))
    , destination_(std::move(destination))
    , staging_path_(staging_path_for(destination_))
    , declared_size_(file_.declared_size) {
}

FileSyncSession::~FileSyncSession() {
    // An interrupted session never leaves a staging file behind
    if (!is_terminal(state_)) {
        remove_staging_file();
    }
}

dfm::Result<void, SyncError> FileSyncSession::transition_to(FileState next) {
    if (state_ == next) {
        return dfm::Ok();
    }
    if (is_terminal(state_) || (next != FileState::Failed && !is_progressive(state_, next))) {
        return Fail<void>(ErrorKind::InvalidState, std::string("Illegal transition ") + to_string(state_) +
                                                        " -> " + to_string(next));
    }
    state_ = next;
    return dfm::Ok();
}

dfm::Result<void, SyncError> FileSyncSession::require(FileState expected, const char* step) const {
    if (state_ != expected) {
        return Fail<void>(ErrorKind::InvalidState, std::string(step) + " called in state " + to_string(state_));
    }
    return dfm::Ok();
}

dfm::Result<void, SyncError> FileSyncSession::fail(SyncError error) {
    abort(error);
    return Err<void>(std::move(error));
}

dfm::Result<void, SyncError> FileSyncSession::open() {
    if (auto ok = require(FileState::Open, "open"); ok.is_error()) {
        return ok;
    }
    if (response_) {
        return dfm::Ok();
    }

    auto opened = context_.store.open(file_);
    if (opened.is_error()) {
        return fail(opened.error());
    }
    response_ = std::move(opened.value());
    declared_size_ = response_->content_length;
    if (declared_size_ != file_.declared_size) {
        spdlog::debug("{}: listed size {} differs from content length {}", file_.path, file_.declared_size,
                      declared_size_);
    }
    return dfm::Ok();
}

dfm::Result<void, SyncError> FileSyncSession::compute_plan() {
    if (auto ok = require(FileState::Open, "compute_plan"); ok.is_error()) {
        return ok;
    }
    if (!response_) {
        return Fail<void>(ErrorKind::InvalidState, "compute_plan called before open");
    }

    ChunkIndexer indexer(context_.options.chunk_size);
    auto local_map = indexer.index_local(destination_);
    if (local_map.is_error()) {
        return fail(local_map.error());
    }

    auto plan = indexer.diff(*response_->raw, declared_size_, local_map.value());
    if (plan.is_error()) {
        return fail(plan.error());
    }
    plan_ = std::move(plan.value());
    if (auto ok = transition_to(FileState::Diffed); ok.is_error()) {
        return ok;
    }

    std::error_code ec;
    const bool local_exists = fs::is_regular_file(destination_, ec);
    const std::uint64_t local_size = local_exists ? fs::file_size(destination_, ec) : 0;
    const bool size_matches = local_exists && !ec && local_size == declared_size_;

    if (!plan_.empty() || !size_matches) {
        return dfm::Ok();
    }

    if (local_size > 0) {
        auto checksum = hash::sha256_file(destination_);
        if (checksum.is_error()) {
            return fail(checksum.error());
        }
        checksum_ = checksum.value();
    }
    response_.reset();

    context_.bus.emit(events::FileUnchangedEvent{file_.name, destination_.string(), checksum_});
    return transition_to(FileState::Unchanged);
}

dfm::Result<void, SyncError> FileSyncSession::prepare_staging_file() {
    std::error_code ec;
    const auto parent = destination_.parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec && !fs::exists(parent)) {
            return Fail<void>(ErrorKind::LocalIo, "Failed to create directory " + parent.string() + ": " + ec.message());
        }
        ec.clear();
    }

    if (fs::is_regular_file(destination_, ec)) {
        fs::copy_file(destination_, staging_path_, fs::copy_options::overwrite_existing, ec);
        if (ec) {
            return Fail<void>(ErrorKind::LocalIo, "Failed to seed staging file from " + destination_.string() +
                                                      ": " + ec.message());
        }
    } else {
        std::ofstream create(staging_path_, std::ios::binary | std::ios::trunc);
        if (!create) {
            return Fail<void>(ErrorKind::LocalIo, "Failed to create staging file " + staging_path_.string());
        }
    }

    fs::resize_file(staging_path_, declared_size_, ec);
    if (ec) {
        return Fail<void>(ErrorKind::LocalIo, "Failed to size staging file " + staging_path_.string() + ": " +
                                                  ec.message());
    }
    return dfm::Ok();
}

dfm::Result<void, SyncError> FileSyncSession::stage() {
    if (auto ok = require(FileState::Diffed, "stage"); ok.is_error()) {
        return ok;
    }
    if (auto ok = transition_to(FileState::Staging); ok.is_error()) {
        return ok;
    }

    // Ranges are fetched on fresh connections
    response_.reset();

    context_.bus.emit(events::DownloadStartedEvent{file_.name, destination_.string(), declared_size_, plan_.size()});

    const auto previous = checkpoint_.load(destination_);
    if (previous.last_committed_offset > 0) {
        context_.bus.emit(events::ResumeHintEvent{destination_.string(), previous.last_committed_offset});
    }

    if (auto prepared = prepare_staging_file(); prepared.is_error()) {
        return fail(prepared.error());
    }

    FileRangeSink sink(staging_path_);
    if (!sink.is_open()) {
        return fail(make_error(ErrorKind::LocalIo, "Failed to open staging file " + staging_path_.string()));
    }

    const std::string path_text = destination_.string();
    auto& bus = context_.bus;
    const ProgressCallback progress = [&bus, &path_text](const ChunkRange& range, std::uint64_t written) {
        bus.emit(events::TransferProgressEvent{path_text, range.start, range.end, written});
    };

    for (const auto& range : plan_) {
        auto fetched = context_.fetcher.fetch(file_.url, range, sink, context_.options.max_retries, progress);
        if (fetched.is_error()) {
            const auto& failure = fetched.error();
            sink.close();
            return fail(make_error(failure.last_error.kind,
                                   "Range " + std::to_string(failure.range.start) + "-" +
                                       std::to_string(failure.range.end) + " failed after " +
                                       std::to_string(failure.attempts) + " attempt(s): " +
                                       failure.last_error.message));
        }
        bytes_transferred_ += fetched.value();
        checkpoint_.save(destination_, range.end + 1);
    }

    auto flushed = sink.flush();
    sink.close();
    if (flushed.is_error()) {
        return fail(flushed.error());
    }
    return dfm::Ok();
}

dfm::Result<void, SyncError> FileSyncSession::verify() {
    if (auto ok = require(FileState::Staging, "verify"); ok.is_error()) {
        return ok;
    }

    std::error_code ec;
    std::string problem;
    if (!fs::is_regular_file(staging_path_, ec)) {
        problem = "staging file is missing";
    } else {
        const std::uint64_t size = fs::file_size(staging_path_, ec);
        if (ec) {
            problem = "cannot stat staging file: " + ec.message();
        } else if (declared_size_ > 0 && size == 0) {
            problem = "staging file is empty";
        } else if (size != declared_size_) {
            problem = "staging file has " + std::to_string(size) + " bytes, expected " +
                      std::to_string(declared_size_);
        }
    }

    if (!problem.empty()) {
        context_.bus.emit(events::InvalidTempFileEvent{staging_path_.string(), problem});
        return fail(make_error(ErrorKind::Verification, problem + ": " + staging_path_.string()));
    }

    auto checksum = hash::sha256_file(staging_path_);
    if (checksum.is_error()) {
        return fail(checksum.error());
    }
    checksum_ = checksum.value();
    return transition_to(FileState::Verified);
}

dfm::Result<void, SyncError> FileSyncSession::commit() {
    if (auto ok = require(FileState::Verified, "commit"); ok.is_error()) {
        return ok;
    }

    std::error_code ec;
    fs::rename(staging_path_, destination_, ec);
    if (ec) {
        return fail(make_error(ErrorKind::LocalIo, "Failed to move " + staging_path_.string() + " over " +
                                                       destination_.string() + ": " + ec.message()));
    }
    if (auto ok = transition_to(FileState::Committed); ok.is_error()) {
        return ok;
    }

    checkpoint_.clear(destination_);
    context_.bus.emit(events::DownloadSuccessEvent{file_.name, destination_.string(), bytes_transferred_,
                                                   plan_.size(), checksum_});
    return dfm::Ok();
}

TransferOutcome FileSyncSession::run() {
    dfm::Result<void, SyncError> step = dfm::Ok();
    if (state_ == FileState::Open) {
        step = open();
        if (step.is_ok()) {
            step = compute_plan();
        }
    }
    if (step.is_ok() && state_ == FileState::Diffed) {
        step = stage();
    }
    if (step.is_ok() && state_ == FileState::Staging) {
        step = verify();
    }
    if (step.is_ok() && state_ == FileState::Verified) {
        step = commit();
    }
    if (step.is_error() && state_ != FileState::Failed) {
        abort(step.error());
    }
    return outcome();
}

void FileSyncSession::abort(const SyncError& error) {
    if (is_terminal(state_)) {
        return;
    }
    response_.reset();
    remove_staging_file();
    error_ = error;
    state_ = FileState::Failed;
    context_.bus.emit(events::DownloadFailedEvent{file_.name, destination_.string(), error.message});
}

void FileSyncSession::remove_staging_file() const {
    std::error_code ec;
    fs::remove(staging_path_, ec);
    if (ec) {
        spdlog::warn("Failed to remove staging file {}: {}", staging_path_.string(), ec.message());
    }
}

TransferOutcome FileSyncSession::outcome() const {
    TransferOutcome outcome;
    outcome.path = destination_.string();
    outcome.declared_size = declared_size_;
    outcome.changed_range_count = plan_.size();

    if (state_ == FileState::Committed || state_ == FileState::Unchanged) {
        outcome.status = TransferStatus::Completed;
        outcome.bytes_transferred = bytes_transferred_;
        outcome.checksum = checksum_;
    } else {
        outcome.status = TransferStatus::Failed;
        outcome.bytes_transferred = 0;
        if (error_) {
            outcome.error = std::string(to_string(error_->kind)) + ": " + error_->message;
        } else {
            outcome.error = std::string("session ended in state ") + to_string(state_);
        }
    }
    return outcome;
}

} // namespace dfm::sync
