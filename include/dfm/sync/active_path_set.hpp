#pragma once

#include <cstddef>
#include <filesystem>
#include <mutex>
#include <string>
#include <unordered_set>

namespace dfm::sync {

/**
 * @brief Destination paths currently being synchronized by one run
 *
 * In-process deduplication only; the mutex is held for the membership
 * test-and-set and never across I/O.
 */
class ActivePathSet {
public:
    /// Returns false if the path is already active
    [[nodiscard]] bool try_acquire(const std::filesystem::path& path);

    void release(const std::filesystem::path& path);

    [[nodiscard]] bool contains(const std::filesystem::path& path) const;
    [[nodiscard]] std::size_t size() const;

private:
    static std::string key_for(const std::filesystem::path& path);

    mutable std::mutex mutex_;
    std::unordered_set<std::string> paths_;
};

/**
 * @brief Scoped membership in an ActivePathSet
 */
class ActivePathGuard {
public:
    ActivePathGuard(ActivePathSet& set, std::filesystem::path path);
    ~ActivePathGuard();

    ActivePathGuard(const ActivePathGuard&) = delete;
    ActivePathGuard& operator=(const ActivePathGuard&) = delete;

    [[nodiscard]] bool acquired() const noexcept { return acquired_; }

private:
    ActivePathSet& set_;
    std::filesystem::path path_;
    bool acquired_;
};

} // namespace dfm::sync
