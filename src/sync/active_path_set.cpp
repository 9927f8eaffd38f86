#include "dfm/sync/active_path_set.hpp"

namespace dfm::sync {

std::string ActivePathSet::key_for(const std::filesystem::path& path) {
    return path.lexically_normal().string();
}

bool ActivePathSet::try_acquire(const std::filesystem::path& path) {
    std::lock_guard lock(mutex_);
    return paths_.insert(key_for(path)).second;
}

void ActivePathSet::release(const std::filesystem::path& path) {
    std::lock_guard lock(mutex_);
    paths_.erase(key_for(path));
}

bool ActivePathSet::contains(const std::filesystem::path& path) const {
    std::lock_guard lock(mutex_);
    return paths_.count(key_for(path)) > 0;
}

std::size_t ActivePathSet::size() const {
    std::lock_guard lock(mutex_);
    return paths_.size();
}

ActivePathGuard::ActivePathGuard(ActivePathSet& set, std::filesystem::path path)
    : set_(set)
    , path_(std::move(path))
    , acquired_(set_.try_acquire(path_)) {
}

ActivePathGuard::~ActivePathGuard() {
    if (acquired_) {
        set_.release(path_);
    }
}

} // namespace dfm::sync
