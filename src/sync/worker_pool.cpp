#include "dfm/sync/worker_pool.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <system_error>

namespace dfm::sync {

namespace {
thread_local const WorkerPool* current_pool = nullptr;
} // namespace

WorkerPool::WorkerPool(std::size_t width) {
    if (width == 0) {
        width = 1;
    }
    workers_.reserve(width);
    try {
        for (std::size_t i = 0; i < width; ++i) {
            workers_.emplace_back([this] { worker_loop(); });
        }
    } catch (const std::system_error& e) {
        // The destructor will not run; stop the threads that did start
        spdlog::error("Failed to start worker {} of {}: {}", workers_.size() + 1, width, e.what());
        shutdown();
        throw;
    }
}

WorkerPool::~WorkerPool() {
    shutdown();
}

void WorkerPool::shutdown() {
    {
        std::unique_lock lock(mutex_);
        stop_ = true;
    }
    cv_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void WorkerPool::submit(TaskGroup& group, std::function<void()> task) {
    {
        std::unique_lock lock(mutex_);
        ++group.pending_;
        queue_.push_back(Task{&group, std::move(task)});
    }
    cv_.notify_all();
}

void WorkerPool::wait(TaskGroup& group) {
    std::unique_lock lock(mutex_);
    const bool helping = on_worker_thread();

    while (group.pending_ > 0) {
        if (helping) {
            auto it = std::find_if(queue_.begin(), queue_.end(),
                                   [&group](const Task& task) { return task.group == &group; });
            if (it != queue_.end()) {
                Task task = std::move(*it);
                queue_.erase(it);
                execute(std::move(task), lock);
                continue;
            }
        }
        cv_.wait(lock);
    }
}

void WorkerPool::worker_loop() {
    current_pool = this;

    std::unique_lock lock(mutex_);
    for (;;) {
        cv_.wait(lock, [this] { return stop_ || !queue_.empty(); });
        if (queue_.empty()) {
            // stop_ is set and nothing is left to run
            return;
        }
        Task task = std::move(queue_.front());
        queue_.pop_front();
        execute(std::move(task), lock);
    }
}

void WorkerPool::execute(Task task, std::unique_lock<std::mutex>& lock) {
    lock.unlock();
    try {
        task.fn();
    } catch (const std::exception& e) {
        spdlog::error("Worker task threw: {}", e.what());
    }
    lock.lock();

    --task.group->pending_;
    cv_.notify_all();
}

bool WorkerPool::on_worker_thread() const noexcept {
    return current_pool == this;
}

} // namespace dfm::sync
