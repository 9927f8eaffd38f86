/**
 * @file worker_pool.hpp
 * @brief One bounded pool of workers shared by a whole tree walk
 *
 * Tasks are grouped: a directory submits its children into a TaskGroup and
 * waits for that group. A worker that waits keeps executing queued tasks
 * of the same group instead of sleeping, so nested directories never tie
 * up the pool and total concurrency stays at the pool width.
 *
 * EXAMPLE:
 * WorkerPool pool(4);
 * TaskGroup group;
 * pool.submit(group, [] { ... });
 * pool.wait(group);
 */

#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace dfm::sync {

class WorkerPool;

/**
 * @brief Set of tasks whose completion can be awaited together
 *
 * A group must outlive wait() on it; the pool only tracks a pending count.
 */
class TaskGroup {
public:
    TaskGroup() = default;
    TaskGroup(const TaskGroup&) = delete;
    TaskGroup& operator=(const TaskGroup&) = delete;

private:
    friend class WorkerPool;
    std::size_t pending_ = 0;  // guarded by the owning pool's mutex
};

class WorkerPool {
public:
    explicit WorkerPool(std::size_t width);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    [[nodiscard]] std::size_t width() const noexcept { return workers_.size(); }

    /**
     * @brief Queue a task (FIFO)
     *
     * Exceptions escaping the task are logged and otherwise ignored; a task
     * is expected to report its own failures.
     */
    void submit(TaskGroup& group, std::function<void()> task);

    /**
     * @brief Block until every task submitted to group has finished
     *
     * THREAD SAFE: Yes. On a worker thread this helps run the group's
     * queued tasks; elsewhere it waits passively.
     */
    void wait(TaskGroup& group);

private:
    struct Task {
        TaskGroup* group;
        std::function<void()> fn;
    };

    void worker_loop();
    void shutdown();

    // Runs task with the lock released, then marks it done
    void execute(Task task, std::unique_lock<std::mutex>& lock);

    [[nodiscard]] bool on_worker_thread() const noexcept;

    std::deque<Task> queue_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_ = false;
    std::vector<std::thread> workers_;
};

} // namespace dfm::sync
