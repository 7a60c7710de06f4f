#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace swarmshare {

// Fixed set of threads draining a shared FIFO. With zero threads, post() runs the task inline.
class WorkerPool {
public:
    using Task = std::function<void()>;

    explicit WorkerPool(std::size_t threads);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Returns false once shutdown() has been called.
    bool post(Task task);
    // Runs what is already queued, then joins.
    void shutdown();

    [[nodiscard]] std::size_t thread_count() const noexcept { return threads_.size(); }

private:
    void worker_loop();
    static void run_task(const Task& task);

    std::vector<std::thread> threads_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Task> tasks_;
    bool stopping_{false};
};

// Serialises tasks posted to a pool: at most one runs at a time, in posting order.
// Everything touching one session's state goes through that session's strand.
class Strand : public std::enable_shared_from_this<Strand> {
public:
    explicit Strand(WorkerPool& pool);

    Strand(const Strand&) = delete;
    Strand& operator=(const Strand&) = delete;

    void post(WorkerPool::Task task);

private:
    void drain();

    WorkerPool& pool_;
    std::mutex mutex_;
    std::deque<WorkerPool::Task> queue_;
    bool active_{false};
};

}  // namespace swarmshare
