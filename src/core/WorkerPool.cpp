#include "swarmshare/core/WorkerPool.hpp"

#include "swarmshare/logging/StructuredLogger.hpp"

#include <exception>
#include <utility>

namespace swarmshare {

using logging::StructuredLogger;
using logging::log_event;

WorkerPool::WorkerPool(std::size_t threads) {
    threads_.reserve(threads);
    for (std::size_t i = 0; i < threads; ++i) {
        threads_.emplace_back(&WorkerPool::worker_loop, this);
    }
}

WorkerPool::~WorkerPool() {
    shutdown();
}

bool WorkerPool::post(Task task) {
    if (threads_.empty()) {
        {
            std::scoped_lock lock(mutex_);
            if (stopping_) {
                return false;
            }
        }
        run_task(task);
        return true;
    }
    {
        std::scoped_lock lock(mutex_);
        if (stopping_) {
            return false;
        }
        tasks_.push_back(std::move(task));
    }
    cv_.notify_one();
    return true;
}

void WorkerPool::shutdown() {
    {
        std::scoped_lock lock(mutex_);
        if (stopping_) {
            return;
        }
        stopping_ = true;
    }
    cv_.notify_all();
    for (auto& thread : threads_) {
        if (thread.joinable() && thread.get_id() != std::this_thread::get_id()) {
            thread.join();
        } else if (thread.joinable()) {
            thread.detach();
        }
    }
}

void WorkerPool::worker_loop() {
    while (true) {
        Task task;
        {
            std::unique_lock lock(mutex_);
            cv_.wait(lock, [this]() { return stopping_ || !tasks_.empty(); });
            if (tasks_.empty()) {
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop_front();
        }
        run_task(task);
    }
}

void WorkerPool::run_task(const Task& task) {
    if (!task) {
        return;
    }
    try {
        task();
    } catch (const std::exception& ex) {
        log_event(StructuredLogger::Level::Error, "worker.task_failed", {{"error", ex.what()}});
    }
}

Strand::Strand(WorkerPool& pool)
    : pool_(pool) {}

void Strand::post(WorkerPool::Task task) {
    {
        std::scoped_lock lock(mutex_);
        queue_.push_back(std::move(task));
        if (active_) {
            return;
        }
        active_ = true;
    }
    auto self = shared_from_this();
    if (!pool_.post([self]() { self->drain(); })) {
        std::scoped_lock lock(mutex_);
        log_event(StructuredLogger::Level::Warning, "worker.strand_dropped", {{"tasks", std::to_string(queue_.size())}});
        queue_.clear();
        active_ = false;
    }
}

void Strand::drain() {
    while (true) {
        WorkerPool::Task task;
        {
            std::scoped_lock lock(mutex_);
            if (queue_.empty()) {
                active_ = false;
                return;
            }
            task = std::move(queue_.front());
            queue_.pop_front();
        }
        try {
            task();
        } catch (const std::exception& ex) {
            log_event(StructuredLogger::Level::Error, "worker.task_failed", {{"error", ex.what()}});
        }
    }
}

}  // namespace swarmshare
