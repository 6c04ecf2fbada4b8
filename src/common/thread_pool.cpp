/// @file thread_pool.cpp
/// @brief Worker pool implementation

#include "common/thread_pool.h"

#include <algorithm>

#include "common/logging.h"

namespace drifter {

ThreadPool::ThreadPool(size_t num_threads) {
    if (num_threads == 0) {
        num_threads = std::max<size_t>(std::thread::hardware_concurrency(), 1);
    }

    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back([this]() { WorkerLoop(); });
    }
    DRIFTER_LOG_DEBUG("Started thread pool with {} workers", num_threads);
}

ThreadPool::~ThreadPool() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    condition_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

bool ThreadPool::NextTask(std::function<void()>& task) {
    std::unique_lock<std::mutex> lock(mutex_);
    condition_.wait(lock, [this] { return stopping_ || !tasks_.empty(); });

    // Queued work still runs after a stop request
    if (tasks_.empty()) {
        return false;
    }
    task = std::move(tasks_.front());
    tasks_.pop();
    return true;
}

void ThreadPool::WorkerLoop() {
    std::function<void()> task;
    while (NextTask(task)) {
        task();
        task = nullptr;
    }
}

}  // namespace drifter
