#pragma once

/// @file thread_pool.h
/// @brief Fixed-size worker pool used for per-column scatter/gather

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace drifter {

/// @brief A fixed set of worker threads draining a FIFO task queue
///
/// Tasks share no state through the pool; callers gather results through
/// the returned futures. Destruction finishes every queued task before the
/// workers are joined.
///
/// Example usage:
/// @code
///   ThreadPool pool(4);
///   std::vector<int> inputs = {1, 2, 3};
///   auto squares = pool.MapOrdered(inputs, [](int x) { return x * x; });
///   // squares == {1, 4, 9}, whatever order the workers ran in
/// @endcode
class ThreadPool {
public:
    /// @param num_threads Number of worker threads (0 = hardware concurrency)
    explicit ThreadPool(size_t num_threads = 0);

    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /// @brief Queue a task
    /// @return Future holding the result, or the exception the task threw
    template <typename F>
    auto Submit(F&& f) -> std::future<std::invoke_result_t<F>>;

    /// @brief Apply fn to every item on the pool and return the results in
    ///        item order
    ///
    /// Blocks until every task has finished. An exception thrown by fn is
    /// rethrown here.
    template <typename T, typename F>
    auto MapOrdered(const std::vector<T>& items, F fn)
        -> std::vector<std::invoke_result_t<F&, const T&>>;

    size_t Size() const { return workers_.size(); }

private:
    void WorkerLoop();

    /// Blocks for the next task; false once stopped and drained
    bool NextTask(std::function<void()>& task);

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;

    std::mutex mutex_;
    std::condition_variable condition_;
    bool stopping_ = false;
};

template <typename F>
auto ThreadPool::Submit(F&& f) -> std::future<std::invoke_result_t<F>> {
    using Result = std::invoke_result_t<F>;

    auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(f));
    std::future<Result> future = task->get_future();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            throw std::runtime_error("Cannot submit task to stopped thread pool");
        }
        tasks_.emplace([task]() { (*task)(); });
    }
    condition_.notify_one();
    return future;
}

template <typename T, typename F>
auto ThreadPool::MapOrdered(const std::vector<T>& items, F fn)
    -> std::vector<std::invoke_result_t<F&, const T&>> {
    using Result = std::invoke_result_t<F&, const T&>;

    std::vector<std::future<Result>> futures;
    futures.reserve(items.size());
    for (const auto& item : items) {
        futures.push_back(Submit([&fn, &item]() { return fn(item); }));
    }

    // Wait for every task before rethrowing so none outlives items or fn
    for (auto& future : futures) {
        future.wait();
    }

    std::vector<Result> results;
    results.reserve(items.size());
    for (auto& future : futures) {
        results.push_back(future.get());
    }
    return results;
}

}  // namespace drifter
