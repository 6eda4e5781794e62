#pragma once
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace stylec::platform {

// Fixed-size worker pool. Used to compile independent style sheets in
// parallel; results are always collected back on the submitting thread.
class ThreadPool {
public:
    // A request for zero threads still starts one worker.
    explicit ThreadPool(size_t num_threads = std::thread::hardware_concurrency());
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Throws std::runtime_error once the pool is shut down.
    template<typename F, typename... Args>
    auto submit(F&& f, Args&&... args) -> std::future<std::invoke_result_t<F, Args...>>;

    // Applies fn to every item on the pool and returns the results in item
    // order. Exceptions thrown by fn propagate from the matching future.
    template<typename T, typename F>
    auto map(const std::vector<T>& items, F fn)
        -> std::vector<std::invoke_result_t<F, const T&>>;

    size_t size() const { return workers_.size(); }

    // Runs what is already queued, then joins the workers. Safe to repeat.
    void shutdown();

private:
    void run_worker();
    void enqueue(std::function<void()> task);

    std::vector<std::jthread> workers_;
    std::deque<std::function<void()>> queue_;
    std::mutex mutex_;
    std::condition_variable wake_;
    bool stopping_ = false;
};

template<typename F, typename... Args>
auto ThreadPool::submit(F&& f, Args&&... args) -> std::future<std::invoke_result_t<F, Args...>> {
    using ReturnType = std::invoke_result_t<F, Args...>;
    auto task = std::make_shared<std::packaged_task<ReturnType()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...)
    );
    auto future = task->get_future();
    enqueue([task]() { (*task)(); });
    return future;
}

template<typename T, typename F>
auto ThreadPool::map(const std::vector<T>& items, F fn)
    -> std::vector<std::invoke_result_t<F, const T&>> {
    using ResultType = std::invoke_result_t<F, const T&>;
    std::vector<std::future<ResultType>> futures;
    futures.reserve(items.size());
    for (const auto& item : items) {
        futures.push_back(submit([&fn, &item]() { return fn(item); }));
    }
    // Every task borrows fn and items; none may outlive this call
    for (auto& future : futures) {
        future.wait();
    }
    std::vector<ResultType> results;
    results.reserve(items.size());
    for (auto& future : futures) {
        results.push_back(future.get());
    }
    return results;
}

} // namespace stylec::platform
